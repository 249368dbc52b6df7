#include "smppnet_frame.h"
#include "smppnet_error.h"

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <string>

namespace smppnet {

uint32_t readLengthPrefix(const uint8_t* prefix) {
    return boost::endian::load_big_u32(prefix);
}

void writeLengthPrefix(uint32_t length, uint8_t* prefix) {
    boost::endian::store_big_u32(prefix, length);
}

void checkFrameLength(uint32_t length, uint32_t maxLength) {
    if (length < kLengthPrefixSize) {
        throw SessionError(error::Code::framing_error,
                           "frame length " + std::to_string(length) + " shorter than its prefix");
    }
    if (length > maxLength) {
        throw SessionError(error::Code::framing_error,
                           "frame length " + std::to_string(length) + " exceeds " + std::to_string(maxLength));
    }
}

std::vector<uint8_t> encodeFrame(const std::vector<uint8_t>& body) {
    std::vector<uint8_t> frame(kLengthPrefixSize + body.size());
    writeLengthPrefix(static_cast<uint32_t>(frame.size()), frame.data());
    std::copy(body.begin(), body.end(), frame.begin() + kLengthPrefixSize);
    return frame;
}

std::vector<uint8_t> frameBody(const std::vector<uint8_t>& frame) {
    if (frame.size() < kLengthPrefixSize) {
        throw SessionError(error::Code::framing_error, "frame shorter than its prefix");
    }
    uint32_t length = readLengthPrefix(frame.data());
    if (length != frame.size()) {
        throw SessionError(error::Code::framing_error,
                           "length prefix " + std::to_string(length) + " does not match frame size " +
                               std::to_string(frame.size()));
    }
    return std::vector<uint8_t>(frame.begin() + kLengthPrefixSize, frame.end());
}

} // namespace smppnet

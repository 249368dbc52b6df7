#include "smppnet_message.h"
#include "smppnet_error.h"
#include "smppnet_frame.h"

#include <boost/endian/conversion.hpp>

#include <algorithm>

namespace smppnet {

std::vector<uint8_t> encode(Message& message) {
    std::vector<uint8_t> buf(kHeaderSize + message.body.size());
    uint32_t total = static_cast<uint32_t>(buf.size());
    writeLengthPrefix(total, buf.data());
    boost::endian::store_big_u32(buf.data() + 4, commandId(message.command));
    boost::endian::store_big_u32(buf.data() + 8, message.status);
    boost::endian::store_big_u32(buf.data() + 12, message.sequence);
    std::copy(message.body.begin(), message.body.end(), buf.begin() + kHeaderSize);
    message.rawLength = total;
    return buf;
}

Message decode(const std::vector<uint8_t>& frame) {
    if (frame.size() < kHeaderSize) {
        throw SessionError(error::Code::decode_error,
                           "PDU of " + std::to_string(frame.size()) + " bytes is shorter than its header");
    }
    uint32_t length = readLengthPrefix(frame.data());
    if (length != frame.size()) {
        throw SessionError(error::Code::decode_error,
                           "command_length " + std::to_string(length) + " does not match " +
                               std::to_string(frame.size()) + " received bytes");
    }
    uint32_t id = boost::endian::load_big_u32(frame.data() + 4);
    auto command = commandFromId(id);
    if (!command) {
        std::vector<uint8_t> raw(frame.begin() + 4, frame.begin() + 8);
        throw SessionError(error::Code::decode_error, "unknown command_id 0x" + toHex(raw));
    }

    Message message;
    message.command   = *command;
    message.status    = boost::endian::load_big_u32(frame.data() + 8);
    message.sequence  = boost::endian::load_big_u32(frame.data() + 12);
    message.body.assign(frame.begin() + kHeaderSize, frame.end());
    message.rawLength = length;
    return message;
}

Message makeResponse(const Message& request, std::vector<uint8_t> body, uint32_t status) {
    auto resp = responseFor(request.command);
    if (!resp) {
        throw SessionError(error::Code::usage_error,
                           std::string(commandName(request.command)) + " has no response command");
    }
    return Message(*resp, request.sequence, std::move(body), status);
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace smppnet

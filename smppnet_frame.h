#pragma once

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace smppnet {

// Every frame is: 4-byte big-endian total length || body, total = 4 + body size.
constexpr std::size_t kLengthPrefixSize = 4;

uint32_t readLengthPrefix(const uint8_t* prefix);
void writeLengthPrefix(uint32_t length, uint8_t* prefix);

// Throws SessionError(framing_error) if length is below the prefix size or above maxLength.
void checkFrameLength(uint32_t length, uint32_t maxLength);

// Prefix a body into one frame.
std::vector<uint8_t> encodeFrame(const std::vector<uint8_t>& body);

// Body of a complete frame; throws SessionError(framing_error) if the prefix disagrees with the size.
std::vector<uint8_t> frameBody(const std::vector<uint8_t>& frame);

using FrameHandler = std::function<void(std::vector<uint8_t> frame)>;
// Called once when the stream ends: end_of_stream, framing_error or a socket error.
using StreamCloseHandler = std::function<void(const boost::system::error_code& ec)>;

// Stream carrying whole frames. Owns the only reader of the connection.
class FrameTransport {
public:
    virtual ~FrameTransport() = default;

    // Throws SessionError(connection_refused) on failure.
    virtual void open(const std::string& host, uint16_t port) = 0;

    // Begin the read chain. Each complete frame (prefix included) goes to onFrame.
    virtual void start(FrameHandler onFrame, StreamCloseHandler onClose) = 0;

    // Queue one complete frame; frames never interleave on the wire.
    // Throws SessionError(not_connected) when the stream is not open.
    virtual void writeFrame(std::vector<uint8_t> frame) = 0;

    // Local close; does not invoke the close handler.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
};

} // namespace smppnet

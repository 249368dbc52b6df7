#pragma once

#include "smppnet_command.h"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <cstdint>
#include <string>

namespace smppnet {
namespace error {

enum class Code {
    // Initial connect failed; not retried.
    connection_refused = 1,
    // Command not permitted in the current bind state; nothing was sent.
    invalid_state,
    // Malformed length prefix or truncated frame; the stream is unusable.
    framing_error,
    // Peer answered with a non-zero command_status.
    protocol_error,
    // No response or data within the allotted time.
    timeout,
    // API precondition violated.
    usage_error,
    // Peer closed the stream on a frame boundary.
    end_of_stream,
    // Frame does not hold a decodable header.
    decode_error,
    // Operation needs an open connection.
    not_connected,
    // Argument out of range (oversized field, bad config).
    invalid_argument,
};

const boost::system::error_category& category();

boost::system::error_code make_error_code(Code code);

} // namespace error

// Exception thrown by every synchronous session call.
class SessionError : public boost::system::system_error {
public:
    explicit SessionError(error::Code code);
    SessionError(error::Code code, const std::string& what);
    explicit SessionError(const boost::system::error_code& ec);
    SessionError(const boost::system::error_code& ec, const std::string& what);
};

// Non-zero command_status from the peer. The session stays usable.
class ProtocolError : public SessionError {
public:
    ProtocolError(Command command, uint32_t status);

    Command command() const { return command_; }
    uint32_t status() const { return status_; }

private:
    Command  command_;
    uint32_t status_;
};

} // namespace smppnet

namespace boost {
namespace system {

template<>
struct is_error_code_enum<::smppnet::error::Code> {
    static const bool value = true;
};

} // namespace system
} // namespace boost

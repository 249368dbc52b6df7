#include "smppnet_error.h"
#include "smppnet_status.h"

#include <cstdio>

namespace smppnet {
namespace error {

namespace {

class Category : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "smppnet";
    }

    std::string message(int value) const override {
        switch (static_cast<Code>(value)) {
            case Code::connection_refused: return "Connection refused";
            case Code::invalid_state:      return "Command not permitted in the current bind state";
            case Code::framing_error:      return "Malformed or truncated frame";
            case Code::protocol_error:     return "Peer returned an error status";
            case Code::timeout:            return "Timed out";
            case Code::usage_error:        return "Operation not allowed in this context";
            case Code::end_of_stream:      return "Connection closed by peer";
            case Code::decode_error:       return "Undecodable PDU header";
            case Code::not_connected:      return "Not connected";
            case Code::invalid_argument:   return "Invalid argument";
        }
        return "Unknown smppnet error";
    }
};

} // namespace

const boost::system::error_category& category() {
    static const Category instance;
    return instance;
}

boost::system::error_code make_error_code(Code code) {
    return boost::system::error_code(static_cast<int>(code), category());
}

} // namespace error

SessionError::SessionError(error::Code code)
    : boost::system::system_error(error::make_error_code(code)) {}

SessionError::SessionError(error::Code code, const std::string& what)
    : boost::system::system_error(error::make_error_code(code), what) {}

SessionError::SessionError(const boost::system::error_code& ec)
    : boost::system::system_error(ec) {}

SessionError::SessionError(const boost::system::error_code& ec, const std::string& what)
    : boost::system::system_error(ec, what) {}

namespace {

std::string protocolErrorText(Command command, uint32_t status) {
    char code[16];
    std::snprintf(code, sizeof(code), "0x%08x", status);
    return std::string("(") + code + ") " + commandName(command) + ": " + statusDescription(status);
}

} // namespace

ProtocolError::ProtocolError(Command command, uint32_t status)
    : SessionError(error::Code::protocol_error, protocolErrorText(command, status)),
      command_(command),
      status_(status) {}

} // namespace smppnet

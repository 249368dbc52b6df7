#pragma once

#include "smppnet_message.h"

#include <cstdint>
#include <string>
#include <vector>

namespace smppnet {

struct BindParams {
    std::string systemId;
    std::string password;
    std::string systemType;
    uint8_t     interfaceVersion{0x34};
    uint8_t     addrTon{0};
    uint8_t     addrNpi{0};
    std::string addressRange;
};

struct SubmitParams {
    std::string serviceType;
    uint8_t     sourceAddrTon{0};
    uint8_t     sourceAddrNpi{0};
    std::string sourceAddr;
    uint8_t     destAddrTon{0};
    uint8_t     destAddrNpi{0};
    std::string destinationAddr;
    uint8_t     esmClass{0};
    uint8_t     protocolId{0};
    uint8_t     priorityFlag{0};
    std::string scheduleDeliveryTime;
    std::string validityPeriod;
    uint8_t     registeredDelivery{0};
    uint8_t     replaceIfPresentFlag{0};
    uint8_t     dataCoding{0};
    uint8_t     smDefaultMsgId{0};
    std::string shortMessage;
};

// Largest short_message in octets.
constexpr std::size_t kMaxShortMessage = 254;

// Appends body fields in wire order. Oversized fields throw SessionError(invalid_argument).
class BodyWriter {
public:
    // maxSize counts the terminating NUL, as the protocol tables do.
    BodyWriter& cstring(const std::string& value, std::size_t maxSize, const char* field);
    BodyWriter& u8(uint8_t value);
    BodyWriter& u32(uint32_t value);
    BodyWriter& octets(const std::string& value, std::size_t maxSize, const char* field);

    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// Reads body fields in order; running past the end throws SessionError(decode_error).
class BodyReader {
public:
    explicit BodyReader(const std::vector<uint8_t>& body) : body_(body) {}

    std::string cstring();
    uint8_t u8();
    uint32_t u32();
    bool atEnd() const { return pos_ >= body_.size(); }

private:
    const std::vector<uint8_t>& body_;
    std::size_t                 pos_{0};
};

std::vector<uint8_t> encodeBindBody(const BindParams& params);
std::vector<uint8_t> encodeSubmitBody(const SubmitParams& params);

// Leading C-string of a response body: system_id of a bind response,
// message_id of a submit response. Empty if the body is empty.
std::string responseId(const Message& response);

} // namespace smppnet

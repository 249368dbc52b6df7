#include "smppnet_body.h"
#include "smppnet_error.h"

#include <boost/endian/conversion.hpp>

#include <algorithm>

namespace smppnet {

BodyWriter& BodyWriter::cstring(const std::string& value, std::size_t maxSize, const char* field) {
    if (value.size() + 1 > maxSize) {
        throw SessionError(error::Code::invalid_argument,
                           std::string(field) + " longer than " + std::to_string(maxSize - 1) + " characters");
    }
    buf_.insert(buf_.end(), value.begin(), value.end());
    buf_.push_back(0);
    return *this;
}

BodyWriter& BodyWriter::u8(uint8_t value) {
    buf_.push_back(value);
    return *this;
}

BodyWriter& BodyWriter::u32(uint32_t value) {
    uint8_t be[4];
    boost::endian::store_big_u32(be, value);
    buf_.insert(buf_.end(), be, be + 4);
    return *this;
}

// Length octet followed by the raw bytes.
BodyWriter& BodyWriter::octets(const std::string& value, std::size_t maxSize, const char* field) {
    if (value.size() > maxSize) {
        throw SessionError(error::Code::invalid_argument,
                           std::string(field) + " longer than " + std::to_string(maxSize) + " octets");
    }
    buf_.push_back(static_cast<uint8_t>(value.size()));
    buf_.insert(buf_.end(), value.begin(), value.end());
    return *this;
}

std::string BodyReader::cstring() {
    auto begin = body_.begin() + static_cast<std::ptrdiff_t>(pos_);
    auto nul = std::find(begin, body_.end(), uint8_t{0});
    if (nul == body_.end()) {
        throw SessionError(error::Code::decode_error, "unterminated C-octet string in PDU body");
    }
    std::string value(begin, nul);
    pos_ += value.size() + 1;
    return value;
}

uint8_t BodyReader::u8() {
    if (pos_ + 1 > body_.size()) {
        throw SessionError(error::Code::decode_error, "PDU body too short");
    }
    return body_[pos_++];
}

uint32_t BodyReader::u32() {
    if (pos_ + 4 > body_.size()) {
        throw SessionError(error::Code::decode_error, "PDU body too short");
    }
    uint32_t value = boost::endian::load_big_u32(body_.data() + pos_);
    pos_ += 4;
    return value;
}

std::vector<uint8_t> encodeBindBody(const BindParams& params) {
    BodyWriter w;
    w.cstring(params.systemId, 16, "system_id")
     .cstring(params.password, 9, "password")
     .cstring(params.systemType, 13, "system_type")
     .u8(params.interfaceVersion)
     .u8(params.addrTon)
     .u8(params.addrNpi)
     .cstring(params.addressRange, 41, "address_range");
    return w.take();
}

std::vector<uint8_t> encodeSubmitBody(const SubmitParams& params) {
    BodyWriter w;
    w.cstring(params.serviceType, 6, "service_type")
     .u8(params.sourceAddrTon)
     .u8(params.sourceAddrNpi)
     .cstring(params.sourceAddr, 21, "source_addr")
     .u8(params.destAddrTon)
     .u8(params.destAddrNpi)
     .cstring(params.destinationAddr, 21, "destination_addr")
     .u8(params.esmClass)
     .u8(params.protocolId)
     .u8(params.priorityFlag)
     .cstring(params.scheduleDeliveryTime, 17, "schedule_delivery_time")
     .cstring(params.validityPeriod, 17, "validity_period")
     .u8(params.registeredDelivery)
     .u8(params.replaceIfPresentFlag)
     .u8(params.dataCoding)
     .u8(params.smDefaultMsgId)
     .octets(params.shortMessage, kMaxShortMessage, "short_message");
    return w.take();
}

std::string responseId(const Message& response) {
    if (response.body.empty()) return std::string();
    BodyReader r(response.body);
    return r.cstring();
}

} // namespace smppnet

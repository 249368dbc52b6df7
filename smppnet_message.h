#pragma once

#include "smppnet_command.h"

#include <cstdint>
#include <string>
#include <vector>

namespace smppnet {

// command_length, command_id, command_status, sequence_number.
constexpr std::size_t kHeaderSize = 16;

// Largest sequence number; the counter wraps back to 1 after it.
constexpr uint32_t kMaxSequence = 0x7FFFFFFF;

// Sequence number following current, skipping 0.
inline uint32_t nextSequenceAfter(uint32_t current) {
    return current >= kMaxSequence ? 1 : current + 1;
}

// One PDU: header fields plus an opaque body.
struct Message {
    Command              command{Command::GenericNack};
    uint32_t             status{0};
    uint32_t             sequence{0};
    std::vector<uint8_t> body;
    // Total framed length including the prefix; filled by encode() and decode().
    uint32_t             rawLength{0};

    Message() = default;
    Message(Command cmd, uint32_t seq, std::vector<uint8_t> data = {}, uint32_t st = 0)
        : command(cmd), status(st), sequence(seq), body(std::move(data)) {}

    Direction direction() const { return directionOf(command); }
    bool isRequest() const { return direction() == Direction::Request; }
    bool isResponse() const { return direction() == Direction::Response; }
    bool isError() const { return status != 0; }
};

// Header + body, with the length prefix set to 16 + body size.
std::vector<uint8_t> encode(Message& message);

// Throws SessionError(decode_error) on a short buffer, prefix mismatch or unknown command id.
Message decode(const std::vector<uint8_t>& frame);

// The _resp to a request, echoing its sequence number.
// Throws SessionError(usage_error) if the request has no response command.
Message makeResponse(const Message& request, std::vector<uint8_t> body = {}, uint32_t status = 0);

std::string toHex(const std::vector<uint8_t>& bytes);

} // namespace smppnet

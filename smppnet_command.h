#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace smppnet {

// SMPP v3.4 command ids. Responses carry bit 31.
enum class Command : uint32_t {
    GenericNack         = 0x80000000,
    BindReceiver        = 0x00000001,
    BindReceiverResp    = 0x80000001,
    BindTransmitter     = 0x00000002,
    BindTransmitterResp = 0x80000002,
    QuerySm             = 0x00000003,
    QuerySmResp         = 0x80000003,
    SubmitSm            = 0x00000004,
    SubmitSmResp        = 0x80000004,
    DeliverSm           = 0x00000005,
    DeliverSmResp       = 0x80000005,
    Unbind              = 0x00000006,
    UnbindResp          = 0x80000006,
    ReplaceSm           = 0x00000007,
    ReplaceSmResp       = 0x80000007,
    CancelSm            = 0x00000008,
    CancelSmResp        = 0x80000008,
    BindTransceiver     = 0x00000009,
    BindTransceiverResp = 0x80000009,
    Outbind             = 0x0000000B,
    EnquireLink         = 0x00000015,
    EnquireLinkResp     = 0x80000015,
    SubmitMulti         = 0x00000021,
    SubmitMultiResp     = 0x80000021,
    DataSm              = 0x00000103,
    DataSmResp          = 0x80000103,
};

enum class SessionState : uint8_t {
    Closed,
    Open,
    BoundTransmitter,
    BoundReceiver,
    BoundTransceiver,
};

enum class Direction {
    Request,
    Response,
};

enum class BindMode {
    Transmitter,
    Receiver,
    Transceiver,
};

const char* commandName(Command command);
const char* stateName(SessionState state);

std::optional<Command> commandFromId(uint32_t id);

inline uint32_t commandId(Command command) {
    return static_cast<uint32_t>(command);
}

inline Direction directionOf(Command command) {
    return (commandId(command) & 0x80000000u) ? Direction::Response : Direction::Request;
}

// Command-State Matrix: states in which a command may be sent or received.
bool isCommandPermitted(Command command, SessionState state);

// State-Setter Map: the state a successful response moves the session into.
std::optional<SessionState> stateAfter(Command command);

// Matching _resp for a request; nullopt for responses and outbind.
std::optional<Command> responseFor(Command request);

Command bindCommand(BindMode mode);

// bind_receiver / bind_transceiver and their responses.
bool isReceiverBind(Command command);

// Every command of the closed set.
const std::vector<Command>& allCommands();

} // namespace smppnet

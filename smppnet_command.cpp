#include "smppnet_command.h"

#include <array>

namespace smppnet {

namespace {

// Bitmask over SessionState values.
using StateSet = uint8_t;

constexpr StateSet bit(SessionState s) {
    return static_cast<StateSet>(1u << static_cast<unsigned>(s));
}

constexpr StateSet kOpen   = bit(SessionState::Open);
constexpr StateSet kTx     = bit(SessionState::BoundTransmitter);
constexpr StateSet kRx     = bit(SessionState::BoundReceiver);
constexpr StateSet kTrx    = bit(SessionState::BoundTransceiver);
constexpr StateSet kBound  = kTx | kRx | kTrx;

struct CommandInfo {
    Command     command;
    const char* name;
    StateSet    states;
};

constexpr std::array<CommandInfo, 26> kCommandTable = {{
    {Command::BindTransmitter,     "bind_transmitter",      kOpen},
    {Command::BindTransmitterResp, "bind_transmitter_resp", kOpen},
    {Command::BindReceiver,        "bind_receiver",         kOpen},
    {Command::BindReceiverResp,    "bind_receiver_resp",    kOpen},
    {Command::BindTransceiver,     "bind_transceiver",      kOpen},
    {Command::BindTransceiverResp, "bind_transceiver_resp", kOpen},
    {Command::Outbind,             "outbind",               kOpen},
    {Command::Unbind,              "unbind",                kBound},
    {Command::UnbindResp,          "unbind_resp",           kBound},
    {Command::SubmitSm,            "submit_sm",             kTx | kTrx},
    {Command::SubmitSmResp,        "submit_sm_resp",        kTx | kTrx},
    {Command::SubmitMulti,         "submit_multi",          kTx | kTrx},
    {Command::SubmitMultiResp,     "submit_multi_resp",     kTx | kTrx},
    {Command::DataSm,              "data_sm",               kBound},
    {Command::DataSmResp,          "data_sm_resp",          kBound},
    {Command::DeliverSm,           "deliver_sm",            kRx | kTrx},
    {Command::DeliverSmResp,       "deliver_sm_resp",       kRx | kTrx},
    {Command::QuerySm,             "query_sm",              kRx | kTrx},
    {Command::QuerySmResp,         "query_sm_resp",         kRx | kTrx},
    {Command::CancelSm,            "cancel_sm",             kRx | kTrx},
    {Command::CancelSmResp,        "cancel_sm_resp",        kRx | kTrx},
    {Command::ReplaceSm,           "replace_sm",            kTx},
    {Command::ReplaceSmResp,       "replace_sm_resp",       kTx},
    {Command::EnquireLink,         "enquire_link",          kBound},
    {Command::EnquireLinkResp,     "enquire_link_resp",     kBound},
    {Command::GenericNack,         "generic_nack",          kBound},
}};

const CommandInfo* find(Command command) {
    for (const auto& info : kCommandTable) {
        if (info.command == command) return &info;
    }
    return nullptr;
}

} // namespace

const char* commandName(Command command) {
    const CommandInfo* info = find(command);
    return info ? info->name : "unknown";
}

const char* stateName(SessionState state) {
    switch (state) {
        case SessionState::Closed:           return "closed";
        case SessionState::Open:             return "open";
        case SessionState::BoundTransmitter: return "bound_tx";
        case SessionState::BoundReceiver:    return "bound_rx";
        case SessionState::BoundTransceiver: return "bound_trx";
    }
    return "unknown";
}

std::optional<Command> commandFromId(uint32_t id) {
    for (const auto& info : kCommandTable) {
        if (commandId(info.command) == id) return info.command;
    }
    return std::nullopt;
}

bool isCommandPermitted(Command command, SessionState state) {
    const CommandInfo* info = find(command);
    return info && (info->states & bit(state)) != 0;
}

std::optional<SessionState> stateAfter(Command command) {
    switch (command) {
        case Command::BindTransmitterResp: return SessionState::BoundTransmitter;
        case Command::BindReceiverResp:    return SessionState::BoundReceiver;
        case Command::BindTransceiverResp: return SessionState::BoundTransceiver;
        case Command::UnbindResp:          return SessionState::Open;
        default:                           return std::nullopt;
    }
}

std::optional<Command> responseFor(Command request) {
    if (directionOf(request) == Direction::Response || request == Command::Outbind) {
        return std::nullopt;
    }
    return commandFromId(commandId(request) | 0x80000000u);
}

Command bindCommand(BindMode mode) {
    switch (mode) {
        case BindMode::Transmitter: return Command::BindTransmitter;
        case BindMode::Receiver:    return Command::BindReceiver;
        case BindMode::Transceiver: return Command::BindTransceiver;
    }
    return Command::BindTransmitter;
}

bool isReceiverBind(Command command) {
    return command == Command::BindReceiver || command == Command::BindReceiverResp ||
           command == Command::BindTransceiver || command == Command::BindTransceiverResp;
}

const std::vector<Command>& allCommands() {
    static const std::vector<Command> commands = [] {
        std::vector<Command> v;
        v.reserve(kCommandTable.size());
        for (const auto& info : kCommandTable) v.push_back(info.command);
        return v;
    }();
    return commands;
}

} // namespace smppnet

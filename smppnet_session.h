#pragma once

#include "smppnet_body.h"
#include "smppnet_command.h"
#include "smppnet_config.h"
#include "smppnet_correlation.h"
#include "smppnet_frame.h"
#include "smppnet_message.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace smppnet {

// Invoked by the dispatch loop for every deliver_sm / data_sm, after it has been acknowledged.
using PushHandler = std::function<void(const Message& message)>;

// One client session with an SMSC: bind state machine, request/response
// correlation and the receiver-side dispatch loop.
//
// The transport's read chain is the only reader of the connection. Responses
// are handed to the caller waiting on their sequence number; peer requests and
// unmatched responses are queued for receive() / listen(), up to
// SessionConfig::maxInbound. Without a receiver-class bind the reader answers
// enquire_link itself. Synchronous calls may be issued while listen() runs on
// another thread.
//
// All synchronous calls throw SessionError (ProtocolError for a non-zero
// command_status).
class Session {
public:
    Session(std::string host, uint16_t port, SessionConfig config = SessionConfig());
    // Takes ownership of a custom transport (used by tests).
    Session(std::string host, uint16_t port, SessionConfig config, std::unique_ptr<FrameTransport> transport);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Closed -> Open. Throws SessionError(connection_refused).
    void connect();
    // Any state -> Closed. Pending waiters fail with not_connected.
    void disconnect();

    Message bind(BindMode mode, const BindParams& params);
    Message bindTransmitter(const BindParams& params) { return bind(BindMode::Transmitter, params); }
    Message bindReceiver(const BindParams& params) { return bind(BindMode::Receiver, params); }
    Message bindTransceiver(const BindParams& params) { return bind(BindMode::Transceiver, params); }

    Message unbind();
    Message sendMessage(const SubmitParams& params);
    Message enquireLink();

    // Validates the command against the current state, then writes one frame.
    // Throws SessionError(invalid_state) without writing anything.
    void send(Message& message);

    // Registers the sequence (assigning one if it is 0) and sends the request.
    uint32_t sendRequest(Message& request);
    Message awaitResponse(uint32_t sequence);
    Message awaitResponse(uint32_t sequence, std::chrono::milliseconds timeout);

    // Next queued peer message; nullopt if nothing arrived within timeout.
    // Throws ProtocolError for an error status, SessionError(end_of_stream)
    // once the stream has ended and the queue is drained, or the stream error.
    std::optional<Message> receive(std::chrono::milliseconds timeout);

    // Dispatch loop. Runs until the peer sends unbind, the stream ends, or stop().
    // A stop() made while no loop runs ends the next one.
    // Throws SessionError(usage_error) unless a receiver-class bind was made.
    void listen();
    void stop();

    // An empty handler restores the default, which only logs.
    void setPushHandler(PushHandler handler);

    SessionState state() const;
    bool isReceiverCapable() const { return receiverCapable_; }

    uint32_t nextSequence();

    const MessageHistory& history() const { return history_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const SessionConfig& config() const { return config_; }

private:
    // receive(), optionally woken early by stop().
    std::optional<Message> take(std::chrono::milliseconds timeout, bool stoppable);

    void onFrame(std::vector<uint8_t> frame);
    void onStreamClosed(const boost::system::error_code& ec);
    void applyStateSetter(const Message& message);

    void onPushReceived(const Message& message);
    void onEnquireLinkReceived(const Message& message);
    bool reply(const Message& request, std::vector<uint8_t> body = {});

    Message exchange(Message message);

    const std::string               host_;
    const uint16_t                  port_;
    const SessionConfig             config_;
    std::unique_ptr<FrameTransport> transport_;

    // Guards state_, inbound_, streamEnded_, streamError_ and pushHandler_.
    mutable std::mutex        mutex_;
    std::condition_variable   inboundCv_;
    SessionState              state_{SessionState::Closed};
    std::deque<Message>       inbound_;
    bool                      streamEnded_{true};
    boost::system::error_code streamError_;
    PushHandler               pushHandler_;

    std::atomic<bool>     receiverCapable_{false};
    std::atomic<bool>     stopRequested_{false};
    std::atomic<uint32_t> sequenceCounter_{1};

    MessageHistory   history_;
    CorrelationTable correlation_;
};

} // namespace smppnet

#include "smppnet_session.h"
#include "smppnet_error.h"
#include "smppnet_status.h"
#include "smppnet_transport.h"

#include <iostream>

namespace smppnet {

namespace {

void defaultPushHandler(const Message& message) {
    std::cout << "[smppnet] Message received handler (should be overridden): "
              << commandName(message.command) << " sequence " << message.sequence << std::endl;
}

} // namespace

Session::Session(std::string host, uint16_t port, SessionConfig config)
    : Session(std::move(host), port, config, nullptr) {}

Session::Session(std::string host, uint16_t port, SessionConfig config, std::unique_ptr<FrameTransport> transport)
    : host_(std::move(host)),
      port_(port),
      config_(config),
      transport_(std::move(transport)),
      pushHandler_(defaultPushHandler) {
    if (!config_.isValid()) {
        throw SessionError(error::Code::invalid_argument, "invalid session configuration");
    }
    if (!transport_) transport_ = std::make_unique<TcpFrameTransport>(config_);
}

Session::~Session() {
    // The transport's threads call back into this object; stop them first.
    transport_.reset();
}

void Session::connect() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Closed) {
            throw SessionError(error::Code::usage_error, "session is already connected");
        }
    }
    if (config_.verbose) std::cout << "[smppnet] Connecting to " << host_ << ":" << port_ << "..." << std::endl;

    transport_->open(host_, port_);
    {
        std::lock_guard lock(mutex_);
        state_ = SessionState::Open;
        inbound_.clear();
        streamEnded_ = false;
        streamError_.clear();
    }
    transport_->start([this](std::vector<uint8_t> frame) { onFrame(std::move(frame)); },
                      [this](const boost::system::error_code& ec) { onStreamClosed(ec); });
}

void Session::disconnect() {
    if (config_.verbose) std::cout << "[smppnet] Disconnecting..." << std::endl;

    transport_->close();
    {
        std::lock_guard lock(mutex_);
        state_ = SessionState::Closed;
        streamEnded_ = true;
    }
    receiverCapable_ = false;
    inboundCv_.notify_all();
    correlation_.failAll(error::make_error_code(error::Code::not_connected));
}

Message Session::bind(BindMode mode, const BindParams& params) {
    Command command = bindCommand(mode);
    if (config_.receiverFlagPolicy == ReceiverFlagPolicy::Optimistic && isReceiverBind(command)) {
        receiverCapable_ = true;
    }

    Message response = exchange(Message(command, 0, encodeBindBody(params)));
    if (config_.verbose) {
        std::cout << "[smppnet] Bound (" << stateName(state()) << ") to '" << responseId(response) << "'" << std::endl;
    }
    return response;
}

Message Session::unbind() {
    return exchange(Message(Command::Unbind, 0));
}

Message Session::sendMessage(const SubmitParams& params) {
    return exchange(Message(Command::SubmitSm, 0, encodeSubmitBody(params)));
}

Message Session::enquireLink() {
    return exchange(Message(Command::EnquireLink, 0));
}

Message Session::exchange(Message message) {
    uint32_t sequence = sendRequest(message);
    return awaitResponse(sequence);
}

void Session::send(Message& message) {
    SessionState current = state();
    if (!isCommandPermitted(message.command, current)) {
        throw SessionError(error::Code::invalid_state,
                           std::string("Command ") + commandName(message.command) + " failed: " +
                               statusDescription(status::ESME_RINVBNDSTS) + " (state " + stateName(current) + ")");
    }

    std::vector<uint8_t> frame = encode(message);
    if (config_.verbose) {
        std::cout << "[smppnet] Sending " << commandName(message.command) << " PDU, sequence "
                  << message.sequence << std::endl;
    }
    if (config_.trace) {
        std::cout << "[smppnet] >> " << toHex(frame) << " " << frame.size() << " bytes" << std::endl;
    }
    history_.record(message);
    transport_->writeFrame(std::move(frame));
}

uint32_t Session::sendRequest(Message& request) {
    if (!request.isRequest()) {
        throw SessionError(error::Code::usage_error,
                           std::string(commandName(request.command)) + " is not a request");
    }
    if (request.sequence == 0) request.sequence = nextSequence();

    correlation_.expect(request.sequence, request.command);
    try {
        send(request);
    } catch (...) {
        correlation_.cancel(request.sequence);
        throw;
    }
    return request.sequence;
}

Message Session::awaitResponse(uint32_t sequence) {
    return awaitResponse(sequence, config_.responseTimeout);
}

Message Session::awaitResponse(uint32_t sequence, std::chrono::milliseconds timeout) {
    Message response = correlation_.wait(sequence, timeout);
    if (response.isError()) {
        throw ProtocolError(response.command, response.status);
    }
    return response;
}

std::optional<Message> Session::receive(std::chrono::milliseconds timeout) {
    return take(timeout, false);
}

std::optional<Message> Session::take(std::chrono::milliseconds timeout, bool stoppable) {
    std::unique_lock lock(mutex_);
    inboundCv_.wait_for(lock, timeout, [this, stoppable] {
        return !inbound_.empty() || streamEnded_ || (stoppable && stopRequested_);
    });

    if (!inbound_.empty()) {
        Message message = std::move(inbound_.front());
        inbound_.pop_front();
        lock.unlock();
        if (message.isError()) {
            throw ProtocolError(message.command, message.status);
        }
        return message;
    }
    if (streamEnded_) {
        if (streamError_) throw SessionError(streamError_, "receive");
        throw SessionError(error::Code::end_of_stream);
    }
    return std::nullopt;
}

void Session::listen() {
    if (!receiverCapable_) {
        throw SessionError(error::Code::usage_error,
                           "listen() is only allowed after a receiver or transceiver bind");
    }
    // A stop() issued before the loop started still applies; each stop ends one loop.
    struct StopReset {
        std::atomic<bool>& flag;
        ~StopReset() { flag = false; }
    } stopReset{stopRequested_};

    while (!stopRequested_) {
        std::optional<Message> message;
        try {
            message = take(config_.pollInterval, true);
        } catch (const ProtocolError& e) {
            std::cerr << "[smppnet] " << e.what() << std::endl;
            continue;
        } catch (const SessionError& e) {
            if (e.code() != error::Code::end_of_stream) throw;
            if (config_.verbose) std::cout << "[smppnet] Connection closed, leaving dispatch loop" << std::endl;
            return;
        }
        if (!message) continue;

        switch (message->command) {
            case Command::Unbind:
                if (config_.verbose) std::cout << "[smppnet] Unbind command received" << std::endl;
                return;
            case Command::DeliverSm:
            case Command::DataSm:
                onPushReceived(*message);
                break;
            case Command::EnquireLink:
                onEnquireLinkReceived(*message);
                break;
            default:
                std::cerr << "[smppnet] Unhandled SMPP command '" << commandName(message->command)
                          << "', sequence " << message->sequence << std::endl;
                break;
        }
    }
}

void Session::stop() {
    {
        std::lock_guard lock(mutex_);
        stopRequested_ = true;
    }
    inboundCv_.notify_all();
}

void Session::setPushHandler(PushHandler handler) {
    std::lock_guard lock(mutex_);
    pushHandler_ = handler ? std::move(handler) : PushHandler(defaultPushHandler);
}

SessionState Session::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t Session::nextSequence() {
    uint32_t current = sequenceCounter_.load();
    uint32_t next;
    do {
        next = nextSequenceAfter(current);
    } while (!sequenceCounter_.compare_exchange_weak(current, next));
    return current;
}

// Runs on the transport's read chain.
void Session::onFrame(std::vector<uint8_t> frame) {
    if (config_.trace) {
        std::cout << "[smppnet] << " << toHex(frame) << " " << frame.size() << " bytes" << std::endl;
    }

    Message message;
    try {
        message = decode(frame);
    } catch (const SessionError& e) {
        std::cerr << "[smppnet] Dropping PDU: " << e.what() << std::endl;
        return;
    }
    if (config_.verbose) {
        std::cout << "[smppnet] Read " << commandName(message.command) << " PDU, sequence "
                  << message.sequence << std::endl;
    }

    history_.record(message);
    applyStateSetter(message);

    if (message.isResponse() && correlation_.fulfil(message)) return;
    if (message.isResponse()) {
        std::cerr << "[smppnet] No request outstanding for " << commandName(message.command)
                  << " sequence " << message.sequence << std::endl;
    }

    // Nobody runs the dispatch loop without a receiver role; keep the link alive here.
    if (message.command == Command::EnquireLink && !receiverCapable_) {
        onEnquireLinkReceived(message);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (inbound_.size() >= config_.maxInbound) {
            const Message& oldest = inbound_.front();
            std::cerr << "[smppnet] Inbound queue full (" << config_.maxInbound << "), dropping "
                      << commandName(oldest.command) << " sequence " << oldest.sequence << std::endl;
            inbound_.pop_front();
        }
        inbound_.push_back(std::move(message));
    }
    inboundCv_.notify_all();
}

void Session::onStreamClosed(const boost::system::error_code& ec) {
    bool clean = ec == error::Code::end_of_stream;
    if (clean) {
        if (config_.verbose) std::cout << "[smppnet] Connection closed by peer" << std::endl;
    } else {
        std::cerr << "[smppnet] Connection lost: " << ec.message() << std::endl;
    }

    {
        std::lock_guard lock(mutex_);
        state_ = SessionState::Closed;
        streamEnded_ = true;
        if (!clean) streamError_ = ec;
    }
    receiverCapable_ = false;
    inboundCv_.notify_all();
    correlation_.failAll(ec);
}

void Session::applyStateSetter(const Message& message) {
    auto next = stateAfter(message.command);

    std::lock_guard lock(mutex_);
    if (!isCommandPermitted(message.command, state_)) {
        std::cerr << "[smppnet] Received " << commandName(message.command) << " in state "
                  << stateName(state_) << ", where it is not permitted" << std::endl;
        return;
    }
    if (!next || message.isError()) return;

    if (config_.verbose) {
        std::cout << "[smppnet] State " << stateName(state_) << " -> " << stateName(*next) << std::endl;
    }
    state_ = *next;
    if (state_ == SessionState::Open) {
        receiverCapable_ = false;
    } else if (isReceiverBind(message.command)) {
        receiverCapable_ = true;
    }
}

void Session::onPushReceived(const Message& message) {
    // Empty message_id.
    if (!reply(message, {0})) return;

    PushHandler handler;
    {
        std::lock_guard lock(mutex_);
        handler = pushHandler_;
    }
    handler(message);
}

void Session::onEnquireLinkReceived(const Message& message) {
    if (reply(message) && config_.verbose) {
        std::cout << "[smppnet] Link enquiry answered, sequence " << message.sequence << std::endl;
    }
}

// Answers a peer request through the same validation as any other send.
bool Session::reply(const Message& request, std::vector<uint8_t> body) {
    Message response = makeResponse(request, std::move(body));
    try {
        send(response);
    } catch (const SessionError& e) {
        if (e.code() != error::Code::invalid_state && e.code() != error::Code::not_connected) throw;
        std::cerr << "[smppnet] Cannot answer " << commandName(request.command) << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace smppnet

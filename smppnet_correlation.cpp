#include "smppnet_correlation.h"
#include "smppnet_error.h"

#include <string>

namespace smppnet {

void MessageHistory::record(const Message& message) {
    std::lock_guard lock(mutex_);
    entries_.push_back({message.sequence, message.direction(), message});
}

std::vector<HistoryEntry> MessageHistory::snapshot() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

std::size_t MessageHistory::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::optional<Message> MessageHistory::request(uint32_t sequence) const {
    return latest(sequence, Direction::Request);
}

std::optional<Message> MessageHistory::response(uint32_t sequence) const {
    return latest(sequence, Direction::Response);
}

std::optional<Message> MessageHistory::latest(uint32_t sequence, Direction direction) const {
    std::lock_guard lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->sequence == sequence && it->direction == direction) return it->message;
    }
    return std::nullopt;
}

void CorrelationTable::expect(uint32_t sequence, Command request) {
    std::lock_guard lock(mutex_);
    if (!pending_.emplace(sequence, Pending{request, std::nullopt, {}}).second) {
        throw SessionError(error::Code::usage_error,
                           "sequence " + std::to_string(sequence) + " already has a request outstanding");
    }
}

bool CorrelationTable::fulfil(const Message& response) {
    {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(response.sequence);
        if (it == pending_.end() || it->second.response) return false;
        if (response.command != Command::GenericNack && responseFor(it->second.request) != response.command) {
            return false;
        }
        it->second.response = response;
    }
    cv_.notify_all();
    return true;
}

Message CorrelationTable::wait(uint32_t sequence, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    auto it = pending_.find(sequence);
    if (it == pending_.end()) {
        throw SessionError(error::Code::usage_error,
                           "no request outstanding for sequence " + std::to_string(sequence));
    }
    // References into the map survive rehashing; only this waiter erases its entry.
    Pending& entry = it->second;
    auto ready = [&entry] { return entry.response.has_value() || entry.error; };

    if (timeout.count() > 0) {
        if (!cv_.wait_for(lock, timeout, ready)) {
            Command request = entry.request;
            pending_.erase(sequence);
            throw SessionError(error::Code::timeout,
                               std::string("no ") + commandName(request) + " response for sequence " +
                                   std::to_string(sequence) + " within " + std::to_string(timeout.count()) + " ms");
        }
    } else {
        cv_.wait(lock, ready);
    }

    if (entry.response) {
        Message response = std::move(*entry.response);
        pending_.erase(sequence);
        return response;
    }
    boost::system::error_code ec = entry.error;
    Command request = entry.request;
    pending_.erase(sequence);
    throw SessionError(ec, std::string("awaiting ") + commandName(request) + " response");
}

void CorrelationTable::cancel(uint32_t sequence) {
    std::lock_guard lock(mutex_);
    pending_.erase(sequence);
}

void CorrelationTable::failAll(const boost::system::error_code& ec) {
    {
        std::lock_guard lock(mutex_);
        for (auto& entry : pending_) {
            if (!entry.second.response) entry.second.error = ec;
        }
    }
    cv_.notify_all();
}

bool CorrelationTable::isOutstanding(uint32_t sequence) const {
    std::lock_guard lock(mutex_);
    return pending_.count(sequence) > 0;
}

std::size_t CorrelationTable::outstanding() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

} // namespace smppnet

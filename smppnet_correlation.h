#pragma once

#include "smppnet_message.h"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace smppnet {

struct HistoryEntry {
    uint32_t  sequence;
    Direction direction;
    Message   message;
};

// Append-only audit trail of every message sent or received by one session.
// Never consulted for control flow.
class MessageHistory {
public:
    void record(const Message& message);

    std::vector<HistoryEntry> snapshot() const;
    std::size_t size() const;

    // Most recent request / response recorded under a sequence number.
    std::optional<Message> request(uint32_t sequence) const;
    std::optional<Message> response(uint32_t sequence) const;

private:
    std::optional<Message> latest(uint32_t sequence, Direction direction) const;

    mutable std::mutex        mutex_;
    std::vector<HistoryEntry> entries_;
};

// Outstanding requests keyed by sequence number. The reader publishes each
// response to the caller blocked on its sequence.
class CorrelationTable {
public:
    // Throws SessionError(usage_error) if the sequence is already outstanding.
    void expect(uint32_t sequence, Command request);

    // Hands a response to its waiter. False when no request with that sequence
    // is outstanding or the command does not answer it (generic_nack answers any).
    bool fulfil(const Message& response);

    // Blocks until the response arrives; timeout 0 waits forever.
    // Throws SessionError(timeout), or the error passed to failAll().
    // The sequence is no longer outstanding once this returns or throws.
    Message wait(uint32_t sequence, std::chrono::milliseconds timeout);

    void cancel(uint32_t sequence);

    // Wakes every waiter with ec.
    void failAll(const boost::system::error_code& ec);

    bool isOutstanding(uint32_t sequence) const;
    std::size_t outstanding() const;

private:
    struct Pending {
        Command                   request;
        std::optional<Message>    response;
        boost::system::error_code error;
    };

    mutable std::mutex                     mutex_;
    std::condition_variable                cv_;
    std::unordered_map<uint32_t, Pending> pending_;
};

} // namespace smppnet

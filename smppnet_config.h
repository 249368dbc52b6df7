#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace smppnet {

// When a receiver-class bind grants the right to run the dispatch loop.
enum class ReceiverFlagPolicy {
    // Before the bind request is sent; stays set if the bind fails.
    Optimistic,
    // Only once a successful bind_receiver_resp / bind_transceiver_resp arrives.
    OnSuccess,
};

struct SessionConfig {
    std::chrono::milliseconds connectTimeout{5000};
    // 0 waits forever.
    std::chrono::milliseconds responseTimeout{10000};
    // Dispatch loop idle wait between polls.
    std::chrono::milliseconds pollInterval{100};
    // 0 disables; a stalled write closes the stream.
    std::chrono::milliseconds writeTimeout{5000};

    uint32_t    maxFrameLength{64 * 1024};
    std::size_t ioThreads{1};
    // Queued peer messages awaiting receive() / listen(); the oldest is dropped beyond this.
    std::size_t maxInbound{1024};

    ReceiverFlagPolicy receiverFlagPolicy{ReceiverFlagPolicy::Optimistic};

    bool verbose{false};
    // Hex dump of every frame sent and received.
    bool trace{false};

    bool isValid() const
    {
        return connectTimeout.count() > 0 &&
               responseTimeout.count() >= 0 &&
               pollInterval.count() > 0 &&
               writeTimeout.count() >= 0 &&
               maxFrameLength >= 16 &&
               ioThreads > 0 &&
               maxInbound > 0;
    }
};

} // namespace smppnet

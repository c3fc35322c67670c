#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "../Protocol/ProtocolTypes.hpp"

// Pending out-of-band updates for the outgoing stream. Polled by the merger
// right before each audio frame; nobody ever waits on it.
class ControlMessageQueue {
public:
    void Enqueue(ControlMessage message);

    // Removes and returns everything queued so far, oldest first.
    std::vector<ControlMessage> DrainPending();

    void Clear();
    bool Empty() const;

private:
    mutable std::mutex _mutex;
    std::deque<ControlMessage> _pending;
};

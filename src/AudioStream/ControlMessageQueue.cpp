#include "ControlMessageQueue.hpp"

#include <iterator>

void ControlMessageQueue::Enqueue(ControlMessage message) {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.push_back(std::move(message));
}

std::vector<ControlMessage> ControlMessageQueue::DrainPending() {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<ControlMessage> drained(std::make_move_iterator(_pending.begin()),
                                        std::make_move_iterator(_pending.end()));
    _pending.clear();
    return drained;
}

void ControlMessageQueue::Clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _pending.clear();
}

bool ControlMessageQueue::Empty() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _pending.empty();
}

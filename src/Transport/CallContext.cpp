#include "CallContext.hpp"

void CallContext::Cancel() {
    AbortHandler handler;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_cancelled.exchange(true)) {
            return;
        }
        handler = _abortHandler;
    }
    if (handler) {
        handler();
    }
}

void CallContext::SetAbortHandler(AbortHandler handler) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_cancelled) {
            _abortHandler = std::move(handler);
            return;
        }
    }
    if (handler) {
        handler();
    }
}

void CallContext::ClearAbortHandler() {
    std::lock_guard<std::mutex> lock(_mutex);
    _abortHandler = nullptr;
}

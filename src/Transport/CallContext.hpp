#pragma once

#include <atomic>
#include <functional>
#include <mutex>

// Transport-level cancellation for one remote call (or one streaming session,
// including its retry). Cancel() flips the flag and fires the abort hook the
// transport registered so a blocked call returns promptly.
class CallContext {
public:
    using AbortHandler = std::function<void()>;

    CallContext() : _cancelled(false) {}

    void Cancel();
    bool IsCancelled() const { return _cancelled; }

    // Runs the handler immediately if the context is already cancelled.
    void SetAbortHandler(AbortHandler handler);
    void ClearAbortHandler();

private:
    std::atomic<bool> _cancelled;
    std::mutex _mutex;
    AbortHandler _abortHandler;
};

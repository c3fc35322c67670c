#pragma once

#include <memory>
#include <string>

#include "../AudioStream/AudioBufferQueue.hpp"
#include "../AudioStream/ControlMessageQueue.hpp"
#include "../Transport/CallContext.hpp"

// State of one dictation attempt. Shared between the controller and the
// thread running its stream; never reused for a later attempt.
struct Session {
    Session(std::string session_id, Mode initial_mode)
        : id(std::move(session_id)),
          mode(initial_mode),
          call(std::make_shared<CallContext>()),
          rpcStarted(false) {}

    bool IsCancelled() const { return call->IsCancelled(); }

    const std::string id;
    Mode mode;                          // guarded by the controller mutex
    std::shared_ptr<CallContext> call;  // cancellation flag + transport abort
    AudioBufferQueue audio;
    ControlMessageQueue controls;
    bool rpcStarted;                    // guarded by the controller mutex
};

#pragma once

#include <deque>
#include <memory>

#include "Session.hpp"

// Produces the outbound sequence of a session: every pending control message
// goes out right before the next audio frame, so a control message never
// overtakes audio pushed before it and never waits behind audio pushed after
// it. Once the audio ends, whatever is still pending is flushed. Nothing more
// is emitted after cancellation.
class OutboundMerger {
public:
    explicit OutboundMerger(std::shared_ptr<Session> session);

    // Blocks while the session is open and no audio is queued.
    bool Next(OutboundItem& item);

private:
    enum class Phase {
        PullFrame,
        EmitControls,
        FlushControls,
        Done
    };

    void TakePending();

    std::shared_ptr<Session> _session;
    Phase _phase;
    std::deque<ControlMessage> _pending;
    AudioFrame _frame;
};

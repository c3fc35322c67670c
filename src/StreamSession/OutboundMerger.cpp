#include "OutboundMerger.hpp"
#include "../common/debug_log.hpp"

OutboundMerger::OutboundMerger(std::shared_ptr<Session> session)
    : _session(std::move(session)), _phase(Phase::PullFrame) {
}

bool OutboundMerger::Next(OutboundItem& item) {
    for (;;) {
        switch (_phase) {
            case Phase::PullFrame: {
                AudioFrame frame;
                if (!_session->audio.WaitNext(frame)) {
                    _phase = _session->IsCancelled() ? Phase::Done : Phase::FlushControls;
                    break;
                }
                if (_session->IsCancelled()) {
                    DEBUG_LOG("[OutboundMerger] Session " << _session->id << " cancelled, stopping");
                    _phase = Phase::Done;
                    break;
                }
                _frame = std::move(frame);
                TakePending();
                _phase = Phase::EmitControls;
                break;
            }

            case Phase::EmitControls:
                if (!_pending.empty()) {
                    item.emplace<ControlMessage>(std::move(_pending.front()));
                    _pending.pop_front();
                    return true;
                }
                item.emplace<AudioFrame>(std::move(_frame));
                _phase = Phase::PullFrame;
                return true;

            case Phase::FlushControls:
                if (_pending.empty()) {
                    TakePending();
                }
                if (_pending.empty()) {
                    _phase = Phase::Done;
                    break;
                }
                DEBUG_LOG("[OutboundMerger] Flushing control message after end of audio");
                item.emplace<ControlMessage>(std::move(_pending.front()));
                _pending.pop_front();
                return true;

            case Phase::Done:
                return false;
        }
    }
}

void OutboundMerger::TakePending() {
    for (auto& message : _session->controls.DrainPending()) {
        _pending.push_back(std::move(message));
    }
}

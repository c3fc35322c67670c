#include "StreamSessionController.hpp"
#include "OutboundMerger.hpp"
#include "../common/debug_log.hpp"

#include <stdexcept>

StreamSessionController::StreamSessionController(std::shared_ptr<RetryingRpcClient> rpc,
                                                 std::shared_ptr<IContextProvider> context_provider)
    : _rpc(std::move(rpc)),
      _context_provider(std::move(context_provider)),
      _state(State::Idle),
      _sampleRate(DEFAULT_SAMPLE_RATE) {
}

StreamSessionController::~StreamSessionController() {
    Cancel();

    std::shared_future<TranscriptResult> inflight;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        inflight = std::move(_inflight);
    }
    if (inflight.valid()) {
        inflight.wait();
    }
}

bool StreamSessionController::Initialize(Mode mode, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (_session && IsActive(_state)) {
        LOG_WARN("[StreamSessionController] Stream already in progress (" << _session->id << ")");
        return false;
    }

    auto session = std::make_shared<Session>(session_id, mode);
    session->audio.SetSampleRate(_sampleRate);
    session->audio.Open();

    _session = std::move(session);
    _state = State::Initialized;

    LOG_INFO("[StreamSessionController] Starting new interaction stream " << session_id
             << " in " << ModeToString(mode) << " mode");
    return true;
}

std::shared_future<TranscriptResult> StreamSessionController::StartRpc() {
    std::shared_future<TranscriptResult> previous;
    std::shared_future<TranscriptResult> current;
    {
        std::lock_guard<std::mutex> lock(_mutex);

        if (!_session) {
            throw std::logic_error("No session to stream");
        }
        if (_session->rpcStarted) {
            LOG_WARN("[StreamSessionController] Stream already started");
            throw std::logic_error("Stream already started");
        }
        if (_state != State::Initialized) {
            throw std::logic_error(std::string("Cannot start stream in state ") + StateToString(_state));
        }

        _session->rpcStarted = true;
        _state = State::Streaming;

        std::shared_ptr<Session> session = _session;
        current = std::async(std::launch::async, [this, session]() {
            return RunStream(session);
        }).share();

        previous = std::move(_inflight);
        _inflight = current;
    }
    // The previous session's worker may still be unwinding and needs _mutex.
    previous = std::shared_future<TranscriptResult>();
    return current;
}

void StreamSessionController::SetMode(Mode mode) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || _state != State::Streaming) {
            LOG_WARN("[StreamSessionController] Cannot change mode - no active stream");
            return;
        }
        _session->mode = mode;
        session = _session;
    }

    LOG_INFO("[StreamSessionController] Mode changed to " << ModeToString(mode));
    session->controls.Enqueue(ModeUpdate{mode});
}

void StreamSessionController::SendContextSnapshot() {
    std::shared_ptr<Session> session;
    Mode mode;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || (_state != State::Initialized && _state != State::Streaming)) {
            LOG_WARN("[StreamSessionController] Cannot send context - no active stream");
            return;
        }
        session = _session;
        mode = _session->mode;
    }

    try {
        ConfigSnapshot snapshot = _context_provider->GatherContext(mode);
        session->controls.Enqueue(std::move(snapshot));
        DEBUG_LOG("[StreamSessionController] Queued context snapshot for " << session->id);
    } catch (const std::exception& e) {
        LOG_ERROR("[StreamSessionController] Failed to gather context: " << e.what());
    }
}

void StreamSessionController::EndInteraction() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_session || _state != State::Streaming) {
            LOG_WARN("[StreamSessionController] No active stream to end");
            return;
        }
        _state = State::Ending;
        session = _session;
    }

    LOG_INFO("[StreamSessionController] Ending interaction stream " << session->id);
    session->audio.Close();
}

void StreamSessionController::Cancel() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state == State::Cancelled) {
            return;
        }
        if (!_session || !IsActive(_state)) {
            DEBUG_LOG("[StreamSessionController] No active stream to cancel");
            return;
        }
        _state = State::Cancelled;
        session = _session;
    }

    LOG_INFO("[StreamSessionController] Cancelling transcription " << session->id);
    session->call->Cancel();
    session->audio.Close();
}

void StreamSessionController::PushAudio(AudioFrame frame) {
    std::shared_ptr<Session> session = CurrentSession();
    if (session) {
        session->audio.Push(std::move(frame));
    }
}

void StreamSessionController::SetSampleRate(unsigned int sampleRate) {
    if (sampleRate == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _sampleRate = sampleRate;
    if (_session) {
        _session->audio.SetSampleRate(sampleRate);
    }
}

int64_t StreamSessionController::GetBufferedDurationMs() const {
    std::shared_ptr<Session> session = CurrentSession();
    return session ? session->audio.GetBufferedDurationMs() : 0;
}

std::vector<uint8_t> StreamSessionController::GetBufferedAudio() const {
    std::shared_ptr<Session> session = CurrentSession();
    return session ? session->audio.GetBufferedAudio() : std::vector<uint8_t>();
}

unsigned int StreamSessionController::GetSampleRate() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->audio.GetSampleRate() : _sampleRate;
}

StreamSessionController::State StreamSessionController::GetState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
}

Mode StreamSessionController::GetMode() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->mode : Mode::Transcribe;
}

std::string StreamSessionController::GetSessionId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session ? _session->id : std::string();
}

const char* StreamSessionController::StateToString(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::Initialized: return "Initialized";
        case State::Streaming: return "Streaming";
        case State::Ending: return "Ending";
        case State::Completed: return "Completed";
        case State::Cancelled: return "Cancelled";
        case State::Errored: return "Errored";
    }
    return "Unknown";
}

TranscriptResult StreamSessionController::RunStream(std::shared_ptr<Session> session) {
    OutboundMerger merger(session);
    IRemoteTransport::OutboundSource next = [&merger](OutboundItem& item) {
        return merger.Next(item);
    };

    try {
        TranscriptResponse response = _rpc->TranscribeStream(next, session->call);
        if (session->IsCancelled()) {
            throw RpcError(StatusCode::Cancelled, "Transcription cancelled");
        }

        TranscriptResult result;
        result.response = std::move(response);
        result.audio = session->audio.GetBufferedAudio();
        result.sampleRate = session->audio.GetSampleRate();

        FinishSession(session, State::Completed);
        LOG_INFO("[StreamSessionController] Stream " << session->id << " completed ("
                 << result.audio.size() << " bytes of audio)");
        return result;
    } catch (const RpcError& e) {
        if (e.IsCancelled() || session->IsCancelled()) {
            FinishSession(session, State::Cancelled);
            LOG_INFO("[StreamSessionController] Stream " << session->id << " cancelled: " << e.what());
        } else {
            FinishSession(session, State::Errored);
            LOG_ERROR("[StreamSessionController] Stream " << session->id << " failed ("
                      << StatusCodeToString(e.Code()) << "): " << e.what());
        }
        throw;
    } catch (const std::exception& e) {
        FinishSession(session, State::Errored);
        LOG_ERROR("[StreamSessionController] Stream " << session->id << " failed: " << e.what());
        throw;
    }
}

void StreamSessionController::FinishSession(const std::shared_ptr<Session>& session, State state) {
    // Late pushes for a finished session must not pile up.
    session->audio.Close();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_session == session && IsActive(_state)) {
        _state = state;
    }
}

std::shared_ptr<Session> StreamSessionController::CurrentSession() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session;
}

bool StreamSessionController::IsActive(State state) {
    return state == State::Initialized || state == State::Streaming || state == State::Ending;
}

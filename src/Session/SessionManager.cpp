#include "SessionManager.hpp"
#include "../common/RandomId.hpp"
#include "../common/debug_log.hpp"

#include <stdexcept>

SessionManager::SessionManager(std::shared_ptr<StreamSessionController> controller,
                               std::shared_ptr<ICaptureSource> capture,
                               std::shared_ptr<IContextProvider> context_provider,
                               std::shared_ptr<ITextInserter> inserter,
                               std::shared_ptr<IInteractionStore> store,
                               Options options)
    : _controller(std::move(controller)),
      _capture(std::move(capture)),
      _context_provider(std::move(context_provider)),
      _inserter(std::move(inserter)),
      _store(std::move(store)),
      _options(std::move(options)),
      _mode(Mode::Transcribe),
      _grammar("") {
    std::weak_ptr<StreamSessionController> weak = _controller;
    _capture->SetOnFrameCallback([weak](AudioFrame frame) {
        if (auto controller = weak.lock()) {
            controller->PushAudio(std::move(frame));
        }
    });
    _capture->SetOnConfigCallback([weak](unsigned int sampleRate) {
        if (auto controller = weak.lock()) {
            controller->SetSampleRate(sampleRate);
        }
    });
}

SessionManager::~SessionManager() {
    Cancel();
    JoinContextThread();
}

bool SessionManager::Start(Mode mode) {
    // One Start at a time; the check below and the thread handover must not
    // interleave with another caller's.
    std::lock_guard<std::mutex> startLock(_start_mutex);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_response.valid()) {
            LOG_WARN("[SessionManager] Session " << _interaction_id << " still in progress");
            return false;
        }
    }
    JoinContextThread();

    std::string id = GenerateRandomId();
    LOG_INFO("[SessionManager] Starting session " << id << " with mode: " << ModeToString(mode));

    if (!_controller->Initialize(mode, id)) {
        LOG_ERROR("[SessionManager] Failed to initialize stream controller");
        return false;
    }

    std::shared_future<TranscriptResult> response;
    try {
        response = _controller->StartRpc();
    } catch (const std::logic_error& e) {
        LOG_ERROR("[SessionManager] Failed to start stream: " << e.what());
        _controller->Cancel();
        return false;
    }

    if (!_capture->Start(_options.deviceId)) {
        LOG_ERROR("[SessionManager] Failed to start audio capture");
        _controller->Cancel();
        AwaitCancelled(response);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _response = response;
        _interaction_id = id;
        _mode = mode;
        _started_at = std::chrono::steady_clock::now();
        _grammar = GrammarRules("");
    }

    _controller->SetMode(mode);
    NotifyRecordingState(RecordingState::Started, mode);

    {
        std::lock_guard<std::mutex> lock(_thread_mutex);
        _context_thread = std::thread(&SessionManager::FetchAndSendContext, this);
    }
    return true;
}

void SessionManager::SetMode(Mode mode) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_response.valid()) {
            LOG_WARN("[SessionManager] No session to change mode for");
            return;
        }
        _mode = mode;
    }

    _controller->SetMode(mode);
    NotifyRecordingState(RecordingState::Started, mode);
}

void SessionManager::Cancel() {
    std::shared_future<TranscriptResult> response;
    Mode mode;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        response = std::move(_response);
        _response = std::shared_future<TranscriptResult>();
        mode = _mode;
    }
    if (!response.valid()) {
        return;
    }

    _controller->Cancel();
    _capture->Stop();
    NotifyRecordingState(RecordingState::Stopped, mode);
    AwaitCancelled(response);
}

SessionManager::Outcome SessionManager::Complete() {
    std::shared_future<TranscriptResult> response;
    std::string id;
    Mode mode;
    std::chrono::steady_clock::time_point startedAt;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        response = std::move(_response);
        _response = std::shared_future<TranscriptResult>();
        id = _interaction_id;
        mode = _mode;
        startedAt = _started_at;
    }
    if (!response.valid()) {
        LOG_WARN("[SessionManager] No session to complete");
        return Outcome::NoSession;
    }

    _capture->Stop();
    int64_t durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt).count();

    int64_t audioDurationMs = _controller->GetBufferedDurationMs();
    if (audioDurationMs < MINIMUM_AUDIO_DURATION_MS) {
        LOG_INFO("[SessionManager] Audio too short (" << audioDurationMs << "ms < "
                 << MINIMUM_AUDIO_DURATION_MS << "ms), cancelling");
        _controller->Cancel();
        NotifyRecordingState(RecordingState::Stopped, mode);
        AwaitCancelled(response);
        return Outcome::TooShort;
    }

    _controller->EndInteraction();
    NotifyRecordingState(RecordingState::Stopped, mode);

    LOG_INFO("[SessionManager] Waiting for stream response from server...");
    try {
        const TranscriptResult& result = response.get();
        DEBUG_LOG("[SessionManager] Received stream response: transcript " << result.response.transcript.size()
                  << " chars, error=" << (result.response.error ? "yes" : "no")
                  << ", audio " << result.audio.size() << " bytes");
        if (_options.grammarServiceEnabled) {
            // Grammar needs the cursor context fetched alongside the snapshot.
            JoinContextThread();
        }
        return HandleResponse(result, id, durationMs);
    } catch (const RpcError& e) {
        if (e.IsSessionInvalidated()) {
            LOG_ERROR("[SessionManager] Authentication expired, signing out: " << e.what());
        } else {
            LOG_ERROR("[SessionManager] Transcription failed (" << StatusCodeToString(e.Code()) << "): " << e.what());
        }
        if (!e.IsCancelled()) {
            PersistFailure(id, e.what(), durationMs);
        }
        return Outcome::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionManager] An unexpected error occurred during transcription: " << e.what());
        PersistFailure(id, e.what(), durationMs);
        return Outcome::Failed;
    }
}

int64_t SessionManager::GetBufferedDurationMs() const {
    return _controller->GetBufferedDurationMs();
}

std::string SessionManager::GetInteractionId() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _interaction_id;
}

void SessionManager::SetRecordingStateCallback(RecordingStateCallback cb) {
    std::lock_guard<std::mutex> lock(_mutex);
    _onRecordingState = std::move(cb);
}

const char* SessionManager::OutcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::NoSession: return "no session";
        case Outcome::TooShort: return "too short";
        case Outcome::Inserted: return "inserted";
        case Outcome::EmptyTranscript: return "empty transcript";
        case Outcome::RemoteError: return "remote error";
        case Outcome::Failed: return "failed";
    }
    return "unknown";
}

void SessionManager::FetchAndSendContext() {
    _controller->SendContextSnapshot();

    if (!_options.grammarServiceEnabled) {
        return;
    }

    try {
        std::string cursorContext = _context_provider->GetCursorContext(CURSOR_CONTEXT_LENGTH);
        std::lock_guard<std::mutex> lock(_mutex);
        _grammar = GrammarRules(std::move(cursorContext));
    } catch (const std::exception& e) {
        LOG_ERROR("[SessionManager] Failed to fetch cursor context: " << e.what());
    }
}

void SessionManager::JoinContextThread() {
    std::lock_guard<std::mutex> lock(_thread_mutex);
    if (_context_thread.joinable()) {
        _context_thread.join();
    }
}

SessionManager::Outcome SessionManager::HandleResponse(const TranscriptResult& result,
                                                       const std::string& id, int64_t durationMs) {
    const TranscriptResponse& response = result.response;

    InteractionRecord record;
    record.id = id;
    record.transcript = response.transcript;
    record.audio = result.audio;
    record.sampleRate = result.sampleRate;
    record.durationMs = durationMs;

    if (response.error) {
        LOG_ERROR("[SessionManager] Transcription error " << response.error->code << ": " << response.error->message);
        record.errorMessage = response.error->message;
        _store->CreateInteraction(record);
        return Outcome::RemoteError;
    }

    if (response.transcript.empty()) {
        LOG_WARN("[SessionManager] Skipping text insertion: empty transcript");
        return Outcome::EmptyTranscript;
    }

    std::string text = response.transcript;
    if (_options.grammarServiceEnabled) {
        std::lock_guard<std::mutex> lock(_mutex);
        text = _grammar.Apply(text);
    }

    if (!_inserter->InsertText(text)) {
        LOG_ERROR("[SessionManager] Text insertion failed");
    }
    _store->CreateInteraction(record);
    return Outcome::Inserted;
}

void SessionManager::PersistFailure(const std::string& id, const std::string& message, int64_t durationMs) {
    InteractionRecord record;
    record.id = id;
    record.audio = _controller->GetBufferedAudio();
    record.sampleRate = _controller->GetSampleRate();
    record.errorMessage = message;
    record.durationMs = durationMs;
    _store->CreateInteraction(record);
}

void SessionManager::AwaitCancelled(const std::shared_future<TranscriptResult>& response) {
    try {
        response.get();
    } catch (const RpcError& e) {
        if (e.IsCancelled()) {
            LOG_INFO("[SessionManager] Stream cancelled as expected: " << e.what());
        } else {
            LOG_WARN("[SessionManager] Stream ended with error while cancelling: " << e.what());
        }
    } catch (const std::exception& e) {
        LOG_WARN("[SessionManager] Stream ended with error while cancelling: " << e.what());
    }
}

void SessionManager::NotifyRecordingState(RecordingState state, Mode mode) {
    RecordingStateCallback cb;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        cb = _onRecordingState;
    }
    if (cb) {
        cb(state, mode);
    }
}

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "GrammarRules.hpp"
#include "../AudioCapture/ICaptureSource.hpp"
#include "../Context/IContextProvider.hpp"
#include "../Persistence/IInteractionStore.hpp"
#include "../StreamSession/StreamSessionController.hpp"
#include "../TextInsertion/ITextInserter.hpp"

// Drives one dictation attempt from hotkey down to text insertion: starts the
// stream and the microphone, and on completion decides between discarding,
// inserting and recording a failed attempt.
class SessionManager {
public:
    enum class RecordingState {
        Started,
        Stopped
    };

    enum class Outcome {
        NoSession,
        TooShort,
        Inserted,
        EmptyTranscript,
        RemoteError,
        Failed
    };

    struct Options {
        std::string deviceId;
        bool grammarServiceEnabled = false;
    };

    using RecordingStateCallback = std::function<void(RecordingState state, Mode mode)>;

    // Shorter utterances are treated as noise and never transcribed.
    static constexpr int64_t MINIMUM_AUDIO_DURATION_MS = 100;
    static constexpr size_t CURSOR_CONTEXT_LENGTH = 10;

    SessionManager(std::shared_ptr<StreamSessionController> controller,
                   std::shared_ptr<ICaptureSource> capture,
                   std::shared_ptr<IContextProvider> context_provider,
                   std::shared_ptr<ITextInserter> inserter,
                   std::shared_ptr<IInteractionStore> store,
                   Options options);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool Start(Mode mode);
    void SetMode(Mode mode);
    void Cancel();
    Outcome Complete();

    int64_t GetBufferedDurationMs() const;
    std::string GetInteractionId() const;

    void SetRecordingStateCallback(RecordingStateCallback cb);

    static const char* OutcomeToString(Outcome outcome);

private:
    void FetchAndSendContext();
    void JoinContextThread();

    Outcome HandleResponse(const TranscriptResult& result, const std::string& id, int64_t durationMs);
    void PersistFailure(const std::string& id, const std::string& message, int64_t durationMs);
    void AwaitCancelled(const std::shared_future<TranscriptResult>& response);
    void NotifyRecordingState(RecordingState state, Mode mode);

    std::shared_ptr<StreamSessionController> _controller;
    std::shared_ptr<ICaptureSource> _capture;
    std::shared_ptr<IContextProvider> _context_provider;
    std::shared_ptr<ITextInserter> _inserter;
    std::shared_ptr<IInteractionStore> _store;
    Options _options;

    mutable std::mutex _mutex;
    std::shared_future<TranscriptResult> _response;
    std::string _interaction_id;
    Mode _mode;
    std::chrono::steady_clock::time_point _started_at;
    GrammarRules _grammar;
    RecordingStateCallback _onRecordingState;

    std::mutex _start_mutex;
    std::mutex _thread_mutex;
    std::thread _context_thread;
};

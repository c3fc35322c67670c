#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Session.hpp"
#include "../Context/IContextProvider.hpp"
#include "../Rpc/RetryingRpcClient.hpp"

// Owns at most one active session and drives its bidirectional stream.
//
//   Idle -> Initialized -> Streaming -> Ending -> Completed
//                  \            \          \----> Cancelled | Errored
//                   \------------\--------------> Cancelled
//
// A new session can be initialized once the previous one reached Completed,
// Cancelled or Errored.
class StreamSessionController {
public:
    enum class State {
        Idle,
        Initialized,
        Streaming,
        Ending,
        Completed,
        Cancelled,
        Errored
    };

    StreamSessionController(std::shared_ptr<RetryingRpcClient> rpc,
                            std::shared_ptr<IContextProvider> context_provider);
    ~StreamSessionController();

    StreamSessionController(const StreamSessionController&) = delete;
    StreamSessionController& operator=(const StreamSessionController&) = delete;

    // Fails (returns false) while another session is Initialized or later and
    // not finished; the active session is left untouched.
    bool Initialize(Mode mode, const std::string& session_id);

    // Opens the stream on a worker thread. The future yields the result when
    // the remote side finalizes and throws RpcError on cancellation or failure.
    // Throws std::logic_error when called twice for a session or without one.
    std::shared_future<TranscriptResult> StartRpc();

    // Streaming only. Queues a mode-only update; audio is untouched.
    void SetMode(Mode mode);

    // Gathers context on the calling thread and queues it for the stream.
    // Never throws: gathering failures are logged.
    void SendContextSnapshot();

    // Streaming only. Closes the audio queue so the stream drains and completes.
    void EndInteraction();

    // Initialized, Streaming or Ending. Calling it again is a no-op.
    void Cancel();

    void PushAudio(AudioFrame frame);
    void SetSampleRate(unsigned int sampleRate);

    // Readable at any time, including after cancellation.
    int64_t GetBufferedDurationMs() const;
    std::vector<uint8_t> GetBufferedAudio() const;
    unsigned int GetSampleRate() const;

    State GetState() const;
    Mode GetMode() const;
    std::string GetSessionId() const;

    static const char* StateToString(State state);

private:
    TranscriptResult RunStream(std::shared_ptr<Session> session);
    void FinishSession(const std::shared_ptr<Session>& session, State state);
    std::shared_ptr<Session> CurrentSession() const;

    static bool IsActive(State state);

    std::shared_ptr<RetryingRpcClient> _rpc;
    std::shared_ptr<IContextProvider> _context_provider;

    mutable std::mutex _mutex;
    std::shared_ptr<Session> _session;
    std::shared_future<TranscriptResult> _inflight;
    State _state;
    unsigned int _sampleRate;
};

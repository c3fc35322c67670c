#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "../Protocol/ProtocolTypes.hpp"

// Outgoing audio for one session plus the retained copy of everything that
// was accepted (BufferedAudio). The capture callback pushes, the stream merger
// is the single consumer.
class AudioBufferQueue {
public:
    AudioBufferQueue();

    // Clears queued frames, BufferedAudio and the byte count, then accepts pushes.
    void Open();

    // Stops accepting frames and wakes the consumer. Frames already queued are
    // still handed out by WaitNext.
    void Close();

    bool IsOpen() const;

    // Appends to the queue and to BufferedAudio and wakes the waiting consumer.
    // Dropped silently while the queue is closed.
    void Push(AudioFrame frame);

    // Blocks until a frame is available or the queue is closed and empty.
    // Returns false once the sequence has ended.
    bool WaitNext(AudioFrame& frame);

    void SetSampleRate(unsigned int sampleRate);
    unsigned int GetSampleRate() const;

    // floor(bytes / bytesPerSample / sampleRate * 1000)
    int64_t GetBufferedDurationMs() const;
    uint64_t GetBufferedBytes() const;
    std::vector<uint8_t> GetBufferedAudio() const;
    void ClearBufferedAudio();

    size_t QueuedFrames() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _frameAvailable;
    std::deque<AudioFrame> _queue;
    std::vector<uint8_t> _bufferedAudio;
    uint64_t _bufferedBytes;
    unsigned int _sampleRate;
    bool _open;
};

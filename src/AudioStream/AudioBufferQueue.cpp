#include "AudioBufferQueue.hpp"

AudioBufferQueue::AudioBufferQueue()
    : _bufferedBytes(0), _sampleRate(DEFAULT_SAMPLE_RATE), _open(false) {
}

void AudioBufferQueue::Open() {
    std::lock_guard<std::mutex> lock(_mutex);
    _queue.clear();
    _bufferedAudio.clear();
    _bufferedBytes = 0;
    _open = true;
}

void AudioBufferQueue::Close() {
    std::lock_guard<std::mutex> lock(_mutex);
    _open = false;
    _frameAvailable.notify_all();
}

bool AudioBufferQueue::IsOpen() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _open;
}

void AudioBufferQueue::Push(AudioFrame frame) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_open) {
        return;
    }

    _bufferedAudio.insert(_bufferedAudio.end(), frame.data.begin(), frame.data.end());
    _bufferedBytes += frame.data.size();
    _queue.push_back(std::move(frame));

    // Only the merger ever waits here.
    _frameAvailable.notify_one();
}

bool AudioBufferQueue::WaitNext(AudioFrame& frame) {
    std::unique_lock<std::mutex> lock(_mutex);
    _frameAvailable.wait(lock, [this] { return !_queue.empty() || !_open; });

    if (_queue.empty()) {
        return false;
    }

    frame = std::move(_queue.front());
    _queue.pop_front();
    return true;
}

void AudioBufferQueue::SetSampleRate(unsigned int sampleRate) {
    if (sampleRate == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _sampleRate = sampleRate;
}

unsigned int AudioBufferQueue::GetSampleRate() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sampleRate;
}

int64_t AudioBufferQueue::GetBufferedDurationMs() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_sampleRate == 0) {
        return 0;
    }
    uint64_t bytesPerSecond = static_cast<uint64_t>(_sampleRate) * PCM_BYTES_PER_SAMPLE;
    return static_cast<int64_t>(_bufferedBytes * 1000 / bytesPerSecond);
}

uint64_t AudioBufferQueue::GetBufferedBytes() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _bufferedBytes;
}

std::vector<uint8_t> AudioBufferQueue::GetBufferedAudio() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _bufferedAudio;
}

void AudioBufferQueue::ClearBufferedAudio() {
    std::lock_guard<std::mutex> lock(_mutex);
    _bufferedAudio.clear();
}

size_t AudioBufferQueue::QueuedFrames() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

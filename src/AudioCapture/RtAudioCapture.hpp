#pragma once

#include <RtAudio.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "ICaptureSource.hpp"
#include "Resampler.hpp"

// Microphone capture: 16-bit mono, delivered buffer by buffer at the
// requested rate. Devices that cannot open that rate are converted.
class RtAudioCapture : public ICaptureSource {
public:
    explicit RtAudioCapture(unsigned int requested_rate = DEFAULT_SAMPLE_RATE);
    ~RtAudioCapture() override;

    void SetOnFrameCallback(FrameCallback cb) override;
    void SetOnConfigCallback(ConfigCallback cb) override;

    bool Start(const std::string& device_id) override;
    void Stop() override;

    // Prints every device with input channels.
    static void ListDevices(std::ostream& out);

private:
    struct CaptureData {
        std::atomic<bool> isRecording{false};
        unsigned int sampleRate = DEFAULT_SAMPLE_RATE;
        // Set while the device runs at a different rate.
        std::unique_ptr<Resampler> resampler;
        std::mutex callbackMutex;
        FrameCallback onFrame;
    };

    static int OnAudioBuffer(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                             double streamTime, RtAudioStreamStatus status, void* userData);

    bool SelectDevice(const std::string& device_id, unsigned int& deviceId);
    unsigned int PickSampleRate(const RtAudio::DeviceInfo& info) const;

    std::unique_ptr<RtAudio> _audio;
    CaptureData _data;
    ConfigCallback _onConfig;
    unsigned int _requested_rate;
    unsigned int _buffer_frames;
};

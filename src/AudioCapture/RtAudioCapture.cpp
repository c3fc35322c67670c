#include "RtAudioCapture.hpp"
#include "../common/debug_log.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>

int RtAudioCapture::OnAudioBuffer(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                                  double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    CaptureData* data = static_cast<CaptureData*>(userData);

    if (status) {
        DEBUG_LOG("[RtAudioCapture] Stream overflow detected!");
    }

    if (data->isRecording && inputBuffer) {
        AudioFrame frame;
        frame.sampleRate = data->sampleRate;
        if (data->resampler) {
            std::vector<int16_t> samples = data->resampler->Process(static_cast<const int16_t*>(inputBuffer),
                                                                    nBufferFrames);
            frame.data.resize(samples.size() * PCM_BYTES_PER_SAMPLE);
            std::memcpy(frame.data.data(), samples.data(), frame.data.size());
        } else {
            frame.data.resize(static_cast<size_t>(nBufferFrames) * PCM_BYTES_PER_SAMPLE);
            std::memcpy(frame.data.data(), inputBuffer, frame.data.size());
        }

        std::lock_guard<std::mutex> lock(data->callbackMutex);
        if (data->onFrame) {
            data->onFrame(std::move(frame));
        }
    }

    return 0;
}

RtAudioCapture::RtAudioCapture(unsigned int requested_rate)
    : _audio(std::make_unique<RtAudio>())
    , _requested_rate(requested_rate)
    , _buffer_frames(512) {
}

RtAudioCapture::~RtAudioCapture() {
    Stop();
}

void RtAudioCapture::SetOnFrameCallback(FrameCallback cb) {
    std::lock_guard<std::mutex> lock(_data.callbackMutex);
    _data.onFrame = std::move(cb);
}

void RtAudioCapture::SetOnConfigCallback(ConfigCallback cb) {
    _onConfig = std::move(cb);
}

bool RtAudioCapture::SelectDevice(const std::string& device_id, unsigned int& deviceId) {
    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        LOG_ERROR("[RtAudioCapture] No audio devices found");
        return false;
    }

    if (!device_id.empty()) {
        unsigned int wanted = 0;
        try {
            wanted = static_cast<unsigned int>(std::stoul(device_id));
        } catch (const std::exception&) {
            LOG_WARN("[RtAudioCapture] Invalid device id '" << device_id << "', using default input");
            wanted = 0;
        }
        for (unsigned int id : deviceIds) {
            if (id == wanted && _audio->getDeviceInfo(id).inputChannels > 0) {
                deviceId = id;
                return true;
            }
        }
        if (wanted != 0) {
            LOG_WARN("[RtAudioCapture] Device " << device_id << " has no input, using default input");
        }
    }

    deviceId = _audio->getDefaultInputDevice();
    if (_audio->getDeviceInfo(deviceId).inputChannels > 0) {
        return true;
    }

    DEBUG_LOG("[RtAudioCapture] Default device has no input channels! Searching for alternative...");
    for (unsigned int id : deviceIds) {
        if (_audio->getDeviceInfo(id).inputChannels > 0) {
            deviceId = id;
            return true;
        }
    }

    LOG_ERROR("[RtAudioCapture] No input devices found!");
    return false;
}

unsigned int RtAudioCapture::PickSampleRate(const RtAudio::DeviceInfo& info) const {
    for (unsigned int sr : info.sampleRates) {
        if (sr == _requested_rate) {
            return sr;
        }
    }
    DEBUG_LOG("[RtAudioCapture] " << _requested_rate << " not supported, using preferred rate: "
              << info.preferredSampleRate);
    return info.preferredSampleRate;
}

bool RtAudioCapture::Start(const std::string& device_id) {
    if (_audio->isStreamOpen()) {
        LOG_WARN("[RtAudioCapture] Capture already running");
        return false;
    }

    unsigned int deviceId = 0;
    if (!SelectDevice(device_id, deviceId)) {
        return false;
    }

    RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceId);
    unsigned int sampleRate = PickSampleRate(info);
    if (sampleRate == 0) {
        LOG_ERROR("[RtAudioCapture] " << info.name << " reports no usable sample rate");
        return false;
    }

    RtAudio::StreamParameters parameters;
    parameters.deviceId = deviceId;
    parameters.nChannels = 1;
    parameters.firstChannel = 0;

    unsigned int bufferFrames = _buffer_frames;
    _data.sampleRate = _requested_rate;
    _data.resampler.reset();
    if (sampleRate != _requested_rate) {
        _data.resampler = std::make_unique<Resampler>(sampleRate, _requested_rate);
        LOG_INFO("[RtAudioCapture] Converting " << sampleRate << " Hz to " << _requested_rate << " Hz");
    }

    DEBUG_LOG("[RtAudioCapture] Opening " << info.name << " at " << sampleRate << " Hz, SINT16");

    if (_audio->openStream(nullptr, &parameters, RTAUDIO_SINT16,
                           sampleRate, &bufferFrames, &RtAudioCapture::OnAudioBuffer, &_data)) {
        LOG_ERROR("[RtAudioCapture] Error opening stream: " << _audio->getErrorText());
        return false;
    }

    if (_onConfig) {
        _onConfig(_data.sampleRate);
    }

    _data.isRecording = true;
    if (_audio->startStream()) {
        LOG_ERROR("[RtAudioCapture] Error starting stream: " << _audio->getErrorText());
        _data.isRecording = false;
        if (_audio->isStreamOpen()) {
            _audio->closeStream();
        }
        return false;
    }

    LOG_INFO("[RtAudioCapture] Recording from " << info.name << " (" << sampleRate << " Hz)");
    return true;
}

void RtAudioCapture::Stop() {
    _data.isRecording = false;

    // stopStream drains the callback thread before returning.
    if (_audio->isStreamRunning()) {
        _audio->stopStream();
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
        DEBUG_LOG("[RtAudioCapture] Recording stopped.");
    }
}

void RtAudioCapture::ListDevices(std::ostream& out) {
    RtAudio audio;
    std::vector<unsigned int> deviceIds = audio.getDeviceIds();
    unsigned int defaultDevice = audio.getDefaultInputDevice();

    out << "Available input devices:" << std::endl;
    for (unsigned int id : deviceIds) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(id);
        if (info.inputChannels == 0) {
            continue;
        }
        out << "  " << id << ": " << info.name;
        if (id == defaultDevice) {
            out << " (default)";
        }
        out << std::endl << "     Input channels: " << info.inputChannels << ", sample rates:";
        for (unsigned int sr : info.sampleRates) {
            out << " " << sr;
        }
        out << std::endl;
    }
}

#pragma once

#include <functional>
#include <string>

#include "../Protocol/ProtocolTypes.hpp"

class ICaptureSource {
public:
    using FrameCallback = std::function<void(AudioFrame)>;
    using ConfigCallback = std::function<void(unsigned int sampleRate)>;

    virtual ~ICaptureSource() = default;

    // Called from the capture thread.
    virtual void SetOnFrameCallback(FrameCallback cb) = 0;
    // Reports the effective sample rate once the device is open.
    virtual void SetOnConfigCallback(ConfigCallback cb) = 0;

    // Empty device id selects the default input.
    virtual bool Start(const std::string& device_id) = 0;
    virtual void Stop() = 0;
};

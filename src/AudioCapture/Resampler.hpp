#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Linear-interpolation rate converter for a continuous 16-bit mono stream.
// The read position and the last input sample carry over between calls, so
// buffers of any size join without clicks or drift.
class Resampler {
public:
    Resampler(unsigned int inputRate, unsigned int outputRate);

    std::vector<int16_t> Process(const int16_t* input, size_t inputSamples);
    void Reset();

    unsigned int InputRate() const { return _input_rate; }
    unsigned int OutputRate() const { return _output_rate; }

private:
    unsigned int _input_rate;
    unsigned int _output_rate;
    double _step;
    // Read position; index 0 is the previous call's last sample once primed.
    double _position;
    int16_t _previous;
    bool _primed;
};

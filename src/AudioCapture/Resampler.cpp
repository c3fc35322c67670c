#include "Resampler.hpp"

#include <cmath>

Resampler::Resampler(unsigned int inputRate, unsigned int outputRate)
    : _input_rate(inputRate)
    , _output_rate(outputRate)
    , _step(static_cast<double>(inputRate) / static_cast<double>(outputRate))
    , _position(0.0)
    , _previous(0)
    , _primed(false) {
}

void Resampler::Reset() {
    _position = 0.0;
    _previous = 0;
    _primed = false;
}

std::vector<int16_t> Resampler::Process(const int16_t* input, size_t inputSamples) {
    if (_input_rate == _output_rate) {
        return std::vector<int16_t>(input, input + inputSamples);
    }
    if (inputSamples == 0) {
        return {};
    }

    const size_t offset = _primed ? 1 : 0;
    const size_t total = inputSamples + offset;
    auto sampleAt = [&](size_t index) -> double {
        return index < offset ? _previous : input[index - offset];
    };

    std::vector<int16_t> output;
    output.reserve(static_cast<size_t>(std::ceil(inputSamples / _step)) + 1);

    while (_position < static_cast<double>(total - 1)) {
        const size_t srcIndex0 = static_cast<size_t>(_position);
        const double t = _position - srcIndex0;
        const double value = sampleAt(srcIndex0) * (1.0 - t) + sampleAt(srcIndex0 + 1) * t;
        output.push_back(static_cast<int16_t>(std::lround(value)));
        _position += _step;
    }

    _position -= static_cast<double>(total - 1);
    _previous = input[inputSamples - 1];
    _primed = true;
    return output;
}

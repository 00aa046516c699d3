#include "audio/level_meter.hpp"

#include <algorithm>
#include <cmath>

float LevelMeter::rms(const int16_t* samples, std::size_t count) {
    if (!samples || count == 0) return 0.0f;

    double acc = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double x = static_cast<double>(samples[i]) / 32768.0;
        acc += x * x;
    }
    acc /= static_cast<double>(count);
    return static_cast<float>(std::sqrt(acc));
}

float LevelMeter::level(const int16_t* samples, std::size_t count) {
    return std::min(100.0f, rms(samples, count) * 200.0f);
}


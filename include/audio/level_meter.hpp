#ifndef LEVEL_METER_HPP
#define LEVEL_METER_HPP

#include <cstddef>
#include <cstdint>

class LevelMeter {
public:
    // RMS of int16 samples scaled to [0, 1].
    static float rms(const int16_t* samples, std::size_t count);

    // UI level in [0, 100]: rms * 200, clamped.
    static float level(const int16_t* samples, std::size_t count);
};

#endif

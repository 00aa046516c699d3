#include "audio/level_meter.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(LevelMeter, SilenceIsZero) {
    std::vector<int16_t> zeros(320, 0);
    EXPECT_FLOAT_EQ(LevelMeter::rms(zeros.data(), zeros.size()), 0.0f);
    EXPECT_FLOAT_EQ(LevelMeter::level(zeros.data(), zeros.size()), 0.0f);
    EXPECT_FLOAT_EQ(LevelMeter::level(nullptr, 0), 0.0f);
}

TEST(LevelMeter, ScalesRmsAndClampsAtHundred) {
    std::vector<int16_t> quarter(320, 8192);     // rms 0.25 -> 50
    EXPECT_NEAR(LevelMeter::level(quarter.data(), quarter.size()), 50.0f, 0.01f);

    std::vector<int16_t> full(320, 32767);
    EXPECT_FLOAT_EQ(LevelMeter::level(full.data(), full.size()), 100.0f);
}

#include "audio/silence_detector.hpp"

// Constructor
SilenceDetector::SilenceDetector(Config config) : config_(config) {}

void SilenceDetector::reset() {
    armed_ = true;
    silenceMs_ = 0;
}

bool SilenceDetector::feed(float level, int bufferMs) {
    if (level >= config_.threshold) {
        armed_ = true;
        silenceMs_ = 0;
        return false;
    }

    if (!armed_) return false;

    silenceMs_ += bufferMs;
    if (silenceMs_ >= config_.silenceMs) {
        armed_ = false;
        silenceMs_ = 0;
        return true;
    }
    return false;
}

#include "stt/utterance_segmenter.hpp"

#include <algorithm>
#include <cmath>

// Constructor
UtteranceSegmenter::UtteranceSegmenter(Config config) : config_(config) {
    samplesPerFrame_ = std::max(1, config_.sampleRate * config_.frameMs / 1000);
    frame_.reserve(samplesPerFrame_);
    preRoll_.reserve((config_.preRollMs * config_.sampleRate) / 1000);
}

void UtteranceSegmenter::reset(bool clearPreRoll) {
    listening_ = false;
    finished_ = false;
    speechMs_ = 0;
    silenceMs_ = 0;
    utterance_.clear();
    if (clearPreRoll) {
        preRoll_.clear();
        frame_.clear();
    }
}

int UtteranceSegmenter::utteranceMs() const {
    return static_cast<int>((1000ull * utterance_.size()) / static_cast<unsigned>(config_.sampleRate));
}

float UtteranceSegmenter::rms(const float* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

void UtteranceSegmenter::pushPreRoll(const float* x, int n) {
    const int maxPre = (config_.preRollMs * config_.sampleRate) / 1000;
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

bool UtteranceSegmenter::feed(const float* samples, std::size_t count) {
    bool closed = false;
    for (std::size_t i = 0; i < count; ++i) {
        frame_.push_back(samples[i]);
        if ((int)frame_.size() < samplesPerFrame_) continue;

        if (finished_) {
            // Segment is waiting to be collected; keep the audio as pre-roll.
            pushPreRoll(frame_.data(), samplesPerFrame_);
        } else if (feedFrame(frame_.data(), samplesPerFrame_)) {
            closed = true;
        }
        frame_.clear();
    }
    return closed;
}

bool UtteranceSegmenter::feedFrame(const float* x, int n) {
    const float r = rms(x, n);

    if (!listening_) {
        pushPreRoll(x, n);
        if (r >= config_.vadStartRms) {
            speechMs_ += config_.frameMs;
            if (speechMs_ >= config_.startHangMs) {
                listening_ = true;
                utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
                preRoll_.clear();
                silenceMs_ = 0;
            }
        } else {
            speechMs_ = 0;
        }
        return false;
    }

    utterance_.insert(utterance_.end(), x, x + n);

    if (r <= config_.vadStopRms) {
        silenceMs_ += config_.frameMs;
        if (silenceMs_ >= config_.stopHangMs) {
            finished_ = true;
            listening_ = false;
            return true;
        }
    } else {
        silenceMs_ = 0;
    }

    if (utteranceMs() >= config_.maxUtteranceMs) {
        finished_ = true;
        listening_ = false;
        return true;
    }
    return false;
}

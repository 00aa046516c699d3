#include "audio/audio_chunker.hpp"
#include "audio/level_meter.hpp"

#include <algorithm>
#include <stdexcept>

// Constructor
AudioChunker::AudioChunker(Config config) : config_(config) {
    if (config_.sampleRate == 0 || config_.channels == 0 || config_.chunkMs <= 0) {
        throw std::invalid_argument("AudioChunker: sample rate, channels and chunk length must be positive");
    }
    samplesPerChunk_ = static_cast<std::size_t>(config_.sampleRate) * config_.channels * config_.chunkMs / 1000;
    pending_.reserve(samplesPerChunk_);
}

void AudioChunker::reset() {
    paused_ = false;
    nextSequence_ = 0;
    startedAtMs_ = -1;
    pending_.clear();
}

void AudioChunker::pause() { paused_ = true; }

void AudioChunker::resume() { paused_ = false; }

std::vector<AudioChunk> AudioChunker::push(const int16_t* samples, std::size_t count, int64_t nowMs) {
    std::vector<AudioChunk> out;
    if (paused_ || !samples || count == 0) return out;

    std::size_t offset = 0;
    while (offset < count) {
        if (pending_.empty()) startedAtMs_ = nowMs;

        const std::size_t room = samplesPerChunk_ - pending_.size();
        const std::size_t n = std::min(room, count - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + n);
        offset += n;

        if (pending_.size() == samplesPerChunk_) out.push_back(take(startedAtMs_));
    }
    return out;
}

std::vector<AudioChunk> AudioChunker::flush(int64_t nowMs) {
    std::vector<AudioChunk> out;
    if (!pending_.empty()) out.push_back(take(startedAtMs_ >= 0 ? startedAtMs_ : nowMs));
    return out;
}

AudioChunk AudioChunker::take(int64_t timestampMs) {
    AudioChunk chunk;
    chunk.sequence = nextSequence_++;
    chunk.sampleRate = config_.sampleRate;
    chunk.channels = config_.channels;
    chunk.timestampMs = timestampMs;
    chunk.level = LevelMeter::level(pending_.data(), pending_.size());
    chunk.samples.swap(pending_);

    pending_.clear();
    pending_.reserve(samplesPerChunk_);
    startedAtMs_ = -1;
    return chunk;
}

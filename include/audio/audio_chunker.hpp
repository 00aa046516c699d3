#ifndef AUDIO_CHUNKER_HPP
#define AUDIO_CHUNKER_HPP

#include "audio/audio_chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Cuts the device stream into chunkMs slices. Sequence numbers increase by one
// per emitted chunk and are never reused within a run.
class AudioChunker {
public:
    struct Config {
        uint32_t sampleRate = 16000;
        uint16_t channels = 1;
        int chunkMs = 1000;
    };

    explicit AudioChunker(Config config);

    // Appends samples; returns the chunks completed by this call (usually zero or one).
    std::vector<AudioChunk> push(const int16_t* samples, std::size_t count, int64_t nowMs);

    // Emits the partially filled chunk, if any.
    std::vector<AudioChunk> flush(int64_t nowMs);

    // While paused, pushed samples are discarded and nothing is emitted.
    void pause();
    void resume();
    bool paused() const { return paused_; }

    uint32_t nextSequence() const { return nextSequence_; }
    std::size_t samplesPerChunk() const { return samplesPerChunk_; }

    void reset();

private:
    AudioChunk take(int64_t nowMs);

    Config config_;
    std::size_t samplesPerChunk_ = 0;

    bool paused_ = false;
    uint32_t nextSequence_ = 0;
    int64_t startedAtMs_ = -1;
    std::vector<int16_t> pending_;
};

#endif

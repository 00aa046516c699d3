#ifndef AUDIO_CHUNK_HPP
#define AUDIO_CHUNK_HPP

#include <cstdint>
#include <vector>

// Fixed-duration slice of mono PCM. Moved from the capture engine to the
// transport and dropped once sent.
struct AudioChunk {
    uint32_t sequence = 0;
    uint32_t sampleRate = 16000;
    uint16_t channels = 1;
    int64_t timestampMs = 0;
    float level = 0.0f;            // 0..100, for UI only; not sent on the wire
    std::vector<int16_t> samples;

    int durationMs() const {
        if (sampleRate == 0 || channels == 0) return 0;
        return static_cast<int>((1000ull * samples.size()) / (static_cast<uint64_t>(sampleRate) * channels));
    }
};

#endif

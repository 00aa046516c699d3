#ifndef RECOGNIZER_HPP
#define RECOGNIZER_HPP

#include "audio/audio_chunk.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// One recognizer output. Partial results for a segment may be revised until
// the recognizer emits the final result carrying the same segmentId.
struct RecognitionResult {
    uint64_t segmentId = 0;
    std::string text;
    bool isFinal = false;
};

// Streaming speech recognizer, one instance per session. Not thread-safe;
// the session worker calls it from a single thread.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    virtual void setLanguage(const std::string& language) = 0;

    // Consumes one chunk, returns whatever results it produced (possibly none).
    virtual std::vector<RecognitionResult> accept(const AudioChunk& chunk) = 0;

    // Turns the open segment, if any, into a final result.
    virtual std::vector<RecognitionResult> finish() = 0;

    // Drops any buffered audio without producing results.
    virtual void reset() = 0;
};

using RecognizerFactory = std::function<std::unique_ptr<Recognizer>()>;

#endif

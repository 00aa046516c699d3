#ifndef TRANSCRIPT_ACCUMULATOR_HPP
#define TRANSCRIPT_ACCUMULATOR_HPP

#include "stt/recognizer.hpp"

#include <cstdint>
#include <string>

// Running transcript for one session since the last question boundary.
// accumulatedText only grows by append, or is emptied as a whole.
class TranscriptionAccumulator {
public:
    // Applies one recognizer result. Returns false when the result was ignored:
    // a repeated final for a segment that was already confirmed, or a late
    // partial for one.
    bool apply(const RecognitionResult& result);

    const std::string& currentSegment() const { return currentSegment_; }
    const std::string& accumulatedText() const { return accumulatedText_; }

    // Confirmed text plus the open segment, as shown to the candidate.
    std::string displayText() const;

    // Copy of the confirmed transcript. The accumulator is unchanged, so a
    // failure while deciding the boundary leaves it intact.
    std::string snapshot() const { return accumulatedText_; }

    // Drops the confirmed transcript and the open segment in one step.
    void resetBoundary() noexcept;

    bool empty() const { return accumulatedText_.empty() && currentSegment_.empty(); }
    uint64_t confirmedSegments() const { return confirmedSegments_; }

private:
    std::string currentSegment_;
    std::string accumulatedText_;
    uint64_t lastFinalSegment_ = 0;
    uint64_t confirmedSegments_ = 0;
};

#endif

#include "pipeline/transcript_accumulator.hpp"
#include "util/text.hpp"

bool TranscriptionAccumulator::apply(const RecognitionResult& result) {
    // Segment ids only grow, so anything at or below the last final is stale.
    if (result.segmentId != 0 && result.segmentId <= lastFinalSegment_) return false;

    if (!result.isFinal) {
        currentSegment_ = trim(result.text);
        return true;
    }

    std::string next = accumulatedText_;
    appendSentence(next, result.text);

    accumulatedText_.swap(next);
    currentSegment_.clear();
    if (result.segmentId != 0) lastFinalSegment_ = result.segmentId;
    ++confirmedSegments_;
    return true;
}

std::string TranscriptionAccumulator::displayText() const {
    std::string out = accumulatedText_;
    appendSentence(out, currentSegment_);
    return out;
}

void TranscriptionAccumulator::resetBoundary() noexcept {
    accumulatedText_.clear();
    currentSegment_.clear();
}

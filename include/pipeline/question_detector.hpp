#ifndef QUESTION_DETECTOR_HPP
#define QUESTION_DETECTOR_HPP

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

// Decides, once per finalize, whether a frozen transcript holds a question
// worth answering. The returned event has id 0; the session assigns ids.
class QuestionBoundaryDetector {
public:
    // boundaryId identifies the finalize signal. A second call with the same or
    // an older boundaryId returns nullopt, so overlapping recognizer output for
    // one finalize can never produce two questions.
    std::optional<QuestionEvent> decide(uint64_t boundaryId, const std::string& snapshot);

    // Empty, or made only of acknowledgements ("okay", "thank you", "mm-hmm").
    static bool isFillerOnly(const std::string& text);

    static QuestionKind classify(const std::string& question);

    // Drops leading filler sentences ("Okay, great. So tell me...").
    static std::string extractQuestion(const std::string& snapshot);

    uint64_t lastBoundary() const { return lastBoundary_; }
    uint64_t questionsDetected() const { return detected_; }

private:
    uint64_t lastBoundary_ = 0;
    uint64_t detected_ = 0;
};

#endif

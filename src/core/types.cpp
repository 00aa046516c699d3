#include "core/types.hpp"

#include <chrono>

const char* questionKindName(QuestionKind kind) {
    switch (kind) {
        case QuestionKind::Behavioral:  return "behavioral";
        case QuestionKind::Technical:   return "technical";
        case QuestionKind::Situational: return "situational";
        case QuestionKind::General:     return "general";
    }
    return "general";
}

QuestionKind questionKindFromName(const std::string& name) {
    if (name == "behavioral") return QuestionKind::Behavioral;
    if (name == "technical") return QuestionKind::Technical;
    if (name == "situational") return QuestionKind::Situational;
    return QuestionKind::General;
}

const char* processingStateName(ProcessingState state) {
    switch (state) {
        case ProcessingState::Idle:         return "idle";
        case ProcessingState::Transcribing: return "transcribing";
        case ProcessingState::Detecting:    return "detecting";
        case ProcessingState::Generating:   return "generating";
    }
    return "idle";
}

int64_t nowUnixMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

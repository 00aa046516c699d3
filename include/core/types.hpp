#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

// Candidate background, read-only for the session.
struct StarStory {
    std::string id;
    std::string title;
    std::string situation;
    std::string task;
    std::string action;
    std::string result;
    std::vector<std::string> tags;
};

struct QaPair {
    std::string id;
    std::string question;
    std::string answer;
    std::string questionType;
};

struct ContextPayload {
    std::string resumeText;
    std::vector<StarStory> starStories;
    std::vector<std::string> talkingPoints;
    std::vector<QaPair> qaPairs;

    bool empty() const {
        return resumeText.empty() && starStories.empty() && talkingPoints.empty() && qaPairs.empty();
    }
};

enum class QuestionKind { Behavioral, Technical, Situational, General };

const char* questionKindName(QuestionKind kind);
// Unknown names map to General.
QuestionKind questionKindFromName(const std::string& name);

struct QuestionEvent {
    uint64_t id = 0;
    std::string text;
    QuestionKind kind = QuestionKind::General;
    std::string transcriptSnapshot;
};

struct AnswerRecord {
    uint64_t questionId = 0;
    std::string question;
    std::string answer;
    int64_t createdAtMs = 0;
    bool grounded = false;
    bool regenerated = false;
    std::string source;                  // "generated" or "uploaded"
    std::vector<std::string> storyIds;   // stories the answer was grounded on
};

enum class ProcessingState { Idle, Transcribing, Detecting, Generating };

const char* processingStateName(ProcessingState state);

// Milliseconds since the Unix epoch.
int64_t nowUnixMs();

#endif

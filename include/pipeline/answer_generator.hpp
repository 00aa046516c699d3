#ifndef ANSWER_GENERATOR_HPP
#define ANSWER_GENERATOR_HPP

#include "core/types.hpp"
#include "pipeline/context_store.hpp"
#include "pipeline/language_model.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Turns a question plus the session's context snapshot into an AnswerRecord.
//
// Grounding order:
//   1. an uploaded Q&A pair whose question matches closely is returned as is;
//   2. the most relevant STAR stories (tag and keyword overlap) ground the prompt;
//   3. without stories, resume text and talking points alone;
//   4. with no context at all, a generic STAR-shaped answer flagged ungrounded.
class AnswerGenerator {
public:
    struct Config {
        std::size_t maxStories = 2;
        double qaMatchThreshold = 0.8;
    };

    struct Request {
        QuestionEvent question;
        ContextStore::Snapshot context;
        bool regenerate = false;
    };

    AnswerGenerator(std::shared_ptr<LanguageModel> model, Config config);

    // Throws SessionError(GenerationFailure | GenerationTimeout) or GenerationCancelled.
    AnswerRecord generate(const Request& request, const GenerationControl& control) const;

    // Stories ordered by relevance, at most maxStories. Stories with no overlap
    // are skipped unless nothing else in the context can ground the answer.
    std::vector<StarStory> selectStories(const QuestionEvent& question, const ContextPayload& context) const;

    // Relevance of one story: 3 per tag found in the question, 1 per shared keyword.
    static int scoreStory(const std::string& question, const StarStory& story);

    const QaPair* matchQaPair(const std::string& question, const std::vector<QaPair>& pairs) const;

    static Prompt buildPrompt(const QuestionEvent& question, const ContextPayload& context,
                              const std::vector<StarStory>& stories);

    const LanguageModel& model() const { return *model_; }

private:
    std::shared_ptr<LanguageModel> model_;
    Config config_;
};

#endif

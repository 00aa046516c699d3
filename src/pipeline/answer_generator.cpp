#include "pipeline/answer_generator.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <sstream>

namespace {

const char* kTag = "Answer Generator";

const char* kSystemPrompt =
    "You are an interview coaching assistant. Your job is to help the candidate answer "
    "interview questions effectively.\n\n"
    "Based on the candidate's background information (resume, STAR stories, talking points), "
    "generate a concise, natural-sounding answer that:\n"
    "1. Directly addresses the question\n"
    "2. Uses specific examples from their experience when relevant\n"
    "3. Follows the STAR format for behavioral questions\n"
    "4. Is conversational and authentic, not robotic\n"
    "5. Can be delivered in about 1-2 minutes\n\n"
    "Answer in short bullet points. The candidate will use this as a guide, not read it verbatim.";

// Word match that tolerates simple inflection ("conflict" / "conflicts", "lead" / "leading").
bool wordMatches(const std::string& a, const std::string& b) {
    if (a == b) return true;
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return shorter.size() >= 4 && longer.compare(0, shorter.size(), shorter) == 0;
}

bool tagInQuestion(const std::vector<std::string>& questionTokens, const std::string& tag) {
    const std::vector<std::string> tagTokens = tokenize(tag);
    if (tagTokens.empty()) return false;
    for (const auto& t : tagTokens) {
        const bool found = std::any_of(questionTokens.begin(), questionTokens.end(),
                                       [&](const std::string& w) { return wordMatches(w, t); });
        if (!found) return false;
    }
    return true;
}

std::string storyText(const StarStory& s) {
    return s.title + " " + s.situation + " " + s.task + " " + s.action + " " + s.result;
}

} // namespace

// Constructor
AnswerGenerator::AnswerGenerator(std::shared_ptr<LanguageModel> model, Config config)
    : model_(std::move(model)), config_(config) {
    if (!model_) throw std::invalid_argument("AnswerGenerator needs a language model");
}

int AnswerGenerator::scoreStory(const std::string& question, const StarStory& story) {
    const std::vector<std::string> questionTokens = tokenize(question);

    int score = 0;
    for (const auto& tag : story.tags) {
        if (tagInQuestion(questionTokens, tag)) score += 3;
    }

    const std::set<std::string> questionWords = contentWords(question);
    for (const auto& w : contentWords(storyText(story))) {
        const bool shared = std::any_of(questionWords.begin(), questionWords.end(),
                                        [&](const std::string& q) { return wordMatches(q, w); });
        if (shared) ++score;
    }
    return score;
}

std::vector<StarStory> AnswerGenerator::selectStories(const QuestionEvent& question,
                                                      const ContextPayload& context) const {
    std::vector<StarStory> selected;
    if (context.starStories.empty() || config_.maxStories == 0) return selected;

    std::vector<int> scores;
    scores.reserve(context.starStories.size());
    for (const auto& story : context.starStories) scores.push_back(scoreStory(question.text, story));

    std::vector<std::size_t> order(context.starStories.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

    for (std::size_t idx : order) {
        if (selected.size() >= config_.maxStories) break;
        if (scores[idx] <= 0) break;
        selected.push_back(context.starStories[idx]);
    }

    // Nothing relevant: a behavioral question still wants a story, and so does
    // a context that has nothing but stories.
    const bool onlyStories = context.resumeText.empty() && context.talkingPoints.empty();
    if (selected.empty() && (question.kind == QuestionKind::Behavioral || onlyStories)) {
        selected.push_back(context.starStories[order.front()]);
    }
    return selected;
}

const QaPair* AnswerGenerator::matchQaPair(const std::string& question, const std::vector<QaPair>& pairs) const {
    const std::string normalized = normalizeText(question);
    const std::set<std::string> words = contentWords(question);

    const QaPair* best = nullptr;
    double bestScore = 0.0;
    for (const auto& pair : pairs) {
        if (normalizeText(pair.question) == normalized) return &pair;

        const double score = jaccard(words, contentWords(pair.question));
        if (score > bestScore) {
            bestScore = score;
            best = &pair;
        }
    }
    return bestScore >= config_.qaMatchThreshold ? best : nullptr;
}

Prompt AnswerGenerator::buildPrompt(const QuestionEvent& question, const ContextPayload& context,
                                    const std::vector<StarStory>& stories) {
    Prompt prompt;
    prompt.system = kSystemPrompt;
    prompt.question = question.text;
    prompt.kind = question.kind;
    prompt.stories = stories;
    prompt.resumeText = context.resumeText;
    prompt.talkingPoints = context.talkingPoints;

    std::vector<std::string> parts;
    if (!context.resumeText.empty()) parts.push_back("RESUME:\n" + context.resumeText);

    if (!stories.empty()) {
        std::ostringstream s;
        s << "STAR STORIES (most relevant first):";
        for (const auto& story : stories) {
            s << "\n\nStory: " << (story.title.empty() ? "Untitled" : story.title)
              << "\nSituation: " << story.situation
              << "\nTask: " << story.task
              << "\nAction: " << story.action
              << "\nResult: " << story.result;
        }
        parts.push_back(s.str());
    }

    if (!context.talkingPoints.empty()) {
        std::string points = "KEY TALKING POINTS:";
        for (const auto& p : context.talkingPoints) points += "\n- " + p;
        parts.push_back(points);
    }

    std::string background;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) background += "\n\n---\n\n";
        background += parts[i];
    }
    if (background.empty()) background = "No specific context provided.";

    prompt.user = "CANDIDATE BACKGROUND:\n" + background +
                  "\n\nINTERVIEW QUESTION (" + questionKindName(question.kind) + "):\n" + question.text +
                  "\n\nGenerate a suggested answer:";
    return prompt;
}

AnswerRecord AnswerGenerator::generate(const Request& request, const GenerationControl& control) const {
    const ContextPayload empty;
    const ContextPayload& context = request.context ? *request.context : empty;

    AnswerRecord record;
    record.questionId = request.question.id;
    record.question = request.question.text;
    record.regenerated = request.regenerate;

    if (control.cancel.cancelled()) throw GenerationCancelled();

    if (const QaPair* match = matchQaPair(request.question.text, context.qaPairs)) {
        Log::info(kTag, "Using uploaded Q&A pair (ID: " + match->id + ")");
        record.answer = match->answer;
        record.source = "uploaded";
        record.grounded = true;
        record.createdAtMs = nowUnixMs();
        return record;
    }

    const std::vector<StarStory> stories = selectStories(request.question, context);
    const Prompt prompt = buildPrompt(request.question, context, stories);

    const auto started = std::chrono::steady_clock::now();
    std::string text;
    try {
        text = model_->complete(prompt, control);
    } catch (const GenerationCancelled&) {
        throw;
    } catch (const SessionError&) {
        throw;
    } catch (const std::exception& e) {
        throw SessionError(ErrorKind::GenerationFailure, std::string("model error: ") + e.what());
    }

    if (control.cancel.cancelled()) throw GenerationCancelled();
    if (control.expired()) throw SessionError(ErrorKind::GenerationTimeout, "answer generation timed out");

    text = trim(text);
    if (text.empty()) throw SessionError(ErrorKind::GenerationFailure, "model returned an empty answer");

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    Log::info(kTag, "Generated " + std::to_string(text.size()) + " chars with " + model_->name() +
                        " in " + std::to_string(elapsed) + "ms (" + std::to_string(stories.size()) + " stories)");

    record.answer = text;
    record.source = "generated";
    record.grounded = !stories.empty() || !context.resumeText.empty() || !context.talkingPoints.empty();
    for (const auto& s : stories) record.storyIds.push_back(s.id);
    record.createdAtMs = nowUnixMs();
    return record;
}

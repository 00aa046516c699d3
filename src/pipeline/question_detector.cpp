#include "pipeline/question_detector.hpp"
#include "util/text.hpp"

#include <set>
#include <vector>

namespace {

const std::set<std::string>& fillerWords() {
    static const std::set<std::string> words = {
        "ok", "okay", "yeah", "yes", "yep", "yup", "no", "nope", "right", "sure", "mhm", "mm",
        "mmhmm", "hmm", "uh", "um", "uhm", "ah", "oh", "so", "alright", "all", "great", "good",
        "cool", "nice", "thanks", "thank", "you", "got", "it", "i", "see", "perfect", "awesome",
        "sounds", "understood", "absolutely", "exactly", "well", "hi", "hello", "makes", "sense",
        "that", "thats", "interesting", "wow", "hmmm", "uhh", "umm", "like", "and", "gotcha", "fine"};
    return words;
}

bool containsPhrase(const std::string& normalized, const char* phrase) {
    return (" " + normalized + " ").find(" " + std::string(phrase) + " ") != std::string::npos;
}

bool containsAny(const std::string& normalized, const std::vector<const char*>& phrases) {
    for (const char* p : phrases) {
        if (containsPhrase(normalized, p)) return true;
    }
    return false;
}

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (char c : text) {
        current += c;
        if (c == '.' || c == '?' || c == '!') {
            out.push_back(trim(current));
            current.clear();
        }
    }
    if (!trim(current).empty()) out.push_back(trim(current));
    return out;
}

} // namespace

bool QuestionBoundaryDetector::isFillerOnly(const std::string& text) {
    for (const auto& token : tokenize(text)) {
        if (!fillerWords().count(token)) return false;
    }
    return true;
}

QuestionKind QuestionBoundaryDetector::classify(const std::string& question) {
    const std::string q = normalizeText(question);

    static const std::vector<const char*> behavioral = {
        "tell me about a time", "describe a time", "give me an example", "give an example",
        "have you ever", "a situation where", "a time when", "a time you", "tell me about yourself",
        "walk me through your", "greatest strength", "greatest weakness", "your strengths",
        "your weaknesses", "biggest challenge", "proudest", "conflict", "disagreement", "failure",
        "failed", "mistake", "led a team", "lead a team"};
    static const std::vector<const char*> situational = {
        "what would you do", "how would you handle", "how would you deal", "how would you approach",
        "how would you respond", "imagine", "suppose", "what if", "if you were", "if you had to"};
    static const std::vector<const char*> technical = {
        "design", "implement", "algorithm", "complexity", "architecture", "how does", "how do you build",
        "how would you build", "explain how", "trade offs", "tradeoffs", "trade off", "database",
        "sql", "nosql", "cache", "caching", "api", "scale", "scalability", "latency", "debug",
        "code", "data structure", "concurrency", "thread", "distributed", "protocol"};

    if (containsAny(q, behavioral)) return QuestionKind::Behavioral;
    if (containsAny(q, situational)) return QuestionKind::Situational;
    if (containsAny(q, technical)) return QuestionKind::Technical;
    return QuestionKind::General;
}

std::string QuestionBoundaryDetector::extractQuestion(const std::string& snapshot) {
    const std::vector<std::string> sentences = splitSentences(snapshot);

    std::size_t first = 0;
    while (first < sentences.size() && isFillerOnly(sentences[first])) ++first;

    std::string out;
    for (std::size_t i = first; i < sentences.size(); ++i) appendSentence(out, sentences[i]);
    return out;
}

std::optional<QuestionEvent> QuestionBoundaryDetector::decide(uint64_t boundaryId, const std::string& snapshot) {
    if (boundaryId <= lastBoundary_) return std::nullopt;
    lastBoundary_ = boundaryId;

    if (isFillerOnly(snapshot)) return std::nullopt;

    const std::string question = extractQuestion(snapshot);
    if (question.empty()) return std::nullopt;

    ++detected_;
    QuestionEvent event;
    event.text = question;
    event.kind = classify(question);
    event.transcriptSnapshot = snapshot;
    return event;
}

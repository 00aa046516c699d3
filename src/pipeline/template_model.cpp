#include "pipeline/language_model.hpp"
#include "util/text.hpp"

#include <sstream>

namespace {

std::string firstSentence(const std::string& text) {
    const std::string t = trim(text);
    const auto end = t.find_first_of(".!?\n");
    return trim(end == std::string::npos ? t : t.substr(0, end + 1));
}

void bullet(std::ostringstream& out, const char* label, const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return;
    out << "- " << label << ": " << t << "\n";
}

} // namespace

std::string TemplateLanguageModel::complete(const Prompt& prompt, const GenerationControl& control) {
    if (control.cancel.cancelled()) throw GenerationCancelled();

    std::ostringstream out;

    if (!prompt.stories.empty()) {
        const StarStory& story = prompt.stories.front();
        if (!story.title.empty()) out << "Use your story \"" << story.title << "\".\n";
        bullet(out, "Situation", story.situation);
        bullet(out, "Task", story.task);
        bullet(out, "Action", story.action);
        bullet(out, "Result", story.result);
        for (std::size_t i = 1; i < prompt.stories.size(); ++i) {
            bullet(out, "Backup example", prompt.stories[i].title);
        }
    } else if (!prompt.resumeText.empty() || !prompt.talkingPoints.empty()) {
        bullet(out, "Open with", firstSentence(prompt.resumeText));
        for (const auto& point : prompt.talkingPoints) bullet(out, "Key point", point);
        bullet(out, "Close", "Connect this experience back to: " + prompt.question);
    } else if (prompt.kind == QuestionKind::Technical) {
        out << "- Clarify: restate the problem and confirm requirements and constraints.\n"
            << "- Approach: outline a simple working design first.\n"
            << "- Trade-offs: discuss performance, cost and failure modes of the choices.\n"
            << "- Wrap up: summarise the design and what you would improve next.\n";
    } else {
        out << "- Situation: briefly set the scene and who was involved.\n"
            << "- Task: state what you were responsible for.\n"
            << "- Action: walk through the specific steps you took.\n"
            << "- Result: share the measurable outcome and what you learned.\n";
    }

    if (control.cancel.cancelled()) throw GenerationCancelled();
    return trim(out.str());
}

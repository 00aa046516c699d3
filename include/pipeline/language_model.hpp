#ifndef LANGUAGE_MODEL_HPP
#define LANGUAGE_MODEL_HPP

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Shared cancel flag. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct GenerationControl {
    CancelToken cancel;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();

    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

// Thrown when a generation was cancelled because its session closed.
class GenerationCancelled : public std::runtime_error {
public:
    GenerationCancelled() : std::runtime_error("generation cancelled") {}
};

// Everything a model needs: the rendered prompt, and the grounding material
// it was rendered from.
struct Prompt {
    std::string system;
    std::string user;

    std::string question;
    QuestionKind kind = QuestionKind::General;
    std::vector<StarStory> stories;          // most relevant first
    std::string resumeText;
    std::vector<std::string> talkingPoints;
};

// Answer-generation service. Implementations should poll control.cancel and
// control.deadline during long calls; they report failures by throwing.
// A call abandoned at its deadline may still be running when the next one
// starts, so complete() must be safe to call concurrently.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    virtual std::string name() const = 0;
    virtual std::string complete(const Prompt& prompt, const GenerationControl& control) = 0;
};

// Offline model: renders a STAR-shaped bullet answer straight from the
// grounding material, or a generic skeleton when there is none.
class TemplateLanguageModel : public LanguageModel {
public:
    std::string name() const override { return "template"; }
    std::string complete(const Prompt& prompt, const GenerationControl& control) override;
};

#endif

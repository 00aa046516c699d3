#ifndef WHISPER_RECOGNIZER_HPP
#define WHISPER_RECOGNIZER_HPP

#include "stt/recognizer.hpp"
#include "stt/utterance_segmenter.hpp"

#include <memory>
#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;

// Loaded whisper.cpp model, shared by every session. Each recognizer keeps
// its own whisper_state so sessions decode in parallel.
class WhisperModel {
public:
    explicit WhisperModel(const std::string& modelPath, bool useGpu = false);
    ~WhisperModel();

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    whisper_context* context() const { return context_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    whisper_context* context_ = nullptr;
};

class WhisperRecognizer : public Recognizer {
public:
    struct Config {
        std::string language = "en";
        int threads = 4;
        int partialIntervalMs = 1000;    // re-decode the open segment this often
        float noSpeechThreshold = 0.6f;
        UtteranceSegmenter::Config segmenter;
    };

    WhisperRecognizer(std::shared_ptr<WhisperModel> model, Config config);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    void setLanguage(const std::string& language) override;
    std::vector<RecognitionResult> accept(const AudioChunk& chunk) override;
    std::vector<RecognitionResult> finish() override;
    void reset() override;

private:
    std::string transcribe(const std::vector<float>& pcm16kMono);
    std::vector<float> toMono16k(const AudioChunk& chunk) const;

    std::shared_ptr<WhisperModel> model_;
    Config config_;
    whisper_state* state_ = nullptr;

    UtteranceSegmenter segmenter_;
    uint64_t segmentId_ = 1;
    int sinceLastPartialMs_ = 0;
    std::string lastPartial_;
};

#endif

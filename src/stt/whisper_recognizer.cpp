#include "stt/whisper_recognizer.hpp"
#include "util/log.hpp"
#include "util/text.hpp"

#include <whisper.h>

#include <algorithm>
#include <stdexcept>

namespace {

const char* kTag = "Whisper STT";
constexpr int kWhisperRate = 16000;

} // namespace

// Constructor
WhisperModel::WhisperModel(const std::string& modelPath, bool useGpu) : path_(modelPath) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = useGpu;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + modelPath);
    Log::info(kTag, "Model loaded: " + modelPath);
}

// Destructor
WhisperModel::~WhisperModel() {
    if (context_) whisper_free(context_);
}

// Constructor
WhisperRecognizer::WhisperRecognizer(std::shared_ptr<WhisperModel> model, Config config)
    : model_(std::move(model)), config_(std::move(config)), segmenter_(config_.segmenter) {
    if (!model_ || !model_->context()) throw std::invalid_argument("WhisperRecognizer needs a loaded model");

    state_ = whisper_init_state(model_->context());
    if (!state_) throw std::runtime_error("whisper_init_state failed");
}

// Destructor
WhisperRecognizer::~WhisperRecognizer() {
    if (state_) whisper_free_state(state_);
}

void WhisperRecognizer::setLanguage(const std::string& language) {
    config_.language = language.empty() ? "en" : language;
}

void WhisperRecognizer::reset() {
    segmenter_.reset(true);
    sinceLastPartialMs_ = 0;
    lastPartial_.clear();
}

std::vector<float> WhisperRecognizer::toMono16k(const AudioChunk& chunk) const {
    const std::size_t channels = chunk.channels ? chunk.channels : 1;
    const std::size_t frames = chunk.samples.size() / channels;

    std::vector<float> mono(frames);
    for (std::size_t f = 0; f < frames; ++f) {
        float acc = 0.0f;
        for (std::size_t c = 0; c < channels; ++c) acc += (float)chunk.samples[f * channels + c] / 32768.0f;
        mono[f] = acc / (float)channels;
    }

    if (chunk.sampleRate == kWhisperRate || mono.empty()) return mono;

    // Linear resample to 16 kHz
    const double ratio = (double)chunk.sampleRate / kWhisperRate;
    const std::size_t outFrames = (std::size_t)((double)frames / ratio);
    std::vector<float> out(outFrames);
    for (std::size_t i = 0; i < outFrames; ++i) {
        const double pos = i * ratio;
        const std::size_t i0 = (std::size_t)pos;
        const std::size_t i1 = std::min(i0 + 1, frames - 1);
        const float t = (float)(pos - (double)i0);
        out[i] = mono[i0] * (1.0f - t) + mono[i1] * t;
    }
    return out;
}

std::vector<RecognitionResult> WhisperRecognizer::accept(const AudioChunk& chunk) {
    std::vector<RecognitionResult> results;

    const std::vector<float> pcm = toMono16k(chunk);
    const bool closed = segmenter_.feed(pcm.data(), pcm.size());
    sinceLastPartialMs_ += chunk.durationMs();

    if (closed) {
        const std::string text = transcribe(segmenter_.utterance());
        if (!text.empty()) results.push_back({segmentId_, text, true});
        ++segmentId_;
        segmenter_.reset();
        sinceLastPartialMs_ = 0;
        lastPartial_.clear();
        return results;
    }

    if (segmenter_.isListening() && sinceLastPartialMs_ >= config_.partialIntervalMs) {
        sinceLastPartialMs_ = 0;
        const std::string text = transcribe(segmenter_.utterance());
        if (!text.empty() && text != lastPartial_) {
            lastPartial_ = text;
            results.push_back({segmentId_, text, false});
        }
    }
    return results;
}

std::vector<RecognitionResult> WhisperRecognizer::finish() {
    std::vector<RecognitionResult> results;
    if (!segmenter_.utterance().empty()) {
        const std::string text = transcribe(segmenter_.utterance());
        if (!text.empty()) results.push_back({segmentId_, text, true});
        ++segmentId_;
    }
    segmenter_.reset();
    sinceLastPartialMs_ = 0;
    lastPartial_.clear();
    return results;
}

// Converts pcm16kMono into text with this recognizer's whisper_state
std::string WhisperRecognizer::transcribe(const std::vector<float>& pcm16kMono) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.no_context = true;

    params.no_speech_thold = config_.noSpeechThreshold;

    const int rc = whisper_full_with_state(model_->context(), state_, params,
                                           pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw std::runtime_error("whisper_full_with_state failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments_from_state(state_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text_from_state(state_, i);

    out = trim(out);
    Log::debug(kTag, "Decoded " + std::to_string(pcm16kMono.size()) + " samples: " + out);
    return out;
}

#include "audio/capture_engine.hpp"
#include "audio/level_meter.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "util/log.hpp"

#include <portaudio.h>

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* kTag = "Audio Capture";

std::string pa_message(PaError e, const char* msg) {
    return std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e);
}

AudioChunker::Config chunkerConfig(const AudioCaptureEngine::Config& config) {
    AudioChunker::Config c;
    c.sampleRate = static_cast<uint32_t>(config.sampleRate);
    c.channels = 1;
    c.chunkMs = config.chunkMs;
    return c;
}

SilenceDetector::Config silenceConfig(const AudioCaptureEngine::Config& config) {
    SilenceDetector::Config c;
    c.threshold = config.silenceThreshold;
    c.silenceMs = config.silenceMs;
    return c;
}

} // namespace

// Constructor
AudioCaptureEngine::AudioCaptureEngine(Config config, ChunkCallback onChunk,
                                       LevelCallback onLevel, SilenceCallback onSilence,
                                       ErrorCallback onError)
    : config_(config),
      onChunk_(std::move(onChunk)),
      onLevel_(std::move(onLevel)),
      onSilence_(std::move(onSilence)),
      onError_(std::move(onError)),
      chunker_(chunkerConfig(config)),
      silence_(silenceConfig(config)) {
    msPerBuffer_ = (int)std::lround(1000.0 * config_.framesPerBuffer / config_.sampleRate);
}

// Destructor
AudioCaptureEngine::~AudioCaptureEngine() { stop(); }

void AudioCaptureEngine::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) return;
    if (thread_.joinable()) thread_.join();
    closeStream();

    PaError e = Pa_Initialize();
    if (e != paNoError) {
        throw SessionError(ErrorKind::DeviceUnavailable, pa_message(e, "Pa_Initialize"));
    }

    PaStreamParameters inParams{};
    inParams.device = config_.deviceIndex >= 0 ? config_.deviceIndex : Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice || inParams.device >= Pa_GetDeviceCount()) {
        Pa_Terminate();
        throw SessionError(ErrorKind::DeviceUnavailable, "No input device available");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    if (!info || info->maxInputChannels < 1) {
        Pa_Terminate();
        throw SessionError(ErrorKind::DeviceUnavailable, "Selected device has no input channels");
    }
    Log::info(kTag, std::string("Input device: ") + info->name);

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    e = Pa_OpenStream(&stream_, &inParams, nullptr,
                      config_.sampleRate, config_.framesPerBuffer,
                      paNoFlag, nullptr, nullptr);
    if (e != paNoError) {
        stream_ = nullptr;
        Pa_Terminate();
        throw SessionError(ErrorKind::DeviceUnavailable, pa_message(e, "Pa_OpenStream"));
    }

    e = Pa_StartStream(stream_);
    if (e != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        Pa_Terminate();
        throw SessionError(ErrorKind::DeviceUnavailable, pa_message(e, "Pa_StartStream"));
    }

    chunker_.reset();
    silence_.reset();
    paused_ = false;
    running_ = true;
    thread_ = std::thread(&AudioCaptureEngine::run, this);
}

void AudioCaptureEngine::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    running_ = false;

    if (thread_.joinable()) thread_.join();
    closeStream();
    level_ = 0.0f;
}

void AudioCaptureEngine::pause() {
    if (running_.load() && !paused_.exchange(true)) Log::info(kTag, "Capture paused");
}

void AudioCaptureEngine::resume() {
    if (running_.load() && paused_.exchange(false)) Log::info(kTag, "Capture resumed");
}

void AudioCaptureEngine::closeStream() {
    if (!stream_) return;
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    Pa_Terminate();
}

// Capture thread: reads device buffers until stop() clears running_
void AudioCaptureEngine::run() {
    std::vector<int16_t> buff(config_.framesPerBuffer);
    uint64_t emitted = 0;

    try {
        while (running_.load()) {
            PaError e = Pa_ReadStream(stream_, buff.data(), config_.framesPerBuffer);
            if (e == paInputOverflowed) {
                Log::debug(kTag, "Input overflowed");
                continue;
            }
            if (e != paNoError) throw SessionError(ErrorKind::DeviceUnavailable, pa_message(e, "Pa_ReadStream"));

            if (paused_.load() != chunker_.paused()) {
                if (paused_.load()) chunker_.pause();
                else chunker_.resume();
            }
            if (chunker_.paused()) continue;

            const float lvl = LevelMeter::level(buff.data(), buff.size());
            level_ = lvl;
            if (onLevel_) onLevel_(lvl);

            if (silence_.feed(lvl, msPerBuffer_) && onSilence_) onSilence_();

            for (auto& chunk : chunker_.push(buff.data(), buff.size(), nowUnixMs())) {
                ++emitted;
                if (onChunk_) onChunk_(std::move(chunk));
            }
        }
    } catch (const SessionError& ex) {
        Log::error(kTag, ex.what());
        running_ = false;
        if (onError_) onError_(ex);
    }

    for (auto& chunk : chunker_.flush(nowUnixMs())) {
        ++emitted;
        if (onChunk_) onChunk_(std::move(chunk));
    }
    Log::info(kTag, "Capture stopped after " + std::to_string(emitted) + " chunks");
}

void AudioCaptureEngine::listDevices() {
    PaError e = Pa_Initialize();
    if (e != paNoError) {
        Log::error(kTag, pa_message(e, "Pa_Initialize"));
        return;
    }

    const int count = Pa_GetDeviceCount();
    const PaDeviceIndex def = Pa_GetDefaultInputDevice();
    std::cout << "Input devices:\n";
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;
        std::cout << "- " << i << ": " << info->name << " (" << info->maxInputChannels << "ch)"
                  << (i == def ? " [default]" : "") << "\n";
    }
    Pa_Terminate();
}

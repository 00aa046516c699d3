#ifndef CAPTURE_ENGINE_HPP
#define CAPTURE_ENGINE_HPP

#include "audio/audio_chunk.hpp"
#include "audio/audio_chunker.hpp"
#include "audio/silence_detector.hpp"
#include "core/errors.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

typedef void PaStream;

// Owns the microphone for one session. Device buffers are read on a capture
// thread; every buffer updates the level meter and the silence detector, and
// completed chunks are handed out through onChunk in sequence order.
class AudioCaptureEngine {
public:
    struct Config {
        int sampleRate = 16000;
        int framesPerBuffer = 800;     // 50 ms at 16 kHz
        int chunkMs = 1000;
        float silenceThreshold = 5.0f;
        int silenceMs = 800;
        int deviceIndex = -1;          // -1 selects the default input device
    };

    using ChunkCallback = std::function<void(AudioChunk chunk)>;
    using LevelCallback = std::function<void(float level)>;
    using SilenceCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const SessionError& error)>;

    AudioCaptureEngine(Config config, ChunkCallback onChunk,
                       LevelCallback onLevel = nullptr, SilenceCallback onSilence = nullptr,
                       ErrorCallback onError = nullptr);
    ~AudioCaptureEngine();

    AudioCaptureEngine(const AudioCaptureEngine&) = delete;
    AudioCaptureEngine& operator=(const AudioCaptureEngine&) = delete;

    // Opens the input device and starts the capture thread.
    // Throws SessionError(DeviceUnavailable) if no device can be opened.
    void start();

    // Stops the thread, emits the partial chunk and releases the device.
    void stop();

    void pause();
    void resume();

    bool isCapturing() const { return running_.load(); }
    bool isPaused() const { return paused_.load(); }
    float level() const { return level_.load(); }

    static void listDevices();

private:
    void run();
    void closeStream();

    Config config_;
    ChunkCallback onChunk_;
    LevelCallback onLevel_;
    SilenceCallback onSilence_;
    ErrorCallback onError_;

    AudioChunker chunker_;
    SilenceDetector silence_;

    std::mutex lifecycle_mutex_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<float> level_{0.0f};

    PaStream* stream_ = nullptr;
    int msPerBuffer_ = 0;
};

#endif

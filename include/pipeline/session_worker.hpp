#ifndef SESSION_WORKER_HPP
#define SESSION_WORKER_HPP

#include "audio/audio_chunk.hpp"
#include "pipeline/answer_generator.hpp"
#include "pipeline/context_store.hpp"
#include "pipeline/question_detector.hpp"
#include "pipeline/transcript_accumulator.hpp"
#include "protocol/messages.hpp"
#include "stt/recognizer.hpp"
#include "util/event_channel.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Receives the outbound events of one session. Called from the ingest and
// generation threads; implementations must be thread-safe.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const SessionEvent& event) = 0;
};

// Server-side pipeline for one session.
//
// Audio and control messages go through one ordered queue drained by the
// ingest thread, which alone touches the recognizer, the transcript and the
// context. Answer generation runs on a second thread, one job at a time, so
// the next question can be transcribed while the last one is answered.
class SessionWorker {
public:
    struct Config {
        std::string language = "en";
        int generationTimeoutMs = 20000;
    };

    struct Stats {
        uint64_t chunks = 0;
        uint64_t bytes = 0;
        uint64_t missingChunks = 0;
        uint64_t reorderedChunks = 0;
        uint64_t recognizerErrors = 0;
        uint64_t questions = 0;
        uint64_t answers = 0;
    };

    SessionWorker(std::string sessionId, Config config, std::unique_ptr<Recognizer> recognizer,
                  std::shared_ptr<const AnswerGenerator> generator, EventSink& sink);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    void start();

    void submitAudio(AudioChunk chunk);
    void submit(ClientMessage message);

    // Cancels in-flight generation, drops queued work and joins both threads.
    // Nothing is emitted once close() has returned.
    void close();

    // Blocks until every submitted item and every generation job has finished.
    void drain();

    const std::string& id() const { return sessionId_; }

    // Answers since the last clear, newest first.
    std::vector<AnswerRecord> answers() const;
    // Every answer of the session, oldest first.
    std::vector<AnswerRecord> history() const;

    Stats stats() const;

private:
    struct Work {
        bool isAudio = false;
        AudioChunk chunk;
        ClientMessage message;
    };

    struct Job {
        QuestionEvent question;
        ContextStore::Snapshot context;
        bool regenerate = false;
        CancelToken cancel;
    };

    void runIngest();
    void runGeneration();

    void handleAudio(const AudioChunk& chunk);
    void handleMessage(const ClientMessage& message);
    void handleFinalize();
    void handleClear();
    void handleRequestAnswer(const ClientMessage& message);
    void handleContext(const ClientMessage& message);

    void applyResults(const std::vector<RecognitionResult>& results);
    void dispatch(const QuestionEvent& question, bool regenerate);
    AnswerRecord awaitAnswer(const Job& job, const GenerationControl& control);
    bool isClosed();
    void emit(const SessionEvent& event);
    void finishItem();

    std::string sessionId_;
    Config config_;
    std::unique_ptr<Recognizer> recognizer_;
    std::shared_ptr<const AnswerGenerator> generator_;
    EventSink& sink_;

    // Ingest thread only
    TranscriptionAccumulator accumulator_;
    QuestionBoundaryDetector detector_;
    ContextStore context_;
    uint64_t boundary_ = 0;
    uint64_t nextQuestionId_ = 1;
    std::optional<uint32_t> expectedSequence_;

    EventChannel<Work> work_;
    EventChannel<Job> jobs_;
    std::thread ingestThread_;
    std::thread generationThread_;

    std::mutex emit_mutex_;
    bool closed_ = false;

    std::mutex baseline_mutex_;
    CancelToken baseline_;

    mutable std::mutex answers_mutex_;
    std::vector<AnswerRecord> history_;
    std::size_t baselineStart_ = 0;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    uint64_t pending_ = 0;

    std::atomic<bool> started_{false};
};

#endif

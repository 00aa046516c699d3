#include "pipeline/session_worker.hpp"
#include "util/log.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <utility>

namespace {

const char* kTag = "Session";

// How often a pending model call is checked against its deadline and cancel flag.
const std::chrono::milliseconds kGenerationPoll(20);

} // namespace

// Constructor
SessionWorker::SessionWorker(std::string sessionId, Config config, std::unique_ptr<Recognizer> recognizer,
                             std::shared_ptr<const AnswerGenerator> generator, EventSink& sink)
    : sessionId_(std::move(sessionId)),
      config_(std::move(config)),
      recognizer_(std::move(recognizer)),
      generator_(std::move(generator)),
      sink_(sink) {
    if (!recognizer_) throw std::invalid_argument("SessionWorker needs a recognizer");
    if (!generator_) throw std::invalid_argument("SessionWorker needs an answer generator");
    if (config_.generationTimeoutMs <= 0) throw std::invalid_argument("generation timeout must be positive");
    recognizer_->setLanguage(config_.language);
}

// Destructor
SessionWorker::~SessionWorker() { close(); }

void SessionWorker::start() {
    if (started_.exchange(true)) return;
    ingestThread_ = std::thread(&SessionWorker::runIngest, this);
    generationThread_ = std::thread(&SessionWorker::runGeneration, this);
}

void SessionWorker::submitAudio(AudioChunk chunk) {
    Work w;
    w.isAudio = true;
    w.chunk = std::move(chunk);

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (work_.push(std::move(w))) ++pending_;
}

void SessionWorker::submit(ClientMessage message) {
    Work w;
    w.message = std::move(message);

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (work_.push(std::move(w))) ++pending_;
}

void SessionWorker::close() {
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        if (closed_) return;
        closed_ = true;
    }

    {
        std::lock_guard<std::mutex> lock(baseline_mutex_);
        baseline_.cancel();
    }

    work_.close();
    work_.clear();
    jobs_.close();
    jobs_.clear();

    if (ingestThread_.joinable()) ingestThread_.join();
    if (generationThread_.joinable()) generationThread_.join();

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_ = 0;
    }
    pending_cv_.notify_all();

    const Stats s = stats();
    Log::info(kTag, sessionId_ + " closed: " + std::to_string(s.chunks) + " chunks, " +
                        std::to_string(s.bytes) + " bytes, " + std::to_string(s.questions) +
                        " questions, " + std::to_string(s.answers) + " answers");
}

void SessionWorker::drain() {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    pending_cv_.wait(lock, [&] { return pending_ == 0; });
}

std::vector<AnswerRecord> SessionWorker::answers() const {
    std::lock_guard<std::mutex> lock(answers_mutex_);
    return std::vector<AnswerRecord>(history_.rbegin(), history_.rend() - static_cast<std::ptrdiff_t>(baselineStart_));
}

std::vector<AnswerRecord> SessionWorker::history() const {
    std::lock_guard<std::mutex> lock(answers_mutex_);
    return history_;
}

SessionWorker::Stats SessionWorker::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SessionWorker::finishItem() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_ > 0) --pending_;
    }
    pending_cv_.notify_all();
}

bool SessionWorker::isClosed() {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    return closed_;
}

void SessionWorker::emit(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (closed_) return;
    sink_.emit(event);
}

// Ingest thread: audio and control messages in arrival order
void SessionWorker::runIngest() {
    Work w;
    while (work_.pop(w)) {
        try {
            if (w.isAudio) {
                handleAudio(w.chunk);
            } else {
                handleMessage(w.message);
            }
        } catch (const SessionError& e) {
            Log::error(kTag, sessionId_ + ": " + e.what());
            emit(SessionEvent::error(e.kind(), e.what()));
        } catch (const std::exception& e) {
            Log::error(kTag, sessionId_ + ": " + e.what());
            emit(SessionEvent::error(ErrorKind::ProtocolViolation, e.what()));
        }
        finishItem();
    }
}

void SessionWorker::handleAudio(const AudioChunk& chunk) {
    uint64_t missing = 0;
    bool stale = false;

    if (expectedSequence_) {
        if (chunk.sequence > *expectedSequence_) {
            missing = chunk.sequence - *expectedSequence_;
        } else if (chunk.sequence < *expectedSequence_) {
            stale = true;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.missingChunks += missing;
        if (stale) ++stats_.reorderedChunks;
        if (!stale) {
            ++stats_.chunks;
            stats_.bytes += chunk.samples.size() * sizeof(int16_t);
        }
    }

    if (missing > 0 || stale) {
        const Stats s = stats();
        const SessionError gap(ErrorKind::RecognitionGap,
                               stale ? "late chunk " + std::to_string(chunk.sequence) + " dropped"
                                     : std::to_string(missing) + " chunk(s) missing before " +
                                           std::to_string(chunk.sequence));
        Log::warn(kTag, sessionId_ + ": " + gap.code() + ": " + gap.what());
        emit(SessionEvent::statusEvent("quality", {{"missing", s.missingChunks}, {"reordered", s.reorderedChunks}}));
        if (stale) return;
    }
    expectedSequence_ = chunk.sequence + 1;

    std::vector<RecognitionResult> results;
    try {
        results = recognizer_->accept(chunk);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.recognizerErrors;
        }
        Log::warn(kTag, sessionId_ + ": " + errorCode(ErrorKind::RecognitionGap) +
                            ": recognizer dropped chunk " + std::to_string(chunk.sequence) + ": " + e.what());
        return;
    }
    applyResults(results);
}

void SessionWorker::applyResults(const std::vector<RecognitionResult>& results) {
    for (const auto& r : results) {
        if (!accumulator_.apply(r)) continue;
        emit(SessionEvent::transcription(r.text, accumulator_.accumulatedText(), r.isFinal));
    }
}

void SessionWorker::handleMessage(const ClientMessage& message) {
    switch (message.type) {
        case ClientMessageType::Finalize:
            handleFinalize();
            break;
        case ClientMessageType::Clear:
            handleClear();
            break;
        case ClientMessageType::RequestAnswer:
            handleRequestAnswer(message);
            break;
        case ClientMessageType::Context:
            handleContext(message);
            break;
        case ClientMessageType::Config:
            recognizer_->setLanguage(message.language);
            config_.language = message.language;
            Log::info(kTag, sessionId_ + " language set to " + message.language);
            emit(SessionEvent::statusEvent("config_ack", {{"language", message.language}}));
            break;
        case ClientMessageType::Hello:
            throw SessionError(ErrorKind::ProtocolViolation, "hello sent twice");
    }
}

void SessionWorker::handleFinalize() {
    try {
        applyResults(recognizer_->finish());
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.recognizerErrors;
        }
        Log::warn(kTag, sessionId_ + ": " + errorCode(ErrorKind::RecognitionGap) +
                            ": recognizer failed to finish segment: " + e.what());
    }

    // Frozen before deciding; the transcript is only dropped once the decision stands.
    const std::string snapshot = accumulator_.snapshot();
    if (!snapshot.empty()) emit(SessionEvent::statusEvent("detecting"));

    std::optional<QuestionEvent> question = detector_.decide(++boundary_, snapshot);
    accumulator_.resetBoundary();

    if (question) {
        question->id = nextQuestionId_++;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.questions;
        }
        Log::info(kTag, sessionId_ + " question " + std::to_string(question->id) + " (" +
                            questionKindName(question->kind) + "): " + question->text);
        emit(SessionEvent::questionDetected(*question));
        dispatch(*question, false);
    } else {
        if (!snapshot.empty()) Log::debug(kTag, sessionId_ + " no question in: " + snapshot);
        emit(SessionEvent::statusEvent("no_question"));
    }

    emit(SessionEvent::statusEvent("finalized", {{"question", question.has_value()}}));
}

void SessionWorker::handleClear() {
    {
        std::lock_guard<std::mutex> lock(baseline_mutex_);
        baseline_.cancel();
        // After close() every later job must see a cancelled token.
        if (!isClosed()) baseline_ = CancelToken();
    }

    accumulator_.resetBoundary();
    recognizer_->reset();
    context_.clear();

    {
        std::lock_guard<std::mutex> lock(answers_mutex_);
        baselineStart_ = history_.size();
    }

    Log::info(kTag, sessionId_ + " cleared");
    emit(SessionEvent::statusEvent("cleared"));
}

void SessionWorker::handleRequestAnswer(const ClientMessage& message) {
    QuestionEvent question;
    question.id = nextQuestionId_++;
    question.text = message.question;
    question.kind = message.questionType.empty() ? QuestionBoundaryDetector::classify(message.question)
                                                 : questionKindFromName(message.questionType);

    Log::info(kTag, sessionId_ + " regenerating as question " + std::to_string(question.id) + ": " +
                        question.text);
    emit(SessionEvent::statusEvent("generating", {{"question_id", question.id}, {"regenerated", true}}));
    dispatch(question, true);
}

void SessionWorker::handleContext(const ClientMessage& message) {
    const ContextPayload& c = message.context;
    const uint64_t version = context_.update(c);

    Log::info(kTag, sessionId_ + " context v" + std::to_string(version) + ": " +
                        std::to_string(c.starStories.size()) + " stories, " +
                        std::to_string(c.talkingPoints.size()) + " talking points, " +
                        std::to_string(c.qaPairs.size()) + " Q&A pairs, resume " +
                        std::to_string(c.resumeText.size()) + " chars");

    emit(SessionEvent::statusEvent("context_ack", {{"version", version},
                                                   {"stories", c.starStories.size()},
                                                   {"talking_points", c.talkingPoints.size()},
                                                   {"qa_pairs", c.qaPairs.size()}}));
}

void SessionWorker::dispatch(const QuestionEvent& question, bool regenerate) {
    Job job;
    job.question = question;
    job.context = context_.current();
    job.regenerate = regenerate;
    {
        std::lock_guard<std::mutex> lock(baseline_mutex_);
        job.cancel = baseline_;
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (jobs_.push(std::move(job))) ++pending_;
}

// Generation thread: one job at a time, in the order questions were raised
void SessionWorker::runGeneration() {
    Job job;
    while (jobs_.pop(job)) {
        const uint64_t questionId = job.question.id;

        if (job.cancel.cancelled()) {
            Log::debug(kTag, sessionId_ + " skipped cancelled question " + std::to_string(questionId));
            finishItem();
            continue;
        }

        GenerationControl control;
        control.cancel = job.cancel;
        control.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.generationTimeoutMs);

        const auto started = std::chrono::steady_clock::now();
        try {
            AnswerRecord record = awaitAnswer(job, control);

            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            Log::info(kTag, sessionId_ + " answer for question " + std::to_string(questionId) + " in " +
                                std::to_string(elapsed.count()) + " ms (" + record.source +
                                (record.grounded ? ", grounded)" : ", ungrounded)"));

            {
                // Same lock handleClear() moves the baseline under.
                std::lock_guard<std::mutex> lock(answers_mutex_);
                if (job.cancel.cancelled()) throw GenerationCancelled();
                history_.push_back(record);
                emit(SessionEvent::answerReady(record));
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.answers;
            }
        } catch (const GenerationCancelled&) {
            Log::debug(kTag, sessionId_ + " generation cancelled for question " + std::to_string(questionId));
        } catch (const SessionError& e) {
            Log::error(kTag, sessionId_ + " question " + std::to_string(questionId) + ": " + e.code() + ": " +
                                 e.what());
            emit(SessionEvent::error(e.kind(), e.what(), questionId));
        } catch (const std::exception& e) {
            Log::error(kTag, sessionId_ + " question " + std::to_string(questionId) + ": " + e.what());
            emit(SessionEvent::error(ErrorKind::GenerationFailure, e.what(), questionId));
        }
        finishItem();
    }
}

// Runs the model call on its own thread so a model that never polls its
// control cannot hold the session past the deadline or past close(). An
// abandoned call finishes in the background and its result is discarded.
AnswerRecord SessionWorker::awaitAnswer(const Job& job, const GenerationControl& control) {
    auto result = std::make_shared<std::promise<AnswerRecord>>();
    std::future<AnswerRecord> answer = result->get_future();

    std::thread([generator = generator_, request = AnswerGenerator::Request{job.question, job.context, job.regenerate},
                 control, result] {
        try {
            result->set_value(generator->generate(request, control));
        } catch (...) {
            result->set_exception(std::current_exception());
        }
    }).detach();

    while (answer.wait_for(kGenerationPoll) != std::future_status::ready) {
        if (control.cancel.cancelled()) throw GenerationCancelled();
        if (control.expired()) {
            throw SessionError(ErrorKind::GenerationTimeout,
                               "no answer within " + std::to_string(config_.generationTimeoutMs) + " ms");
        }
    }
    return answer.get();
}

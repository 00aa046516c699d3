#include "pipeline/session_worker.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace {

class SessionWorkerTest : public ::testing::Test {
protected:
    void start(std::map<uint32_t, std::string> script, std::shared_ptr<LanguageModel> model = nullptr,
               int timeoutMs = 20000) {
        if (!model) model = std::make_shared<TemplateLanguageModel>();
        recognizerLog = std::make_shared<ScriptedRecognizer::Log>();
        generator = std::make_shared<const AnswerGenerator>(model, AnswerGenerator::Config());

        SessionWorker::Config config;
        config.generationTimeoutMs = timeoutMs;
        worker = std::make_unique<SessionWorker>("test-session", config,
                                                 std::make_unique<ScriptedRecognizer>(std::move(script), recognizerLog),
                                                 generator, sink);
        worker->start();
    }

    void TearDown() override {
        if (worker) worker->close();
    }

    void sendContext(const ContextPayload& payload) {
        ClientMessage m = message(ClientMessageType::Context);
        m.context = payload;
        worker->submit(m);
    }

    void speak(uint32_t from, uint32_t to) {
        for (uint32_t seq = from; seq <= to; ++seq) worker->submitAudio(chunkWithSequence(seq));
    }

    void finalize() { worker->submit(message(ClientMessageType::Finalize)); }

    void regenerate(const std::string& text) {
        ClientMessage m = message(ClientMessageType::RequestAnswer);
        m.question = text;
        worker->submit(m);
    }

    std::size_t count(const std::string& status) const {
        const auto s = sink.statuses();
        return static_cast<std::size_t>(std::count(s.begin(), s.end(), status));
    }

    CollectingSink sink;
    std::shared_ptr<ScriptedRecognizer::Log> recognizerLog;
    std::shared_ptr<const AnswerGenerator> generator;
    std::unique_ptr<SessionWorker> worker;
};

ContextPayload conflictContext() {
    ContextPayload c;
    c.starStories = {story("s1", "Resolving a design dispute", {"conflict"}),
                     story("s2", "Scaling the billing service", {"leadership"})};
    return c;
}

const std::map<uint32_t, std::string> kConflictScript = {
    {0, "Tell me about a time"}, {1, "you resolved a conflict"}, {2, "with a teammate."}};

} // namespace

TEST_F(SessionWorkerTest, SpokenConflictQuestionGetsAGroundedAnswer) {
    start(kConflictScript);
    sendContext(conflictContext());
    speak(0, 2);
    finalize();
    worker->drain();

    const auto transcripts = sink.ofType(SessionEvent::Type::Transcription);
    ASSERT_EQ(transcripts.size(), 4u);
    EXPECT_FALSE(transcripts[0].isFinal);
    EXPECT_EQ(transcripts[2].text, "Tell me about a time you resolved a conflict with a teammate.");
    EXPECT_TRUE(transcripts[3].isFinal);
    EXPECT_EQ(transcripts[3].accumulatedText, "Tell me about a time you resolved a conflict with a teammate.");

    const auto questions = sink.ofType(SessionEvent::Type::QuestionDetected);
    ASSERT_EQ(questions.size(), 1u);
    EXPECT_EQ(questions[0].question.id, 1u);
    EXPECT_EQ(questions[0].question.kind, QuestionKind::Behavioral);

    const auto answers = sink.ofType(SessionEvent::Type::Answer);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].answer.questionId, 1u);
    EXPECT_TRUE(answers[0].answer.grounded);
    EXPECT_EQ(answers[0].answer.storyIds, (std::vector<std::string>{"s1"}));

    EXPECT_EQ(count("context_ack"), 1u);
    EXPECT_EQ(count("detecting"), 1u);
    EXPECT_EQ(count("finalized"), 1u);
    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Error).empty());
    EXPECT_EQ(worker->answers().size(), 1u);
}

TEST_F(SessionWorkerTest, QuestionIsAnnouncedBeforeItsAnswer) {
    start(kConflictScript);
    speak(0, 2);
    finalize();
    worker->drain();

    const auto events = sink.events();
    auto isQuestion = [](const SessionEvent& e) { return e.type == SessionEvent::Type::QuestionDetected; };
    auto isAnswer = [](const SessionEvent& e) { return e.type == SessionEvent::Type::Answer; };
    const auto q = std::find_if(events.begin(), events.end(), isQuestion);
    const auto a = std::find_if(events.begin(), events.end(), isAnswer);
    ASSERT_NE(q, events.end());
    ASSERT_NE(a, events.end());
    EXPECT_LT(q - events.begin(), a - events.begin());
}

TEST_F(SessionWorkerTest, FinalizeOnEmptyTranscriptTwiceYieldsNoQuestion) {
    start({});
    finalize();
    finalize();
    worker->drain();

    EXPECT_TRUE(sink.ofType(SessionEvent::Type::QuestionDetected).empty());
    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Error).empty());
    EXPECT_EQ(count("no_question"), 2u);
    EXPECT_EQ(count("finalized"), 2u);
    EXPECT_EQ(count("detecting"), 0u);
}

TEST_F(SessionWorkerTest, FillerIsDiscardedAtTheBoundary) {
    start({{0, "Okay, thank you."}, {1, "Why do you want this role?"}});
    speak(0, 0);
    finalize();
    speak(1, 1);
    finalize();
    worker->drain();

    const auto questions = sink.ofType(SessionEvent::Type::QuestionDetected);
    ASSERT_EQ(questions.size(), 1u);
    EXPECT_EQ(questions[0].question.text, "Why do you want this role?");
    EXPECT_EQ(count("no_question"), 1u);
}

TEST_F(SessionWorkerTest, RegenerationAppendsANewRecord) {
    start(kConflictScript);
    sendContext(conflictContext());
    speak(0, 2);
    finalize();
    worker->drain();
    const AnswerRecord original = worker->answers().at(0);

    regenerate(original.question);
    worker->drain();

    const auto answers = worker->answers();
    ASSERT_EQ(answers.size(), 2u);
    EXPECT_EQ(answers[0].questionId, 2u);
    EXPECT_TRUE(answers[0].regenerated);
    EXPECT_EQ(answers[0].question, original.question);
    EXPECT_EQ(answers[1].questionId, original.questionId);
    EXPECT_EQ(answers[1].answer, original.answer);
    EXPECT_FALSE(answers[1].regenerated);

    const auto statuses = sink.ofType(SessionEvent::Type::Status);
    const auto generating = std::find_if(statuses.begin(), statuses.end(),
                                         [](const SessionEvent& e) { return e.status == "generating"; });
    ASSERT_NE(generating, statuses.end());
    EXPECT_EQ(generating->questionId, 2u);
    EXPECT_TRUE(generating->detail.value("regenerated", false));
}

TEST_F(SessionWorkerTest, CloseCancelsInFlightGenerationSilently) {
    start(kConflictScript, std::make_shared<FakeModel>(blockUntilStopped));
    speak(0, 2);
    finalize();

    ASSERT_TRUE(sink.waitFor([](const std::vector<SessionEvent>& events) {
        return std::any_of(events.begin(), events.end(),
                           [](const SessionEvent& e) { return e.type == SessionEvent::Type::QuestionDetected; });
    }));

    worker->close();
    const std::size_t seen = sink.events().size();

    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Answer).empty());
    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Error).empty());
    EXPECT_TRUE(worker->answers().empty());

    // Nothing after close.
    worker->submit(message(ClientMessageType::Finalize));
    EXPECT_EQ(sink.events().size(), seen);
}

TEST_F(SessionWorkerTest, SlowModelTimesOut) {
    start(kConflictScript, std::make_shared<FakeModel>(blockUntilStopped), 50);
    speak(0, 2);
    finalize();
    worker->drain();

    const auto errors = sink.ofType(SessionEvent::Type::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].errorKind, ErrorKind::GenerationTimeout);
    EXPECT_EQ(errors[0].questionId, 1u);
    EXPECT_TRUE(worker->answers().empty());
}

namespace {

// Sleeps through its call without ever looking at the control, then flags that it returned.
FakeModel::Fn sleepIgnoringControl(std::chrono::milliseconds nap, std::shared_ptr<std::atomic<bool>> returned) {
    return [nap, returned](const Prompt&, const GenerationControl&) -> std::string {
        std::this_thread::sleep_for(nap);
        returned->store(true);
        return "An answer that arrived too late.";
    };
}

void waitUntilReturned(const std::atomic<bool>& returned) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!returned.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    // let the abandoned call finish logging
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

} // namespace

TEST_F(SessionWorkerTest, ModelIgnoringTheDeadlineStillTimesOut) {
    auto returned = std::make_shared<std::atomic<bool>>(false);
    start(kConflictScript, std::make_shared<FakeModel>(sleepIgnoringControl(std::chrono::milliseconds(800), returned)),
          100);

    const auto began = std::chrono::steady_clock::now();
    speak(0, 2);
    finalize();
    worker->drain();
    const auto waited = std::chrono::steady_clock::now() - began;

    EXPECT_LT(waited, std::chrono::milliseconds(700));
    const auto errors = sink.ofType(SessionEvent::Type::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].errorKind, ErrorKind::GenerationTimeout);
    EXPECT_EQ(errors[0].questionId, 1u);

    waitUntilReturned(*returned);
    EXPECT_TRUE(worker->answers().empty());
    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Answer).empty());
}

TEST_F(SessionWorkerTest, CloseDuringClearDoesNotWaitForAStuckModel) {
    auto returned = std::make_shared<std::atomic<bool>>(false);
    auto model = std::make_shared<FakeModel>(sleepIgnoringControl(std::chrono::milliseconds(1500), returned));
    start(kConflictScript, model);
    speak(0, 2);
    finalize();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (model->prompts().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_FALSE(model->prompts().empty());

    worker->submit(message(ClientMessageType::Clear));
    const auto began = std::chrono::steady_clock::now();
    worker->close();
    EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::milliseconds(1000));

    waitUntilReturned(*returned);
    EXPECT_TRUE(sink.ofType(SessionEvent::Type::Answer).empty());
    EXPECT_TRUE(worker->answers().empty());
}

TEST_F(SessionWorkerTest, ModelFailureLeavesTheSessionUsable) {
    auto failures = std::make_shared<int>(1);
    start({{0, "Why do you want this role?"}, {1, "What motivates you?"}},
          std::make_shared<FakeModel>([failures](const Prompt&, const GenerationControl&) -> std::string {
              if ((*failures)-- > 0) throw std::runtime_error("model unavailable");
              return "Because I like hard problems.";
          }));

    speak(0, 0);
    finalize();
    worker->drain();
    speak(1, 1);
    finalize();
    worker->drain();

    const auto errors = sink.ofType(SessionEvent::Type::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].errorKind, ErrorKind::GenerationFailure);
    EXPECT_EQ(errors[0].questionId, 1u);

    const auto answers = worker->answers();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].questionId, 2u);
}

TEST_F(SessionWorkerTest, ClearResetsTranscriptContextAndAnswerView) {
    start({{0, "Tell me about a time"}, {1, "you resolved a conflict."}, {2, "Tell me about a conflict."}});
    sendContext(conflictContext());
    speak(0, 1);
    finalize();
    worker->drain();
    ASSERT_EQ(worker->answers().size(), 1u);

    worker->submit(message(ClientMessageType::Clear));
    worker->drain();
    EXPECT_EQ(count("cleared"), 1u);
    EXPECT_TRUE(worker->answers().empty());
    EXPECT_EQ(worker->history().size(), 1u);
    {
        std::lock_guard<std::mutex> lock(recognizerLog->mutex);
        EXPECT_EQ(recognizerLog->resets, 1);
    }

    speak(2, 2);
    finalize();
    worker->drain();

    const auto answers = worker->answers();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_TRUE(answers[0].storyIds.empty());
    EXPECT_FALSE(answers[0].grounded);
}

TEST_F(SessionWorkerTest, SequenceGapsAreReportedAndLateChunksDropped) {
    start({});
    worker->submitAudio(chunkWithSequence(0));
    worker->submitAudio(chunkWithSequence(1));
    worker->submitAudio(chunkWithSequence(3));
    worker->submitAudio(chunkWithSequence(2));
    worker->drain();

    EXPECT_EQ(count("quality"), 2u);
    const auto s = worker->stats();
    EXPECT_EQ(s.missingChunks, 1u);
    EXPECT_EQ(s.reorderedChunks, 1u);
    EXPECT_EQ(s.chunks, 3u);
    EXPECT_EQ(s.bytes, 3u * 1600u * 2u);

    std::lock_guard<std::mutex> lock(recognizerLog->mutex);
    EXPECT_EQ(recognizerLog->accepted, (std::vector<uint32_t>{0, 1, 3}));
}

TEST_F(SessionWorkerTest, ConfigSetsRecognizerLanguage) {
    start({});
    ClientMessage m = message(ClientMessageType::Config);
    m.language = "ko";
    worker->submit(m);
    worker->drain();

    EXPECT_EQ(count("config_ack"), 1u);
    std::lock_guard<std::mutex> lock(recognizerLog->mutex);
    EXPECT_EQ(recognizerLog->language, "ko");
}

TEST_F(SessionWorkerTest, ContextAckReportsWhatWasStored) {
    start({});
    ContextPayload c = conflictContext();
    c.talkingPoints = {"a", "b", "c"};
    sendContext(c);
    worker->drain();

    const auto statuses = sink.ofType(SessionEvent::Type::Status);
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].status, "context_ack");
    EXPECT_EQ(statuses[0].detail.value("version", 0), 1);
    EXPECT_EQ(statuses[0].detail.value("stories", 0), 2);
    EXPECT_EQ(statuses[0].detail.value("talking_points", 0), 3);
    EXPECT_EQ(statuses[0].detail.value("qa_pairs", -1), 0);
}

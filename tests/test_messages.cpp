#include "protocol/messages.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(AudioPayload, HeaderFieldsAndSamplesSurviveTheWire) {
    AudioChunk chunk;
    chunk.sequence = 0x01020304;
    chunk.sampleRate = 16000;
    chunk.channels = 1;
    chunk.timestampMs = 1700000000123;
    chunk.samples = {0, 1, -1, 32767, -32768};

    const auto bytes = encodeAudioPayload(chunk);
    ASSERT_EQ(bytes.size(), kAudioHeaderSize + 10);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "CCA1");
    EXPECT_EQ(bytes[4], 0x01);
    EXPECT_EQ(bytes[7], 0x04);
    // little-endian samples
    EXPECT_EQ(bytes[kAudioHeaderSize + 2], 0x01);
    EXPECT_EQ(bytes[kAudioHeaderSize + 3], 0x00);

    const AudioChunk back = decodeAudioPayload(bytes);
    EXPECT_EQ(back.sequence, chunk.sequence);
    EXPECT_EQ(back.sampleRate, 16000u);
    EXPECT_EQ(back.channels, 1);
    EXPECT_EQ(back.timestampMs, chunk.timestampMs);
    EXPECT_EQ(back.samples, chunk.samples);
}

TEST(AudioPayload, RejectsMalformedFrames) {
    AudioChunk chunk;
    chunk.samples = {1, 2};
    auto bytes = encodeAudioPayload(chunk);

    auto badMagic = bytes;
    badMagic[0] = 'X';
    EXPECT_THROW(decodeAudioPayload(badMagic), SessionError);

    auto odd = bytes;
    odd.push_back(0);
    EXPECT_THROW(decodeAudioPayload(odd), SessionError);

    auto badFormat = bytes;
    badFormat[15] = 9;
    EXPECT_THROW(decodeAudioPayload(badFormat), SessionError);

    EXPECT_THROW(decodeAudioPayload(std::vector<uint8_t>(10, 0)), SessionError);
}

TEST(Envelope, InvalidJsonIsAProtocolViolation) {
    try {
        decodeClientMessage("{not json");
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolViolation);
        EXPECT_NE(std::string(e.what()).find("Invalid JSON message"), std::string::npos);
    }
    EXPECT_THROW(decodeClientMessage("[1,2]"), SessionError);
    EXPECT_THROW(decodeClientMessage("{\"payload\":{}}"), SessionError);
    EXPECT_THROW(decodeClientMessage("{\"type\":\"dance\",\"payload\":{}}"), SessionError);
}

TEST(ClientMessages, HelloNeedsAUser) {
    const ClientMessage hello = decodeClientMessage(encodeHello("cand-7"));
    EXPECT_EQ(hello.type, ClientMessageType::Hello);
    EXPECT_EQ(hello.userId, "cand-7");
    EXPECT_EQ(hello.protocol, kProtocolVersion);

    EXPECT_THROW(decodeClientMessage(R"({"type":"hello","payload":{}})"), SessionError);
}

TEST(ClientMessages, RequestAnswerNeedsAQuestion) {
    const ClientMessage m = decodeClientMessage(encodeRequestAnswer("Why us?", "general"));
    EXPECT_EQ(m.type, ClientMessageType::RequestAnswer);
    EXPECT_EQ(m.question, "Why us?");
    EXPECT_EQ(m.questionType, "general");

    EXPECT_THROW(decodeClientMessage(R"({"type":"request_answer","payload":{"question":""}})"), SessionError);
}

TEST(ClientMessages, ConfigDefaultsToEnglish) {
    EXPECT_EQ(decodeClientMessage(R"({"type":"config","payload":{}})").language, "en");
    EXPECT_EQ(decodeClientMessage(encodeConfig("ko")).language, "ko");
}

TEST(ClientMessages, ContextToleratesPartialProfiles) {
    const std::string text = R"({"type":"context","payload":{
        "star_stories":[{"id":"s1","title":"Merge conflict","tags":["conflict", 3]}, "junk"],
        "talking_points":["Led migrations", {"content":"Mentors juniors"}, {"other":1}],
        "qa_pairs":[{"id":"q1","question":"Why us?","answer":"Mission."},{"id":"q2","question":"No answer"}]}})";

    const ClientMessage m = decodeClientMessage(text);
    ASSERT_EQ(m.type, ClientMessageType::Context);
    EXPECT_TRUE(m.context.resumeText.empty());
    ASSERT_EQ(m.context.starStories.size(), 1u);
    EXPECT_EQ(m.context.starStories[0].tags, (std::vector<std::string>{"conflict"}));
    EXPECT_EQ(m.context.talkingPoints, (std::vector<std::string>{"Led migrations", "Mentors juniors"}));
    ASSERT_EQ(m.context.qaPairs.size(), 1u);
    EXPECT_EQ(m.context.qaPairs[0].id, "q1");
}

TEST(SessionEvents, StatusCarriesEventNameAndDetail) {
    const std::string text =
        encodeSessionEvent(SessionEvent::statusEvent("generating", {{"question_id", 4}, {"regenerated", true}}));

    const json j = json::parse(text);
    EXPECT_EQ(j["type"], "status");
    EXPECT_EQ(j["payload"]["event"], "generating");

    const SessionEvent e = decodeSessionEvent(text);
    EXPECT_EQ(e.type, SessionEvent::Type::Status);
    EXPECT_EQ(e.status, "generating");
    EXPECT_EQ(e.questionId, 4u);
    EXPECT_TRUE(e.detail.value("regenerated", false));
    EXPECT_FALSE(e.detail.contains("event"));
}

TEST(SessionEvents, AnswerKeepsProvenance) {
    AnswerRecord a;
    a.questionId = 2;
    a.question = "Tell me about a conflict";
    a.answer = "- Situation: ...";
    a.createdAtMs = 1700000000000;
    a.grounded = true;
    a.regenerated = true;
    a.source = "generated";
    a.storyIds = {"s1"};

    const SessionEvent e = decodeSessionEvent(encodeSessionEvent(SessionEvent::answerReady(a)));
    ASSERT_EQ(e.type, SessionEvent::Type::Answer);
    EXPECT_EQ(e.questionId, 2u);
    EXPECT_EQ(e.answer.createdAtMs, a.createdAtMs);
    EXPECT_TRUE(e.answer.grounded);
    EXPECT_TRUE(e.answer.regenerated);
    EXPECT_EQ(e.answer.storyIds, a.storyIds);
}

TEST(SessionEvents, ErrorsUseStableCodes) {
    const std::string text = encodeSessionEvent(SessionEvent::error(ErrorKind::GenerationTimeout, "slow", 3));
    const json j = json::parse(text);
    EXPECT_EQ(j["payload"]["code"], "generation_timeout");
    EXPECT_EQ(j["payload"]["question_id"], 3);

    const SessionEvent e = decodeSessionEvent(text);
    EXPECT_EQ(e.errorKind, ErrorKind::GenerationTimeout);
    EXPECT_EQ(e.questionId, 3u);
    EXPECT_EQ(e.message, "slow");
}

TEST(SessionEvents, StatusWithoutEventIsRejected) {
    EXPECT_THROW(decodeSessionEvent(R"({"type":"status","payload":{}})"), SessionError);
}

TEST(SessionEvents, InvalidUtf8IsReplacedNotThrown) {
    std::string wire;
    ASSERT_NO_THROW(wire = encodeSessionEvent(SessionEvent::transcription("caf\xc3", "caf\xc3", false)));
    const SessionEvent e = decodeSessionEvent(wire);
    EXPECT_EQ(e.text, "caf\xef\xbf\xbd");

    ASSERT_NO_THROW(wire = encodeRequestAnswer("na\xefve?"));
    const ClientMessage m = decodeClientMessage(wire);
    EXPECT_EQ(m.question, "na\xef\xbf\xbd" "ve?");
}

#ifndef MESSAGES_HPP
#define MESSAGES_HPP

#include "audio/audio_chunk.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

static constexpr int kProtocolVersion = 1;

// ---- Binary audio payload ----
// "CCA1", u32 seq, u32 rate, u16 channels, u16 format, u64 timestamp (all big-endian),
// then int16 little-endian samples.
static constexpr std::size_t kAudioHeaderSize = 24;
static constexpr uint16_t kFormatPcm16 = 1;

std::vector<uint8_t> encodeAudioPayload(const AudioChunk& chunk);
// Throws SessionError(ProtocolViolation) on a bad magic, format or odd sample bytes.
AudioChunk decodeAudioPayload(const std::vector<uint8_t>& bytes);

// ---- Text envelopes: {"type": ..., "payload": {...}} ----
struct Envelope {
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
};

std::string encodeEnvelope(const std::string& type, const nlohmann::json& payload);
// Throws SessionError(ProtocolViolation) when the text is not a typed envelope.
Envelope decodeEnvelope(const std::string& text);

nlohmann::json contextToJson(const ContextPayload& context);
// Missing fields default to empty, as profile data is often partial.
ContextPayload contextFromJson(const nlohmann::json& j);

nlohmann::json answerToJson(const AnswerRecord& answer);
AnswerRecord answerFromJson(const nlohmann::json& j);

// ---- Client -> server ----
enum class ClientMessageType { Hello, Config, Context, RequestAnswer, Finalize, Clear };

struct ClientMessage {
    ClientMessageType type = ClientMessageType::Hello;
    std::string userId;          // hello
    int protocol = kProtocolVersion;
    std::string language;        // config
    ContextPayload context;      // context
    std::string question;        // request_answer
    std::string questionType;    // request_answer, optional
};

std::string encodeHello(const std::string& userId);
std::string encodeConfig(const std::string& language);
std::string encodeContext(const ContextPayload& context);
std::string encodeRequestAnswer(const std::string& question, const std::string& questionType = "");
std::string encodeFinalize();
std::string encodeClear();

// Throws SessionError(ProtocolViolation) for unknown types or missing required fields.
ClientMessage decodeClientMessage(const std::string& text);

// ---- Server -> client, and transport-local status ----
struct SessionEvent {
    enum class Type { Transcription, QuestionDetected, Answer, Error, Status };

    Type type = Type::Status;

    // transcription
    std::string text;
    std::string accumulatedText;
    bool isFinal = false;

    // question_detected
    QuestionEvent question;

    // answer
    AnswerRecord answer;

    // error
    ErrorKind errorKind = ErrorKind::GenerationFailure;
    std::string message;

    // error and status "generating"
    uint64_t questionId = 0;

    // status: server events (session_started, config_ack, context_ack, detecting,
    // no_question, generating, finalized, cleared, quality) and transport-local
    // events (connecting, connected, reconnected, disconnected, reconnect_failed)
    std::string status;
    nlohmann::json detail = nlohmann::json::object();

    static SessionEvent transcription(const std::string& text, const std::string& accumulated, bool isFinal);
    static SessionEvent questionDetected(const QuestionEvent& question);
    static SessionEvent answerReady(const AnswerRecord& answer);
    static SessionEvent error(ErrorKind kind, const std::string& message, uint64_t questionId = 0);
    static SessionEvent statusEvent(const std::string& status,
                                    nlohmann::json detail = nlohmann::json::object());
};

std::string encodeSessionEvent(const SessionEvent& event);
// Throws SessionError(ProtocolViolation) for unknown types.
SessionEvent decodeSessionEvent(const std::string& text);

#endif

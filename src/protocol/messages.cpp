#include "protocol/messages.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace {

const char kAudioMagic[4] = {'C', 'C', 'A', '1'};

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(v >> shift));
}

void putU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(v >> shift));
}

uint64_t getBE(const uint8_t* p, int bytes) {
    uint64_t v = 0;
    for (int i = 0; i < bytes; ++i) v = (v << 8) | p[i];
    return v;
}

SessionError protocolError(const std::string& msg) {
    return SessionError(ErrorKind::ProtocolViolation, msg);
}

// Accepts a string, or a number rendered as text; anything else is empty.
std::string stringField(const json& j, const char* key) {
    if (!j.is_object()) return {};
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return {};
}

bool boolField(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

uint64_t u64Field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return 0;
    return it->get<uint64_t>();
}

std::vector<std::string> stringList(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

const json& objectOrEmpty(const json& j) {
    static const json empty = json::object();
    return j.is_object() ? j : empty;
}

} // namespace

// ---- Binary audio payload ----

std::vector<uint8_t> encodeAudioPayload(const AudioChunk& chunk) {
    std::vector<uint8_t> out;
    out.reserve(kAudioHeaderSize + chunk.samples.size() * 2);
    out.insert(out.end(), kAudioMagic, kAudioMagic + 4);
    putU32(out, chunk.sequence);
    putU32(out, chunk.sampleRate);
    putU16(out, chunk.channels);
    putU16(out, kFormatPcm16);
    putU64(out, static_cast<uint64_t>(chunk.timestampMs));
    for (int16_t s : chunk.samples) {
        const uint16_t u = static_cast<uint16_t>(s);
        out.push_back(static_cast<uint8_t>(u & 0xff));
        out.push_back(static_cast<uint8_t>(u >> 8));
    }
    return out;
}

AudioChunk decodeAudioPayload(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < kAudioHeaderSize) throw protocolError("audio frame shorter than header");
    if (!std::equal(kAudioMagic, kAudioMagic + 4, bytes.begin())) throw protocolError("bad audio frame magic");

    const uint8_t* p = bytes.data();
    AudioChunk chunk;
    chunk.sequence = static_cast<uint32_t>(getBE(p + 4, 4));
    chunk.sampleRate = static_cast<uint32_t>(getBE(p + 8, 4));
    chunk.channels = static_cast<uint16_t>(getBE(p + 12, 2));
    const uint16_t format = static_cast<uint16_t>(getBE(p + 14, 2));
    chunk.timestampMs = static_cast<int64_t>(getBE(p + 16, 8));

    if (format != kFormatPcm16) throw protocolError("unsupported audio format " + std::to_string(format));
    if (chunk.sampleRate == 0 || chunk.channels == 0) throw protocolError("audio frame without rate or channels");

    const std::size_t dataBytes = bytes.size() - kAudioHeaderSize;
    if (dataBytes % 2 != 0) throw protocolError("audio frame has odd sample bytes");

    chunk.samples.resize(dataBytes / 2);
    for (std::size_t i = 0; i < chunk.samples.size(); ++i) {
        const uint8_t lo = p[kAudioHeaderSize + 2 * i];
        const uint8_t hi = p[kAudioHeaderSize + 2 * i + 1];
        chunk.samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return chunk;
}

// ---- Envelopes ----

std::string encodeEnvelope(const std::string& type, const json& payload) {
    json j;
    j["type"] = type;
    j["payload"] = payload.is_null() ? json::object() : payload;
    // Recognizer text can stop inside a multi-byte character; bad bytes become U+FFFD.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Envelope decodeEnvelope(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw protocolError(std::string("Invalid JSON message: ") + e.what());
    }
    if (!j.is_object()) throw protocolError("envelope is not an object");

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) throw protocolError("envelope without type");

    Envelope env;
    env.type = type->get<std::string>();
    auto payload = j.find("payload");
    if (payload != j.end() && !payload->is_null()) {
        if (!payload->is_object()) throw protocolError("envelope payload is not an object");
        env.payload = *payload;
    }
    return env;
}

json contextToJson(const ContextPayload& context) {
    json stories = json::array();
    for (const auto& s : context.starStories) {
        stories.push_back({{"id", s.id}, {"title", s.title}, {"situation", s.situation},
                           {"task", s.task}, {"action", s.action}, {"result", s.result},
                           {"tags", s.tags}});
    }

    json qa = json::array();
    for (const auto& p : context.qaPairs) {
        qa.push_back({{"id", p.id}, {"question", p.question}, {"answer", p.answer},
                      {"question_type", p.questionType}});
    }

    return {{"resume_text", context.resumeText},
            {"star_stories", stories},
            {"talking_points", context.talkingPoints},
            {"qa_pairs", qa}};
}

ContextPayload contextFromJson(const json& in) {
    const json& j = objectOrEmpty(in);
    ContextPayload context;
    context.resumeText = stringField(j, "resume_text");

    auto stories = j.find("star_stories");
    if (stories != j.end() && stories->is_array()) {
        for (const auto& item : *stories) {
            if (!item.is_object()) continue;
            StarStory s;
            s.id = stringField(item, "id");
            s.title = stringField(item, "title");
            s.situation = stringField(item, "situation");
            s.task = stringField(item, "task");
            s.action = stringField(item, "action");
            s.result = stringField(item, "result");
            s.tags = stringList(item, "tags");
            context.starStories.push_back(std::move(s));
        }
    }

    auto points = j.find("talking_points");
    if (points != j.end() && points->is_array()) {
        for (const auto& item : *points) {
            std::string text = item.is_string() ? item.get<std::string>() : stringField(item, "content");
            if (!text.empty()) context.talkingPoints.push_back(std::move(text));
        }
    }

    auto qa = j.find("qa_pairs");
    if (qa != j.end() && qa->is_array()) {
        for (const auto& item : *qa) {
            if (!item.is_object()) continue;
            QaPair p;
            p.id = stringField(item, "id");
            p.question = stringField(item, "question");
            p.answer = stringField(item, "answer");
            p.questionType = stringField(item, "question_type");
            if (!p.question.empty() && !p.answer.empty()) context.qaPairs.push_back(std::move(p));
        }
    }
    return context;
}

json answerToJson(const AnswerRecord& answer) {
    return {{"question_id", answer.questionId},
            {"question", answer.question},
            {"answer", answer.answer},
            {"created_at", answer.createdAtMs},
            {"grounded", answer.grounded},
            {"regenerated", answer.regenerated},
            {"source", answer.source},
            {"story_ids", answer.storyIds}};
}

AnswerRecord answerFromJson(const json& in) {
    const json& j = objectOrEmpty(in);
    AnswerRecord a;
    a.questionId = u64Field(j, "question_id");
    a.question = stringField(j, "question");
    a.answer = stringField(j, "answer");
    auto created = j.find("created_at");
    if (created != j.end() && created->is_number_integer()) a.createdAtMs = created->get<int64_t>();
    a.grounded = boolField(j, "grounded", false);
    a.regenerated = boolField(j, "regenerated", false);
    a.source = stringField(j, "source");
    a.storyIds = stringList(j, "story_ids");
    return a;
}

// ---- Client -> server ----

std::string encodeHello(const std::string& userId) {
    return encodeEnvelope("hello", {{"user_id", userId}, {"protocol", kProtocolVersion}});
}

std::string encodeConfig(const std::string& language) {
    return encodeEnvelope("config", {{"language", language}});
}

std::string encodeContext(const ContextPayload& context) {
    return encodeEnvelope("context", contextToJson(context));
}

std::string encodeRequestAnswer(const std::string& question, const std::string& questionType) {
    json payload = {{"question", question}};
    if (!questionType.empty()) payload["question_type"] = questionType;
    return encodeEnvelope("request_answer", payload);
}

std::string encodeFinalize() { return encodeEnvelope("finalize", json::object()); }

std::string encodeClear() { return encodeEnvelope("clear", json::object()); }

ClientMessage decodeClientMessage(const std::string& text) {
    const Envelope env = decodeEnvelope(text);
    ClientMessage msg;

    if (env.type == "hello") {
        msg.type = ClientMessageType::Hello;
        msg.userId = stringField(env.payload, "user_id");
        auto proto = env.payload.find("protocol");
        if (proto != env.payload.end() && proto->is_number_integer()) msg.protocol = proto->get<int>();
        if (msg.userId.empty()) throw protocolError("hello without user_id");
    } else if (env.type == "config") {
        msg.type = ClientMessageType::Config;
        msg.language = stringField(env.payload, "language");
        if (msg.language.empty()) msg.language = "en";
    } else if (env.type == "context") {
        msg.type = ClientMessageType::Context;
        msg.context = contextFromJson(env.payload);
    } else if (env.type == "request_answer") {
        msg.type = ClientMessageType::RequestAnswer;
        msg.question = stringField(env.payload, "question");
        msg.questionType = stringField(env.payload, "question_type");
        if (msg.question.empty()) throw protocolError("request_answer without question");
    } else if (env.type == "finalize") {
        msg.type = ClientMessageType::Finalize;
    } else if (env.type == "clear") {
        msg.type = ClientMessageType::Clear;
    } else {
        throw protocolError("unknown message type: " + env.type);
    }
    return msg;
}

// ---- Server -> client ----

SessionEvent SessionEvent::transcription(const std::string& text, const std::string& accumulated, bool isFinal) {
    SessionEvent e;
    e.type = Type::Transcription;
    e.text = text;
    e.accumulatedText = accumulated;
    e.isFinal = isFinal;
    return e;
}

SessionEvent SessionEvent::questionDetected(const QuestionEvent& question) {
    SessionEvent e;
    e.type = Type::QuestionDetected;
    e.question = question;
    e.questionId = question.id;
    return e;
}

SessionEvent SessionEvent::answerReady(const AnswerRecord& answer) {
    SessionEvent e;
    e.type = Type::Answer;
    e.answer = answer;
    e.questionId = answer.questionId;
    return e;
}

SessionEvent SessionEvent::error(ErrorKind kind, const std::string& message, uint64_t questionId) {
    SessionEvent e;
    e.type = Type::Error;
    e.errorKind = kind;
    e.message = message;
    e.questionId = questionId;
    return e;
}

SessionEvent SessionEvent::statusEvent(const std::string& status, json detail) {
    SessionEvent e;
    e.type = Type::Status;
    e.status = status;
    e.detail = detail.is_object() ? std::move(detail) : json::object();
    e.questionId = u64Field(e.detail, "question_id");
    return e;
}

std::string encodeSessionEvent(const SessionEvent& event) {
    switch (event.type) {
        case SessionEvent::Type::Transcription:
            return encodeEnvelope("transcription", {{"text", event.text},
                                                    {"accumulated_text", event.accumulatedText},
                                                    {"is_final", event.isFinal}});
        case SessionEvent::Type::QuestionDetected:
            return encodeEnvelope("question_detected",
                                  {{"question_id", event.question.id},
                                   {"question", event.question.text},
                                   {"question_type", questionKindName(event.question.kind)}});
        case SessionEvent::Type::Answer:
            return encodeEnvelope("answer", answerToJson(event.answer));
        case SessionEvent::Type::Error: {
            json payload = {{"code", errorCode(event.errorKind)}, {"message", event.message}};
            if (event.questionId != 0) payload["question_id"] = event.questionId;
            return encodeEnvelope("error", payload);
        }
        case SessionEvent::Type::Status: {
            json payload = event.detail;
            payload["event"] = event.status;
            return encodeEnvelope("status", payload);
        }
    }
    throw protocolError("unencodable event");
}

SessionEvent decodeSessionEvent(const std::string& text) {
    const Envelope env = decodeEnvelope(text);
    const json& p = env.payload;

    if (env.type == "transcription") {
        return SessionEvent::transcription(stringField(p, "text"), stringField(p, "accumulated_text"),
                                           boolField(p, "is_final", false));
    }
    if (env.type == "question_detected") {
        QuestionEvent q;
        q.id = u64Field(p, "question_id");
        q.text = stringField(p, "question");
        q.kind = questionKindFromName(stringField(p, "question_type"));
        return SessionEvent::questionDetected(q);
    }
    if (env.type == "answer") {
        return SessionEvent::answerReady(answerFromJson(p));
    }
    if (env.type == "error") {
        return SessionEvent::error(errorKindFromCode(stringField(p, "code")), stringField(p, "message"),
                                   u64Field(p, "question_id"));
    }
    if (env.type == "status") {
        json detail = p;
        const std::string status = stringField(p, "event");
        detail.erase("event");
        if (status.empty()) throw protocolError("status without event");
        return SessionEvent::statusEvent(status, detail);
    }
    throw protocolError("unknown event type: " + env.type);
}

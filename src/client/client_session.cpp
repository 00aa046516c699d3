#include "client/client_session.hpp"
#include "util/log.hpp"

#include <stdexcept>
#include <utility>

namespace {

const char* kTag = "Client Session";

} // namespace

// Constructor
ClientSession::ClientSession(Config config, SessionTransport& transport, ProfileSource& profiles)
    : config_(std::move(config)), transport_(transport), profiles_(profiles) {}

void ClientSession::onChunk(const AudioChunk& chunk) {
    if (state_.connection() != SessionStateMachine::Connection::Streaming || !contextSent_) {
        ++heldBack_;
        return;
    }
    if (transport_.sendAudio(chunk)) audioSinceFinalize_ = true;
}

void ClientSession::onSilence() {
    if (!config_.finalizeOnSilence || !audioSinceFinalize_) return;
    if (state_.connection() != SessionStateMachine::Connection::Streaming) return;
    finalize();
}

void ClientSession::onEvent(const SessionEvent& event) {
    state_.handle(event);

    if (event.type == SessionEvent::Type::Status && event.status == "session_started") {
        contextSent_ = false;
        audioSinceFinalize_ = false;
        if (!transport_.sendConfig(config_.language)) {
            Log::warn(kTag, "language not sent; channel is down");
        }
        uploadContext();
    } else if (event.type == SessionEvent::Type::Status && event.status == "cleared") {
        // Clear empties the server's context; audio waits until it is back.
        contextSent_ = false;
        uploadContext();
    } else if (event.type == SessionEvent::Type::Status && event.status == "disconnected") {
        contextSent_ = false;
    }
}

bool ClientSession::uploadContext() {
    ContextPayload payload;
    try {
        payload = profiles_.fetch(config_.userId);
    } catch (const std::exception& e) {
        // The session still runs; answers are just ungrounded.
        Log::warn(kTag, std::string("profile unavailable, sending empty context: ") + e.what());
    }

    contextSent_ = transport_.sendContext(payload);
    if (!contextSent_) Log::warn(kTag, "context not sent; channel is down");
    return contextSent_;
}

bool ClientSession::refreshContext() {
    if (state_.connection() != SessionStateMachine::Connection::Streaming) return false;
    return uploadContext();
}

bool ClientSession::finalize() {
    audioSinceFinalize_ = false;
    return transport_.finalizeAudio();
}

bool ClientSession::regenerate(const std::string& question) {
    if (!question.empty()) return transport_.requestAnswer(question);

    const auto& last = state_.lastQuestion();
    if (last) return transport_.requestAnswer(last->text, questionKindName(last->kind));
    if (!state_.answers().empty()) return transport_.requestAnswer(state_.answers().front().question);

    Log::warn(kTag, "nothing to regenerate yet");
    return false;
}

bool ClientSession::clear() { return transport_.clearSession(); }

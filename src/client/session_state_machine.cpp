#include "client/session_state_machine.hpp"

bool SessionStateMachine::handle(const SessionEvent& event) {
    switch (event.type) {
        case SessionEvent::Type::Status:
            return handleStatus(event);

        case SessionEvent::Type::Transcription:
            if (connection_ != Connection::Streaming) return false;
            currentText_ = event.isFinal ? std::string() : event.text;
            accumulatedText_ = event.accumulatedText;
            processing_ = ProcessingState::Transcribing;
            lastStable_ = ProcessingState::Transcribing;
            return true;

        case SessionEvent::Type::QuestionDetected:
            if (connection_ != Connection::Streaming) return false;
            if (!enterGenerating(event.question.id)) return false;
            lastQuestion_ = event.question;
            lastStable_ = ProcessingState::Idle;
            currentText_.clear();
            accumulatedText_.clear();
            return true;

        case SessionEvent::Type::Answer:
            answers_.insert(answers_.begin(), event.answer);
            if (generatingQuestion_ == event.answer.questionId) generatingQuestion_ = 0;
            currentText_.clear();
            accumulatedText_.clear();
            settle();
            return true;

        case SessionEvent::Type::Error:
            lastError_ = ErrorInfo{event.errorKind, event.message, event.questionId};
            if (event.errorKind == ErrorKind::GenerationFailure || event.errorKind == ErrorKind::GenerationTimeout) {
                if (event.questionId == 0 || event.questionId == generatingQuestion_) generatingQuestion_ = 0;
                if (processing_ == ProcessingState::Generating) processing_ = lastStable_;
            }
            if (event.errorKind == ErrorKind::TransportDisconnected && connection_ == Connection::Idle) {
                connectionLost_ = true;
            }
            return true;
    }
    return false;
}

bool SessionStateMachine::handleStatus(const SessionEvent& event) {
    const std::string& s = event.status;

    if (s == "connecting") {
        if (connection_ == Connection::Connecting) return false;
        connection_ = Connection::Connecting;
        return true;
    }
    if (s == "connected" || s == "reconnected") {
        connection_ = Connection::Connecting;
        connectionLost_ = false;
        return true;
    }
    if (s == "session_started") {
        connection_ = Connection::Streaming;
        sessionId_ = event.detail.value("session_id", "");
        // Question ids restart with every server session.
        started_.clear();
        generatingQuestion_ = 0;
        processing_ = ProcessingState::Idle;
        lastStable_ = ProcessingState::Idle;
        currentText_.clear();
        accumulatedText_.clear();
        needsContext_ = true;
        return true;
    }
    if (s == "disconnected") {
        const bool unexpected = event.detail.value("unexpected", false);
        connection_ = unexpected ? Connection::Connecting : Connection::Idle;
        processing_ = ProcessingState::Idle;
        lastStable_ = ProcessingState::Idle;
        generatingQuestion_ = 0;
        currentText_.clear();
        accumulatedText_.clear();
        return true;
    }
    if (s == "reconnect_failed") {
        connection_ = Connection::Idle;
        connectionLost_ = true;
        return true;
    }

    if (connection_ != Connection::Streaming) return false;

    if (s == "context_ack") {
        needsContext_ = false;
        return true;
    }
    if (s == "detecting") {
        processing_ = ProcessingState::Detecting;
        return true;
    }
    if (s == "no_question") {
        currentText_.clear();
        accumulatedText_.clear();
        processing_ = ProcessingState::Idle;
        lastStable_ = ProcessingState::Idle;
        return true;
    }
    if (s == "generating") {
        return enterGenerating(event.questionId);
    }
    if (s == "cleared") {
        currentText_.clear();
        accumulatedText_.clear();
        answers_.clear();
        lastQuestion_.reset();
        lastError_.reset();
        generatingQuestion_ = 0;
        processing_ = ProcessingState::Idle;
        lastStable_ = ProcessingState::Idle;
        // The server dropped its context along with the transcript.
        needsContext_ = true;
        return true;
    }
    // config_ack, finalized, quality
    return false;
}

bool SessionStateMachine::enterGenerating(uint64_t questionId) {
    if (questionId != 0 && !started_.insert(questionId).second) return false;
    generatingQuestion_ = questionId;
    processing_ = ProcessingState::Generating;
    return true;
}

// Back to steady streaming once an answer landed
void SessionStateMachine::settle() {
    processing_ = ProcessingState::Idle;
    lastStable_ = ProcessingState::Idle;
}

std::string SessionStateMachine::label() const {
    if (connection_ == Connection::Idle) return "idle";
    if (connection_ == Connection::Connecting) return "connecting";
    switch (processing_) {
        case ProcessingState::Idle: return "steady";
        case ProcessingState::Transcribing: return "transcribing";
        case ProcessingState::Detecting: return "detecting";
        case ProcessingState::Generating: return "generating";
    }
    return "steady";
}

#ifndef SESSION_STATE_MACHINE_HPP
#define SESSION_STATE_MACHINE_HPP

#include "core/errors.hpp"
#include "core/types.hpp"
#include "protocol/messages.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

// What the candidate sees. Fed every event in arrival order from one thread;
// holds no I/O.
class SessionStateMachine {
public:
    enum class Connection { Idle, Connecting, Streaming };

    struct ErrorInfo {
        ErrorKind kind = ErrorKind::GenerationFailure;
        std::string message;
        uint64_t questionId = 0;
    };

    // Returns true when the event changed the view.
    bool handle(const SessionEvent& event);

    Connection connection() const { return connection_; }
    ProcessingState processing() const { return processing_; }

    const std::string& sessionId() const { return sessionId_; }
    const std::string& currentText() const { return currentText_; }
    const std::string& accumulatedText() const { return accumulatedText_; }

    // Newest first.
    const std::vector<AnswerRecord>& answers() const { return answers_; }

    const std::optional<QuestionEvent>& lastQuestion() const { return lastQuestion_; }
    uint64_t generatingQuestion() const { return generatingQuestion_; }
    const std::optional<ErrorInfo>& lastError() const { return lastError_; }

    // True from session start until the server acknowledged a context upload.
    bool needsContext() const { return needsContext_; }

    // A reconnect was attempted and gave up.
    bool connectionLost() const { return connectionLost_; }

    // "idle", "connecting", "steady", "transcribing", "detecting", "generating"
    std::string label() const;

private:
    bool handleStatus(const SessionEvent& event);
    bool enterGenerating(uint64_t questionId);
    void settle();

    Connection connection_ = Connection::Idle;
    ProcessingState processing_ = ProcessingState::Idle;
    ProcessingState lastStable_ = ProcessingState::Idle;

    std::string sessionId_;
    std::string currentText_;
    std::string accumulatedText_;
    std::vector<AnswerRecord> answers_;
    std::optional<QuestionEvent> lastQuestion_;
    uint64_t generatingQuestion_ = 0;
    std::optional<ErrorInfo> lastError_;

    // Question ids that already entered generating in this session.
    std::set<uint64_t> started_;

    bool needsContext_ = false;
    bool connectionLost_ = false;
};

#endif

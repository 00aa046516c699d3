#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind {
    DeviceUnavailable,      // microphone missing or denied; capture stops, session stays up
    TransportDisconnected,  // channel dropped; reconnect with backoff, then resend context
    RecognitionGap,         // lost or reordered audio; logged, never retried
    GenerationFailure,      // model error; answer slot stays empty, user may retry
    GenerationTimeout,      // GenerationFailure with its own code
    ProtocolViolation       // malformed frame or envelope
};

// Stable code used in "error" envelopes.
const char* errorCode(ErrorKind kind);
ErrorKind errorKindFromCode(const std::string& code);

class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* code() const { return errorCode(kind_); }

private:
    ErrorKind kind_;
};

#endif

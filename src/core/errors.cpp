#include "core/errors.hpp"

const char* errorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnavailable:     return "device_unavailable";
        case ErrorKind::TransportDisconnected: return "connection_lost";
        case ErrorKind::RecognitionGap:        return "recognition_gap";
        case ErrorKind::GenerationFailure:     return "generation_error";
        case ErrorKind::GenerationTimeout:     return "generation_timeout";
        case ErrorKind::ProtocolViolation:     return "protocol_error";
    }
    return "generation_error";
}

ErrorKind errorKindFromCode(const std::string& code) {
    if (code == "device_unavailable") return ErrorKind::DeviceUnavailable;
    if (code == "connection_lost") return ErrorKind::TransportDisconnected;
    if (code == "recognition_gap") return ErrorKind::RecognitionGap;
    if (code == "generation_timeout") return ErrorKind::GenerationTimeout;
    if (code == "protocol_error") return ErrorKind::ProtocolViolation;
    return ErrorKind::GenerationFailure;
}

#include "net/frame_codec.hpp"
#include "core/errors.hpp"

#include <string>
#include <utility>

namespace {

FrameKind checkedKind(uint8_t raw) {
    switch (raw) {
        case 0x01: return FrameKind::Text;
        case 0x02: return FrameKind::Binary;
        case 0x08: return FrameKind::Close;
        default: break;
    }
    throw SessionError(ErrorKind::ProtocolViolation, "unknown frame kind " + std::to_string((int)raw));
}

uint32_t checkedLength(const uint8_t* p) {
    const uint32_t len = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    if (len > kMaxFramePayload) {
        throw SessionError(ErrorKind::ProtocolViolation, "frame payload too large: " + std::to_string(len));
    }
    return len;
}

} // namespace

Frame textFrame(const std::string& text) {
    Frame f;
    f.kind = FrameKind::Text;
    f.payload.assign(text.begin(), text.end());
    return f;
}

Frame binaryFrame(std::vector<uint8_t> bytes) {
    Frame f;
    f.kind = FrameKind::Binary;
    f.payload = std::move(bytes);
    return f;
}

Frame closeFrame() {
    Frame f;
    f.kind = FrameKind::Close;
    return f;
}

std::vector<uint8_t> encodeFrame(const Frame& frame) {
    if (frame.payload.size() > kMaxFramePayload) {
        throw SessionError(ErrorKind::ProtocolViolation, "frame payload too large to send");
    }
    const uint32_t len = static_cast<uint32_t>(frame.payload.size());

    std::vector<uint8_t> out;
    out.reserve(kFrameHeaderSize + len);
    out.push_back(static_cast<uint8_t>(frame.kind));
    out.push_back(static_cast<uint8_t>(len >> 24));
    out.push_back(static_cast<uint8_t>(len >> 16));
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len));
    out.insert(out.end(), frame.payload.begin(), frame.payload.end());
    return out;
}

bool readFrame(socket_t s, Frame& out) {
    uint8_t header[kFrameHeaderSize];
    if (!recvExact(s, header, sizeof(header))) return false;

    out.kind = checkedKind(header[0]);
    const uint32_t len = checkedLength(header + 1);
    out.payload.resize(len);
    if (len > 0 && !recvExact(s, out.payload.data(), len)) return false;
    return true;
}

bool writeFrame(socket_t s, const Frame& frame) {
    const std::vector<uint8_t> bytes = encodeFrame(frame);
    return sendAll(s, bytes.data(), bytes.size());
}

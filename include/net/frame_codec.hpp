#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include "net/socket.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Wire frame: 1 byte kind, 4 byte big-endian length, payload.
enum class FrameKind : uint8_t {
    Text = 0x01,
    Binary = 0x02,
    Close = 0x08
};

struct Frame {
    FrameKind kind = FrameKind::Text;
    std::vector<uint8_t> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

static constexpr std::size_t kFrameHeaderSize = 5;
static constexpr std::size_t kMaxFramePayload = 1u << 20;

Frame textFrame(const std::string& text);
Frame binaryFrame(std::vector<uint8_t> bytes);
Frame closeFrame();

std::vector<uint8_t> encodeFrame(const Frame& frame);

// Blocking socket I/O. readFrame returns false when the peer closed the stream
// and throws SessionError(ProtocolViolation) on an unknown kind or an oversized length.
bool readFrame(socket_t s, Frame& out);
bool writeFrame(socket_t s, const Frame& frame);

#endif

#ifndef SOCKET_HPP
#define SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

struct Endpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 8765;
};

// Parses "tcp://host:port" or "host:port". Throws std::invalid_argument.
Endpoint parseEndpoint(const std::string& url);

// Last socket error as text.
std::string socketError();

void closeSocket(socket_t s);
void shutdownSocket(socket_t s);

// Blocking helpers; false when the peer closed or the socket failed.
bool sendAll(socket_t s, const void* data, std::size_t n);
bool recvExact(socket_t s, void* data, std::size_t n);

// TCP listener bound to ip:port (port 0 picks an ephemeral port).
// Throws std::runtime_error on failure.
socket_t openListener(const std::string& bindIp, uint16_t port, int backlog = 16);
uint16_t localPort(socket_t s);

// Throws std::runtime_error on failure.
socket_t connectTo(const Endpoint& endpoint);

void setNoDelay(socket_t s);

#endif

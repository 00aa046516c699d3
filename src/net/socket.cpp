#include "net/socket.hpp"

#include <cstring>
#include <stdexcept>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <netdb.h>
  #include <netinet/in.h>
  #include <netinet/tcp.h>
  #include <sys/socket.h>
  #include <unistd.h>
#endif

Endpoint parseEndpoint(const std::string& url) {
    std::string rest = url;
    const std::string scheme = "tcp://";
    if (rest.compare(0, scheme.size(), scheme) == 0) rest = rest.substr(scheme.size());
    while (!rest.empty() && rest.back() == '/') rest.pop_back();

    const auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
        throw std::invalid_argument("endpoint must look like tcp://host:port: " + url);
    }

    Endpoint ep;
    ep.host = rest.substr(0, colon);
    int port = 0;
    try {
        port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port in endpoint: " + url);
    }
    if (port <= 0 || port > 65535) throw std::invalid_argument("port out of range in endpoint: " + url);
    ep.port = static_cast<uint16_t>(port);
    return ep;
}

std::string socketError() {
#ifdef _WIN32
    return "winsock error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

void closeSocket(socket_t s) {
    if (s == kInvalidSocket) return;
#ifdef _WIN32
    ::closesocket(s);
#else
    ::close(s);
#endif
}

void shutdownSocket(socket_t s) {
    if (s == kInvalidSocket) return;
#ifdef _WIN32
    ::shutdown(s, SD_BOTH);
#else
    ::shutdown(s, SHUT_RDWR);
#endif
}

bool sendAll(socket_t s, const void* data, std::size_t n) {
    const char* p = static_cast<const char*>(data);
    std::size_t off = 0;
    while (off < n) {
#ifdef _WIN32
        const int k = ::send(s, p + off, (int)(n - off), 0);
#else
        const ssize_t k = ::send(s, p + off, n - off, MSG_NOSIGNAL);
#endif
        if (k <= 0) return false;
        off += (std::size_t)k;
    }
    return true;
}

bool recvExact(socket_t s, void* data, std::size_t n) {
    char* p = static_cast<char*>(data);
    std::size_t off = 0;
    while (off < n) {
#ifdef _WIN32
        const int k = ::recv(s, p + off, (int)(n - off), 0);
#else
        const ssize_t k = ::recv(s, p + off, n - off, 0);
#endif
        if (k <= 0) return false;
        off += (std::size_t)k;
    }
    return true;
}

socket_t openListener(const std::string& bindIp, uint16_t port, int backlog) {
    socket_t s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s == kInvalidSocket) throw std::runtime_error("socket() failed: " + socketError());

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, bindIp.c_str(), &addr.sin_addr) != 1) {
        closeSocket(s);
        throw std::runtime_error("invalid bind ip: " + bindIp);
    }

    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string err = socketError();
        closeSocket(s);
        throw std::runtime_error("bind() failed: " + err);
    }

    if (::listen(s, backlog) < 0) {
        const std::string err = socketError();
        closeSocket(s);
        throw std::runtime_error("listen() failed: " + err);
    }
    return s;
}

uint16_t localPort(socket_t s) {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

socket_t connectTo(const Endpoint& endpoint) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const std::string port = std::to_string(endpoint.port);
    const int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        throw std::runtime_error("cannot resolve " + endpoint.host + ": " + ::gai_strerror(rc));
    }

    socket_t s = kInvalidSocket;
    std::string lastError = "no addresses";
    for (addrinfo* ai = result; ai; ai = ai->ai_next) {
        s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s == kInvalidSocket) {
            lastError = socketError();
            continue;
        }
        if (::connect(s, ai->ai_addr, (int)ai->ai_addrlen) == 0) break;
        lastError = socketError();
        closeSocket(s);
        s = kInvalidSocket;
    }
    ::freeaddrinfo(result);

    if (s == kInvalidSocket) {
        throw std::runtime_error("connect to " + endpoint.host + ":" + port + " failed: " + lastError);
    }
    setNoDelay(s);
    return s;
}

void setNoDelay(socket_t s) {
    int flag = 1;
#ifdef _WIN32
    ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, (const char*)&flag, sizeof(flag));
#else
    ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
#endif
}

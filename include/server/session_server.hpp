#ifndef SESSION_SERVER_HPP
#define SESSION_SERVER_HPP

#include "net/socket.hpp"
#include "pipeline/answer_generator.hpp"
#include "pipeline/session_worker.hpp"
#include "stt/recognizer.hpp"
#include "util/event_channel.hpp"

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// TCP front of the interview pipeline. One connection is one session: the
// client says hello, gets a fresh session id, and the session lives until the
// connection drops.
class SessionServer {
public:
    struct Config {
        std::string bindIp = "127.0.0.1";
        uint16_t port = 8765;           // 0 picks an ephemeral port
        std::size_t maxSessions = 32;
        SessionWorker::Config session;
    };

    SessionServer(Config config, RecognizerFactory recognizers, std::shared_ptr<const AnswerGenerator> generator);
    ~SessionServer();

    // Binds and starts accepting. Throws std::runtime_error if the port cannot be bound.
    void start();
    // Closes the listener and every open session.
    void stop();

    bool isRunning() const { return running_.load(); }
    uint16_t port() const { return port_; }
    std::size_t activeSessions() const;

private:
    struct Connection {
        socket_t sock = kInvalidSocket;
        std::string peer;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void run();
    void serve(Connection& conn);
    void reap(bool all);

    Config config_;
    RecognizerFactory recognizers_;
    std::shared_ptr<const AnswerGenerator> generator_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    socket_t listener_{kInvalidSocket};
    uint16_t port_ = 0;

    mutable std::mutex connections_mutex_;
    std::list<std::unique_ptr<Connection>> connections_;
};

// Unique id for a new session.
std::string newSessionId();

#endif

#include "server/session_server.hpp"
#include "net/frame_codec.hpp"
#include "protocol/messages.hpp"
#include "util/log.hpp"

#include <chrono>
#include <cstdio>
#include <functional>
#include <random>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <arpa/inet.h>
  #include <netinet/in.h>
  #include <sys/socket.h>
#endif

namespace {

const char* kTag = "Session Server";

// Queues encoded events for the connection's writer thread.
class OutboundSink : public EventSink {
public:
    explicit OutboundSink(EventChannel<std::string>& out) : out_(out) {}

    void emit(const SessionEvent& event) override { out_.push(encodeSessionEvent(event)); }

private:
    EventChannel<std::string>& out_;
};

void sendError(socket_t s, ErrorKind kind, const std::string& message) {
    writeFrame(s, textFrame(encodeSessionEvent(SessionEvent::error(kind, message))));
}

} // namespace

std::string newSessionId() {
    static std::mutex mutex;
    static std::mt19937_64 rng(std::random_device{}());

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = rng();
        lo = rng();
    }

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>(0x4000 | (hi & 0x0fff)), static_cast<unsigned>(0x8000 | (lo >> 50)),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return buf;
}

// Constructor
SessionServer::SessionServer(Config config, RecognizerFactory recognizers,
                             std::shared_ptr<const AnswerGenerator> generator)
    : config_(std::move(config)), recognizers_(std::move(recognizers)), generator_(std::move(generator)) {
    if (!recognizers_) throw std::invalid_argument("SessionServer needs a recognizer factory");
    if (!generator_) throw std::invalid_argument("SessionServer needs an answer generator");
}

// Destructor
SessionServer::~SessionServer() { stop(); }

// Binds the listener and starts the accept thread
void SessionServer::start() {
    if (running_.load()) return;

    listener_ = openListener(config_.bindIp, config_.port);
    port_ = localPort(listener_);
    running_ = true;

    Log::info(kTag, "Listening on tcp://" + config_.bindIp + ":" + std::to_string(port_));
    thread_ = std::thread(&SessionServer::run, this);
}

// Stops accepting and closes every session
void SessionServer::stop() {
    if (!running_.exchange(false)) return;

    shutdownSocket(listener_);
    closeSocket(listener_);
    listener_ = kInvalidSocket;

    if (thread_.joinable()) thread_.join();

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& c : connections_) shutdownSocket(c->sock);
    }
    reap(true);
    Log::info(kTag, "Stopped");
}

std::size_t SessionServer::activeSessions() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::size_t n = 0;
    for (const auto& c : connections_) {
        if (!c->done.load()) ++n;
    }
    return n;
}

// Joins finished connection threads, or all of them
void SessionServer::reap(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c->thread.joinable()) c->thread.join();
        closeSocket(c->sock);
    }
}

// Accept loop
void SessionServer::run() {
    while (running_.load()) {
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
#else
        socklen_t slen = sizeof(src);
#endif
        socket_t s = ::accept(listener_, reinterpret_cast<sockaddr*>(&src), &slen);
        if (s == kInvalidSocket) {
            if (running_.load()) Log::error(kTag, "accept() failed: " + socketError());
            break;
        }

        reap(false);

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        const std::string peer =
            std::string(ok ? ipstr : "?") + ":" + std::to_string(ntohs(src.sin_port));

        if (activeSessions() >= config_.maxSessions) {
            Log::warn(kTag, "Rejecting " + peer + ": " + std::to_string(config_.maxSessions) + " sessions open");
            sendError(s, ErrorKind::ProtocolViolation, "server busy");
            closeSocket(s);
            continue;
        }

        setNoDelay(s);
        Log::info(kTag, "Connection from " + peer);

        auto conn = std::make_unique<Connection>();
        conn->sock = s;
        conn->peer = peer;
        Connection& ref = *conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.push_back(std::move(conn));
        }
        ref.thread = std::thread(&SessionServer::serve, this, std::ref(ref));
    }
}

// Per-connection thread: handshake, then frames into the session worker
void SessionServer::serve(Connection& conn) {
    const socket_t s = conn.sock;

    try {
        Frame frame;
        if (!readFrame(s, frame)) {
            Log::info(kTag, conn.peer + " closed before hello");
            conn.done = true;
            return;
        }

        ClientMessage hello;
        if (frame.kind == FrameKind::Text) hello = decodeClientMessage(frame.text());
        if (frame.kind != FrameKind::Text || hello.type != ClientMessageType::Hello) {
            throw SessionError(ErrorKind::ProtocolViolation, "expected hello as first message");
        }
        if (hello.protocol != kProtocolVersion) {
            throw SessionError(ErrorKind::ProtocolViolation,
                               "unsupported protocol version " + std::to_string(hello.protocol));
        }

        EventChannel<std::string> outbound;
        OutboundSink sink(outbound);
        const std::string sessionId = newSessionId();

        SessionWorker worker(sessionId, config_.session, recognizers_(), generator_, sink);
        Log::info(kTag, "Session " + sessionId + " started for user " + hello.userId + " (" + conn.peer + ")");

        std::thread writer([&] {
            std::string text;
            while (outbound.pop(text)) {
                if (!writeFrame(s, textFrame(text))) {
                    Log::warn(kTag, "Session " + sessionId + ": write failed: " + socketError());
                    shutdownSocket(s);
                    break;
                }
            }
        });

        sink.emit(SessionEvent::statusEvent("session_started", {{"session_id", sessionId}}));
        worker.start();

        while (running_.load()) {
            try {
                if (!readFrame(s, frame)) break;
            } catch (const SessionError& e) {
                // Framing is lost; nothing after this can be trusted.
                Log::warn(kTag, "Session " + sessionId + ": " + e.code() + ": " + e.what());
                outbound.push(encodeSessionEvent(SessionEvent::error(e.kind(), e.what())));
                break;
            }

            if (frame.kind == FrameKind::Close) break;

            try {
                if (frame.kind == FrameKind::Binary) {
                    worker.submitAudio(decodeAudioPayload(frame.payload));
                } else {
                    ClientMessage msg = decodeClientMessage(frame.text());
                    if (msg.type == ClientMessageType::Hello) {
                        throw SessionError(ErrorKind::ProtocolViolation, "hello sent twice");
                    }
                    worker.submit(std::move(msg));
                }
            } catch (const SessionError& e) {
                Log::warn(kTag, "Session " + sessionId + ": " + e.code() + ": " + e.what());
                outbound.push(encodeSessionEvent(SessionEvent::error(e.kind(), e.what())));
            } catch (const std::exception& e) {
                Log::warn(kTag, "Session " + sessionId + ": " + e.what());
                outbound.push(encodeSessionEvent(SessionEvent::error(ErrorKind::ProtocolViolation, e.what())));
            }
        }

        // Cancels in-flight generation; nothing is delivered for it.
        worker.close();
        outbound.close();
        writer.join();

        const SessionWorker::Stats st = worker.stats();
        Log::info(kTag, "Session " + sessionId + " ended (" + conn.peer + "): received " +
                            std::to_string(st.chunks) + " audio chunks, " + std::to_string(st.bytes) +
                            " bytes, " + std::to_string(st.missingChunks) + " missing");
    } catch (const SessionError& e) {
        Log::warn(kTag, conn.peer + ": " + e.code() + ": " + e.what());
        sendError(s, e.kind(), e.what());
    } catch (const std::exception& e) {
        Log::error(kTag, conn.peer + ": " + e.what());
    }

    // Closed by reap() once this thread is joined.
    shutdownSocket(s);
    conn.done = true;
}

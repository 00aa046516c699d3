#include "client/session_transport.hpp"
#include "net/frame_codec.hpp"
#include "util/log.hpp"

#include <stdexcept>
#include <utility>

namespace {

const char* kTag = "Session Transport";

} // namespace

// Constructor
SessionTransport::SessionTransport(Config config, EventHandler onEvent)
    : config_(std::move(config)),
      endpoint_(parseEndpoint(config_.url)),
      onEvent_(std::move(onEvent)),
      policy_(config_.reconnect) {
    if (!onEvent_) throw std::invalid_argument("SessionTransport needs an event handler");
}

// Destructor
SessionTransport::~SessionTransport() { close(); }

void SessionTransport::connect(const std::string& url) {
    if (running_.load()) throw std::logic_error("SessionTransport is already connected");
    endpoint_ = parseEndpoint(url);
    config_.url = url;
    connect();
}

// Starts the connection thread
void SessionTransport::connect() {
    if (running_.exchange(true)) return;
    if (thread_.joinable()) thread_.join();
    policy_.reset();
    thread_ = std::thread(&SessionTransport::run, this);
}

// Stops the connection thread
void SessionTransport::close() {
    if (!running_.exchange(false)) {
        if (thread_.joinable()) thread_.join();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (sock_ != kInvalidSocket) {
            if (!writeFrame(sock_, closeFrame())) Log::debug(kTag, "close frame not sent: " + socketError());
            shutdownSocket(sock_);
        }
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) thread_.join();
}

bool SessionTransport::waitConnected(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return wait_cv_.wait_for(lock, timeout, [&] { return connected_.load() || !running_.load(); }) &&
           connected_.load();
}

std::string SessionTransport::sessionId() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return sessionId_;
}

void SessionTransport::deliver(const SessionEvent& event) {
    try {
        onEvent_(event);
    } catch (const std::exception& e) {
        Log::error(kTag, std::string("event handler threw: ") + e.what());
    }
}

bool SessionTransport::sendText(const std::string& text) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (sock_ == kInvalidSocket) return false;
    if (!writeFrame(sock_, textFrame(text))) {
        Log::warn(kTag, "send failed: " + socketError());
        // Wakes the reader, which runs the reconnect path.
        shutdownSocket(sock_);
        return false;
    }
    return true;
}

bool SessionTransport::sendAudio(const AudioChunk& chunk) {
    bool sent = false;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (sock_ != kInvalidSocket && connected_.load()) {
            sent = writeFrame(sock_, binaryFrame(encodeAudioPayload(chunk)));
            if (!sent) shutdownSocket(sock_);
        }
    }
    if (!sent) ++dropped_;
    return sent;
}

bool SessionTransport::sendContext(const ContextPayload& context) { return sendText(encodeContext(context)); }

bool SessionTransport::requestAnswer(const std::string& question, const std::string& questionType) {
    return sendText(encodeRequestAnswer(question, questionType));
}

bool SessionTransport::finalizeAudio() { return sendText(encodeFinalize()); }

bool SessionTransport::clearSession() { return sendText(encodeClear()); }

bool SessionTransport::sendConfig(const std::string& language) { return sendText(encodeConfig(language)); }

// Connection thread: connect, read until the channel drops, back off, repeat
void SessionTransport::run() {
    ReconnectPolicy& policy = policy_;
    bool everConnected = false;

    while (running_.load()) {
        deliver(SessionEvent::statusEvent("connecting", {{"url", config_.url}, {"attempt", policy.attempts()}}));

        socket_t s = kInvalidSocket;
        try {
            s = connectTo(endpoint_);
            if (!writeFrame(s, textFrame(encodeHello(config_.userId)))) {
                closeSocket(s);
                s = kInvalidSocket;
                Log::warn(kTag, "hello failed: " + socketError());
            }
        } catch (const std::exception& e) {
            Log::warn(kTag, e.what());
        }

        if (s != kInvalidSocket) {
            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                sock_ = s;
                sessionId_.clear();
                // close() ran before the socket was published; let readLoop return at once.
                if (!running_.load()) shutdownSocket(s);
            }
            {
                std::lock_guard<std::mutex> lock(wait_mutex_);
                connected_ = true;
            }
            wait_cv_.notify_all();

            Log::info(kTag, std::string(everConnected ? "Reconnected to " : "Connected to ") + config_.url);
            deliver(SessionEvent::statusEvent(everConnected ? "reconnected" : "connected", {{"url", config_.url}}));
            everConnected = true;

            readLoop(s);

            {
                std::lock_guard<std::mutex> lock(send_mutex_);
                sock_ = kInvalidSocket;
            }
            connected_ = false;
            closeSocket(s);

            if (!running_.load()) {
                Log::info(kTag, "Disconnected");
                deliver(SessionEvent::statusEvent("disconnected", {{"unexpected", false}}));
                break;
            }
            Log::warn(kTag, "Connection to " + config_.url + " lost");
            deliver(SessionEvent::statusEvent("disconnected", {{"unexpected", true}}));
        }

        const auto delay = policy.nextDelay();
        if (!delay) {
            const std::string msg = "could not reach " + config_.url + " after " +
                                    std::to_string(policy.attempts()) + " attempts";
            Log::error(kTag, msg);
            deliver(SessionEvent::statusEvent("reconnect_failed", {{"attempts", policy.attempts()}}));
            deliver(SessionEvent::error(ErrorKind::TransportDisconnected, msg));
            {
                std::lock_guard<std::mutex> lock(wait_mutex_);
                running_ = false;
            }
            wait_cv_.notify_all();
            break;
        }

        Log::info(kTag, "Retrying in " + std::to_string(delay->count()) + " ms");
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, *delay, [&] { return !running_.load(); });
    }
}

void SessionTransport::readLoop(socket_t s) {
    Frame frame;
    while (true) {
        try {
            if (!readFrame(s, frame)) return;
        } catch (const SessionError& e) {
            Log::warn(kTag, std::string(e.code()) + ": " + e.what());
            return;
        }

        if (frame.kind == FrameKind::Close) return;
        if (frame.kind != FrameKind::Text) continue;

        try {
            SessionEvent event = decodeSessionEvent(frame.text());
            if (event.type == SessionEvent::Type::Status && event.status == "session_started") {
                // Only an accepted session counts as recovered; a refused hello keeps backing off.
                policy_.reset();
                std::lock_guard<std::mutex> lock(send_mutex_);
                sessionId_ = event.detail.value("session_id", "");
            }
            deliver(event);
        } catch (const SessionError& e) {
            Log::warn(kTag, std::string(e.code()) + ": " + e.what());
            deliver(SessionEvent::error(e.kind(), e.what()));
        } catch (const std::exception& e) {
            Log::warn(kTag, std::string("bad event: ") + e.what());
            deliver(SessionEvent::error(ErrorKind::ProtocolViolation, e.what()));
        }
    }
}

#ifndef SESSION_TRANSPORT_HPP
#define SESSION_TRANSPORT_HPP

#include "audio/audio_chunk.hpp"
#include "client/reconnect_policy.hpp"
#include "core/types.hpp"
#include "net/socket.hpp"
#include "protocol/messages.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Client end of the session channel.
//
// Outbound calls may come from any thread. Inbound frames are decoded on the
// reader thread and handed, in order, to the event handler together with the
// transport's own status events (connecting, connected, reconnected,
// disconnected, reconnect_failed). The handler should only enqueue; it must
// not call close().
class SessionTransport {
public:
    using EventHandler = std::function<void(const SessionEvent& event)>;

    struct Config {
        std::string url = "tcp://127.0.0.1:8765";
        std::string userId;
        ReconnectPolicy::Config reconnect;
    };

    SessionTransport(Config config, EventHandler onEvent);
    ~SessionTransport();

    SessionTransport(const SessionTransport&) = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;

    // Starts connecting in the background. A lost channel is re-established
    // with backoff until the policy gives up. Throws std::invalid_argument on
    // a malformed url.
    void connect();
    void connect(const std::string& url);

    // User-initiated shutdown; no reconnect follows.
    void close();

    bool isConnected() const { return connected_.load(); }
    bool waitConnected(std::chrono::milliseconds timeout);

    // Audio sent while disconnected is dropped and counted, never queued.
    bool sendAudio(const AudioChunk& chunk);
    bool sendContext(const ContextPayload& context);
    bool requestAnswer(const std::string& question, const std::string& questionType = "");
    bool finalizeAudio();
    bool clearSession();
    bool sendConfig(const std::string& language);

    uint64_t droppedChunks() const { return dropped_.load(); }
    std::string sessionId() const;

private:
    void run();
    void readLoop(socket_t s);
    bool sendText(const std::string& text);
    void deliver(const SessionEvent& event);

    Config config_;
    Endpoint endpoint_;
    EventHandler onEvent_;
    ReconnectPolicy policy_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> dropped_{0};

    mutable std::mutex send_mutex_;
    socket_t sock_{kInvalidSocket};
    std::string sessionId_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

#endif

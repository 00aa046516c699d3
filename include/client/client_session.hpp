#ifndef CLIENT_SESSION_HPP
#define CLIENT_SESSION_HPP

#include "audio/audio_chunk.hpp"
#include "client/profile_source.hpp"
#include "client/session_state_machine.hpp"
#include "client/session_transport.hpp"

#include <cstdint>
#include <string>

// Client-side session logic, driven from the one consumer loop: audio chunks,
// silence, transport events and user commands all arrive here in order.
//
// Every new server session gets the language and a fresh context before any
// audio; chunks captured before that are dropped.
class ClientSession {
public:
    struct Config {
        std::string userId;
        std::string language = "en";
        bool finalizeOnSilence = true;
    };

    ClientSession(Config config, SessionTransport& transport, ProfileSource& profiles);

    void onChunk(const AudioChunk& chunk);
    void onSilence();
    void onEvent(const SessionEvent& event);

    // Manual "I'm done talking".
    bool finalize();
    // Asks for a fresh answer to the last question, or to the given text.
    bool regenerate(const std::string& question = "");
    bool clear();
    // Re-reads the profile and uploads it.
    bool refreshContext();

    const SessionStateMachine& state() const { return state_; }
    uint64_t heldBackChunks() const { return heldBack_; }
    bool contextSent() const { return contextSent_; }

private:
    bool uploadContext();

    Config config_;
    SessionTransport& transport_;
    ProfileSource& profiles_;
    SessionStateMachine state_;

    bool contextSent_ = false;
    bool audioSinceFinalize_ = false;
    uint64_t heldBack_ = 0;
};

#endif

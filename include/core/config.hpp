#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "audio/capture_engine.hpp"
#include "client/client_session.hpp"
#include "client/session_transport.hpp"
#include "pipeline/answer_generator.hpp"
#include "server/session_server.hpp"
#include "stt/whisper_recognizer.hpp"

#include <string>
#include <vector>

// Settings are layered: built-in defaults, then the JSON file named by
// --config, then the environment, then command-line flags.

struct ServerConfig {
    SessionServer::Config server;
    std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
    bool useGpu = false;
    WhisperRecognizer::Config whisper;
    AnswerGenerator::Config answers;
    std::string logLevel = "info";
    bool help = false;
};

struct ClientConfig {
    SessionTransport::Config transport;
    AudioCaptureEngine::Config capture;
    ClientSession::Config session;
    std::string profilePath;
    std::string logLevel = "info";
    bool listDevices = false;
    bool help = false;
};

// args excludes the program name. Throw std::invalid_argument on unknown flags,
// missing values or bad numbers, std::runtime_error on an unreadable file.
ServerConfig loadServerConfig(const std::vector<std::string>& args);
ClientConfig loadClientConfig(const std::vector<std::string>& args);

std::vector<std::string> argsFrom(int argc, char** argv);

std::string serverUsage();
std::string clientUsage();

#endif

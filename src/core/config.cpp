#include "core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open config file " + path);
    try {
        json j;
        in >> j;
        if (!j.is_object()) throw std::runtime_error("config file " + path + " is not a JSON object");
        return j;
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid config file " + path + ": " + e.what());
    }
}

// Copies j[key] into out when present; a value of the wrong type is an error.
template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw std::invalid_argument(std::string("config key '") + key + "' has the wrong type");
    }
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    return it != j.end() && it->is_object() ? *it : empty;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return v && *v ? v : nullptr;
}

int toInt(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

double toDouble(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

uint16_t toPort(const std::string& flag, const std::string& value) {
    const int port = toInt(flag, value);
    if (port < 0 || port > 65535) throw std::invalid_argument(flag + " out of range: " + value);
    return static_cast<uint16_t>(port);
}

// Finds --config first so the file sits under env and flags.
std::string configPath(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw std::invalid_argument("--config needs a value");
            return args[i + 1];
        }
    }
    return "";
}

class FlagReader {
public:
    explicit FlagReader(const std::vector<std::string>& args) : args_(args) {}

    bool next(std::string& flag) {
        if (i_ >= args_.size()) return false;
        flag = args_[i_++];
        return true;
    }

    std::string value(const std::string& flag) {
        if (i_ >= args_.size()) throw std::invalid_argument(flag + " needs a value");
        return args_[i_++];
    }

private:
    const std::vector<std::string>& args_;
    std::size_t i_ = 0;
};

void applyServerJson(ServerConfig& c, const json& j) {
    read(j, "bind", c.server.bindIp);
    int port = c.server.port;
    read(j, "port", port);
    c.server.port = toPort("port", std::to_string(port));
    read(j, "max_sessions", c.server.maxSessions);
    read(j, "log_level", c.logLevel);

    const json& w = section(j, "whisper");
    read(w, "model", c.modelPath);
    read(w, "use_gpu", c.useGpu);
    read(w, "threads", c.whisper.threads);
    read(w, "language", c.whisper.language);
    read(w, "partial_interval_ms", c.whisper.partialIntervalMs);
    read(w, "no_speech_threshold", c.whisper.noSpeechThreshold);
    read(w, "vad_start_rms", c.whisper.segmenter.vadStartRms);
    read(w, "vad_stop_rms", c.whisper.segmenter.vadStopRms);
    read(w, "start_hang_ms", c.whisper.segmenter.startHangMs);
    read(w, "stop_hang_ms", c.whisper.segmenter.stopHangMs);
    read(w, "max_utterance_ms", c.whisper.segmenter.maxUtteranceMs);

    const json& g = section(j, "generation");
    read(g, "timeout_ms", c.server.session.generationTimeoutMs);
    read(g, "max_stories", c.answers.maxStories);
    read(g, "qa_match_threshold", c.answers.qaMatchThreshold);
}

void applyClientJson(ClientConfig& c, const json& j) {
    read(j, "url", c.transport.url);
    read(j, "user", c.transport.userId);
    read(j, "profile", c.profilePath);
    read(j, "language", c.session.language);
    read(j, "finalize_on_silence", c.session.finalizeOnSilence);
    read(j, "log_level", c.logLevel);

    const json& a = section(j, "audio");
    read(a, "sample_rate", c.capture.sampleRate);
    read(a, "frames_per_buffer", c.capture.framesPerBuffer);
    read(a, "chunk_ms", c.capture.chunkMs);
    read(a, "silence_threshold", c.capture.silenceThreshold);
    read(a, "silence_ms", c.capture.silenceMs);
    read(a, "device", c.capture.deviceIndex);

    const json& r = section(j, "reconnect");
    read(r, "initial_ms", c.transport.reconnect.initialDelayMs);
    read(r, "multiplier", c.transport.reconnect.multiplier);
    read(r, "max_ms", c.transport.reconnect.maxDelayMs);
    read(r, "max_attempts", c.transport.reconnect.maxAttempts);
}

} // namespace

std::vector<std::string> argsFrom(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return args;
}

ServerConfig loadServerConfig(const std::vector<std::string>& args) {
    ServerConfig c;

    const std::string file = configPath(args);
    if (!file.empty()) applyServerJson(c, readJsonFile(file));

    if (const char* v = env("CUECARD_WHISPER_MODEL")) c.modelPath = v;

    FlagReader flags(args);
    std::string flag;
    while (flags.next(flag)) {
        if (flag == "--config") {
            flags.value(flag);
        } else if (flag == "--bind") {
            c.server.bindIp = flags.value(flag);
        } else if (flag == "--port") {
            c.server.port = toPort(flag, flags.value(flag));
        } else if (flag == "--model") {
            c.modelPath = flags.value(flag);
        } else if (flag == "--gpu") {
            c.useGpu = true;
        } else if (flag == "--threads") {
            c.whisper.threads = toInt(flag, flags.value(flag));
        } else if (flag == "--language") {
            c.whisper.language = flags.value(flag);
        } else if (flag == "--timeout-ms") {
            c.server.session.generationTimeoutMs = toInt(flag, flags.value(flag));
        } else if (flag == "--max-stories") {
            c.answers.maxStories = static_cast<std::size_t>(toInt(flag, flags.value(flag)));
        } else if (flag == "--max-sessions") {
            c.server.maxSessions = static_cast<std::size_t>(toInt(flag, flags.value(flag)));
        } else if (flag == "--log-level") {
            c.logLevel = flags.value(flag);
        } else if (flag == "--help" || flag == "-h") {
            c.help = true;
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    c.server.session.language = c.whisper.language;
    if (c.server.session.generationTimeoutMs <= 0) throw std::invalid_argument("generation timeout must be positive");
    if (c.whisper.threads <= 0) throw std::invalid_argument("whisper threads must be positive");
    return c;
}

ClientConfig loadClientConfig(const std::vector<std::string>& args) {
    ClientConfig c;

    const std::string file = configPath(args);
    if (!file.empty()) applyClientJson(c, readJsonFile(file));

    if (const char* v = env("CUECARD_URL")) c.transport.url = v;
    if (const char* v = env("CUECARD_USER")) c.transport.userId = v;

    FlagReader flags(args);
    std::string flag;
    while (flags.next(flag)) {
        if (flag == "--config") {
            flags.value(flag);
        } else if (flag == "--url") {
            c.transport.url = flags.value(flag);
        } else if (flag == "--user") {
            c.transport.userId = flags.value(flag);
        } else if (flag == "--profile") {
            c.profilePath = flags.value(flag);
        } else if (flag == "--language") {
            c.session.language = flags.value(flag);
        } else if (flag == "--device") {
            c.capture.deviceIndex = toInt(flag, flags.value(flag));
        } else if (flag == "--chunk-ms") {
            c.capture.chunkMs = toInt(flag, flags.value(flag));
        } else if (flag == "--silence-ms") {
            c.capture.silenceMs = toInt(flag, flags.value(flag));
        } else if (flag == "--silence-threshold") {
            c.capture.silenceThreshold = static_cast<float>(toDouble(flag, flags.value(flag)));
        } else if (flag == "--no-auto-finalize") {
            c.session.finalizeOnSilence = false;
        } else if (flag == "--list-devices") {
            c.listDevices = true;
        } else if (flag == "--log-level") {
            c.logLevel = flags.value(flag);
        } else if (flag == "--help" || flag == "-h") {
            c.help = true;
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    if (c.transport.userId.empty() && !c.help && !c.listDevices) {
        throw std::invalid_argument("no user identity; pass --user or set CUECARD_USER");
    }
    c.session.userId = c.transport.userId;
    parseEndpoint(c.transport.url);  // throws on a malformed url
    return c;
}

std::string serverUsage() {
    return "usage: cuecard_server [options]\n"
           "  --config <file>       JSON settings\n"
           "  --bind <ip>           listen address (127.0.0.1)\n"
           "  --port <n>            listen port (8765)\n"
           "  --model <path>        whisper model, or CUECARD_WHISPER_MODEL\n"
           "  --gpu                 decode on the GPU\n"
           "  --threads <n>         whisper threads (4)\n"
           "  --language <code>     default recognition language (en)\n"
           "  --timeout-ms <n>      answer generation timeout (20000)\n"
           "  --max-stories <n>     STAR stories per answer (2)\n"
           "  --max-sessions <n>    concurrent sessions (32)\n"
           "  --log-level <level>   debug, info, warn, error\n";
}

std::string clientUsage() {
    return "usage: cuecard_client [options]\n"
           "  --config <file>            JSON settings\n"
           "  --url <tcp://host:port>    server, or CUECARD_URL\n"
           "  --user <id>                user identity, or CUECARD_USER (required)\n"
           "  --profile <file>           JSON profile with resume and STAR stories\n"
           "  --language <code>          recognition language (en)\n"
           "  --device <n>               input device index (default device)\n"
           "  --chunk-ms <n>             audio chunk interval (1000)\n"
           "  --silence-ms <n>           silence before a question boundary (800)\n"
           "  --silence-threshold <n>    level below which audio counts as silence (5)\n"
           "  --no-auto-finalize         only finalize on command\n"
           "  --list-devices             print input devices and exit\n"
           "  --log-level <level>        debug, info, warn, error\n";
}

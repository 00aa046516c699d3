#include "util/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

std::atomic<int> g_level{static_cast<int>(Log::Level::Info)};
std::mutex g_write_mutex;

const char* levelName(Log::Level level) {
    switch (level) {
        case Log::Level::Debug: return "DEBUG";
        case Log::Level::Info:  return "INFO";
        case Log::Level::Warn:  return "WARN";
        case Log::Level::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

void Log::setLevel(Level level) { g_level.store(static_cast<int>(level)); }

Log::Level Log::level() { return static_cast<Level>(g_level.load()); }

Log::Level Log::parseLevel(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

void Log::debug(const std::string& tag, const std::string& msg) { write(Level::Debug, tag, msg); }
void Log::info(const std::string& tag, const std::string& msg) { write(Level::Info, tag, msg); }
void Log::warn(const std::string& tag, const std::string& msg) { write(Level::Warn, tag, msg); }
void Log::error(const std::string& tag, const std::string& msg) { write(Level::Error, tag, msg); }

void Log::write(Level level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = (level >= Level::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] [" << levelName(level) << "] " << msg << std::endl;
}

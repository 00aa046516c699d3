#ifndef LOG_HPP
#define LOG_HPP

#include <string>

// Console logger. Lines look like "[Session Server] [WARN] message".
// DEBUG/INFO go to stdout, WARN/ERROR to stderr.
class Log {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    static void setLevel(Level level);
    static Level level();

    // Accepts "debug", "info", "warn", "error". Throws std::invalid_argument otherwise.
    static Level parseLevel(const std::string& name);

    static void debug(const std::string& tag, const std::string& msg);
    static void info(const std::string& tag, const std::string& msg);
    static void warn(const std::string& tag, const std::string& msg);
    static void error(const std::string& tag, const std::string& msg);

private:
    static void write(Level level, const std::string& tag, const std::string& msg);
};

#endif

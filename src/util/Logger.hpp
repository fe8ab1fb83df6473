#pragma once

#include <string>

namespace rit {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic log
 *
 * Every level is written to stderr; stdout carries only command output.
 * The starting level comes from RIT_LOG.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level <= currentLevel; }
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse "error|warn|info|debug" or "0".."3"; unknown values give Info
    static LogLevel parseLevel(const std::string& value);

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;
    LogLevel currentLevel;
};

}

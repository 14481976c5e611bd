// Minimal logging interface. A logger is handed to the connector and to the
// transport backends explicitly; nothing here is process-global.
#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace sftpkit {

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

const char* toString(LogLevel level);

// Parses "trace", "debug", "info", "warn"/"warning", "error", "off" (case
// insensitive). Unknown or empty text yields "fallback".
LogLevel parseLogLevel(const std::string& text, LogLevel fallback);

// Only supports the "{}" placeholder, without escaping.
template <typename... Args>
std::string formatMessage(std::string_view fmt, const Args&... args) {
    std::ostringstream out;
    out << std::boolalpha;
    std::string_view::size_type pos = 0;

    auto replace = [&](const auto& arg) {
        if (pos == std::string_view::npos)
            return;
        const auto f = fmt.find("{}", pos);
        if (f == std::string_view::npos)
            return;
        out << fmt.substr(pos, f - pos) << arg;
        pos = f + 2;
    };
    (replace(args), ...);

    if (pos < fmt.size())
        out << fmt.substr(pos);
    return out.str();
}

class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info) : level_(level) {}
    virtual ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_;
    }
    LogLevel level() const { return level_; }
    void setLevel(LogLevel level) { level_ = level; }

    void logLine(LogLevel level, const std::string& line) {
        if (enabled(level))
            write(level, line);
    }

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, const Args&... args) {
        if (enabled(level))
            write(level, formatMessage(fmt, args...));
    }

    template <typename... Args>
    void trace(std::string_view fmt, const Args&... args) { log(LogLevel::Trace, fmt, args...); }
    template <typename... Args>
    void debug(std::string_view fmt, const Args&... args) { log(LogLevel::Debug, fmt, args...); }
    template <typename... Args>
    void info(std::string_view fmt, const Args&... args) { log(LogLevel::Info, fmt, args...); }
    template <typename... Args>
    void warn(std::string_view fmt, const Args&... args) { log(LogLevel::Warn, fmt, args...); }
    template <typename... Args>
    void error(std::string_view fmt, const Args&... args) { log(LogLevel::Error, fmt, args...); }

protected:
    virtual void write(LogLevel level, const std::string& line) = 0;

private:
    LogLevel level_;
};

// "[sftpkit] WARN message" lines on stderr.
class StderrLogger : public Logger {
public:
    using Logger::Logger;

protected:
    void write(LogLevel level, const std::string& line) override;
};

// Prefixes every line with a tag and forwards to another logger, which
// decides whether the line is kept.
class TaggedLogger : public Logger {
public:
    TaggedLogger(std::shared_ptr<Logger> target, std::string tag);

protected:
    void write(LogLevel level, const std::string& line) override;

private:
    std::shared_ptr<Logger> target_;
    std::string tag_;
};

// Discards everything.
class NullLogger : public Logger {
public:
    NullLogger() : Logger(LogLevel::Off) {}

protected:
    void write(LogLevel, const std::string&) override {}
};

// StderrLogger at the level named by SFTPKIT_LOG_LEVEL (default: warn).
std::shared_ptr<Logger> makeDefaultLogger();

// Private key paths and similar values only reach the logs when SFTPKIT_ENV
// names a development setup and SFTPKIT_LOG_SENSITIVE is switched on.
bool sensitiveLoggingEnabled();

// "value" when sensitive logging is enabled, "<redacted>" otherwise.
std::string redactUnlessSensitive(const std::string& value);

} // namespace sftpkit

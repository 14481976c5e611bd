#include "sftpkit/Logger.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace sftpkit {

namespace {

std::string lowercase(std::string text) {
    for (char& c : text)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return text;
}

// Trimmed, lower-cased value of an environment variable; empty when unset.
std::string envValue(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw)
        return {};
    const std::string value(raw);
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return {};
    const auto end = value.find_last_not_of(" \t\r\n");
    return lowercase(value.substr(start, end - start + 1));
}

bool envEnabled(const char* name) {
    const std::string v = envValue(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

LogLevel parseLogLevel(const std::string& text, LogLevel fallback) {
    const std::string v = lowercase(text);

    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "off" || v == "none") return LogLevel::Off;
    return fallback;
}

void StderrLogger::write(LogLevel level, const std::string& line) {
    std::fprintf(stderr, "[sftpkit] %s %s\n", toString(level), line.c_str());
}

TaggedLogger::TaggedLogger(std::shared_ptr<Logger> target, std::string tag)
    : Logger(LogLevel::Trace), target_(std::move(target)), tag_(std::move(tag)) {}

void TaggedLogger::write(LogLevel level, const std::string& line) {
    if (target_)
        target_->logLine(level, tag_ + line);
}

std::shared_ptr<Logger> makeDefaultLogger() {
    const LogLevel level =
        parseLogLevel(envValue("SFTPKIT_LOG_LEVEL"), LogLevel::Warn);
    return std::make_shared<StderrLogger>(level);
}

bool sensitiveLoggingEnabled() {
    const std::string env = envValue("SFTPKIT_ENV");
    const bool dev = env == "dev" || env == "development" || env == "local" || env == "debug";
    return dev && envEnabled("SFTPKIT_LOG_SENSITIVE");
}

std::string redactUnlessSensitive(const std::string& value) {
    return sensitiveLoggingEnabled() ? value : std::string("<redacted>");
}

} // namespace sftpkit

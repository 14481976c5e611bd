// Configuration, remote path and logging helpers (no external framework, run via CTest).
#include "sftpkit/Logger.hpp"
#include "sftpkit/RemotePath.hpp"
#include "sftpkit/SftpConfig.hpp"
#include "sftpkit/SftpError.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

class CollectingLogger : public sftpkit::Logger {
public:
    explicit CollectingLogger(sftpkit::LogLevel level) : Logger(level) {}

    std::vector<std::string> lines;

protected:
    void write(sftpkit::LogLevel level, const std::string &line) override {
        lines.push_back(std::string(sftpkit::toString(level)) + " " + line);
    }
};

bool hasViolation(const std::vector<std::string> &violations, const std::string &text) {
    return std::find(violations.begin(), violations.end(), text) != violations.end();
}

void test_config_defaults(TestContext &t) {
    sftpkit::SftpConfig c;
    t.check(c.port == 22, "default port should be 22");
    t.check(c.preferred_authentications == "publickey,password",
            "default preferred authentications");
    t.check(c.timeout == std::chrono::milliseconds(5000), "default timeout should be 5 seconds");
    t.check(!c.disable_strict_host_checking, "strict host checking on by default");
    t.check(!c.password && !c.private_key_file_path, "no credentials by default");
    t.check(!c.key_exchange_type && !c.remote_base_path, "optional settings empty by default");
}

void test_normalized_config(TestContext &t) {
    sftpkit::SftpConfig c;
    c.port = 0;
    c.preferred_authentications = "  ";
    c.timeout = std::chrono::milliseconds(-1);
    const auto n = sftpkit::normalizedConfig(c);
    t.check(n.port == 22, "zero port should become 22");
    t.check(n.preferred_authentications == "publickey,password", "blank auth list gets the default");
    t.check(n.timeout == sftpkit::SftpConfig::kDefaultTimeout, "non-positive timeout gets the default");

    c.port = 2222;
    c.preferred_authentications = "password";
    c.timeout = std::chrono::milliseconds(750);
    const auto kept = sftpkit::normalizedConfig(c);
    t.check(kept.port == 2222 && kept.preferred_authentications == "password" &&
                kept.timeout == std::chrono::milliseconds(750),
            "explicit values should be kept");
}

void test_validate_config(TestContext &t) {
    sftpkit::SftpConfig c;
    c.port = 0;
    c.timeout = std::chrono::milliseconds(10);
    const auto violations = sftpkit::validateConfig(c);
    t.check(hasViolation(violations, "port must be between 1 and 65535"), "zero port reported");
    t.check(hasViolation(violations, "host must not be blank"), "blank host reported");
    t.check(hasViolation(violations, "user must not be blank"), "blank user reported");
    t.check(hasViolation(violations, "error_path must not be blank"), "blank error path reported");
    t.check(hasViolation(violations, "known_hosts_file must not be blank"), "blank known hosts reported");
    t.check(hasViolation(violations, "timeout must be at least 50 milliseconds"), "short timeout reported");

    sftpkit::SftpConfig ok;
    ok.host = "sftp.test";
    ok.user = "bob";
    ok.error_path = "/tmp/errors";
    ok.known_hosts_file = "/etc/ssh/known_hosts";
    t.check(sftpkit::validateConfig(ok).empty(), "complete config has no violations");
}

void test_is_blank(TestContext &t) {
    t.check(sftpkit::isBlank(std::string()), "empty string is blank");
    t.check(sftpkit::isBlank(std::string(" \t\n")), "whitespace is blank");
    t.check(!sftpkit::isBlank(std::string(" x ")), "text is not blank");
    t.check(sftpkit::isBlank(std::optional<std::string>()), "absent value is blank");
    t.check(!sftpkit::isBlank(std::optional<std::string>("pw")), "present value is not blank");
}

void test_remote_paths(TestContext &t) {
    t.check(sftpkit::joinRemotePath("", "a") == "a", "empty base keeps the name relative");
    t.check(sftpkit::joinRemotePath("", "/a") == "/a", "empty base keeps an absolute name");
    t.check(sftpkit::joinRemotePath("/data/", "a") == "/data/a", "no doubled separator");
    t.check(sftpkit::joinRemotePath("/data", "a") == "/data/a", "separator added");

    t.check(sftpkit::normalizeRemotePath("/a//b/./c/../d") == "/a/b/d", "absolute path normalized");
    t.check(sftpkit::normalizeRemotePath("/../..") == "/", "no climbing above root");
    t.check(sftpkit::normalizeRemotePath("a/../../b") == "../b", "relative path keeps leading ..");
    t.check(sftpkit::normalizeRemotePath("") == ".", "empty relative path is .");

    t.check(sftpkit::resolveRemotePath("/home/bob", "in") == "/home/bob/in", "relative resolves against cwd");
    t.check(sftpkit::resolveRemotePath("/home/bob", "/srv") == "/srv", "absolute ignores cwd");
    t.check(sftpkit::resolveRemotePath("/home/bob", "..") == "/home", "parent of cwd");
    t.check(sftpkit::resolveRemotePath("", "x") == "/x", "empty cwd means root");
}

void test_log_levels(TestContext &t) {
    using sftpkit::LogLevel;
    t.check(sftpkit::parseLogLevel("TRACE", LogLevel::Off) == LogLevel::Trace, "trace parsed");
    t.check(sftpkit::parseLogLevel("warning", LogLevel::Off) == LogLevel::Warn, "warning alias parsed");
    t.check(sftpkit::parseLogLevel("off", LogLevel::Info) == LogLevel::Off, "off parsed");
    t.check(sftpkit::parseLogLevel("", LogLevel::Warn) == LogLevel::Warn, "empty text uses fallback");
    t.check(sftpkit::parseLogLevel("loud", LogLevel::Error) == LogLevel::Error, "unknown text uses fallback");
}

void test_format_message(TestContext &t) {
    t.check(sftpkit::formatMessage("{}@{}:{}", "bob", "host", 22) == "bob@host:22", "placeholders filled in order");
    t.check(sftpkit::formatMessage("connected: {}", true) == "connected: true", "booleans are words");
    t.check(sftpkit::formatMessage("only {}", 1, 2) == "only 1", "extra arguments are dropped");
    t.check(sftpkit::formatMessage("{} and {}", "a") == "a and {}", "missing arguments keep the placeholder");
    t.check(sftpkit::formatMessage("plain") == "plain", "no placeholders");
}

void test_logger_level_filtering(TestContext &t) {
    CollectingLogger log(sftpkit::LogLevel::Warn);
    log.debug("hidden {}", 1);
    log.warn("shown {}", 2);
    log.error("also shown");
    t.check(log.lines.size() == 2, "only warn and above are written");
    if (log.lines.size() == 2) {
        t.check(log.lines[0] == "WARN shown 2", "warn line formatted");
        t.check(log.lines[1] == "ERROR also shown", "error line formatted");
    }

    log.setLevel(sftpkit::LogLevel::Off);
    log.error("dropped");
    t.check(log.lines.size() == 2, "Off discards everything");
}

void test_tagged_logger(TestContext &t) {
    auto target = std::make_shared<CollectingLogger>(sftpkit::LogLevel::Info);
    sftpkit::TaggedLogger tagged(target, "[bob@host:22] ");
    tagged.trace("not kept");
    tagged.info("kept {}", "line");
    t.check(target->lines.size() == 1, "target level decides what is kept");
    if (!target->lines.empty())
        t.check(target->lines[0] == "INFO [bob@host:22] kept line", "tag prefixes the line");
}

void test_redaction(TestContext &t) {
    ::unsetenv("SFTPKIT_ENV");
    ::unsetenv("SFTPKIT_LOG_SENSITIVE");
    t.check(sftpkit::redactUnlessSensitive("/keys/id") == "<redacted>", "redacted by default");

    ::setenv("SFTPKIT_LOG_SENSITIVE", "1", 1);
    t.check(sftpkit::redactUnlessSensitive("/keys/id") == "<redacted>", "flag alone is not enough");

    ::setenv("SFTPKIT_ENV", " Dev ", 1);
    t.check(sftpkit::redactUnlessSensitive("/keys/id") == "/keys/id", "dev environment with flag shows values");

    ::unsetenv("SFTPKIT_ENV");
    ::unsetenv("SFTPKIT_LOG_SENSITIVE");
}

void test_default_logger_level(TestContext &t) {
    ::unsetenv("SFTPKIT_LOG_LEVEL");
    auto def = sftpkit::makeDefaultLogger();
    t.check(def && def->level() == sftpkit::LogLevel::Warn, "default level is warn");

    ::setenv("SFTPKIT_LOG_LEVEL", "debug", 1);
    auto dbg = sftpkit::makeDefaultLogger();
    t.check(dbg && dbg->level() == sftpkit::LogLevel::Debug, "level read from SFTPKIT_LOG_LEVEL");
    ::unsetenv("SFTPKIT_LOG_LEVEL");
}

void test_error_causes(TestContext &t) {
    std::exception_ptr root;
    try {
        sftpkit::requireSuccess(false, "cd /data", "No such file");
    } catch (const sftpkit::TransportError &) {
        root = std::current_exception();
    }
    t.check(sftpkit::exceptionMessage(root) == "cd /data failed: No such file", "requireSuccess message");

    const sftpkit::SftpTransfersError middle(sftpkit::SftpErrorKind::Operation, "listing failed", root);
    const sftpkit::SftpTransfersError outer(sftpkit::SftpErrorKind::Connection, "outer",
                                            std::make_exception_ptr(middle));
    t.check(outer.describeCause() == "listing failed; caused by: cd /data failed: No such file",
            "nested causes are described in order");
    t.check(std::string(sftpkit::toString(outer.kind())) == "connection", "kind name");

    std::exception_ptr none;
    try {
        sftpkit::requireSuccess(false, "rm x", "");
    } catch (const sftpkit::TransportError &e) {
        t.check(std::string(e.what()) == "rm x failed: unknown error", "empty transport text gets a placeholder");
    }
    t.check(sftpkit::exceptionMessage(none).empty(), "no exception, no message");
}

} // namespace

int main() {
    TestContext t;
    test_config_defaults(t);
    test_normalized_config(t);
    test_validate_config(t);
    test_is_blank(t);
    test_remote_paths(t);
    test_log_levels(t);
    test_format_message(t);
    test_logger_level_filtering(t);
    test_tagged_logger(t);
    test_redaction(t);
    test_default_logger_level(t);
    test_error_causes(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpkit_config_logging_tests\n";
    return EXIT_SUCCESS;
}

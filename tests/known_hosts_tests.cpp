// known_hosts parsing and key-exchange-type detection (no external framework, run via CTest).
#include "sftpkit/KnownHosts.hpp"
#include "sftpkit/MockTransport.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    template <typename Fn>
    void checkThrowsInvalidArgument(Fn &&fn, const std::string &msg) {
        try {
            fn();
        } catch (const std::invalid_argument &) {
            return;
        } catch (const std::exception &e) {
            check(false, msg + " (threw another exception: " + e.what() + ")");
            return;
        }
        check(false, msg + " (nothing thrown)");
    }
};

sftpkit::HostKey entry(const std::string &host, const std::string &type) {
    return sftpkit::HostKey{host, type, "AAAAkey", ""};
}

void test_known_host_without_comma(TestContext &t) {
    for (const std::string raw : {"server.test", "10.0.0.7", "|1|c2FsdA==|aGFzaA=="}) {
        const auto kh = sftpkit::KnownHost::fromHostField(raw);
        t.check(kh.host_name == raw, "host name should equal raw field for " + raw);
        t.check(!kh.ip_address.has_value(), "ip should be absent for " + raw);
    }
}

void test_known_host_with_comma(TestContext &t) {
    const auto kh = sftpkit::KnownHost::fromHostField("server.test,192.168.1.10");
    t.check(kh.host_name == "server.test", "host name should be text before the comma");
    t.check(kh.ip_address && *kh.ip_address == "192.168.1.10",
            "ip should be text after the comma");
}

void test_known_host_malformed(TestContext &t) {
    t.checkThrowsInvalidArgument(
        [] { sftpkit::KnownHost::fromHostField("a.test,10.0.0.1,10.0.0.2"); },
        "two commas should be rejected");
    t.checkThrowsInvalidArgument([] { sftpkit::KnownHost::fromHostField("a.test,"); },
                                 "empty ip part should be rejected");
}

void test_detect_empty(TestContext &t) {
    const std::vector<sftpkit::HostKey> none;
    t.check(!sftpkit::detectKeyExchangeTypeForHost("server.test", none).has_value(),
            "no known hosts should yield nothing");
}

void test_detect_by_host_and_ip(TestContext &t) {
    const std::vector<sftpkit::HostKey> hosts = {
        entry("other.test", "ssh-rsa"),
        entry("server.test,192.168.1.10", "ecdsa-sha2-nistp256"),
        entry("v6.test,fe80::1", "ssh-ed25519"),
    };

    auto byName = sftpkit::detectKeyExchangeTypeForHost("server.test", hosts);
    t.check(byName && *byName == "ecdsa-sha2-nistp256", "host name should match name part");

    auto byIp = sftpkit::detectKeyExchangeTypeForHost("192.168.1.10", hosts);
    t.check(byIp && *byIp == "ecdsa-sha2-nistp256", "IPv4 literal should match ip part");

    auto byV6 = sftpkit::detectKeyExchangeTypeForHost("fe80::1", hosts);
    t.check(byV6 && *byV6 == "ssh-ed25519", "IPv6 literal should match ip part");

    t.check(!sftpkit::detectKeyExchangeTypeForHost("10.9.9.9", hosts),
            "unknown ip should not match");
    t.check(!sftpkit::detectKeyExchangeTypeForHost("missing.test", hosts),
            "unknown host should not match");
}

void test_detect_ip_never_matches_name_part(TestContext &t) {
    // An entry whose only token is an IP is a host name token for matching.
    const std::vector<sftpkit::HostKey> hosts = {entry("10.0.0.7", "ssh-rsa")};
    t.check(!sftpkit::detectKeyExchangeTypeForHost("10.0.0.7", hosts),
            "IP query should only compare against the ip part");
}

void test_detect_first_match_wins(TestContext &t) {
    const std::vector<sftpkit::HostKey> hosts = {
        entry("server.test", "ssh-rsa"),
        entry("server.test", "ecdsa-sha2-nistp521"),
    };
    auto found = sftpkit::detectKeyExchangeTypeForHost("server.test", hosts);
    t.check(found && *found == "ssh-rsa", "first matching entry should win");
}

void test_detect_preconditions(TestContext &t) {
    const std::vector<sftpkit::HostKey> hosts = {entry("a.test,1.1.1.1,2.2.2.2", "ssh-rsa")};
    t.checkThrowsInvalidArgument([&] { sftpkit::detectKeyExchangeTypeForHost("a.test", hosts); },
                                 "malformed entry should fail loudly");
    t.checkThrowsInvalidArgument([] { sftpkit::detectKeyExchangeTypeForHost("  ", {}); },
                                 "blank host should be rejected");
}

void test_detect_through_repository(TestContext &t) {
    sftpkit::KnownHostsRepository repo({entry("server.test", "ssh-dss")});
    auto found = sftpkit::detectKeyExchangeTypeForHost("server.test", repo);
    t.check(found && *found == "ssh-dss", "repository overload should detect");
}

void test_set_session_key_exchange_type(TestContext &t) {
    sftpkit::MockTransport transport;
    std::string err;
    auto session = transport.getSession("bob", "server.test", 22, err);
    t.check(session != nullptr, "mock transport should create a session");
    if (!session)
        return;

    sftpkit::setSessionKeyExchangeType(*session, "ssh-rsa");
    t.check(session->config(sftpkit::kServerHostKey).value_or("") == "ssh-rsa",
            "server_host_key should be set on the session");
    t.checkThrowsInvalidArgument([&] { sftpkit::setSessionKeyExchangeType(*session, ""); },
                                 "blank key exchange type should be rejected");
}

void test_is_inet_address(TestContext &t) {
    t.check(sftpkit::isInetAddress("127.0.0.1"), "IPv4 literal");
    t.check(sftpkit::isInetAddress("::1"), "IPv6 literal");
    t.check(!sftpkit::isInetAddress("localhost"), "host name is not an address");
    t.check(!sftpkit::isInetAddress("256.1.1.1"), "out of range octet is not an address");
}

void test_parse_known_hosts_lines(TestContext &t) {
    sftpkit::HostKey e;
    t.check(!sftpkit::parseKnownHostsLine("", e), "blank line is skipped");
    t.check(!sftpkit::parseKnownHostsLine("   # comment", e), "comment line is skipped");
    t.check(!sftpkit::parseKnownHostsLine("@revoked * ssh-rsa AAAA", e), "marker line is skipped");
    t.check(!sftpkit::parseKnownHostsLine("host.only ssh-rsa", e), "line without key is skipped");

    t.check(sftpkit::parseKnownHostsLine("server.test,10.0.0.1 ecdsa-sha2-nistp256 AAAAE2 bob@laptop", e),
            "regular line parses");
    t.check(e.host == "server.test,10.0.0.1", "host field kept verbatim");
    t.check(e.type == "ecdsa-sha2-nistp256", "key type parsed");
    t.check(e.key == "AAAAE2", "key parsed");
    t.check(e.comment == "bob@laptop", "comment parsed");
}

void test_load_known_hosts_file(TestContext &t) {
    const auto token = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    const fs::path path = fs::temp_directory_path() / ("sftpkit-known-hosts-" + token);
    {
        std::ofstream out(path);
        out << "# generated\n"
            << "first.test ssh-rsa AAAA1\n"
            << "\n"
            << "second.test,10.1.1.1 ssh-ed25519 AAAA2\r\n";
    }

    std::vector<sftpkit::HostKey> entries;
    std::string err;
    t.check(sftpkit::loadKnownHostsFile(path.string(), entries, err), "existing file loads: " + err);
    t.check(entries.size() == 2, "two entries expected");
    if (entries.size() == 2) {
        t.check(entries[0].host == "first.test", "entries keep file order");
        t.check(entries[1].type == "ssh-ed25519", "CRLF line parsed");
    }
    std::error_code ec;
    fs::remove(path, ec);

    err.clear();
    t.check(!sftpkit::loadKnownHostsFile(path.string(), entries, err), "missing file fails");
    t.check(!err.empty(), "missing file reports an error");
}

} // namespace

int main() {
    TestContext t;
    test_known_host_without_comma(t);
    test_known_host_with_comma(t);
    test_known_host_malformed(t);
    test_detect_empty(t);
    test_detect_by_host_and_ip(t);
    test_detect_ip_never_matches_name_part(t);
    test_detect_first_match_wins(t);
    test_detect_preconditions(t);
    test_detect_through_repository(t);
    test_set_session_key_exchange_type(t);
    test_is_inet_address(t);
    test_parse_known_hosts_lines(t);
    test_load_known_hosts_file(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpkit_known_hosts_tests\n";
    return EXIT_SUCCESS;
}

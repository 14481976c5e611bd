// Connection settings consumed read-only by SftpConnector.
//
// The connector uses either the private key or the password, never both. When
// both are present the private key wins.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sftpkit {

struct SftpConfig {
    static constexpr std::uint16_t kDefaultPort = 22;
    static constexpr const char* kDefaultPreferredAuthentications = "publickey,password";
    static constexpr std::chrono::milliseconds kDefaultTimeout{5000};
    static constexpr std::chrono::milliseconds kMinimumTimeout{50};

    std::uint16_t port = kDefaultPort;
    std::string host;
    std::string user;

    std::optional<std::string> password;
    std::optional<std::string> private_key_file_path;

    // Comma separated, in order of preference (like ssh -o PreferredAuthentications=...).
    std::string preferred_authentications = kDefaultPreferredAuthentications;

    // When set, used instead of the type detected from known_hosts.
    std::optional<std::string> key_exchange_type;

    // Root of the remote location. Stored for callers only; never used by the connector.
    std::optional<std::string> remote_base_path;

    // Local directory where callers write transfer error reports.
    std::string error_path;

    std::string known_hosts_file;

    // Equivalent to ssh -o StrictHostKeyChecking=no. Testing only.
    bool disable_strict_host_checking = false;

    std::chrono::milliseconds timeout = kDefaultTimeout;
};

// Copy of "config" with defaults applied to a zero port, blank preferred
// authentications and a non-positive timeout.
SftpConfig normalizedConfig(SftpConfig config);

// Human readable violations; empty when the configuration is usable.
std::vector<std::string> validateConfig(const SftpConfig& config);

bool isBlank(const std::optional<std::string>& value);
bool isBlank(const std::string& value);

} // namespace sftpkit

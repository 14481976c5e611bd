#include "sftpkit/SftpConfig.hpp"

#include <algorithm>
#include <cctype>

namespace sftpkit {

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool isBlank(const std::optional<std::string>& value) {
    return !value.has_value() || isBlank(*value);
}

SftpConfig normalizedConfig(SftpConfig config) {
    if (config.port == 0)
        config.port = SftpConfig::kDefaultPort;
    if (isBlank(config.preferred_authentications))
        config.preferred_authentications = SftpConfig::kDefaultPreferredAuthentications;
    if (config.timeout.count() <= 0)
        config.timeout = SftpConfig::kDefaultTimeout;
    return config;
}

std::vector<std::string> validateConfig(const SftpConfig& config) {
    std::vector<std::string> violations;
    if (config.port == 0)
        violations.emplace_back("port must be between 1 and 65535");
    if (isBlank(config.host))
        violations.emplace_back("host must not be blank");
    if (isBlank(config.user))
        violations.emplace_back("user must not be blank");
    if (isBlank(config.preferred_authentications))
        violations.emplace_back("preferred_authentications must not be blank");
    if (isBlank(config.error_path))
        violations.emplace_back("error_path must not be blank");
    if (isBlank(config.known_hosts_file))
        violations.emplace_back("known_hosts_file must not be blank");
    if (config.timeout < SftpConfig::kMinimumTimeout)
        violations.emplace_back("timeout must be at least 50 milliseconds");
    return violations;
}

} // namespace sftpkit

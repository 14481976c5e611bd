#include "sftpkit/KnownHosts.hpp"
#include "sftpkit/SftpConfig.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sftpkit {

KnownHost KnownHost::fromHostField(const std::string& host) {
    const auto comma = host.find(',');
    if (comma == std::string::npos)
        return KnownHost{host, std::nullopt};

    if (host.find(',', comma + 1) != std::string::npos || comma + 1 == host.size()) {
        throw std::invalid_argument("Expecting host key to be in format: hostName,IP but was: " + host);
    }
    return KnownHost{host.substr(0, comma), host.substr(comma + 1)};
}

bool isInetAddress(const std::string& value) {
    in_addr v4{};
    in6_addr v6{};
    return ::inet_pton(AF_INET, value.c_str(), &v4) == 1 ||
           ::inet_pton(AF_INET6, value.c_str(), &v6) == 1;
}

std::optional<std::string> detectKeyExchangeTypeForHost(const std::string& hostOrIp,
                                                         const std::vector<HostKey>& knownHosts) {
    if (isBlank(hostOrIp))
        throw std::invalid_argument("host must not be blank");

    const bool isIp = isInetAddress(hostOrIp);
    for (const auto& entry : knownHosts) {
        const KnownHost known = KnownHost::fromHostField(entry.host);
        const bool match = isIp ? (known.ip_address && *known.ip_address == hostOrIp)
                                : known.host_name == hostOrIp;
        if (match)
            return entry.type;
    }
    return std::nullopt;
}

std::optional<std::string> detectKeyExchangeTypeForHost(const std::string& hostOrIp,
                                                         const HostKeyRepository& knownHosts) {
    return detectKeyExchangeTypeForHost(hostOrIp, knownHosts.hostKeys());
}

void setSessionKeyExchangeType(SshSession& session, const std::string& keyExchangeType) {
    if (isBlank(keyExchangeType))
        throw std::invalid_argument("keyExchangeType must not be blank");
    session.setConfig(kServerHostKey, keyExchangeType);
}

bool parseKnownHostsLine(const std::string& line, HostKey& out) {
    std::istringstream in(line);
    std::string first;
    if (!(in >> first) || first[0] == '#')
        return false;
    // Marker lines describe CAs or revoked keys, not hosts.
    if (first[0] == '@')
        return false;

    HostKey entry;
    entry.host = first;
    if (!(in >> entry.type >> entry.key))
        return false;
    std::getline(in, entry.comment);
    const auto start = entry.comment.find_first_not_of(" \t");
    entry.comment = (start == std::string::npos) ? std::string() : entry.comment.substr(start);

    out = std::move(entry);
    return true;
}

bool loadKnownHostsFile(const std::string& path, std::vector<HostKey>& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "Could not read known_hosts file: " + path;
        return false;
    }
    out.clear();
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        HostKey entry;
        if (parseKnownHostsLine(line, entry))
            out.push_back(std::move(entry));
    }
    if (in.bad()) {
        err = "I/O error reading known_hosts file: " + path;
        return false;
    }
    return true;
}

} // namespace sftpkit

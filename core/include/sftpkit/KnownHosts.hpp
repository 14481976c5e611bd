// known_hosts parsing and key-exchange-type detection.
#pragma once
#include "SftpTypes.hpp"
#include "SshTransport.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sftpkit {

// Host and IP parts of a known_hosts host field.
struct KnownHost {
    std::string host_name;
    std::optional<std::string> ip_address;

    // "name,ip" splits in two; anything without a comma is the host name.
    // Throws std::invalid_argument for more than one comma or an empty IP part.
    static KnownHost fromHostField(const std::string& host);
};

// True for IPv4 and IPv6 literals.
bool isInetAddress(const std::string& value);

// Key type of the first entry matching "hostOrIp": IP literals are compared to
// the IP part of each entry, everything else to the host name part.
std::optional<std::string> detectKeyExchangeTypeForHost(const std::string& hostOrIp,
                                                         const std::vector<HostKey>& knownHosts);
std::optional<std::string> detectKeyExchangeTypeForHost(const std::string& hostOrIp,
                                                         const HostKeyRepository& knownHosts);

// Sets the server host key algorithm the session will ask for.
void setSessionKeyExchangeType(SshSession& session, const std::string& keyExchangeType);

// Parses one OpenSSH known_hosts line. Returns false for blank lines, comments,
// @cert-authority/@revoked lines and lines without a key.
bool parseKnownHostsLine(const std::string& line, HostKey& out);

bool loadKnownHostsFile(const std::string& path, std::vector<HostKey>& out, std::string& err);

// Repository over an in-memory list of entries.
class KnownHostsRepository : public HostKeyRepository {
public:
    KnownHostsRepository() = default;
    explicit KnownHostsRepository(std::vector<HostKey> entries) : entries_(std::move(entries)) {}

    std::vector<HostKey> hostKeys() const override { return entries_; }
    void assign(std::vector<HostKey> entries) { entries_ = std::move(entries); }
    void add(HostKey entry) { entries_.push_back(std::move(entry)); }

private:
    std::vector<HostKey> entries_;
};

} // namespace sftpkit

// In-memory transport: a small simulated remote tree plus a log of every
// primitive called, for tests and demos without a real server.
#pragma once
#include "KnownHosts.hpp"
#include "SshTransport.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sftpkit {

class MockTransport : public SshTransport {
public:
    MockTransport();

    // --- scripting ---

    // Entries served when setKnownHosts(path) is called; unknown paths fail.
    void setKnownHostsFile(const std::string& path, std::vector<HostKey> entries);

    // Makes a primitive fail. "call" is either a primitive name ("cd",
    // "session.connect", ...) or a full recorded call ("cd /data").
    void failOn(const std::string& call, std::string message = "simulated failure");

    // Channel type handed out by openChannel (default "sftp").
    void setChannelType(std::string type) { channelType_ = std::move(type); }

    // When set, sessions with StrictHostKeyChecking other than "no" refuse
    // hosts without a known_hosts entry.
    void setRequireKnownHost(bool require) { requireKnownHost_ = require; }

    void addDirectory(const std::string& path);
    void addFile(const std::string& path, std::string content);

    // --- inspection ---

    bool hasDirectory(const std::string& path) const;
    std::optional<std::string> fileContent(const std::string& path) const;

    const std::vector<std::string>& calls() const { return calls_; }
    // Number of recorded calls equal to "call" or starting with "call ".
    std::size_t countCalls(const std::string& call) const;
    void clearCalls() { calls_.clear(); }

    const std::vector<std::string>& identities() const { return identities_; }

    // --- SshTransport ---

    bool setKnownHosts(const std::string& path, std::string& err) override;
    const HostKeyRepository& hostKeyRepository() const override { return knownHosts_; }
    bool addIdentity(const std::string& privateKeyPath, std::string& err) override;
    std::unique_ptr<SshSession> getSession(const std::string& user,
                                           const std::string& host,
                                           std::uint16_t port,
                                           std::string& err) override;

private:
    friend class MockSession;
    friend class MockSftpChannel;

    // Records "call" and reports whether it was scripted to fail.
    bool record(const std::string& name, const std::string& call, std::string& err);

    std::vector<std::string> calls_;
    std::unordered_map<std::string, std::string> failures_;
    std::unordered_map<std::string, std::vector<HostKey>> knownHostsFiles_;
    KnownHostsRepository knownHosts_;
    std::vector<std::string> identities_;
    std::string channelType_ = "sftp";
    bool requireKnownHost_ = false;

    std::set<std::string> dirs_;
    std::map<std::string, std::string> files_;
};

} // namespace sftpkit

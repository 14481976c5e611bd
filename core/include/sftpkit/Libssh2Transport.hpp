// libssh2 backend: TCP socket, SSH session and SFTP channel.
#pragma once
#include "KnownHosts.hpp"
#include "Logger.hpp"
#include "SftpConfig.hpp"
#include "SshTransport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sftpkit {

class SftpConnector;

class Libssh2Transport : public SshTransport {
public:
    explicit Libssh2Transport(std::shared_ptr<Logger> logger = makeDefaultLogger());

    bool setKnownHosts(const std::string& path, std::string& err) override;
    const HostKeyRepository& hostKeyRepository() const override { return knownHosts_; }
    bool addIdentity(const std::string& privateKeyPath, std::string& err) override;
    std::unique_ptr<SshSession> getSession(const std::string& user,
                                           const std::string& host,
                                           std::uint16_t port,
                                           std::string& err) override;

    const std::string& knownHostsPath() const { return knownHostsPath_; }
    const std::vector<std::string>& identities() const { return identities_; }
    Logger& logger() const { return *logger_; }

private:
    std::shared_ptr<Logger> logger_;
    KnownHostsRepository knownHosts_;
    std::string knownHostsPath_;
    std::vector<std::string> identities_;
};

// Disconnected connector using a Libssh2Transport that logs to the same logger.
std::unique_ptr<SftpConnector> makeLibssh2Connector(SftpConfig config,
                                                    std::shared_ptr<Logger> logger = makeDefaultLogger());

} // namespace sftpkit

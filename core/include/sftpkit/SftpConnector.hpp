// Owns one SSH session and one SFTP channel built on top of it, opened with
// the settings of an SftpConfig. Not thread safe: use one connector per
// concurrent unit of work.
#pragma once
#include "Logger.hpp"
#include "SftpConfig.hpp"
#include "SftpError.hpp"
#include "SshTransport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sftpkit {

class SftpConnector {
public:
    // The connector starts disconnected; call connect() to open a connection.
    SftpConnector(SftpConfig config,
                  std::unique_ptr<SshTransport> transport,
                  std::shared_ptr<Logger> logger = makeDefaultLogger());
    ~SftpConnector();

    SftpConnector(const SftpConnector&) = delete;
    SftpConnector& operator=(const SftpConnector&) = delete;

    // Constructs a connector and connects it right away.
    static std::unique_ptr<SftpConnector> setupAndOpenConnection(
        SftpConfig config,
        std::unique_ptr<SshTransport> transport,
        std::shared_ptr<Logger> logger = makeDefaultLogger());

    /**
     * Opens the session and the SFTP channel. In order: known hosts, session for
     * user@host:port, timeout, preferred authentications, key exchange type
     * (configured or detected from known hosts), private key or password,
     * optional StrictHostKeyChecking=no, session connect, sftp channel connect.
     *
     * Throws SftpTransfersError: Configuration when there is neither a private
     * key nor a password, Connection for any transport failure (the connector
     * stays disconnected). A malformed known_hosts entry throws
     * std::invalid_argument.
     */
    void connect();

    // Closes the channel, then the session. Safe to call at any time, any number of times.
    void disconnect();

    bool isConnected() const;

    // The configured key exchange type if not blank, else the one detected
    // from the transport's known hosts for the configured host.
    std::optional<std::string> getOrDetectKeyExchangeType() const;

    const SftpConfig& config() const { return config_; }
    Logger& logger() { return *logger_; }

    // Runs "op" against the live channel. Fails with NotConnected without
    // calling "op" when there is no connected channel; anything "op" throws is
    // rethrown as an Operation SftpTransfersError carrying the original as cause.
    template <typename Op>
    void runCommand(Op&& op);

    template <typename Op>
    std::invoke_result_t<Op&, SftpChannel&> runCommandWithResult(Op&& op);

private:
    struct Disconnected {};
    struct Connected {
        std::unique_ptr<SshSession> session;
        std::unique_ptr<SftpChannel> channel;
    };

    SftpChannel& requireConnectedChannel();
    void checkCredentialsPresent() const;
    void addAuthToSession(SshSession& session);
    void setKeyExchangeTypeIfConfiguredOrDetected(SshSession& session);
    void disableStrictHostKeyCheckingIfConfigured(SshSession& session);
    static SftpTransfersError operationFailure(const std::exception_ptr& cause);

    SftpConfig config_;
    std::unique_ptr<SshTransport> transport_;
    std::shared_ptr<Logger> logger_;
    std::variant<Disconnected, Connected> state_;
};

template <typename Op>
void SftpConnector::runCommand(Op&& op) {
    SftpChannel& channel = requireConnectedChannel();
    try {
        op(channel);
    } catch (...) {
        throw operationFailure(std::current_exception());
    }
}

template <typename Op>
std::invoke_result_t<Op&, SftpChannel&> SftpConnector::runCommandWithResult(Op&& op) {
    SftpChannel& channel = requireConnectedChannel();
    try {
        return op(channel);
    } catch (...) {
        throw operationFailure(std::current_exception());
    }
}

} // namespace sftpkit

#include "sftpkit/SftpConnector.hpp"
#include "sftpkit/KnownHosts.hpp"

#include <limits>
#include <stdexcept>

namespace sftpkit {

namespace {

constexpr const char* kNotConnected = "Sftp is not connected. Call connect first";

std::string connectionTag(const SftpConfig& config) {
    return "[" + config.user + "@" + config.host + ":" + std::to_string(config.port) + "] ";
}

} // namespace

SftpConnector::SftpConnector(SftpConfig config,
                             std::unique_ptr<SshTransport> transport,
                             std::shared_ptr<Logger> logger)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_)
        throw std::invalid_argument("SshTransport is required");
    if (!logger)
        logger = std::make_shared<NullLogger>();
    logger_ = std::make_shared<TaggedLogger>(std::move(logger), connectionTag(config_));
}

SftpConnector::~SftpConnector() {
    disconnect();
}

std::unique_ptr<SftpConnector> SftpConnector::setupAndOpenConnection(
    SftpConfig config,
    std::unique_ptr<SshTransport> transport,
    std::shared_ptr<Logger> logger) {
    auto connector = std::make_unique<SftpConnector>(std::move(config),
                                                     std::move(transport),
                                                     std::move(logger));
    connector->connect();
    return connector;
}

void SftpConnector::connect() {
    logger_->trace("Entering connect()");
    if (std::holds_alternative<Connected>(state_)) {
        logger_->debug("Already connected; closing the previous session first");
        disconnect();
    }

    checkCredentialsPresent();
    if (config_.timeout.count() > std::numeric_limits<int>::max()) {
        throw SftpTransfersError(SftpErrorKind::Configuration,
                                 "Timeout of " + std::to_string(config_.timeout.count()) +
                                     " milliseconds is out of range");
    }

    std::unique_ptr<SshSession> session;
    std::unique_ptr<Channel> channel;
    auto closePartial = [&] {
        if (channel)
            channel->disconnect();
        if (session)
            session->disconnect();
    };

    try {
        std::string err;

        logger_->trace("Setting known hosts to {}", config_.known_hosts_file);
        requireSuccess(transport_->setKnownHosts(config_.known_hosts_file, err),
                       "Loading known hosts " + config_.known_hosts_file, err);

        logger_->trace("Creating session; connecting to: {}@{}:{}",
                       config_.user, config_.host, config_.port);
        session = transport_->getSession(config_.user, config_.host, config_.port, err);
        requireSuccess(session != nullptr, "Creating session", err);

        logger_->trace("Setting timeout to {} milliseconds", config_.timeout.count());
        session->setTimeout(config_.timeout);

        logger_->trace("Setting preferred authentications to: {}", config_.preferred_authentications);
        session->setConfig(kPreferredAuthentications, config_.preferred_authentications);

        setKeyExchangeTypeIfConfiguredOrDetected(*session);
        addAuthToSession(*session);
        disableStrictHostKeyCheckingIfConfigured(*session);

        logger_->debug("Attempt session connect using timeout: {} millis", session->timeout().count());
        requireSuccess(session->connect(err), "Session connect", err);
        logger_->debug("Session connected: {}", session->isConnected());

        channel = session->openChannel(kSftpChannelType, err);
        requireSuccess(channel != nullptr, "Opening sftp channel", err);

        logger_->debug("Attempt openChannel using timeout: {} millis", config_.timeout.count());
        requireSuccess(channel->connect(config_.timeout, err), "Channel connect", err);
        logger_->debug("Channel connected: {}", channel->isConnected());

        auto* sftp = dynamic_cast<SftpChannel*>(channel.get());
        if (!sftp) {
            throw TransportError("Expected channel to be an sftp channel, but was a: " +
                                 channel->type());
        }
        std::unique_ptr<SftpChannel> sftpChannel(sftp);
        channel.release();
        state_ = Connected{std::move(session), std::move(sftpChannel)};
        logger_->trace("Ready sftp channel, remote directory {}", sftp->pwd());
    } catch (const TransportError&) {
        closePartial();
        logger_->error("Connecting to {} failed", config_.host);
        throw SftpTransfersError(SftpErrorKind::Connection,
                                 "Error occurred connecting to " + config_.host,
                                 std::current_exception());
    } catch (...) {
        closePartial();
        throw;
    }
}

void SftpConnector::disconnect() {
    if (auto* connected = std::get_if<Connected>(&state_)) {
        if (connected->channel) {
            connected->channel->disconnect();
            connected->channel.reset();
        }
        if (connected->session) {
            connected->session->disconnect();
            connected->session.reset();
        }
        logger_->debug("Disconnected");
    }
    state_ = Disconnected{};
}

bool SftpConnector::isConnected() const {
    const auto* connected = std::get_if<Connected>(&state_);
    return connected && connected->channel && connected->channel->isConnected();
}

std::optional<std::string> SftpConnector::getOrDetectKeyExchangeType() const {
    if (!isBlank(config_.key_exchange_type))
        return config_.key_exchange_type;
    return detectKeyExchangeTypeForHost(config_.host, transport_->hostKeyRepository());
}

SftpChannel& SftpConnector::requireConnectedChannel() {
    auto* connected = std::get_if<Connected>(&state_);
    if (!connected || !connected->channel || !connected->channel->isConnected())
        throw SftpTransfersError(SftpErrorKind::NotConnected, kNotConnected);
    return *connected->channel;
}

void SftpConnector::checkCredentialsPresent() const {
    if (isBlank(config_.private_key_file_path) && isBlank(config_.password)) {
        throw SftpTransfersError(SftpErrorKind::Configuration,
                                 "Missing a private key and a password; cannot authenticate to the SFTP server");
    }
}

void SftpConnector::addAuthToSession(SshSession& session) {
    std::string err;
    if (!isBlank(config_.private_key_file_path)) {
        logger_->debug("Using private key '{}' to connect",
                       redactUnlessSensitive(*config_.private_key_file_path));
        requireSuccess(transport_->addIdentity(*config_.private_key_file_path, err),
                       "Adding identity", err);
    } else if (!isBlank(config_.password)) {
        logger_->debug("Using password to connect");
        session.setPassword(*config_.password);
    } else {
        checkCredentialsPresent();
    }
}

void SftpConnector::setKeyExchangeTypeIfConfiguredOrDetected(SshSession& session) {
    logger_->trace("Detecting key exchange type with host");
    const auto keyExchangeType = getOrDetectKeyExchangeType();
    if (!keyExchangeType) {
        logger_->trace("Did not detect key exchange type for host: {}", config_.host);
        return;
    }
    setSessionKeyExchangeType(session, *keyExchangeType);
    logger_->debug("Set key exchange type [{}] for host {}", *keyExchangeType, config_.host);
}

void SftpConnector::disableStrictHostKeyCheckingIfConfigured(SshSession& session) {
    if (config_.disable_strict_host_checking) {
        logger_->warn("Disabling strict host checking - This should only be used for testing purposes!");
        session.setConfig(kStrictHostKeyChecking, "no");
    }
}

SftpTransfersError SftpConnector::operationFailure(const std::exception_ptr& cause) {
    return SftpTransfersError(SftpErrorKind::Operation, exceptionMessage(cause), cause);
}

} // namespace sftpkit

// Abstract SSH/SFTP transport. Concrete backends (libssh2, in-memory mock) must
// honour this API so the connector and transfer code stay decoupled from them.
// Primitives report failures through "err" and a false return value.
#pragma once
#include "SftpTypes.hpp"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sftpkit {

class HostKeyRepository {
public:
    virtual ~HostKeyRepository() = default;

    // Known host entries, in file order.
    virtual std::vector<HostKey> hostKeys() const = 0;
};

class Channel {
public:
    virtual ~Channel() = default;

    virtual std::string type() const = 0;
    virtual bool connect(std::chrono::milliseconds timeout, std::string& err) = 0;
    virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;
};

// Channel speaking the SFTP sub-protocol. Relative paths resolve against the
// current directory set by cd(); the current directory is kept client-side.
class SftpChannel : public Channel {
public:
    virtual bool cd(const std::string& path, std::string& err) = 0;
    virtual std::string pwd() const = 0;

    virtual bool mkdir(const std::string& path, std::string& err) = 0;

    virtual bool ls(const std::string& path,
                    std::vector<FileInfo>& out,
                    std::string& err) = 0;

    // Streams the remote file into "out".
    virtual bool get(const std::string& remoteFilename,
                     std::ostream& out,
                     std::string& err) = 0;

    // Creates or truncates the remote file and writes everything from "data".
    virtual bool put(std::istream& data,
                     const std::string& remoteFilename,
                     std::string& err) = 0;

    virtual bool rm(const std::string& remoteFilename, std::string& err) = 0;
};

class SshSession {
public:
    virtual ~SshSession() = default;

    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;
    virtual std::chrono::milliseconds timeout() const = 0;

    virtual void setConfig(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> config(const std::string& key) const = 0;

    virtual void setPassword(const std::string& password) = 0;

    // Opens the network connection, handshakes and authenticates.
    virtual bool connect(std::string& err) = 0;
    virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;

    virtual std::unique_ptr<Channel> openChannel(const std::string& type,
                                                 std::string& err) = 0;
};

class SshTransport {
public:
    virtual ~SshTransport() = default;

    virtual bool setKnownHosts(const std::string& path, std::string& err) = 0;
    virtual const HostKeyRepository& hostKeyRepository() const = 0;

    // Registers a private key used by sessions created from this transport.
    // Registering the same path again is a no-op.
    virtual bool addIdentity(const std::string& privateKeyPath, std::string& err) = 0;

    virtual std::unique_ptr<SshSession> getSession(const std::string& user,
                                                   const std::string& host,
                                                   std::uint16_t port,
                                                   std::string& err) = 0;
};

} // namespace sftpkit

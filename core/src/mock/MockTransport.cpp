#include "sftpkit/MockTransport.hpp"
#include "sftpkit/RemotePath.hpp"

#include <algorithm>
#include <istream>
#include <iterator>
#include <ostream>

namespace sftpkit {

namespace {

std::string parentOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0)
        return "/";
    return path.substr(0, slash);
}

std::string baseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Channel of a type other than sftp.
class MockPlainChannel : public Channel {
public:
    explicit MockPlainChannel(std::string type) : type_(std::move(type)) {}

    std::string type() const override { return type_; }
    bool connect(std::chrono::milliseconds, std::string&) override {
        connected_ = true;
        return true;
    }
    bool isConnected() const override { return connected_; }
    void disconnect() override { connected_ = false; }

private:
    std::string type_;
    bool connected_ = false;
};

} // namespace

class MockSession;

class MockSftpChannel : public SftpChannel {
public:
    MockSftpChannel(MockTransport& transport, const MockSession& session)
        : transport_(transport), session_(session) {}

    std::string type() const override { return kSftpChannelType; }
    bool connect(std::chrono::milliseconds timeout, std::string& err) override;
    bool isConnected() const override;
    void disconnect() override;

    bool cd(const std::string& path, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, path);
        if (transport_.record("cd", "cd " + target, err))
            return false;
        if (!transport_.dirs_.count(target)) {
            err = "No such file: " + target;
            return false;
        }
        cwd_ = target;
        return true;
    }

    std::string pwd() const override { return cwd_; }

    bool mkdir(const std::string& path, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, path);
        if (transport_.record("mkdir", "mkdir " + target, err))
            return false;
        if (transport_.dirs_.count(target) || transport_.files_.count(target)) {
            err = "Failure: " + target + " already exists";
            return false;
        }
        if (!transport_.dirs_.count(parentOf(target))) {
            err = "No such file: " + parentOf(target);
            return false;
        }
        transport_.dirs_.insert(target);
        return true;
    }

    bool ls(const std::string& path, std::vector<FileInfo>& out, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, path);
        if (transport_.record("ls", "ls " + target, err))
            return false;
        if (!transport_.dirs_.count(target)) {
            err = "No such file: " + target;
            return false;
        }
        out.clear();
        for (const auto& dir : transport_.dirs_) {
            if (dir != "/" && parentOf(dir) == target)
                out.push_back(FileInfo{baseName(dir), true, 0, 0, 040755, 0, 0});
        }
        for (const auto& file : transport_.files_) {
            if (parentOf(file.first) == target) {
                out.push_back(FileInfo{baseName(file.first), false,
                                       static_cast<std::uint64_t>(file.second.size()), 0, 0100644, 0, 0});
            }
        }
        std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
            return a.name < b.name;
        });
        return true;
    }

    bool get(const std::string& remoteFilename, std::ostream& out, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, remoteFilename);
        if (transport_.record("get", "get " + target, err))
            return false;
        auto it = transport_.files_.find(target);
        if (it == transport_.files_.end()) {
            err = "No such file: " + target;
            return false;
        }
        out.write(it->second.data(), static_cast<std::streamsize>(it->second.size()));
        if (!out) {
            err = "Local write failed for " + target;
            return false;
        }
        return true;
    }

    bool put(std::istream& data, const std::string& remoteFilename, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, remoteFilename);
        if (transport_.record("put", "put " + target, err))
            return false;
        if (!transport_.dirs_.count(parentOf(target))) {
            err = "No such file: " + parentOf(target);
            return false;
        }
        std::string content((std::istreambuf_iterator<char>(data)), std::istreambuf_iterator<char>());
        transport_.files_[target] = std::move(content);
        return true;
    }

    bool rm(const std::string& remoteFilename, std::string& err) override {
        const std::string target = resolveRemotePath(cwd_, remoteFilename);
        if (transport_.record("rm", "rm " + target, err))
            return false;
        if (!transport_.files_.erase(target)) {
            err = "No such file: " + target;
            return false;
        }
        return true;
    }

private:
    MockTransport& transport_;
    const MockSession& session_;
    std::string cwd_ = "/";
    bool connected_ = false;
};

class MockSession : public SshSession {
public:
    MockSession(MockTransport& transport, std::string user, std::string host, std::uint16_t port)
        : transport_(transport), user_(std::move(user)), host_(std::move(host)), port_(port) {}

    void setTimeout(std::chrono::milliseconds timeout) override {
        std::string ignored;
        transport_.record("session.setTimeout", "session.setTimeout " + std::to_string(timeout.count()), ignored);
        timeout_ = timeout;
    }
    std::chrono::milliseconds timeout() const override { return timeout_; }

    void setConfig(const std::string& key, const std::string& value) override {
        std::string ignored;
        transport_.record("session.setConfig", "session.setConfig " + key + "=" + value, ignored);
        config_[key] = value;
    }
    std::optional<std::string> config(const std::string& key) const override {
        auto it = config_.find(key);
        if (it == config_.end())
            return std::nullopt;
        return it->second;
    }

    void setPassword(const std::string& password) override {
        std::string ignored;
        transport_.record("session.setPassword", "session.setPassword", ignored);
        password_ = password;
    }

    bool connect(std::string& err) override {
        if (transport_.record("session.connect", "session.connect", err))
            return false;
        if (transport_.requireKnownHost_ && config(kStrictHostKeyChecking).value_or("yes") != "no") {
            const auto type = detectKeyExchangeTypeForHost(host_, transport_.knownHosts_);
            if (!type) {
                err = "UnknownHostKey: " + host_;
                return false;
            }
        }
        if (transport_.identities_.empty() && !password_) {
            err = "Auth fail for " + user_ + "@" + host_ + ":" + std::to_string(port_);
            return false;
        }
        connected_ = true;
        return true;
    }

    bool isConnected() const override { return connected_; }

    void disconnect() override {
        std::string ignored;
        transport_.record("session.disconnect", "session.disconnect", ignored);
        connected_ = false;
    }

    std::unique_ptr<Channel> openChannel(const std::string& type, std::string& err) override {
        if (transport_.record("session.openChannel", "session.openChannel " + type, err))
            return nullptr;
        if (!connected_) {
            err = "session is down";
            return nullptr;
        }
        if (transport_.channelType_ != kSftpChannelType)
            return std::make_unique<MockPlainChannel>(transport_.channelType_);
        return std::make_unique<MockSftpChannel>(transport_, *this);
    }

private:
    MockTransport& transport_;
    std::string user_;
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_{0};
    std::map<std::string, std::string> config_;
    std::optional<std::string> password_;
    bool connected_ = false;
};

bool MockSftpChannel::connect(std::chrono::milliseconds timeout, std::string& err) {
    if (transport_.record("channel.connect", "channel.connect " + std::to_string(timeout.count()), err))
        return false;
    if (!session_.isConnected()) {
        err = "session is down";
        return false;
    }
    cwd_ = "/";
    connected_ = true;
    return true;
}

bool MockSftpChannel::isConnected() const {
    return connected_ && session_.isConnected();
}

void MockSftpChannel::disconnect() {
    std::string ignored;
    transport_.record("channel.disconnect", "channel.disconnect", ignored);
    connected_ = false;
}

MockTransport::MockTransport() {
    dirs_.insert("/");
}

void MockTransport::setKnownHostsFile(const std::string& path, std::vector<HostKey> entries) {
    knownHostsFiles_[path] = std::move(entries);
}

void MockTransport::failOn(const std::string& call, std::string message) {
    failures_[call] = std::move(message);
}

void MockTransport::addDirectory(const std::string& path) {
    std::string current = normalizeRemotePath(path);
    while (current != "/" && current != ".") {
        dirs_.insert(current);
        current = parentOf(current);
    }
}

void MockTransport::addFile(const std::string& path, std::string content) {
    const std::string target = normalizeRemotePath(path);
    addDirectory(parentOf(target));
    files_[target] = std::move(content);
}

bool MockTransport::hasDirectory(const std::string& path) const {
    return dirs_.count(normalizeRemotePath(path)) != 0;
}

std::optional<std::string> MockTransport::fileContent(const std::string& path) const {
    auto it = files_.find(normalizeRemotePath(path));
    if (it == files_.end())
        return std::nullopt;
    return it->second;
}

std::size_t MockTransport::countCalls(const std::string& call) const {
    return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(), [&](const std::string& c) {
        return c == call || c.rfind(call + " ", 0) == 0;
    }));
}

bool MockTransport::record(const std::string& name, const std::string& call, std::string& err) {
    calls_.push_back(call);
    auto it = failures_.find(call);
    if (it == failures_.end())
        it = failures_.find(name);
    if (it == failures_.end())
        return false;
    err = it->second;
    return true;
}

bool MockTransport::setKnownHosts(const std::string& path, std::string& err) {
    if (record("setKnownHosts", "setKnownHosts " + path, err))
        return false;
    auto it = knownHostsFiles_.find(path);
    if (it == knownHostsFiles_.end()) {
        err = "Could not read known_hosts file: " + path;
        return false;
    }
    knownHosts_.assign(it->second);
    return true;
}

bool MockTransport::addIdentity(const std::string& privateKeyPath, std::string& err) {
    if (record("addIdentity", "addIdentity " + privateKeyPath, err))
        return false;
    if (std::find(identities_.begin(), identities_.end(), privateKeyPath) == identities_.end())
        identities_.push_back(privateKeyPath);
    return true;
}

std::unique_ptr<SshSession> MockTransport::getSession(const std::string& user,
                                                      const std::string& host,
                                                      std::uint16_t port,
                                                      std::string& err) {
    if (record("getSession", "getSession " + user + "@" + host + ":" + std::to_string(port), err))
        return nullptr;
    return std::make_unique<MockSession>(*this, user, host, port);
}

} // namespace sftpkit

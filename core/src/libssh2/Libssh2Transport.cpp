// libssh2 backend: manages the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and client-side working directory.
#include "sftpkit/Libssh2Transport.hpp"
#include "sftpkit/RemotePath.hpp"
#include "sftpkit/SftpConnector.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftpkit {

namespace {

// Global libssh2 initialisation (once per process).
std::once_flag g_libssh2_init;

constexpr std::size_t kChunk = 64 * 1024;

// Routes libssh2's own trace output to the injected logger.
void traceHandler(LIBSSH2_SESSION*, void* context, const char* data, size_t length) {
    auto* logger = static_cast<Logger*>(context);
    if (!logger || !data)
        return;
    std::string line(data, length);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
    logger->debug("libssh2: {}", line);
}

std::string sftpErrorText(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_EOF: return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE: return "failure";
        case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
        case LIBSSH2_FX_NO_CONNECTION: return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME: return "invalid filename";
        default: return "sftp status " + std::to_string(code);
    }
}

std::vector<std::string> splitMethods(const std::string& list) {
    std::vector<std::string> out;
    std::stringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        const auto start = item.find_first_not_of(" \t");
        const auto end = item.find_last_not_of(" \t");
        if (start != std::string::npos)
            out.push_back(item.substr(start, end - start + 1));
    }
    return out;
}

int knownHostKeyAlgorithm(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default:
            return 0;
    }
}

// Answers keyboard-interactive prompts: the user name for prompts mentioning
// "user" or "name", the password for everything else.
struct KbdIntCtx {
    const std::string* user;
    const std::string* pass;
};

char* duplicate(const std::string& s) {
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    return buf;
}

void kbdintCallback(const char*, int, const char*, int,
                    int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                    void** abstract) {
    const auto* ctx = (abstract && *abstract) ? static_cast<const KbdIntCtx*>(*abstract) : nullptr;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (!ctx)
            continue;

        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        for (char& c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;

        const std::string* answer = wantUser ? ctx->user : ctx->pass;
        if (!answer || answer->empty())
            continue;
        responses[i].text = duplicate(*answer);
        if (responses[i].text)
            responses[i].length = static_cast<unsigned int>(answer->size());
    }
}

} // namespace

class Libssh2Session : public SshSession {
public:
    Libssh2Session(Libssh2Transport& transport, std::string user, std::string host, std::uint16_t port)
        : transport_(transport), user_(std::move(user)), host_(std::move(host)), port_(port) {}

    ~Libssh2Session() override { disconnect(); }

    void setTimeout(std::chrono::milliseconds timeout) override { timeout_ = timeout; }
    std::chrono::milliseconds timeout() const override { return timeout_; }

    void setConfig(const std::string& key, const std::string& value) override { config_[key] = value; }
    std::optional<std::string> config(const std::string& key) const override {
        auto it = config_.find(key);
        if (it == config_.end())
            return std::nullopt;
        return it->second;
    }

    void setPassword(const std::string& password) override { password_ = password; }

    bool connect(std::string& err) override;
    bool isConnected() const override { return connected_; }
    void disconnect() override;

    std::unique_ptr<Channel> openChannel(const std::string& type, std::string& err) override;

    LIBSSH2_SESSION* raw() const { return session_; }
    std::string lastError() const;

private:
    bool tcpConnect(std::string& err);
    bool verifyHostKey(std::string& err);
    bool authenticate(std::string& err);
    bool authenticatePublicKey();
    bool authenticatePassword();
    bool authenticateKeyboardInteractive();

    Libssh2Transport& transport_;
    std::string user_;
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_{0};
    std::map<std::string, std::string> config_;
    std::optional<std::string> password_;

    int sock_ = -1;
    LIBSSH2_SESSION* session_ = nullptr;
    bool connected_ = false;
};

class Libssh2SftpChannel : public SftpChannel {
public:
    explicit Libssh2SftpChannel(Libssh2Session& session) : session_(session) {}
    ~Libssh2SftpChannel() override { disconnect(); }

    std::string type() const override { return kSftpChannelType; }
    bool connect(std::chrono::milliseconds timeout, std::string& err) override;
    bool isConnected() const override { return sftp_ != nullptr && session_.isConnected(); }
    void disconnect() override;

    bool cd(const std::string& path, std::string& err) override;
    std::string pwd() const override { return cwd_; }
    bool mkdir(const std::string& path, std::string& err) override;
    bool ls(const std::string& path, std::vector<FileInfo>& out, std::string& err) override;
    bool get(const std::string& remoteFilename, std::ostream& out, std::string& err) override;
    bool put(std::istream& data, const std::string& remoteFilename, std::string& err) override;
    bool rm(const std::string& remoteFilename, std::string& err) override;

private:
    bool requireOpen(std::string& err) const;
    bool realpath(const std::string& path, std::string& out, std::string& err);
    std::string failure(const std::string& what) const;

    Libssh2Session& session_;
    LIBSSH2_SFTP* sftp_ = nullptr;
    std::string cwd_ = "/";
};

// ---------------------------------------------------------------- session

std::string Libssh2Session::lastError() const {
    if (!session_)
        return {};
    char* msg = nullptr;
    int len = 0;
    const int code = libssh2_session_last_error(session_, &msg, &len, 0);
    std::string out = (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
    if (code != 0)
        out += " (libssh2 error " + std::to_string(code) + ")";
    return out;
}

bool Libssh2Session::tcpConnect(std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port_);
    struct addrinfo* res = nullptr;
    const int gai = getaddrinfo(host_.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    const int waitMs = timeout_.count() > 0 ? static_cast<int>(timeout_.count()) : -1;
    std::string lastErr = "could not connect to " + host_ + ":" + portStr;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;

        // Non-blocking connect so the configured timeout bounds it.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, waitMs);
            if (rc == 0) {
                lastErr = "timeout connecting to " + host_ + ":" + portStr;
                rc = -1;
            } else if (rc > 0) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                if (soErr != 0) {
                    lastErr = std::string("connect: ") + std::strerror(soErr);
                    rc = -1;
                } else {
                    rc = 0;
                }
            }
        } else if (rc != 0) {
            lastErr = std::string("connect: ") + std::strerror(errno);
        }
        if (rc != 0) {
            ::close(s);
            continue;
        }
        ::fcntl(s, F_SETFL, flags);

        // TCP keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        sock_ = s;
        freeaddrinfo(res);
        return true;
    }
    freeaddrinfo(res);
    err = lastErr;
    return false;
}

bool Libssh2Session::verifyHostKey(std::string& err) {
    if (config(kStrictHostKeyChecking).value_or("yes") == "no") {
        transport_.logger().debug("Skipping host key verification for {}", host_);
        return true;
    }

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialise known_hosts";
        return false;
    }
    const std::string& khPath = transport_.knownHostsPath();
    if (khPath.empty() ||
        libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(nh);
        err = "known_hosts not available or unreadable: " + khPath;
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain the server host key";
        return false;
    }

    const int alg = knownHostKeyAlgorithm(keytype);
    const int typemaskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemaskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, host_.c_str(), port_, hostkey, keylen, typemaskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, host_.c_str(), port_, hostkey, keylen, typemaskHash, &host);
    libssh2_knownhost_free(nh);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key for " + host_ + " does not match known_hosts"
              : "Host " + host_ + " is unknown in known_hosts";
    return false;
}

bool Libssh2Session::authenticatePublicKey() {
    for (const auto& identity : transport_.identities()) {
        const int rc = libssh2_userauth_publickey_fromfile(session_, user_.c_str(), nullptr,
                                                           identity.c_str(), nullptr);
        if (rc == 0)
            return true;
        transport_.logger().debug("Public key authentication failed: {}", lastError());
    }
    return false;
}

bool Libssh2Session::authenticatePassword() {
    if (!password_)
        return false;
    const int rc = libssh2_userauth_password(session_, user_.c_str(), password_->c_str());
    if (rc != 0)
        transport_.logger().debug("Password authentication failed: {}", lastError());
    return rc == 0;
}

bool Libssh2Session::authenticateKeyboardInteractive() {
    if (!password_)
        return false;
    KbdIntCtx ctx{&user_, &*password_};
    void** abs = libssh2_session_abstract(session_);
    if (abs)
        *abs = &ctx;
    const int rc = libssh2_userauth_keyboard_interactive(session_, user_.c_str(), kbdintCallback);
    if (abs)
        *abs = nullptr;
    if (rc != 0)
        transport_.logger().debug("Keyboard-interactive authentication failed: {}", lastError());
    return rc == 0;
}

bool Libssh2Session::authenticate(std::string& err) {
    const auto preferred = splitMethods(config(kPreferredAuthentications).value_or(SftpConfig::kDefaultPreferredAuthentications));

    char* methods = libssh2_userauth_list(session_, user_.c_str(), static_cast<unsigned>(user_.size()));
    if (!methods && libssh2_userauth_authenticated(session_))
        return true;  // "none" was accepted
    const std::string offered = methods ? std::string(methods) : std::string();
    auto serverOffers = [&](const std::string& m) {
        return offered.empty() || offered.find(m) != std::string::npos;
    };

    for (const auto& method : preferred) {
        if (!serverOffers(method)) {
            transport_.logger().trace("Server does not offer {}", method);
            continue;
        }
        bool ok = false;
        if (method == "publickey")
            ok = authenticatePublicKey();
        else if (method == "password")
            ok = authenticatePassword();
        else if (method == "keyboard-interactive")
            ok = authenticateKeyboardInteractive();
        else
            transport_.logger().trace("Skipping unsupported authentication method {}", method);
        if (ok) {
            transport_.logger().debug("Authenticated using {}", method);
            return true;
        }
    }
    err = "Auth fail for " + user_ + " (server methods: " + offered + ")";
    const std::string last = lastError();
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2Session::connect(std::string& err) {
    if (connected_) {
        err = "Session is already connected";
        return false;
    }
    std::call_once(g_libssh2_init, [] { libssh2_init(0); });

    if (!tcpConnect(err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    Logger& logger = transport_.logger();
    if (logger.enabled(LogLevel::Debug)) {
        libssh2_trace_sethandler(session_, &logger, traceHandler);
        libssh2_trace(session_, ~0);
    }

    libssh2_session_set_blocking(session_, 1);
    if (timeout_.count() > 0)
        libssh2_session_set_timeout(session_, static_cast<long>(timeout_.count()));

    if (auto hostKeyType = config(kServerHostKey)) {
        if (libssh2_session_method_pref(session_, LIBSSH2_METHOD_HOSTKEY, hostKeyType->c_str()) != 0) {
            err = "Unsupported server host key algorithm " + *hostKeyType + ": " + lastError();
            disconnect();
            return false;
        }
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        disconnect();
        return false;
    }

    // Keepalive every 30s if the peer allows it.
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(err) || !authenticate(err)) {
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void Libssh2Session::disconnect() {
    if (session_) {
        if (connected_)
            libssh2_session_disconnect(session_, "Normal Shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

std::unique_ptr<Channel> Libssh2Session::openChannel(const std::string& type, std::string& err) {
    if (!connected_) {
        err = "Session is not connected";
        return nullptr;
    }
    if (type != kSftpChannelType) {
        err = "Unsupported channel type: " + type;
        return nullptr;
    }
    return std::make_unique<Libssh2SftpChannel>(*this);
}

// ---------------------------------------------------------------- sftp channel

bool Libssh2SftpChannel::connect(std::chrono::milliseconds timeout, std::string& err) {
    if (!session_.isConnected()) {
        err = "Session is not connected";
        return false;
    }
    LIBSSH2_SESSION* raw = session_.raw();
    const long previous = libssh2_session_get_timeout(raw);
    libssh2_session_set_timeout(raw, static_cast<long>(timeout.count()));
    sftp_ = libssh2_sftp_init(raw);
    libssh2_session_set_timeout(raw, previous);
    if (!sftp_) {
        err = "Could not initialise SFTP: " + session_.lastError();
        return false;
    }

    std::string home;
    std::string ignored;
    cwd_ = realpath(".", home, ignored) ? home : "/";
    return true;
}

void Libssh2SftpChannel::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
}

bool Libssh2SftpChannel::requireOpen(std::string& err) const {
    if (!isConnected()) {
        err = "Sftp channel is not connected";
        return false;
    }
    return true;
}

std::string Libssh2SftpChannel::failure(const std::string& what) const {
    return what + ": " + sftpErrorText(libssh2_sftp_last_error(sftp_));
}

bool Libssh2SftpChannel::realpath(const std::string& path, std::string& out, std::string& err) {
    char buf[4096];
    const int n = libssh2_sftp_realpath(sftp_, path.c_str(), buf, sizeof(buf));
    if (n <= 0) {
        err = failure("realpath " + path);
        return false;
    }
    out.assign(buf, static_cast<std::size_t>(n));
    return true;
}

bool Libssh2SftpChannel::cd(const std::string& path, std::string& err) {
    if (!requireOpen(err))
        return false;
    std::string real;
    if (!realpath(resolveRemotePath(cwd_, path), real, err))
        return false;

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp_, real.c_str(), &attrs) != 0) {
        err = failure("stat " + real);
        return false;
    }
    const bool isDir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                       (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    if (!isDir) {
        err = "Can't change directory: " + real + " is not a directory";
        return false;
    }
    cwd_ = real;
    return true;
}

bool Libssh2SftpChannel::mkdir(const std::string& path, std::string& err) {
    if (!requireOpen(err))
        return false;
    const std::string target = resolveRemotePath(cwd_, path);
    if (libssh2_sftp_mkdir(sftp_, target.c_str(), 0755) != 0) {
        err = failure("mkdir " + target);
        return false;
    }
    return true;
}

bool Libssh2SftpChannel::ls(const std::string& path, std::vector<FileInfo>& out, std::string& err) {
    if (!requireOpen(err))
        return false;
    const std::string target = resolveRemotePath(cwd_, path);

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, target.c_str());
    if (!dir) {
        err = failure("opendir " + target);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err = failure("readdir " + target);
            libssh2_sftp_closedir(dir);
            return false;
        }

        FileInfo fi{};
        fi.name = std::string(filename, static_cast<std::size_t>(rc));
        if (fi.name == "." || fi.name == "..")
            continue;
        fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                        ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                        : false;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
            fi.uid = static_cast<std::uint32_t>(attrs.uid);
            fi.gid = static_cast<std::uint32_t>(attrs.gid);
        }
        out.push_back(std::move(fi));
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpChannel::get(const std::string& remoteFilename, std::ostream& out, std::string& err) {
    if (!requireOpen(err))
        return false;
    const std::string target = resolveRemotePath(cwd_, remoteFilename);

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open(sftp_, target.c_str(), LIBSSH2_FXF_READ, 0);
    if (!rh) {
        err = failure("open " + target);
        return false;
    }

    std::vector<char> buf(kChunk);
    while (true) {
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;  // EOF
        if (n < 0) {
            err = failure("read " + target);
            libssh2_sftp_close(rh);
            return false;
        }
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) {
            err = "Local write failed while reading " + target;
            libssh2_sftp_close(rh);
            return false;
        }
    }

    libssh2_sftp_close(rh);
    return true;
}

bool Libssh2SftpChannel::put(std::istream& data, const std::string& remoteFilename, std::string& err) {
    if (!requireOpen(err))
        return false;
    const std::string target = resolveRemotePath(cwd_, remoteFilename);

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open(sftp_, target.c_str(),
                                                LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                0644);
    if (!wh) {
        err = failure("open " + target);
        return false;
    }

    std::vector<char> buf(kChunk);
    while (data) {
        data.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto n = static_cast<std::size_t>(data.gcount());
        const char* p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = failure("write " + target);
                libssh2_sftp_close(wh);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
    }
    if (data.bad()) {
        err = "Reading the source stream failed for " + target;
        libssh2_sftp_close(wh);
        return false;
    }

    libssh2_sftp_close(wh);
    return true;
}

bool Libssh2SftpChannel::rm(const std::string& remoteFilename, std::string& err) {
    if (!requireOpen(err))
        return false;
    const std::string target = resolveRemotePath(cwd_, remoteFilename);
    if (libssh2_sftp_unlink(sftp_, target.c_str()) != 0) {
        err = failure("rm " + target);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------- transport

Libssh2Transport::Libssh2Transport(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<NullLogger>()) {}

bool Libssh2Transport::setKnownHosts(const std::string& path, std::string& err) {
    std::vector<HostKey> entries;
    if (!loadKnownHostsFile(path, entries, err))
        return false;
    logger_->trace("Loaded {} known host entries from {}", entries.size(), path);
    knownHosts_.assign(std::move(entries));
    knownHostsPath_ = path;
    return true;
}

bool Libssh2Transport::addIdentity(const std::string& privateKeyPath, std::string& err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(privateKeyPath, ec)) {
        err = "Private key file not found: " + privateKeyPath;
        return false;
    }
    if (std::find(identities_.begin(), identities_.end(), privateKeyPath) == identities_.end())
        identities_.push_back(privateKeyPath);
    return true;
}

std::unique_ptr<SshSession> Libssh2Transport::getSession(const std::string& user,
                                                         const std::string& host,
                                                         std::uint16_t port,
                                                         std::string& err) {
    if (user.empty() || host.empty()) {
        err = "user and host are required";
        return nullptr;
    }
    return std::make_unique<Libssh2Session>(*this, user, host, port);
}

std::unique_ptr<SftpConnector> makeLibssh2Connector(SftpConfig config, std::shared_ptr<Logger> logger) {
    auto transport = std::make_unique<Libssh2Transport>(logger);
    return std::make_unique<SftpConnector>(std::move(config), std::move(transport), std::move(logger));
}

} // namespace sftpkit

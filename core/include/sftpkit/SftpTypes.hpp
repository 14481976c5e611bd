// Basic types shared by the connector, the transfer layer and the transport backends.
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sftpkit {

// One entry of a remote directory listing.
struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if known)
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

// One line of a known_hosts file. "host" is the raw host field, which may be
// "hostname,ip", a single token, or a hashed "|1|..." value.
struct HostKey {
    std::string host;
    std::string type;  // e.g. ssh-rsa, ecdsa-sha2-nistp256
    std::string key;   // base64 blob
    std::string comment;
};

// Session configuration keys understood by every backend.
inline constexpr const char* kPreferredAuthentications = "PreferredAuthentications";
inline constexpr const char* kServerHostKey = "server_host_key";
inline constexpr const char* kStrictHostKeyChecking = "StrictHostKeyChecking";

// Channel type used for file transfers.
inline constexpr const char* kSftpChannelType = "sftp";

} // namespace sftpkit

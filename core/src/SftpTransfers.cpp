#include "sftpkit/SftpTransfers.hpp"
#include "sftpkit/RemotePath.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sftpkit {

namespace {

constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at "pos", or the length
// of its longest valid prefix (at least 1) negated when it is malformed.
int utf8SequenceLength(const std::string& text, std::size_t pos) {
    const auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    const unsigned char lead = byte(pos);
    if (lead < 0x80)
        return 1;

    int length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return -1;
    }

    for (int i = 1; i < length; ++i) {
        const std::size_t at = pos + static_cast<std::size_t>(i);
        if (at >= text.size())
            return -i;
        const unsigned char c = byte(at);
        if (c < low || c > high)
            return -i;
        low = 0x80;
        high = 0xBF;
    }
    return length;
}

// Every malformed sequence becomes U+FFFD.
std::string replaceMalformedUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const int length = utf8SequenceLength(bytes, pos);
        if (length > 0) {
            out.append(bytes, pos, static_cast<std::size_t>(length));
            pos += static_cast<std::size_t>(length);
        } else {
            out += kReplacementCharacter;
            pos += static_cast<std::size_t>(-length);
        }
    }
    return out;
}

} // namespace

SftpTransfers::SftpTransfers(SftpConnector& connector) : connector_(connector) {}

void SftpTransfers::connect() {
    connector_.connect();
}

void SftpTransfers::disconnect() {
    connector_.disconnect();
}

void SftpTransfers::putFile(const std::string& remotePath,
                            const std::string& filename,
                            std::istream& data) {
    connector_.runCommand([&](SftpChannel& channel) {
        changeOrCreateRemoteDirectory(channel, remotePath);
        std::string err;
        requireSuccess(channel.put(data, filename, err), "put " + filename, err);
    });
}

// SFTP offers no cheap existence check, so try to change into the directory
// and create it when that fails.
void SftpTransfers::changeOrCreateRemoteDirectory(SftpChannel& channel, const std::string& path) {
    std::string err;
    connector_.logger().debug("Attempting to change to {} on the remote host", path);
    if (channel.cd(path, err)) {
        connector_.logger().debug("Successfully changed directory on the remote host");
        return;
    }
    connector_.logger().debug("Directory {} did not exist ({}). Will create it", path, err);
    err.clear();
    requireSuccess(channel.mkdir(path, err), "mkdir " + path, err);
    changeToRemoteDirectory(channel, path);
}

void SftpTransfers::getAndStoreAllFiles(const std::string& remotePath,
                                        const LocalPathFn& localPathFn,
                                        const LocalFilenameFn& localFilenameFn) {
    for (const auto& filename : listFiles(remotePath))
        getAndStoreFile(remotePath, localPathFn, filename, localFilenameFn);

    for (const auto& directory : listDirectories(remotePath))
        getAndStoreAllFiles(joinRemotePath(remotePath, directory), localPathFn, localFilenameFn);
}

void SftpTransfers::getAndStoreFile(const std::string& remotePath,
                                    const fs::path& localPath,
                                    const std::string& filename) {
    getAndStoreFile(remotePath, localPath, filename, filename);
}

void SftpTransfers::getAndStoreFile(const std::string& remotePath,
                                    const fs::path& localPath,
                                    const std::string& remoteFilename,
                                    const std::string& localFilename) {
    getAndStoreFile(
        remotePath,
        [localPath](const std::string&, const std::string&) { return localPath; },
        remoteFilename,
        [localFilename](const std::string&, const std::string&) { return localFilename; });
}

void SftpTransfers::getAndStoreFile(const std::string& remotePath,
                                    const LocalPathFn& localPathFn,
                                    const std::string& remoteFilename,
                                    const LocalFilenameFn& localFilenameFn) {
    connector_.runCommand([&](SftpChannel& channel) {
        changeToRemoteDirectory(channel, remotePath);

        const fs::path localPath = localPathFn(remotePath, remoteFilename);
        ensureLocalDirectoryExists(localPath);

        const fs::path target = localPath / localFilenameFn(remotePath, remoteFilename);
        storeLocalFile(target, [&](std::ostream& out) {
            std::string err;
            requireSuccess(channel.get(remoteFilename, out, err), "get " + remoteFilename, err);
        });
    });
}

// An existing local file is only replaced once the whole remote file has
// been written next to it.
void SftpTransfers::storeLocalFile(const fs::path& target,
                                   const std::function<void(std::ostream&)>& write) {
    fs::path partial = target;
    partial += ".sftpkit-part";

    try {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            throw TransportError("Could not open local file for writing: " + partial.string());
        write(out);
        out.close();
        if (!out)
            throw TransportError("Could not write local file: " + partial.string());
        fs::rename(partial, target);
    } catch (...) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw;
    }
}

void SftpTransfers::ensureLocalDirectoryExists(const fs::path& path) {
    if (fs::exists(path))
        return;
    connector_.logger().debug("Local storage directory {} doesn't exist. Creating.", path.string());
    fs::create_directories(path);
}

std::string SftpTransfers::getFileContent(const std::string& remotePath,
                                          const std::string& remoteFilename) {
    return connector_.runCommandWithResult([&](SftpChannel& channel) {
        changeToRemoteDirectory(channel, remotePath);

        std::ostringstream content;
        std::string err;
        requireSuccess(channel.get(remoteFilename, content, err), "get " + remoteFilename, err);
        return replaceMalformedUtf8(content.str());
    });
}

std::vector<std::string> SftpTransfers::listFiles(const std::string& remotePath) {
    return listRemoteItems(remotePath, false);
}

std::vector<std::string> SftpTransfers::listDirectories(const std::string& remotePath) {
    return listRemoteItems(remotePath, true);
}

std::vector<std::string> SftpTransfers::listRemoteItems(const std::string& remotePath, bool directories) {
    return connector_.runCommandWithResult([&](SftpChannel& channel) {
        changeToRemoteDirectory(channel, remotePath);

        std::vector<FileInfo> entries;
        std::string err;
        requireSuccess(channel.ls(".", entries, err), "ls " + remotePath, err);

        std::vector<std::string> names;
        for (const auto& entry : entries) {
            if (entry.is_dir == directories)
                names.push_back(entry.name);
        }
        return names;
    });
}

void SftpTransfers::deleteRemoteFile(const std::string& remotePath, const std::string& remoteFilename) {
    connector_.runCommand([&](SftpChannel& channel) {
        changeToRemoteDirectory(channel, remotePath);
        connector_.logger().debug("Deleting {} from {}", remoteFilename, remotePath);
        std::string err;
        requireSuccess(channel.rm(remoteFilename, err), "rm " + remoteFilename, err);
    });
}

void SftpTransfers::changeToRemoteDirectory(SftpChannel& channel, const std::string& path) {
    connector_.logger().debug("Attempting to change to {} on the remote host", path);
    std::string err;
    requireSuccess(channel.cd(path, err), "cd " + path, err);
    connector_.logger().debug("Successfully changed directory on the remote host");
}

} // namespace sftpkit

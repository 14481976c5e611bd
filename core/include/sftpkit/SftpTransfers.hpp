// Basic SFTP operations on top of an SftpConnector. Every operation goes
// through SftpConnector::runCommand, so all failures surface as
// SftpTransfersError.
#pragma once
#include "SftpConnector.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace sftpkit {

class SftpTransfers {
public:
    // Computes a local directory, or a local file name, from (remote path, remote file name).
    using LocalPathFn = std::function<std::filesystem::path(const std::string&, const std::string&)>;
    using LocalFilenameFn = std::function<std::string(const std::string&, const std::string&)>;

    explicit SftpTransfers(SftpConnector& connector);

    // Delegate to the connector.
    void connect();
    void disconnect();

    // Writes "data" as "filename" under "remotePath", creating the remote
    // directory first when changing into it fails.
    void putFile(const std::string& remotePath, const std::string& filename, std::istream& data);

    /**
     * Mirrors the remote tree under "remotePath": first every file directly
     * under it, then each sub-directory, recursively (depth first). Local
     * locations come from the two mapping functions, called once per file.
     *
     * Symlink cycles on the remote side are not detected.
     */
    void getAndStoreAllFiles(const std::string& remotePath,
                             const LocalPathFn& localPathFn,
                             const LocalFilenameFn& localFilenameFn);

    // Stores remote "filename" as localPath/filename.
    void getAndStoreFile(const std::string& remotePath,
                         const std::filesystem::path& localPath,
                         const std::string& filename);

    void getAndStoreFile(const std::string& remotePath,
                         const std::filesystem::path& localPath,
                         const std::string& remoteFilename,
                         const std::string& localFilename);

    // Stores the remote file as localPathFn(...)/localFilenameFn(...),
    // creating the local directory if needed. An existing local file is
    // overwritten on success and left untouched when the download fails.
    void getAndStoreFile(const std::string& remotePath,
                         const LocalPathFn& localPathFn,
                         const std::string& remoteFilename,
                         const LocalFilenameFn& localFilenameFn);

    // Contents of the remote file decoded as UTF-8; malformed sequences become U+FFFD.
    std::string getFileContent(const std::string& remotePath, const std::string& remoteFilename);

    // Names of the non-directory entries of "remotePath", in listing order.
    std::vector<std::string> listFiles(const std::string& remotePath);

    // Names of the directory entries of "remotePath", in listing order.
    std::vector<std::string> listDirectories(const std::string& remotePath);

    void deleteRemoteFile(const std::string& remotePath, const std::string& remoteFilename);

private:
    std::vector<std::string> listRemoteItems(const std::string& remotePath, bool directories);
    void changeToRemoteDirectory(SftpChannel& channel, const std::string& path);
    void changeOrCreateRemoteDirectory(SftpChannel& channel, const std::string& path);
    void ensureLocalDirectoryExists(const std::filesystem::path& path);
    void storeLocalFile(const std::filesystem::path& target,
                        const std::function<void(std::ostream&)>& write);

    SftpConnector& connector_;
};

} // namespace sftpkit

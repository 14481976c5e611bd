// POSIX-style remote path helpers. Remote paths are always '/'-separated,
// whatever the local platform is.
#pragma once
#include <string>

namespace sftpkit {

// "base" + "/" + "name", without doubling separators. An empty base yields "name".
std::string joinRemotePath(const std::string& base, const std::string& name);

// Collapses repeated separators, "." and ".." segments. Relative paths stay
// relative; ".." never climbs above the root of an absolute path.
std::string normalizeRemotePath(const std::string& path);

// "path" if absolute, otherwise "path" relative to "cwd"; normalized either way.
std::string resolveRemotePath(const std::string& cwd, const std::string& path);

} // namespace sftpkit

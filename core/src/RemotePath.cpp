#include "sftpkit/RemotePath.hpp"

#include <vector>

namespace sftpkit {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string normalizeRemotePath(const std::string& path) {
    const bool absolute = !path.empty() && path.front() == '/';
    std::vector<std::string> parts;
    std::string::size_type pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string::npos)
            next = path.size();
        const std::string seg = path.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".")
            continue;
        if (seg == "..") {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();
            else if (!absolute)
                parts.push_back(seg);
            continue;
        }
        parts.push_back(seg);
    }

    std::string out = absolute ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i)
            out += '/';
        out += parts[i];
    }
    if (out.empty())
        out = ".";
    return out;
}

std::string resolveRemotePath(const std::string& cwd, const std::string& path) {
    if (!path.empty() && path.front() == '/')
        return normalizeRemotePath(path);
    return normalizeRemotePath(joinRemotePath(cwd.empty() ? "/" : cwd, path));
}

} // namespace sftpkit

#include "MountTable.hpp"
#include <algorithm>

std::string cleanPath(const std::string &path)
{
    if (path.empty())
        return ".";

    const bool rooted = path.front() == '/';
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < path.size())
    {
        size_t next = path.find('/', i);
        if (next == std::string::npos)
            next = path.size();
        std::string seg = path.substr(i, next - i);
        i = next + 1;

        if (seg.empty() || seg == ".")
            continue;
        if (seg == "..")
        {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();
            else if (!rooted)
                parts.push_back(seg);
            continue;
        }
        parts.push_back(seg);
    }

    std::string out = rooted ? "/" : "";
    for (size_t p = 0; p < parts.size(); ++p)
    {
        if (p)
            out += '/';
        out += parts[p];
    }
    if (out.empty())
        return ".";
    return out;
}

BridgeResult normalizeMountPoint(const std::string &point, std::string &out)
{
    std::string s = cleanPath(point);
    if (s == ".")
        return BridgeResult::failure(BridgeError::InvalidArgument, "invalid file system mount point: " + s);
    if (s.front() != '/')
        return BridgeResult::failure(BridgeError::InvalidArgument, "mount point must be absolute: " + s);
    if (s != "/")
        s += '/';
    out = s;
    return BridgeResult::success();
}

BridgeResult MountTable::mount(const std::string &point, std::shared_ptr<FileSystem> fs)
{
    std::string p;
    BridgeResult r = normalizeMountPoint(point, p);
    if (!r.ok)
        return r;
    if (!fs)
        return BridgeResult::failure(BridgeError::InvalidArgument, "no file system given for mount point: " + p);

    auto it = m_mounts.find(p);
    if (it != m_mounts.end())
    {
        it->second = std::move(fs);
        return BridgeResult::success();
    }

    m_mounts.emplace(p, std::move(fs));
    m_points.insert(std::lower_bound(m_points.begin(), m_points.end(), p), p);
    return BridgeResult::success();
}

BridgeResult MountTable::unmount(const std::string &point)
{
    std::string p;
    BridgeResult r = normalizeMountPoint(point, p);
    if (!r.ok)
        return r;

    auto it = m_mounts.find(p);
    if (it == m_mounts.end())
        return BridgeResult::failure(BridgeError::NotFound, "no file system mounted: \"" + p + "\"");

    m_mounts.erase(it);
    auto pos = std::lower_bound(m_points.begin(), m_points.end(), p);
    if (pos != m_points.end() && *pos == p)
        m_points.erase(pos);
    return BridgeResult::success();
}

std::optional<MountEntry> MountTable::resolve(const std::string &path) const
{
    std::string query = path;
    while (!query.empty())
    {
        // Last point that sorts at or before the query.
        auto pos = std::upper_bound(m_points.begin(), m_points.end(), query);
        if (pos == m_points.begin())
            return std::nullopt;
        const std::string &candidate = *(pos - 1);
        if (query.compare(0, candidate.size(), candidate) == 0)
            return MountEntry{candidate, m_mounts.at(candidate)};

        // Any shorter mount covering the query is also a prefix of the
        // candidate, so continue with their common directory prefix.
        size_t common = 0;
        size_t limit = std::min(query.size(), candidate.size());
        while (common < limit && query[common] == candidate[common])
            ++common;
        size_t slash = query.rfind('/', common == 0 ? 0 : common - 1);
        if (slash == std::string::npos || common == 0)
            return std::nullopt;
        query.resize(slash + 1);
    }
    return std::nullopt;
}

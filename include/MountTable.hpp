// MountTable.hpp - sorted virtual mount points with longest-prefix lookup
#pragma once
#include "BridgeError.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class FileSystem;

struct MountEntry
{
    std::string point; // normalized, ends with '/'
    std::shared_ptr<FileSystem> fs;
};

// Lexical path cleanup: collapses "//", "." and "..". Same rules as a POSIX
// shell would apply without touching the disk. "" becomes ".".
std::string cleanPath(const std::string &path);

// "/a/b" -> "/a/b/", "/" stays "/". Empty, "." and relative points are invalid.
BridgeResult normalizeMountPoint(const std::string &point, std::string &out);

// Not synchronized; BridgeState holds the lock.
class MountTable
{
public:
    // Replaces any provider already mounted at the normalized point.
    BridgeResult mount(const std::string &point, std::shared_ptr<FileSystem> fs);
    BridgeResult unmount(const std::string &point);

    // Most specific mount point that is a literal prefix of path.
    std::optional<MountEntry> resolve(const std::string &path) const;

    const std::vector<std::string> &points() const { return m_points; }
    size_t size() const { return m_points.size(); }

private:
    std::vector<std::string> m_points;
    std::unordered_map<std::string, std::shared_ptr<FileSystem>> m_mounts;
};

#pragma once
#include <FileSystem.hpp>
#include <filesystem>
#include <string>

// A host directory exposed read-only. File contents are loaded whole when
// opened; stat reads metadata only.
class LocalFileSystem : public FileSystem
{
public:
    explicit LocalFileSystem(std::filesystem::path root);
    ~LocalFileSystem() override = default;

    OpenResult open(const std::string &path) override;
    ListResult list(const std::string &path) override;
    StatResult stat(const std::string &path) override;
    std::string describe() const override { return "directory " + m_root.string(); }

    bool isOpen() const { return m_open; }
    const std::filesystem::path &root() const { return m_root; }

private:
    // false when path climbs above the root
    bool hostPath(const std::string &path, std::filesystem::path &out) const;

    std::filesystem::path m_root;
    bool m_open = false;
};

#pragma once
#include <FileSystem.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-memory tree filled by the host. Directories are keyed with a trailing
// slash, so open("/logs") misses and open("/logs/") finds the directory.
class MemoryFileSystem : public FileSystem
{
public:
    explicit MemoryFileSystem(std::time_t modTime = 0);
    ~MemoryFileSystem() override = default;

    // Parent directories are created as needed.
    void addFile(const std::string &path, const std::string &content, std::time_t modTime = 0);
    void addFile(const std::string &path, std::vector<uint8_t> content, std::time_t modTime = 0);
    void addDirectory(const std::string &path, std::time_t modTime = 0);

    OpenResult open(const std::string &path) override;
    ListResult list(const std::string &path) override;
    StatResult stat(const std::string &path) override;
    std::string describe() const override { return "memory"; }

private:
    struct Entry
    {
        std::shared_ptr<const std::vector<uint8_t>> data;
        std::time_t modTime = 0;
        bool isDir = false;
    };

    void addParentsLocked(const std::string &path, std::time_t modTime);
    bool find(const std::string &path, Entry &out) const;
    static FileInfo infoFor(const Entry &e);

    std::time_t m_defaultTime;
    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
};

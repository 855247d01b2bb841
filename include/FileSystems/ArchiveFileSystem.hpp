#pragma once
#include <FileSystem.hpp>
#include <memory>
#include <string>
#include <vector>

// zip/7z/iso/... archives (or a plain directory) read through PhysFS. A
// source ending in ".zst" is a zstd-compressed archive, decompressed in memory
// before it is mounted. Each source is mounted once under a private PhysFS mount
// point, shared by every instance reading that source.
class ArchiveFileSystem : public FileSystem
{
public:
    explicit ArchiveFileSystem(const std::string &source);
    ~ArchiveFileSystem() override = default;

    OpenResult open(const std::string &path) override;
    ListResult list(const std::string &path) override;
    std::string describe() const override { return "archive " + m_source; }

    bool isOpen() const { return m_mount != nullptr; }
    const std::string &lastError() const { return m_error; }

    // Called once per process; later calls return the first outcome.
    static bool initPhysFS(const char *argv0);

    // Shared with open streams so the archive stays mounted while they read.
    struct Mount;

private:
    std::string physPath(const std::string &path) const;

    std::string m_source;
    std::string m_error;
    std::shared_ptr<Mount> m_mount;
};

// Decompresses a whole zstd frame. Returns false with a message when the frame
// is malformed or its size is not recorded in the header.
bool decompressZstd(const std::vector<uint8_t> &in, std::vector<uint8_t> &out, std::string *outError);

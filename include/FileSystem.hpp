// FileSystem.hpp - read-only file system provider interface
#pragma once
#include "HandleRegistry.hpp"
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class FileError { None, NotFound, IsDirectory, NotDirectory, PermissionDenied, Io };

const char *fileErrorName(FileError e);

struct FileInfo
{
    uint64_t size = 0;
    std::time_t modTime = 0;
    uint32_t mode = 0; // permission bits as the provider reports them
    bool isDir = false;
};

struct StatResult
{
    bool ok = false;
    FileError code = FileError::None;
    std::string error;
    FileInfo info;
};

struct ReadResult
{
    bool ok = false;
    size_t count = 0;
    bool eof = false;
    std::string error;
};

struct DirEntry
{
    std::string name;
    bool isDir = false;
};

struct ListResult
{
    bool ok = false;
    FileError code = FileError::None;
    std::string error;
    std::vector<DirEntry> entries;
};

// One open entry. Stored in the handle registry while Tcl holds a channel on
// it; the registry's release hook closes it.
class FileStream : public HostObject
{
public:
    ~FileStream() override = default;

    virtual ReadResult read(char *buf, size_t len) = 0;
    virtual StatResult stat() = 0;
    virtual void close() = 0;

    void release() override { close(); }
};

struct OpenResult
{
    bool ok = false;
    FileError code = FileError::None;
    std::string error;
    std::shared_ptr<FileStream> stream;

    static OpenResult failure(FileError code, std::string message);
};

// Paths handed to a provider are relative to its mount point and always start
// with '/'. A trailing '/' asks for a directory.
class FileSystem
{
public:
    virtual ~FileSystem() = default;

    virtual OpenResult open(const std::string &path) = 0;
    virtual ListResult list(const std::string &path) = 0;
    virtual std::string describe() const = 0;

    // Metadata without reading content. The default opens the entry and asks
    // the stream; providers that load content on open override it.
    virtual StatResult stat(const std::string &path);
};

// Whole-buffer stream over shared, immutable bytes.
class MemoryStream : public FileStream
{
public:
    MemoryStream(std::shared_ptr<const std::vector<uint8_t>> data, FileInfo info);

    ReadResult read(char *buf, size_t len) override;
    StatResult stat() override;
    void close() override;

private:
    std::mutex m_mutex;
    std::shared_ptr<const std::vector<uint8_t>> m_data;
    FileInfo m_info;
    size_t m_offset = 0;
    bool m_closed = false;
};

// Metadata-only stream for directories.
class DirectoryStream : public FileStream
{
public:
    explicit DirectoryStream(FileInfo info);

    ReadResult read(char *buf, size_t len) override;
    StatResult stat() override;
    void close() override {}

private:
    FileInfo m_info;
};

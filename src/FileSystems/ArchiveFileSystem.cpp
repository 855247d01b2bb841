#include "FileSystems/ArchiveFileSystem.hpp"
#include "MountTable.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <physfs.h>
#include <plog/Log.h>
#include <zstd.h>

static std::string physfsError()
{
    return PHYSFS_getErrorByCode(PHYSFS_getLastErrorCode());
}

static bool endsWith(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// PhysFS keys its search path by archive name and silently ignores a second
// mount of the same name, so instances sharing a source share one mount.
namespace
{
struct SharedMount
{
    std::string point;
    unsigned refs = 0;
};

std::mutex &sharedMountMutex()
{
    static std::mutex *m = new std::mutex;
    return *m;
}

std::map<std::string, SharedMount> &sharedMounts()
{
    static auto *mounts = new std::map<std::string, SharedMount>;
    return *mounts;
}
} // namespace

struct ArchiveFileSystem::Mount
{
    std::string point;    // private PhysFS mount point, "/tclbridge/<n>"
    std::string archive;  // name PhysFS knows the archive by, for unmount
    bool shared = false;  // archive is counted in sharedMounts()
    std::vector<uint8_t> memory; // decompressed image for ".zst" sources

    ~Mount()
    {
        if (archive.empty())
            return;
        if (!shared)
        {
            unmount();
            return;
        }
        std::lock_guard<std::mutex> l(sharedMountMutex());
        auto &mounts = sharedMounts();
        auto it = mounts.find(archive);
        if (it != mounts.end())
        {
            if (--it->second.refs > 0)
                return;
            mounts.erase(it);
        }
        unmount();
    }

    void unmount()
    {
        if (PHYSFS_unmount(archive.c_str()) == 0)
            PLOGW << "ArchiveFileSystem: unmount of " << archive << " failed: " << physfsError();
    }
};

namespace
{
class ArchiveStream : public FileStream
{
public:
    ArchiveStream(PHYSFS_File *file, FileInfo info, std::shared_ptr<ArchiveFileSystem::Mount> mount)
        : m_file(file), m_info(info), m_mount(std::move(mount))
    {
    }

    ~ArchiveStream() override { close(); }

    ReadResult read(char *buf, size_t len) override
    {
        ReadResult res;
        std::lock_guard<std::mutex> l(m_mutex);
        if (!m_file)
        {
            res.error = "read on closed stream";
            return res;
        }
        PHYSFS_sint64 n = PHYSFS_readBytes(m_file, buf, len);
        if (n < 0)
        {
            res.error = physfsError();
            return res;
        }
        res.ok = true;
        res.count = static_cast<size_t>(n);
        res.eof = PHYSFS_eof(m_file) != 0;
        return res;
    }

    StatResult stat() override
    {
        StatResult res;
        res.ok = true;
        res.info = m_info;
        return res;
    }

    void close() override
    {
        std::lock_guard<std::mutex> l(m_mutex);
        if (!m_file)
            return;
        if (PHYSFS_close(m_file) == 0)
            PLOGW << "ArchiveStream: close failed: " << physfsError();
        m_file = nullptr;
        m_mount.reset();
    }

private:
    std::mutex m_mutex;
    PHYSFS_File *m_file;
    FileInfo m_info;
    std::shared_ptr<ArchiveFileSystem::Mount> m_mount;
};
} // namespace

bool decompressZstd(const std::vector<uint8_t> &in, std::vector<uint8_t> &out, std::string *outError)
{
    unsigned long long const size = ZSTD_getFrameContentSize(in.data(), in.size());
    if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN)
    {
        if (outError)
            *outError = "not a zstd frame with a known content size";
        return false;
    }
    out.resize(static_cast<size_t>(size));
    size_t const written = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(written))
    {
        if (outError)
            *outError = ZSTD_getErrorName(written);
        out.clear();
        return false;
    }
    out.resize(written);
    return true;
}

bool ArchiveFileSystem::initPhysFS(const char *argv0)
{
    static std::once_flag once;
    static bool initialized = false;
    std::call_once(once, [argv0]() {
        if (PHYSFS_isInit() || PHYSFS_init(argv0) != 0)
            initialized = true;
        else
            PLOGE << "Failed to initialize PhysFS: " << physfsError();
    });
    return initialized;
}

ArchiveFileSystem::ArchiveFileSystem(const std::string &source) : m_source(source)
{
    static std::atomic<unsigned> counter{0};

    if (!initPhysFS(nullptr))
    {
        m_error = "PhysFS is not initialized";
        return;
    }

    auto mount = std::make_shared<Mount>();
    unsigned n = ++counter;
    mount->point = "/tclbridge/" + std::to_string(n);

    int rc;
    if (endsWith(source, ".zst"))
    {
        std::ifstream ifs(source, std::ios::binary);
        if (!ifs)
        {
            m_error = "cannot read " + source;
            PLOGW << "ArchiveFileSystem: " << m_error;
            return;
        }
        std::vector<uint8_t> compressed((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (!decompressZstd(compressed, mount->memory, &m_error))
        {
            m_error = source + ": " + m_error;
            PLOGW << "ArchiveFileSystem: " << m_error;
            return;
        }
        // PhysFS picks the archiver from the name, so keep the inner extension
        std::string inner = source.substr(0, source.size() - 4);
        size_t slash = inner.find_last_of('/');
        if (slash != std::string::npos)
            inner = inner.substr(slash + 1);
        mount->archive = std::to_string(n) + "-" + inner;
        rc = PHYSFS_mountMemory(mount->memory.data(), mount->memory.size(), nullptr,
                                mount->archive.c_str(), mount->point.c_str(), 1);
    }
    else
    {
        std::lock_guard<std::mutex> l(sharedMountMutex());
        auto &mounts = sharedMounts();
        auto it = mounts.find(source);
        if (it != mounts.end())
        {
            mount->point = it->second.point;
            it->second.refs++;
            rc = 1;
            PLOGD << "ArchiveFileSystem: reusing mount of " << source;
        }
        else
        {
            rc = PHYSFS_mount(source.c_str(), mount->point.c_str(), 1);
            if (rc != 0)
                mounts[source] = SharedMount{mount->point, 1};
        }
        if (rc != 0)
        {
            mount->archive = source;
            mount->shared = true;
        }
    }

    if (rc == 0)
    {
        m_error = "failed to mount " + source + ": " + physfsError();
        PLOGW << "ArchiveFileSystem: " << m_error;
        // nothing to unmount
        mount->archive.clear();
        return;
    }
    m_mount = std::move(mount);
    PLOGI << "ArchiveFileSystem: mounted " << source << " at " << m_mount->point;
}

std::string ArchiveFileSystem::physPath(const std::string &path) const
{
    std::string clean = cleanPath("/" + path);
    if (clean == "/")
        return m_mount->point;
    return m_mount->point + clean;
}

OpenResult ArchiveFileSystem::open(const std::string &path)
{
    if (!m_mount)
        return OpenResult::failure(FileError::Io, m_error);

    std::string p = physPath(path);
    PHYSFS_Stat st;
    if (PHYSFS_stat(p.c_str(), &st) == 0)
        return OpenResult::failure(FileError::NotFound, "no such file: " + path);

    FileInfo info;
    info.modTime = st.modtime > 0 ? static_cast<std::time_t>(st.modtime) : 0;
    OpenResult res;
    if (st.filetype == PHYSFS_FILETYPE_DIRECTORY)
    {
        info.isDir = true;
        info.mode = 0555;
        res.ok = true;
        res.stream = std::make_shared<DirectoryStream>(info);
        return res;
    }
    if (!path.empty() && path.back() == '/')
        return OpenResult::failure(FileError::NotDirectory, "not a directory: " + path);

    info.mode = 0444;
    info.size = st.filesize > 0 ? static_cast<uint64_t>(st.filesize) : 0;
    PHYSFS_File *file = PHYSFS_openRead(p.c_str());
    if (!file)
        return OpenResult::failure(FileError::Io, "failed to open " + path + ": " + physfsError());

    res.ok = true;
    res.stream = std::make_shared<ArchiveStream>(file, info, m_mount);
    PLOGD << "ArchiveFileSystem: opened " << p;
    return res;
}

ListResult ArchiveFileSystem::list(const std::string &path)
{
    ListResult res;
    if (!m_mount)
    {
        res.code = FileError::Io;
        res.error = m_error;
        return res;
    }

    std::string p = physPath(path);
    PHYSFS_Stat st;
    if (PHYSFS_stat(p.c_str(), &st) == 0)
    {
        res.code = FileError::NotFound;
        res.error = "no such directory: " + path;
        return res;
    }
    if (st.filetype != PHYSFS_FILETYPE_DIRECTORY)
    {
        res.code = FileError::NotDirectory;
        res.error = "not a directory: " + path;
        return res;
    }

    char **rc = PHYSFS_enumerateFiles(p.c_str());
    if (!rc)
    {
        res.code = FileError::Io;
        res.error = physfsError();
        return res;
    }
    for (char **i = rc; *i != nullptr; i++)
    {
        DirEntry d;
        d.name = *i;
        std::string child = p + "/" + d.name;
        PHYSFS_Stat cst;
        d.isDir = PHYSFS_stat(child.c_str(), &cst) != 0 && cst.filetype == PHYSFS_FILETYPE_DIRECTORY;
        res.entries.push_back(std::move(d));
    }
    PHYSFS_freeList(rc);
    res.ok = true;
    return res;
}

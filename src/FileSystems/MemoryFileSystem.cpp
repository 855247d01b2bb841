#include "FileSystems/MemoryFileSystem.hpp"
#include "MountTable.hpp"
#include <plog/Log.h>

static std::string fileKey(const std::string &path)
{
    std::string p = cleanPath("/" + path);
    return p;
}

static std::string dirKey(const std::string &path)
{
    std::string p = cleanPath("/" + path);
    if (p != "/")
        p += '/';
    return p;
}

MemoryFileSystem::MemoryFileSystem(std::time_t modTime) : m_defaultTime(modTime)
{
    m_entries["/"] = Entry{nullptr, modTime, true};
}

void MemoryFileSystem::addParentsLocked(const std::string &path, std::time_t modTime)
{
    // path is a cleaned key; walk every ancestor directory
    for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1))
    {
        std::string dir = path.substr(0, pos + 1);
        if (m_entries.find(dir) == m_entries.end())
            m_entries[dir] = Entry{nullptr, modTime, true};
    }
}

void MemoryFileSystem::addFile(const std::string &path, const std::string &content, std::time_t modTime)
{
    addFile(path, std::vector<uint8_t>(content.begin(), content.end()), modTime);
}

void MemoryFileSystem::addFile(const std::string &path, std::vector<uint8_t> content, std::time_t modTime)
{
    if (!modTime)
        modTime = m_defaultTime;
    std::string key = fileKey(path);
    std::lock_guard<std::mutex> l(m_mutex);
    addParentsLocked(key, modTime);
    m_entries[key] = Entry{std::make_shared<const std::vector<uint8_t>>(std::move(content)), modTime, false};
}

void MemoryFileSystem::addDirectory(const std::string &path, std::time_t modTime)
{
    if (!modTime)
        modTime = m_defaultTime;
    std::string key = dirKey(path);
    std::lock_guard<std::mutex> l(m_mutex);
    addParentsLocked(key, modTime);
    m_entries[key] = Entry{nullptr, modTime, true};
}

bool MemoryFileSystem::find(const std::string &path, Entry &out) const
{
    bool wantDir = !path.empty() && path.back() == '/';
    std::string key = wantDir ? dirKey(path) : fileKey(path);
    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    out = it->second;
    return true;
}

FileInfo MemoryFileSystem::infoFor(const Entry &e)
{
    FileInfo info;
    info.modTime = e.modTime;
    info.isDir = e.isDir;
    info.mode = e.isDir ? 0555 : 0444;
    info.size = e.data ? e.data->size() : 0;
    return info;
}

StatResult MemoryFileSystem::stat(const std::string &path)
{
    StatResult res;
    Entry e;
    if (!find(path, e))
    {
        res.code = FileError::NotFound;
        res.error = "no such file: " + path;
        return res;
    }
    res.ok = true;
    res.info = infoFor(e);
    return res;
}

OpenResult MemoryFileSystem::open(const std::string &path)
{
    Entry e;
    if (!find(path, e))
        return OpenResult::failure(FileError::NotFound, "no such file: " + path);

    OpenResult res;
    res.ok = true;
    if (e.isDir)
        res.stream = std::make_shared<DirectoryStream>(infoFor(e));
    else
        res.stream = std::make_shared<MemoryStream>(e.data, infoFor(e));
    return res;
}

ListResult MemoryFileSystem::list(const std::string &path)
{
    ListResult res;
    std::string dir = dirKey(path);

    std::lock_guard<std::mutex> l(m_mutex);
    auto it = m_entries.find(dir);
    if (it == m_entries.end())
    {
        res.code = m_entries.count(fileKey(path)) ? FileError::NotDirectory : FileError::NotFound;
        res.error = std::string(fileErrorName(res.code)) + ": " + path;
        return res;
    }

    for (++it; it != m_entries.end() && it->first.compare(0, dir.size(), dir) == 0; ++it)
    {
        std::string rest = it->first.substr(dir.size());
        size_t slash = rest.find('/');
        // only immediate children: "name" or "name/"
        if (slash != std::string::npos && slash != rest.size() - 1)
            continue;
        DirEntry d;
        d.isDir = it->second.isDir;
        d.name = d.isDir ? rest.substr(0, rest.size() - 1) : rest;
        res.entries.push_back(std::move(d));
    }
    res.ok = true;
    PLOGD << "MemoryFileSystem: listed " << res.entries.size() << " entries in " << dir;
    return res;
}

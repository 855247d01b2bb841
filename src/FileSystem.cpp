#include "FileSystem.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

const char *fileErrorName(FileError e)
{
    switch (e)
    {
    case FileError::None: return "none";
    case FileError::NotFound: return "not found";
    case FileError::IsDirectory: return "is a directory";
    case FileError::NotDirectory: return "not a directory";
    case FileError::PermissionDenied: return "permission denied";
    case FileError::Io: return "i/o error";
    }
    return "unknown";
}

OpenResult OpenResult::failure(FileError code, std::string message)
{
    OpenResult r;
    r.code = code;
    r.error = std::move(message);
    return r;
}

StatResult FileSystem::stat(const std::string &path)
{
    OpenResult r = open(path);
    if (!r.ok)
    {
        StatResult res;
        res.code = r.code;
        res.error = std::move(r.error);
        return res;
    }
    StatResult res = r.stream->stat();
    r.stream->close();
    if (!res.ok && res.code == FileError::None)
        res.code = FileError::Io;
    return res;
}

MemoryStream::MemoryStream(std::shared_ptr<const std::vector<uint8_t>> data, FileInfo info)
    : m_data(std::move(data)), m_info(info)
{
    if (!m_data)
        m_data = std::make_shared<const std::vector<uint8_t>>();
    m_info.size = m_data->size();
}

ReadResult MemoryStream::read(char *buf, size_t len)
{
    ReadResult res;
    std::lock_guard<std::mutex> l(m_mutex);
    if (m_closed)
    {
        res.error = "read on closed stream";
        return res;
    }
    size_t avail = m_data->size() - m_offset;
    size_t n = std::min(avail, len);
    if (n)
        std::memcpy(buf, m_data->data() + m_offset, n);
    m_offset += n;
    res.ok = true;
    res.count = n;
    res.eof = m_offset == m_data->size();
    return res;
}

StatResult MemoryStream::stat()
{
    StatResult res;
    res.ok = true;
    res.info = m_info;
    return res;
}

void MemoryStream::close()
{
    std::lock_guard<std::mutex> l(m_mutex);
    m_closed = true;
}

DirectoryStream::DirectoryStream(FileInfo info) : m_info(info)
{
    m_info.isDir = true;
}

ReadResult DirectoryStream::read(char *, size_t)
{
    ReadResult res;
    res.error = "is a directory";
    return res;
}

StatResult DirectoryStream::stat()
{
    StatResult res;
    res.ok = true;
    res.info = m_info;
    return res;
}

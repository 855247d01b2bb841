#include "FileSystems/LocalFileSystem.hpp"
#include <chrono>
#include <fstream>
#include <iterator>
#include <plog/Log.h>
#include <system_error>

static std::time_t toTimeT(std::filesystem::file_time_type ft)
{
    using namespace std::chrono;
    auto sys = time_point_cast<system_clock::duration>(ft - std::filesystem::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(sys);
}

LocalFileSystem::LocalFileSystem(std::filesystem::path root)
{
    std::error_code ec;
    m_root = std::filesystem::absolute(root, ec);
    if (ec)
        m_root = std::move(root);
    m_open = std::filesystem::is_directory(m_root, ec);
    if (!m_open)
        PLOGW << "LocalFileSystem: not a directory: " << m_root.string();
}

bool LocalFileSystem::hostPath(const std::string &path, std::filesystem::path &out) const
{
    out = m_root;
    int depth = 0;
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
            if (--depth < 0)
                return false;
            out = out.parent_path();
            continue;
        }
        ++depth;
        out /= seg;
    }
    return true;
}

StatResult LocalFileSystem::stat(const std::string &path)
{
    StatResult res;
    std::filesystem::path p;
    if (!m_open || !hostPath(path, p))
    {
        res.code = FileError::NotFound;
        res.error = "no such file: " + path;
        return res;
    }

    std::error_code ec;
    auto st = std::filesystem::status(p, ec);
    if (ec || !std::filesystem::exists(st))
    {
        res.code = FileError::NotFound;
        res.error = "no such file: " + path;
        return res;
    }

    FileInfo &info = res.info;
    info.mode = static_cast<uint32_t>(st.permissions()) & 0777;
    info.isDir = std::filesystem::is_directory(st);
    auto mtime = std::filesystem::last_write_time(p, ec);
    if (!ec)
        info.modTime = toTimeT(mtime);

    if (!info.isDir)
    {
        if (!path.empty() && path.back() == '/')
        {
            res.code = FileError::NotDirectory;
            res.error = "not a directory: " + path;
            return res;
        }
        auto size = std::filesystem::file_size(p, ec);
        if (ec)
        {
            res.code = FileError::Io;
            res.error = "cannot stat " + p.string() + ": " + ec.message();
            return res;
        }
        info.size = static_cast<uint64_t>(size);
    }
    res.ok = true;
    return res;
}

OpenResult LocalFileSystem::open(const std::string &path)
{
    StatResult st = stat(path);
    if (!st.ok)
        return OpenResult::failure(st.code, st.error);

    OpenResult res;
    if (st.info.isDir)
    {
        res.ok = true;
        res.stream = std::make_shared<DirectoryStream>(st.info);
        return res;
    }

    std::filesystem::path p;
    if (!hostPath(path, p))
        return OpenResult::failure(FileError::NotFound, "no such file: " + path);
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs)
        return OpenResult::failure(FileError::PermissionDenied, "cannot read " + p.string());
    auto data = std::make_shared<std::vector<uint8_t>>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        return OpenResult::failure(FileError::Io, "read failed: " + p.string());

    res.ok = true;
    res.stream = std::make_shared<MemoryStream>(std::move(data), st.info);
    PLOGD << "LocalFileSystem: opened " << p.string();
    return res;
}

ListResult LocalFileSystem::list(const std::string &path)
{
    ListResult res;
    std::filesystem::path p;
    if (!m_open || !hostPath(path, p))
    {
        res.code = FileError::NotFound;
        res.error = "no such directory: " + path;
        return res;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(p, ec))
    {
        res.code = std::filesystem::exists(p, ec) ? FileError::NotDirectory : FileError::NotFound;
        res.error = std::string(fileErrorName(res.code)) + ": " + path;
        return res;
    }

    for (std::filesystem::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec))
    {
        DirEntry d;
        d.name = it->path().filename().string();
        std::error_code dec;
        d.isDir = it->is_directory(dec);
        res.entries.push_back(std::move(d));
    }
    if (ec)
    {
        res.entries.clear();
        res.code = FileError::Io;
        res.error = ec.message();
        return res;
    }
    res.ok = true;
    return res;
}

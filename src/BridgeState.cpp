#include "BridgeState.hpp"
#include <plog/Log.h>

BridgeState &BridgeState::get()
{
    static BridgeState instance;
    return instance;
}

BridgeResult BridgeState::mount(const std::string &point, std::shared_ptr<FileSystem> fs)
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_mounts.mount(point, std::move(fs));
}

BridgeResult BridgeState::unmount(const std::string &point)
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_mounts.unmount(point);
}

std::optional<ResolvedPath> BridgeState::resolve(const std::string &path) const
{
    std::optional<MountEntry> entry;
    {
        // "/data" also names the root of the mount "/data/"
        std::string query = path;
        if (!query.empty() && query.back() != '/')
            query += '/';
        std::lock_guard<std::mutex> l(m_mutex);
        entry = m_mounts.resolve(query);
    }
    if (!entry)
        return std::nullopt;

    ResolvedPath out;
    out.point = entry->point;
    out.fs = std::move(entry->fs);
    if (path.size() >= out.point.size())
        out.relative = path.substr(out.point.size() - 1);
    else
        out.relative = "/";
    return out;
}

std::vector<std::string> BridgeState::mountPoints() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_mounts.points();
}

Handle BridgeState::storeObject(std::shared_ptr<HostObject> object)
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_handles.store(std::move(object));
}

std::shared_ptr<HostObject> BridgeState::loadObject(Handle handle) const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_handles.load(handle);
}

void BridgeState::releaseObject(Handle handle)
{
    std::shared_ptr<HostObject> object;
    {
        std::lock_guard<std::mutex> l(m_mutex);
        object = m_handles.release(handle);
    }
    if (!object)
    {
        PLOGD << "BridgeState: handle " << handle << " already released";
        return;
    }
    object->release();
}

size_t BridgeState::liveHandles() const
{
    std::lock_guard<std::mutex> l(m_mutex);
    return m_handles.size();
}

// BridgeState.hpp - process-wide mount table and handle registry
#pragma once
#include "BridgeError.hpp"
#include "HandleRegistry.hpp"
#include "MountTable.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A path resolved against the mount table. relative always starts with '/'.
struct ResolvedPath
{
    std::string point;
    std::string relative;
    std::shared_ptr<FileSystem> fs;
};

// Shared by every interpreter in the process. One mutex guards both tables and
// is held only for the table operation itself, never across provider I/O or a
// release hook.
class BridgeState
{
public:
    static BridgeState &get();

    BridgeResult mount(const std::string &point, std::shared_ptr<FileSystem> fs);
    BridgeResult unmount(const std::string &point);
    std::optional<ResolvedPath> resolve(const std::string &path) const;
    std::vector<std::string> mountPoints() const;

    Handle storeObject(std::shared_ptr<HostObject> object);
    std::shared_ptr<HostObject> loadObject(Handle handle) const;

    // Typed recovery; nullptr when the handle is stale or holds another type.
    template <typename T>
    std::shared_ptr<T> loadAs(Handle handle) const
    {
        return std::dynamic_pointer_cast<T>(loadObject(handle));
    }

    // Idempotent. The object's release hook runs after the lock is dropped.
    void releaseObject(Handle handle);

    size_t liveHandles() const;

private:
    BridgeState() = default;
    BridgeState(const BridgeState &) = delete;
    BridgeState &operator=(const BridgeState &) = delete;

    mutable std::mutex m_mutex;
    HandleRegistry m_handles;
    MountTable m_mounts;
};

// HandleRegistry.hpp - opaque tokens for host objects handed to Tcl as ClientData
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

using Handle = std::uintptr_t;
constexpr Handle kInvalidHandle = 0;

// Base for anything the registry can hold. release() runs once when the
// registry drops its entry (stream close, command deletion callback, ...).
class HostObject
{
public:
    virtual ~HostObject() = default;
    virtual void release() {}
};

// Arena of slots addressed by (index, generation). A released slot bumps its
// generation before it is reused, so a stale handle never finds the new
// occupant. Not synchronized; BridgeState holds the lock.
class HandleRegistry
{
public:
    // Token layout: low bits index + 1, high bits generation. 32/32 on 64-bit
    // targets, 24/8 on 32-bit ones.
    static constexpr unsigned kIndexBits = sizeof(Handle) >= 8 ? 32 : 24;
    static constexpr size_t kMaxSlots = (size_t(1) << kIndexBits) - 1;

    explicit HandleRegistry(size_t maxSlots = kMaxSlots);

    // kInvalidHandle when every slot is live and no more can be addressed
    Handle store(std::shared_ptr<HostObject> object);

    // nullptr when the handle is unknown or already released
    std::shared_ptr<HostObject> load(Handle handle) const;

    // Removes the entry and hands the object back so the caller can run its
    // release hook outside any lock. Releasing twice returns nullptr.
    std::shared_ptr<HostObject> release(Handle handle);

    size_t size() const { return m_live; }

    // Tcl ClientData round trip. The pointer value is never dereferenced.
    static void *toClientData(Handle handle) { return reinterpret_cast<void *>(handle); }
    static Handle fromClientData(void *clientData) { return reinterpret_cast<Handle>(clientData); }

private:
    struct Slot
    {
        std::shared_ptr<HostObject> object;
        uint32_t generation = 1;
    };

    bool decode(Handle handle, size_t &index, uint32_t &generation) const;

    std::vector<Slot> m_slots;
    std::vector<size_t> m_free;
    size_t m_live = 0;
    size_t m_maxSlots;
};

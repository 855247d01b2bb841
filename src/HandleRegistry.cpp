#include "HandleRegistry.hpp"
#include <limits>

static constexpr unsigned kIndexBits = HandleRegistry::kIndexBits;
static constexpr Handle kIndexMask = (Handle(1) << kIndexBits) - 1;
static constexpr Handle kMaxGeneration = std::numeric_limits<Handle>::max() >> kIndexBits;

static Handle encode(size_t index, uint32_t generation)
{
    return (static_cast<Handle>(generation) << kIndexBits) | static_cast<Handle>(index + 1);
}

HandleRegistry::HandleRegistry(size_t maxSlots) : m_maxSlots(maxSlots < kMaxSlots ? maxSlots : kMaxSlots)
{
}

bool HandleRegistry::decode(Handle handle, size_t &index, uint32_t &generation) const
{
    Handle low = handle & kIndexMask;
    if (low == 0)
        return false;
    index = static_cast<size_t>(low - 1);
    generation = static_cast<uint32_t>(handle >> kIndexBits);
    return index < m_slots.size();
}

Handle HandleRegistry::store(std::shared_ptr<HostObject> object)
{
    size_t index;
    if (!m_free.empty())
    {
        index = m_free.back();
        m_free.pop_back();
    }
    else
    {
        if (m_slots.size() >= m_maxSlots)
            return kInvalidHandle;
        index = m_slots.size();
        m_slots.emplace_back();
    }
    Slot &slot = m_slots[index];
    slot.object = std::move(object);
    ++m_live;
    return encode(index, slot.generation);
}

std::shared_ptr<HostObject> HandleRegistry::load(Handle handle) const
{
    size_t index = 0;
    uint32_t generation = 0;
    if (!decode(handle, index, generation))
        return nullptr;
    const Slot &slot = m_slots[index];
    if (!slot.object || slot.generation != generation)
        return nullptr;
    return slot.object;
}

std::shared_ptr<HostObject> HandleRegistry::release(Handle handle)
{
    size_t index = 0;
    uint32_t generation = 0;
    if (!decode(handle, index, generation))
        return nullptr;
    Slot &slot = m_slots[index];
    if (!slot.object || slot.generation != generation)
        return nullptr;

    std::shared_ptr<HostObject> out = std::move(slot.object);
    slot.object.reset();
    slot.generation = slot.generation == kMaxGeneration ? 1 : slot.generation + 1;
    m_free.push_back(index);
    --m_live;
    return out;
}

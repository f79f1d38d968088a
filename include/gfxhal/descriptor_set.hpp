#pragma once

#include <gfxhal/descriptor.hpp>
#include <gfxhal/device_object.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/result.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace gfxhal {

class DescriptorSet;

namespace detail {

struct PoolState;

// Host-side mirror of one descriptor set. The write version increments on
// every write or copy; command buffers snapshot it when they finish.
struct SetState {
    SetLayoutRef                                layout;
    std::vector<std::vector<Descriptor>>        descriptors; // [binding index][element]
    std::shared_ptr<std::atomic<std::uint64_t>> version =
        std::make_shared<std::atomic<std::uint64_t>>(0);
    HeapRuns     runs;
    Handle       handle;
    NativeHandle native = NullHandle;
};

} // namespace detail

// Per-kind descriptor capacity plus a set count. Sets return their capacity
// and heap runs to the pool when destroyed or when the pool is reset.
//
// Thread safety: thread-confined. Use one pool per recording thread.
class DescriptorPool : public DeviceObject {
public:
    DescriptorPool() = default;
    ~DescriptorPool();
    DescriptorPool(DescriptorPool&&) noexcept = default;
    DescriptorPool& operator=(DescriptorPool&&) noexcept;

    // TooManyObjects when maxSets sets are live; OutOfHostMemory when a kind's
    // capacity or the device's shader-visible heap cannot hold the set.
    [[nodiscard]] Result<DescriptorSet> allocate(const SetLayoutRef& layout);
    [[nodiscard]] Result<std::vector<DescriptorSet>> allocate(
        const std::vector<SetLayoutRef>& layouts);

    // Invalidates every set allocated from this pool.
    [[nodiscard]] Result<void> reset();

    [[nodiscard]] std::uint32_t maxSets()  const;
    [[nodiscard]] std::uint32_t liveSets() const;

private:
    friend class Device;

    // Drops every live set and marks the pool dead; the native pool itself
    // is retired by DeviceObject.
    void release();

    std::shared_ptr<detail::PoolState> state_;
};

// Thread safety: may be read by many in-flight command buffers; writes must
// be serialized by the caller and must not overlap a pending submission that
// binds the set.
class DescriptorSet {
public:
    DescriptorSet() = default;
    ~DescriptorSet();
    DescriptorSet(DescriptorSet&&) noexcept;
    DescriptorSet& operator=(DescriptorSet&&) noexcept;
    DescriptorSet(const DescriptorSet&) = delete;
    DescriptorSet& operator=(const DescriptorSet&) = delete;

    // Returns the set to its pool.
    void destroy();

    [[nodiscard]] bool                valid()   const { return state_ != nullptr; }
    [[nodiscard]] Handle              handle()  const;
    [[nodiscard]] NativeHandle        native()  const;
    [[nodiscard]] const SetLayoutRef& layout()  const;
    [[nodiscard]] std::uint64_t       version() const;
    [[nodiscard]] const HeapRuns&     heapRuns() const;

    // Last written value of one element (monostate when never written).
    [[nodiscard]] const Descriptor& descriptor(std::uint32_t binding,
                                               std::uint32_t element = 0) const;

private:
    friend class DescriptorPool;
    friend class Device;
    friend class CommandBuffer;

    std::shared_ptr<detail::PoolState> pool_;
    std::shared_ptr<detail::SetState>  state_;
};

// Writes descriptors[i] to element arrayElement + i of binding, rolling over
// into the next binding number once an array is full. Every binding rolled
// into must have the same kind and stages.
struct DescriptorWrite {
    DescriptorSet*          set          = nullptr;
    std::uint32_t           binding      = 0;
    std::uint32_t           arrayElement = 0;
    std::vector<Descriptor> descriptors;
};

struct DescriptorCopy {
    const DescriptorSet* src          = nullptr;
    std::uint32_t        srcBinding   = 0;
    std::uint32_t        srcElement   = 0;
    DescriptorSet*       dst          = nullptr;
    std::uint32_t        dstBinding   = 0;
    std::uint32_t        dstElement   = 0;
    std::uint32_t        count        = 1;
};

} // namespace gfxhal

#pragma once

#include <gfxhal/descriptor_set.hpp>
#include <gfxhal/device.hpp>
#include <gfxhal/garbage.hpp>
#include <gfxhal/handle.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/range_allocator.hpp>
#include <gfxhal/register_allocator.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gfxhal::detail {

struct InstanceState {
    std::shared_ptr<NativeInstance> native;
    std::string                     appName;
    Validation                      validation = DefaultValidation;
    std::vector<AdapterInfo>        adapters;
};

struct ArenaEntry {
    ObjectKind   kind   = ObjectKind::Buffer;
    NativeHandle native = NullHandle;
};

struct PoolState {
    std::shared_ptr<DeviceCore>             core;
    NativeHandle                            native  = NullHandle;
    std::uint32_t                           maxSets = 0;
    std::map<DescriptorKind, std::uint32_t> capacity;
    std::map<DescriptorKind, std::uint32_t> used;
    std::vector<std::shared_ptr<SetState>>  live;
    bool                                    alive = true;
};

// Everything a device's objects share. Owned jointly by the Device and by
// every object created from it, so it outlives all of them; its destructor
// drains the queues and frees whatever the collector still holds.
//
// Thread safety: internally synchronized.
class DeviceCore {
public:
    DeviceCore(std::shared_ptr<InstanceState> instance, std::unique_ptr<NativeDevice> native,
               RegisterAllocator allocator, Validation validation,
               std::vector<std::uint32_t> queueFamilies);
    ~DeviceCore();

    DeviceCore(const DeviceCore&) = delete;
    DeviceCore& operator=(const DeviceCore&) = delete;

    [[nodiscard]] NativeDevice&            native()     const { return *native_; }
    [[nodiscard]] const AdapterInfo&       adapter()    const { return native_->adapter(); }
    [[nodiscard]] const RegisterAllocator& allocator()  const { return allocator_; }
    [[nodiscard]] Validation               validation() const { return validation_; }
    [[nodiscard]] const std::string&       appName()    const { return instance_->appName; }

    [[nodiscard]] std::uint32_t queueCount() const {
        return static_cast<std::uint32_t>(queueFamilies_.size());
    }
    [[nodiscard]] std::uint32_t queueFamily(std::uint32_t queue) const {
        return queueFamilies_[queue];
    }

    // Device loss. Sticky once observed.
    [[nodiscard]] bool  lost() const { return lost_.load(std::memory_order_acquire); }
    [[nodiscard]] Error lostError(const char* operation) const;
    [[nodiscard]] Result<void> checkLost(const char* operation) const;
    void observe(const Error& error);

    template <typename T>
    [[nodiscard]] Result<T> observed(Result<T> result) {
        if (!result.ok()) observe(result.error());
        return result;
    }

    // Usage errors. FailFast throws; Report logs and hands the error back.
    [[nodiscard]] Error report(Error error) const;

    // Arena of live native objects.
    [[nodiscard]] Handle track(ObjectKind kind, NativeHandle native);
    [[nodiscard]] bool   live(Handle handle) const;
    [[nodiscard]] std::optional<ArenaEntry> lookup(Handle handle) const;

    // Removes the handle and hands its native object to the collector.
    void retire(Handle handle);
    // Drops the handle without touching the native object (the pool that
    // owns it frees it).
    void untrack(Handle handle);

    // Shader-visible heap runs for the heap/table model.
    [[nodiscard]] Result<HeapRuns> allocateHeapRuns(std::uint32_t resources,
                                                    std::uint32_t samplers);
    void freeHeapRuns(const HeapRuns& runs);

    // Submission bookkeeping.
    [[nodiscard]] std::mutex&   submitMutex() { return submitMutex_; }
    [[nodiscard]] std::uint64_t submittedSerial(std::uint32_t queue) const;
    void                        setSubmittedSerial(std::uint32_t queue, std::uint64_t serial);
    [[nodiscard]] std::uint64_t completedSerial(std::uint32_t queue) const;

    void collect();
    [[nodiscard]] std::size_t pendingGarbage() const { return garbage_.pending(); }

private:
    void destroyNative(ObjectKind kind, NativeHandle handle);
    [[nodiscard]] std::vector<std::uint64_t> submittedSnapshot() const;
    [[nodiscard]] std::vector<std::uint64_t> completedSnapshot() const;

    std::shared_ptr<InstanceState> instance_;
    std::unique_ptr<NativeDevice>  native_;
    RegisterAllocator              allocator_;
    Validation                     validation_;
    std::vector<std::uint32_t>     queueFamilies_;

    std::atomic<bool> lost_{false};

    mutable std::mutex  arenaMutex_;
    Arena<ArenaEntry>   arena_;

    std::mutex                    heapMutex_;
    RangeAllocator<std::uint32_t> resourceHeap_;
    RangeAllocator<std::uint32_t> samplerHeap_;

    std::mutex                                    submitMutex_;
    std::unique_ptr<std::atomic<std::uint64_t>[]> submitted_;

    GarbageCollector garbage_;
};

} // namespace gfxhal::detail

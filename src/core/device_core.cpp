#include "device_core.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace gfxhal::detail {

DeviceCore::DeviceCore(std::shared_ptr<InstanceState> instance,
                       std::unique_ptr<NativeDevice> native, RegisterAllocator allocator,
                       Validation validation, std::vector<std::uint32_t> queueFamilies)
    : instance_(std::move(instance)),
      native_(std::move(native)),
      allocator_(std::move(allocator)),
      validation_(validation),
      queueFamilies_(std::move(queueFamilies)),
      resourceHeap_(Range<std::uint32_t>{0, native_->adapter().limits.resourceHeapSize}),
      samplerHeap_(Range<std::uint32_t>{0, native_->adapter().limits.samplerHeapSize}),
      submitted_(new std::atomic<std::uint64_t>[queueFamilies_.size()]),
      garbage_([this](ObjectKind kind, NativeHandle handle) { destroyNative(kind, handle); }) {
    for (std::size_t q = 0; q < queueFamilies_.size(); ++q) submitted_[q].store(0);
}

DeviceCore::~DeviceCore() {
    for (std::uint32_t q = 0; q < queueCount(); ++q) {
        auto idle = native_->waitQueueIdle(q);
        if (!idle.ok() && !idle.failedWith(ErrorCode::DeviceLost)) {
            std::fprintf(stderr, "[gfxhal] %s: queue %u did not drain at shutdown: %s\n",
                         appName().c_str(), q, idle.error().format().c_str());
        }
    }

    std::size_t freed = garbage_.drain();

    std::size_t leaked = 0;
    arena_.forEach([&](Handle, const ArenaEntry&) { ++leaked; });
    if (leaked > 0) {
        std::fprintf(stderr, "[gfxhal] %s: %zu objects still tracked at device shutdown\n",
                     appName().c_str(), leaked);
    }
    if (freed > 0 && validation_ == Validation::FailFast) {
        std::fprintf(stderr, "[gfxhal] %s: freed %zu retired objects at shutdown\n",
                     appName().c_str(), freed);
    }
}

Error DeviceCore::lostError(const char* operation) const {
    return Error{operation, ErrorCode::DeviceLost, 0,
                 "the device was lost earlier; destroy it and create a new one"};
}

Result<void> DeviceCore::checkLost(const char* operation) const {
    if (lost()) return lostError(operation);
    return {};
}

void DeviceCore::observe(const Error& error) {
    if (error.code != ErrorCode::DeviceLost) return;
    bool expected = false;
    if (lost_.compare_exchange_strong(expected, true)) {
        std::fprintf(stderr, "[gfxhal] %s: device lost during %s\n", appName().c_str(),
                     error.operation.c_str());
    }
}

Error DeviceCore::report(Error error) const {
    if (validation_ == Validation::FailFast) throwError(error);
    std::fprintf(stderr, "[gfxhal] %s: %s\n", appName().c_str(), error.format().c_str());
    return error;
}

Handle DeviceCore::track(ObjectKind kind, NativeHandle native) {
    std::lock_guard lock(arenaMutex_);
    return arena_.insert(ArenaEntry{kind, native});
}

bool DeviceCore::live(Handle handle) const {
    std::lock_guard lock(arenaMutex_);
    return arena_.contains(handle);
}

std::optional<ArenaEntry> DeviceCore::lookup(Handle handle) const {
    std::lock_guard lock(arenaMutex_);
    const ArenaEntry* entry = arena_.get(handle);
    if (!entry) return std::nullopt;
    return *entry;
}

void DeviceCore::retire(Handle handle) {
    std::lock_guard submit(submitMutex_);
    std::optional<ArenaEntry> entry;
    {
        std::lock_guard lock(arenaMutex_);
        entry = arena_.remove(handle);
    }
    if (!entry) return;
    garbage_.retire(entry->kind, entry->native, submittedSnapshot());
}

void DeviceCore::untrack(Handle handle) {
    std::lock_guard lock(arenaMutex_);
    (void)arena_.remove(handle);
}

Result<HeapRuns> DeviceCore::allocateHeapRuns(std::uint32_t resources, std::uint32_t samplers) {
    std::lock_guard lock(heapMutex_);
    HeapRuns runs;
    if (resources > 0) {
        auto run = resourceHeap_.allocate(resources);
        if (!run) {
            return Error{"allocate descriptor set", ErrorCode::OutOfHostMemory, 0,
                         "shader-visible resource heap has no free run of " +
                             std::to_string(resources) + " descriptors"};
        }
        runs.resources = *run;
    }
    if (samplers > 0) {
        auto run = samplerHeap_.allocate(samplers);
        if (!run) {
            if (resources > 0) (void)resourceHeap_.free(runs.resources);
            return Error{"allocate descriptor set", ErrorCode::OutOfHostMemory, 0,
                         "shader-visible sampler heap has no free run of " +
                             std::to_string(samplers) + " descriptors"};
        }
        runs.samplers = *run;
    }
    return runs;
}

void DeviceCore::freeHeapRuns(const HeapRuns& runs) {
    std::lock_guard lock(heapMutex_);
    if (runs.resources.length() > 0 && !resourceHeap_.free(runs.resources)) {
        std::fprintf(stderr, "[gfxhal] %s: resource heap run [%u, %u) freed twice\n",
                     appName().c_str(), runs.resources.start, runs.resources.end);
    }
    if (runs.samplers.length() > 0 && !samplerHeap_.free(runs.samplers)) {
        std::fprintf(stderr, "[gfxhal] %s: sampler heap run [%u, %u) freed twice\n",
                     appName().c_str(), runs.samplers.start, runs.samplers.end);
    }
}

std::uint64_t DeviceCore::submittedSerial(std::uint32_t queue) const {
    return submitted_[queue].load(std::memory_order_acquire);
}

void DeviceCore::setSubmittedSerial(std::uint32_t queue, std::uint64_t serial) {
    submitted_[queue].store(serial, std::memory_order_release);
}

std::uint64_t DeviceCore::completedSerial(std::uint32_t queue) const {
    return native_->completedSerial(queue);
}

void DeviceCore::collect() {
    (void)garbage_.collect(completedSnapshot());
}

void DeviceCore::destroyNative(ObjectKind kind, NativeHandle handle) {
    native_->destroy(kind, handle);
}

std::vector<std::uint64_t> DeviceCore::submittedSnapshot() const {
    std::vector<std::uint64_t> out(queueFamilies_.size());
    for (std::size_t q = 0; q < out.size(); ++q) out[q] = submitted_[q].load();
    return out;
}

std::vector<std::uint64_t> DeviceCore::completedSnapshot() const {
    std::vector<std::uint64_t> out(queueFamilies_.size());
    for (std::uint32_t q = 0; q < out.size(); ++q) out[q] = native_->completedSerial(q);
    return out;
}

} // namespace gfxhal::detail

#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace gfxhal {

class CommandBuffer;
class Fence;
class Semaphore;

namespace detail {
class DeviceCore;
} // namespace detail

struct SemaphoreWait {
    const Semaphore* semaphore = nullptr;
    PipelineStage    stages    = PipelineStage::AllCommands;
};

struct SubmitInfo {
    std::vector<CommandBuffer*>    commandBuffers;
    std::vector<SemaphoreWait>     waits;
    std::vector<const Semaphore*>  signals;
    Fence*                         fence = nullptr;
};

// Ordered submission channel. Submissions on one queue complete in order;
// ordering across queues only comes from semaphores.
//
// Thread safety: internally synchronized.
class Queue {
public:
    Queue() = default;

    [[nodiscard]] bool          valid()  const { return core_ != nullptr; }
    [[nodiscard]] std::uint32_t index()  const { return index_; }
    [[nodiscard]] std::uint32_t family() const { return family_; }

    // Validates every buffer (Executable, unpoisoned, primary, no stale
    // handles, no descriptor set written since finish), the fence (unsignaled
    // and not already submitted) and the binary semaphores before handing the
    // work to the native queue. Collects garbage afterwards.
    [[nodiscard]] Result<void> submit(const SubmitInfo& info);

    // OutOfDate / SurfaceLost come back from the native presentation engine.
    [[nodiscard]] Result<void> present(const PresentTarget& target,
                                       const std::vector<const Semaphore*>& waits = {});

    // Blocks until the queue is idle, then collects garbage.
    [[nodiscard]] Result<void> waitIdle();

    // Last serial submitted to / completed by this queue.
    [[nodiscard]] std::uint64_t submittedSerial() const;
    [[nodiscard]] std::uint64_t completedSerial() const;

private:
    friend class Device;

    std::shared_ptr<detail::DeviceCore> core_;
    std::uint32_t                       index_  = 0;
    std::uint32_t                       family_ = 0;
};

} // namespace gfxhal

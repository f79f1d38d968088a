#include "recorder.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace gfxhal::vulkan::detail {

// Streams are recorded into native command buffers here, at submit. The
// batch is recycled once the queue's timeline reaches its serial.
Result<void> VulkanDevice::submit(std::uint32_t queue, NativeSubmission submission) {
    constexpr const char* op = "queue submit";
    if (auto r = alive(op); !r.ok()) return r;
    if (queue >= queues_.size()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }
    QueueState& q = *queues_[queue];

    {
        std::lock_guard lock(q.mutex);
        recycle(q, completedSerial(queue));

        InFlight batch;
        batch.serial = submission.serial;

        std::vector<VkCommandBufferSubmitInfo> commandBuffers;
        commandBuffers.reserve(submission.commandBuffers.size());
        StreamRecorder recorder(*this, q, batch);
        for (const auto& stream : submission.commandBuffers) {
            auto cmd = recorder.recordPrimary(*stream);
            if (!cmd.ok()) {
                releaseBatch(q, batch);
                return std::move(cmd.error());
            }
            VkCommandBufferSubmitInfo info{};
            info.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
            info.commandBuffer = cmd.value();
            commandBuffers.push_back(info);
        }

        std::vector<VkSemaphoreSubmitInfo> waits;
        waits.reserve(submission.waits.size());
        for (const auto& w : submission.waits) {
            VkSemaphoreSubmitInfo info{};
            info.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
            info.semaphore = fromNative<VkSemaphore>(w.semaphore);
            info.stageMask = toVk(w.stages);
            waits.push_back(info);
        }

        std::vector<VkSemaphoreSubmitInfo> signals;
        signals.reserve(submission.signals.size() + 1);
        for (NativeHandle s : submission.signals) {
            VkSemaphoreSubmitInfo info{};
            info.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
            info.semaphore = fromNative<VkSemaphore>(s);
            info.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            signals.push_back(info);
        }
        VkSemaphoreSubmitInfo timeline{};
        timeline.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
        timeline.semaphore = q.timeline;
        timeline.value     = submission.serial;
        timeline.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
        signals.push_back(timeline);

        VkSubmitInfo2 si{};
        si.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
        si.waitSemaphoreInfoCount   = static_cast<std::uint32_t>(waits.size());
        si.pWaitSemaphoreInfos      = waits.data();
        si.commandBufferInfoCount   = static_cast<std::uint32_t>(commandBuffers.size());
        si.pCommandBufferInfos      = commandBuffers.data();
        si.signalSemaphoreInfoCount = static_cast<std::uint32_t>(signals.size());
        si.pSignalSemaphoreInfos    = signals.data();

        VkResult vr = vkQueueSubmit2(q.queue, 1, &si, fromNative<VkFence>(submission.fence));
        if (vr != VK_SUCCESS) {
            releaseBatch(q, batch);
            return fail(op, vr, "vkQueueSubmit2 failed");
        }

        q.submitted.store(submission.serial, std::memory_order_release);
        q.inFlight.push_back(std::move(batch));
    }

    collectRetired(false);
    return {};
}

// After a device loss nothing more will execute, so everything submitted
// counts as finished.
std::uint64_t VulkanDevice::completedSerial(std::uint32_t queue) {
    if (queue >= queues_.size()) return 0;
    QueueState& q = *queues_[queue];
    if (lost_.load(std::memory_order_acquire)) return q.submitted.load(std::memory_order_acquire);

    std::uint64_t value = 0;
    VkResult vr = vkGetSemaphoreCounterValue(device_, q.timeline, &value);
    if (vr != VK_SUCCESS) {
        (void)fail("query completed serial", vr, "vkGetSemaphoreCounterValue failed");
        return lost_.load(std::memory_order_acquire) ? q.submitted.load(std::memory_order_acquire)
                                                     : 0;
    }
    return value;
}

Result<void> VulkanDevice::waitQueueIdle(std::uint32_t queue) {
    constexpr const char* op = "queue wait idle";
    if (auto r = alive(op); !r.ok()) return r;
    if (queue >= queues_.size()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }
    QueueState& q = *queues_[queue];
    {
        std::lock_guard lock(q.mutex);
        VkResult vr = vkQueueWaitIdle(q.queue);
        if (vr != VK_SUCCESS) return fail(op, vr, "vkQueueWaitIdle failed");
        recycle(q, completedSerial(queue));
    }
    collectRetired(false);
    return {};
}

// SUBOPTIMAL still presented the image; the caller sees success.
Result<void> VulkanDevice::present(std::uint32_t queue, const PresentTarget& target,
                                   const std::vector<NativeHandle>& waits) {
    constexpr const char* op = "present";
    if (auto r = alive(op); !r.ok()) return r;
    if (queue >= queues_.size()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }
    if (!swapchain_) {
        return Error{op, ErrorCode::UnsupportedUsage, 0,
                     "the device was created without VK_KHR_swapchain"};
    }

    std::vector<VkSemaphore> semaphores;
    semaphores.reserve(waits.size());
    for (NativeHandle w : waits) semaphores.push_back(fromNative<VkSemaphore>(w));

    VkSwapchainKHR swapchain = fromNative<VkSwapchainKHR>(target.surface);

    VkPresentInfoKHR pi{};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = static_cast<std::uint32_t>(semaphores.size());
    pi.pWaitSemaphores    = semaphores.data();
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &swapchain;
    pi.pImageIndices      = &target.imageIndex;

    QueueState& q = *queues_[queue];
    std::lock_guard lock(q.mutex);
    VkResult vr = vkQueuePresentKHR(q.queue, &pi);
    if (vr == VK_SUCCESS || vr == VK_SUBOPTIMAL_KHR) return {};
    return fail(op, vr, "vkQueuePresentKHR failed");
}

void VulkanDevice::recycle(QueueState& queue, std::uint64_t completed) {
    while (!queue.inFlight.empty() && queue.inFlight.front().serial <= completed) {
        releaseBatch(queue, queue.inFlight.front());
        queue.inFlight.pop_front();
    }
}

// Split-barrier events are reset by the command buffer that waited on them.
void VulkanDevice::releaseBatch(QueueState& queue, InFlight& batch) {
    if (!batch.commandBuffers.empty()) {
        vkFreeCommandBuffers(device_, queue.pool,
                             static_cast<std::uint32_t>(batch.commandBuffers.size()),
                             batch.commandBuffers.data());
        batch.commandBuffers.clear();
    }
    if (!batch.events.empty()) {
        std::lock_guard lock(eventMutex_);
        freeEvents_.insert(freeEvents_.end(), batch.events.begin(), batch.events.end());
        batch.events.clear();
    }
}

} // namespace gfxhal::vulkan::detail

#pragma once

#include "device.hpp"

#include <gfxhal/barrier.hpp>
#include <gfxhal/commands.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <map>
#include <vector>

namespace gfxhal::vulkan::detail {

// A BarrierSet resolved to native barriers. VkDependencyInfo points into
// the arrays, so the object is neither copied nor moved.
class DependencyInfo {
public:
    DependencyInfo(const VulkanDevice& device, const BarrierSet& barriers);
    DependencyInfo(const DependencyInfo&) = delete;
    DependencyInfo& operator=(const DependencyInfo&) = delete;

    [[nodiscard]] const VkDependencyInfo* get() const { return &info_; }
    [[nodiscard]] bool empty() const {
        return memory_.empty() && buffers_.empty() && images_.empty();
    }
    [[nodiscard]] VkPipelineStageFlags2 dstStages() const { return dstStages_; }

private:
    std::vector<VkMemoryBarrier2>       memory_;
    std::vector<VkBufferMemoryBarrier2> buffers_;
    std::vector<VkImageMemoryBarrier2>  images_;
    VkDependencyInfo                    info_{};
    VkPipelineStageFlags2               dstStages_ = 0;
};

// Records CommandStreams into command buffers from one queue's pool. The
// command buffers and split-barrier events it creates are added to batch.
//
// Thread safety: the caller holds the queue's lock.
class StreamRecorder {
public:
    StreamRecorder(VulkanDevice& device, QueueState& queue, InFlight& batch)
        : device_(device), queue_(queue), batch_(batch) {}

    [[nodiscard]] Result<VkCommandBuffer> recordPrimary(const CommandStream& stream);

private:
    // Render pass state a secondary inherits.
    struct PassState {
        VkRenderPass  renderPass  = VK_NULL_HANDLE;
        VkFramebuffer framebuffer = VK_NULL_HANDLE;
        std::uint32_t subpass     = 0;
    };

    [[nodiscard]] Result<VkCommandBuffer> allocate(VkCommandBufferLevel level);
    [[nodiscard]] Result<VkCommandBuffer> recordSecondary(const CommandStream& stream,
                                                          const PassState* pass);
    [[nodiscard]] Result<void> recordCommands(VkCommandBuffer cmd, const CommandStream& stream);

    VulkanDevice& device_;
    QueueState&   queue_;
    InFlight&     batch_;
};

} // namespace gfxhal::vulkan::detail

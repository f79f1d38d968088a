#include "recorder.hpp"

#include <cstdint>
#include <cstdio>

namespace gfxhal::vulkan::detail {

DependencyInfo::DependencyInfo(const VulkanDevice& device, const BarrierSet& barriers) {
    memory_.reserve(barriers.memory.size());
    for (const auto& m : barriers.memory) {
        VkMemoryBarrier2 b{};
        b.sType         = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        b.srcStageMask  = toVk(m.srcStages);
        b.srcAccessMask = toVk(m.srcAccess);
        b.dstStageMask  = toVk(m.dstStages);
        b.dstAccessMask = toVk(m.dstAccess);
        dstStages_ |= b.dstStageMask;
        memory_.push_back(b);
    }

    buffers_.reserve(barriers.buffers.size());
    for (const auto& bb : barriers.buffers) {
        auto record = device.buffer(bb.buffer.native);
        if (!record) continue;
        VkBufferMemoryBarrier2 b{};
        b.sType               = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2;
        b.srcStageMask        = toVk(bb.srcStages);
        b.srcAccessMask       = toVk(bb.srcAccess);
        b.dstStageMask        = toVk(bb.dstStages);
        b.dstAccessMask       = toVk(bb.dstAccess);
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.buffer              = record->buffer;
        b.offset              = bb.offset;
        b.size                = bb.size == WholeSize ? VK_WHOLE_SIZE : bb.size;
        dstStages_ |= b.dstStageMask;
        buffers_.push_back(b);
    }

    images_.reserve(barriers.images.size());
    for (const auto& ib : barriers.images) {
        auto record = device.image(ib.image.native);
        if (!record) continue;
#ifndef NDEBUG
        if (any(ib.srcStages & PipelineStage::AllCommands) ||
            any(ib.dstStages & PipelineStage::AllCommands)) {
            std::fprintf(stderr,
                         "[gfxhal perf] image barrier uses ALL_COMMANDS "
                         "-- this creates a full pipeline bubble.\n");
        }
#endif
        VkImageMemoryBarrier2 b{};
        b.sType               = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
        b.srcStageMask        = toVk(ib.srcStages);
        b.srcAccessMask       = toVk(ib.srcAccess);
        b.dstStageMask        = toVk(ib.dstStages);
        b.dstAccessMask       = toVk(ib.dstAccess);
        b.oldLayout           = toVk(ib.oldLayout);
        b.newLayout           = toVk(ib.newLayout);
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.image               = record->image;
        b.subresourceRange    = {record->aspects, ib.range.baseMip, ib.range.mipCount,
                                 ib.range.baseLayer, ib.range.layerCount};
        dstStages_ |= b.dstStageMask;
        images_.push_back(b);
    }

    info_.sType                    = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    info_.memoryBarrierCount       = static_cast<std::uint32_t>(memory_.size());
    info_.pMemoryBarriers          = memory_.data();
    info_.bufferMemoryBarrierCount = static_cast<std::uint32_t>(buffers_.size());
    info_.pBufferMemoryBarriers    = buffers_.data();
    info_.imageMemoryBarrierCount  = static_cast<std::uint32_t>(images_.size());
    info_.pImageMemoryBarriers     = images_.data();
}

} // namespace gfxhal::vulkan::detail

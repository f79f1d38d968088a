#pragma once

#include <gfxhal/resource_desc.hpp>
#include <gfxhal/types.hpp>

#include <vector>

namespace gfxhal {

struct MemoryBarrier {
    PipelineStage srcStages = PipelineStage::None;
    Access        srcAccess = Access::None;
    PipelineStage dstStages = PipelineStage::None;
    Access        dstAccess = Access::None;
};

struct BufferBarrier {
    ResourceRef   buffer;
    std::uint64_t offset    = 0;
    std::uint64_t size      = WholeSize;
    PipelineStage srcStages = PipelineStage::None;
    Access        srcAccess = Access::None;
    PipelineStage dstStages = PipelineStage::None;
    Access        dstAccess = Access::None;
};

struct ImageBarrier {
    ResourceRef           image;
    ImageLayout           oldLayout = ImageLayout::Undefined;
    ImageLayout           newLayout = ImageLayout::Undefined;
    PipelineStage         srcStages = PipelineStage::None;
    Access                srcAccess = Access::None;
    PipelineStage         dstStages = PipelineStage::None;
    Access                dstAccess = Access::None;
    ImageSubresourceRange range;
};

// Accumulated barriers flushed as one native call.
struct BarrierSet {
    std::vector<MemoryBarrier> memory;
    std::vector<BufferBarrier> buffers;
    std::vector<ImageBarrier>  images;

    [[nodiscard]] bool empty() const {
        return memory.empty() && buffers.empty() && images.empty();
    }
};

// Barrier between a layout's own stage/access and another layout's. Fills
// both halves from usageOf(); the caller narrows them if it knows better.
[[nodiscard]] ImageBarrier layoutTransition(ResourceRef image, ImageLayout from, ImageLayout to,
                                            ImageSubresourceRange range = {});

} // namespace gfxhal

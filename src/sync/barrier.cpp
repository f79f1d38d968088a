#include <gfxhal/barrier.hpp>

namespace gfxhal {

ImageBarrier layoutTransition(ResourceRef image, ImageLayout from, ImageLayout to,
                              ImageSubresourceRange range) {
    const LayoutUsage src = usageOf(from);
    const LayoutUsage dst = usageOf(to);

    ImageBarrier b;
    b.image     = image;
    b.oldLayout = from;
    b.newLayout = to;
    // Only prior writes need to be made available; prior reads need an
    // execution dependency alone.
    b.srcStages = src.stages;
    b.srcAccess = src.access & kWriteAccess;
    b.dstStages = dst.stages;
    b.dstAccess = dst.access;
    b.range     = range;
    return b;
}

} // namespace gfxhal

#include <gfxhal/pass_planner.hpp>

#include <cassert>
#include <cstdio>

using gfxhal::Access;
using gfxhal::BarrierTiming;
using gfxhal::ErrorCode;
using gfxhal::Format;
using gfxhal::ImageLayout;
using gfxhal::PipelineStage;

namespace {

// Attachment 0 is written in subpass 0 and read as an input in subpass 1,
// which writes attachment 1.
gfxhal::RenderPassDesc deferred() {
    gfxhal::RenderPassDesc desc;
    desc.attachments.resize(2);
    desc.attachments[0].format      = Format::R8G8B8A8Unorm;
    desc.attachments[0].finalLayout = ImageLayout::ShaderReadOnly;
    desc.attachments[1].format      = Format::B8G8R8A8Unorm;
    desc.attachments[1].finalLayout = ImageLayout::Present;

    gfxhal::SubpassDesc gbuffer;
    gbuffer.colors = {0};
    gfxhal::SubpassDesc lighting;
    lighting.inputs = {0};
    lighting.colors = {1};
    desc.subpasses = {gbuffer, lighting};
    return desc;
}

} // namespace

int main() {
    // Color target then input: one transition between the subpasses, none at exit
    {
        auto plan = gfxhal::planRenderPass(deferred());
        assert(plan.ok());
        const auto& p = plan.value();

        assert(p.interSubpassBarrierCount() == 1);
        assert(p.subpasses[0].after.empty());
        assert(p.subpasses[1].before.size() == 1);
        const auto& b = p.subpasses[1].before[0];
        assert(b.attachment == 0);
        assert(b.oldLayout == ImageLayout::ColorAttachment);
        assert(b.newLayout == ImageLayout::ShaderReadOnly);
        assert(b.srcStages == PipelineStage::ColorAttachmentOutput);
        assert(b.srcAccess == Access::ColorAttachmentWrite);
        assert(b.dstStages == PipelineStage::FragmentShader);
        assert(b.dstAccess == Access::InputAttachmentRead);
        assert(b.timing == BarrierTiming::Full);

        // Attachment 0 ends in its final layout already; attachment 1 needs Present.
        assert(p.exit.size() == 1);
        assert(p.exit[0].attachment == 1);
        assert(p.exit[0].newLayout == ImageLayout::Present);

        // Both start Undefined.
        assert(p.entry.size() == 2);
        assert(p.entry[0].oldLayout == ImageLayout::Undefined);
        assert(p.entry[0].newLayout == ImageLayout::ColorAttachment);

        assert(p.layouts[0][0] == ImageLayout::ColorAttachment);
        assert(p.layouts[1][0] == ImageLayout::ShaderReadOnly);
        assert(!p.layouts[0][1].has_value());
        assert(p.barrierCount() == 4);
        std::printf("  color -> input: ok\n");
    }

    // Native pass does entry/exit and subpass transitions itself
    {
        gfxhal::PlannerOptions options;
        options.implicitEntryExit          = true;
        options.implicitSubpassTransitions = true;
        auto plan = gfxhal::planRenderPass(deferred(), options);
        assert(plan.ok());
        assert(plan.value().barrierCount() == 0);
        assert(plan.value().implicitEntry.size() == 2);
        assert(plan.value().implicitExit.size() == 1);
        assert(plan.value().layouts[1][0] == ImageLayout::ShaderReadOnly);
    }

    // Split barriers pair up across the subpass boundary
    {
        gfxhal::PlannerOptions options;
        options.splitBarriers = true;
        auto plan = gfxhal::planRenderPass(deferred(), options);
        assert(plan.ok());
        const auto& p = plan.value();
        assert(p.subpasses[0].after.size() == 1);
        assert(p.subpasses[1].before.size() == 1);
        assert(p.subpasses[0].after[0].timing == BarrierTiming::SplitBegin);
        assert(p.subpasses[1].before[0].timing == BarrierTiming::SplitEnd);
        assert(p.subpasses[0].after[0].splitId == p.subpasses[1].before[0].splitId);
        assert(p.interSubpassBarrierCount() == 1);
        assert(gfxhal::validateSplitPairs(p).ok());
        std::printf("  split barriers: ok\n");
    }

    // Broken split pairs
    {
        gfxhal::PlannerOptions options;
        options.splitBarriers = true;
        auto plan = gfxhal::planRenderPass(deferred(), options).value();

        auto orphanEnd = plan;
        orphanEnd.subpasses[0].after.clear();
        auto r = gfxhal::validateSplitPairs(orphanEnd);
        assert(!r.ok() && r.error().code == ErrorCode::InvalidUsage);

        auto neverEnded = plan;
        neverEnded.subpasses[1].before.clear();
        assert(!gfxhal::validateSplitPairs(neverEnded).ok());

        auto mismatched = plan;
        mismatched.subpasses[1].before[0].newLayout = ImageLayout::General;
        assert(!gfxhal::validateSplitPairs(mismatched).ok());

        auto doubled = plan;
        doubled.subpasses[0].after.push_back(doubled.subpasses[0].after[0]);
        assert(!gfxhal::validateSplitPairs(doubled).ok());
        std::printf("  split validation: ok\n");
    }

    // Same layout in consecutive subpasses needs no barrier
    {
        gfxhal::RenderPassDesc desc;
        desc.attachments.resize(1);
        desc.attachments[0].finalLayout = ImageLayout::ColorAttachment;
        gfxhal::SubpassDesc s;
        s.colors = {0};
        desc.subpasses = {s, s, s};
        auto plan = gfxhal::planRenderPass(desc);
        assert(plan.ok());
        assert(plan.value().interSubpassBarrierCount() == 0);
        assert(plan.value().exit.empty());
        assert(plan.value().entry.size() == 1);
    }

    // Depth: read-only use and a loaded attachment already in layout
    {
        gfxhal::RenderPassDesc desc;
        desc.attachments.resize(1);
        desc.attachments[0].format        = Format::D32Sfloat;
        desc.attachments[0].load          = gfxhal::LoadOp::Load;
        desc.attachments[0].initialLayout = ImageLayout::DepthStencilAttachment;
        desc.attachments[0].finalLayout   = ImageLayout::DepthStencilReadOnly;
        gfxhal::SubpassDesc write;
        write.depthStencil = 0u;
        gfxhal::SubpassDesc read;
        read.depthStencil  = 0u;
        read.depthReadOnly = true;
        desc.subpasses     = {write, read};

        auto plan = gfxhal::planRenderPass(desc);
        assert(plan.ok());
        const auto& p = plan.value();
        assert(p.entry.empty());
        assert(p.exit.empty());
        assert(p.subpasses[1].before.size() == 1);
        assert(p.subpasses[1].before[0].oldLayout == ImageLayout::DepthStencilAttachment);
        assert(p.subpasses[1].before[0].newLayout == ImageLayout::DepthStencilReadOnly);
        assert(p.subpasses[1].before[0].srcAccess == Access::DepthStencilAttachmentWrite);
    }

    // Written and read in one subpass uses General
    {
        gfxhal::RenderPassDesc desc;
        desc.attachments.resize(1);
        desc.attachments[0].finalLayout = ImageLayout::General;
        gfxhal::SubpassDesc s;
        s.colors = {0};
        s.inputs = {0};
        desc.subpasses = {s};
        auto plan = gfxhal::planRenderPass(desc);
        assert(plan.ok());
        assert(plan.value().layouts[0][0] == ImageLayout::General);
        assert(plan.value().exit.empty());
    }

    // Unreferenced attachment only transitions at exit
    {
        gfxhal::RenderPassDesc desc;
        desc.attachments.resize(2);
        desc.attachments[1].initialLayout = ImageLayout::TransferDst;
        desc.attachments[1].finalLayout   = ImageLayout::ShaderReadOnly;
        gfxhal::SubpassDesc s;
        s.colors    = {0};
        s.preserves = {1};
        desc.subpasses = {s};
        auto plan = gfxhal::planRenderPass(desc);
        assert(plan.ok());
        std::size_t forOne = 0;
        for (const auto& b : plan.value().exit) {
            if (b.attachment == 1) {
                ++forOne;
                assert(b.oldLayout == ImageLayout::TransferDst);
            }
        }
        assert(forOne == 1);
        for (const auto& b : plan.value().entry) assert(b.attachment != 1);
    }

    // Validation
    {
        auto expectInvalid = [](const gfxhal::RenderPassDesc& d) {
            auto r = gfxhal::validateRenderPass(d);
            assert(!r.ok() && r.error().code == ErrorCode::InvalidUsage);
            assert(!gfxhal::planRenderPass(d).ok());
        };

        gfxhal::RenderPassDesc none;
        none.attachments.resize(1);
        expectInvalid(none);

        auto outOfRange = deferred();
        outOfRange.subpasses[0].colors = {5};
        expectInvalid(outOfRange);

        auto depthAsColor = deferred();
        depthAsColor.attachments[0].format = Format::D32Sfloat;
        expectInvalid(depthAsColor);

        auto colorAsDepth = deferred();
        colorAsDepth.subpasses[0].colors.clear();
        colorAsDepth.subpasses[0].depthStencil = 0u;
        expectInvalid(colorAsDepth);

        auto resolves = deferred();
        resolves.subpasses[1].resolves = {0, 1};
        expectInvalid(resolves);

        auto preserved = deferred();
        preserved.subpasses[1].preserves = {0};
        expectInvalid(preserved);

        auto undefinedFinal = deferred();
        undefinedFinal.attachments[1].finalLayout = ImageLayout::Undefined;
        expectInvalid(undefinedFinal);

        assert(gfxhal::validateRenderPass(deferred()).ok());
        std::printf("  validation: ok\n");
    }

    std::printf("pass planner tests passed\n");
    return 0;
}

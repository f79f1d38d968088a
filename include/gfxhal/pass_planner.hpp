#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/format.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace gfxhal {

enum class LoadOp : std::uint8_t {
    Load,
    Clear,
    DontCare,
};

enum class StoreOp : std::uint8_t {
    Store,
    DontCare,
};

struct AttachmentDesc {
    Format        format        = Format::R8G8B8A8Unorm;
    std::uint32_t samples       = 1;
    LoadOp        load          = LoadOp::Clear;
    StoreOp       store         = StoreOp::Store;
    LoadOp        stencilLoad   = LoadOp::DontCare;
    StoreOp       stencilStore  = StoreOp::DontCare;
    ImageLayout   initialLayout = ImageLayout::Undefined;
    ImageLayout   finalLayout   = ImageLayout::ShaderReadOnly;
};

inline constexpr std::uint32_t UnusedAttachment = ~0u;

// Attachment indices per role. Layouts are derived: color and resolve use
// ColorAttachment, depth uses DepthStencilAttachment (DepthStencilReadOnly
// when depthReadOnly), inputs use ShaderReadOnly, and an attachment that is
// both written and read as input in one subpass uses General.
struct SubpassDesc {
    std::vector<std::uint32_t>   colors;
    std::optional<std::uint32_t> depthStencil;
    bool                         depthReadOnly = false;
    std::vector<std::uint32_t>   inputs;
    std::vector<std::uint32_t>   resolves;  // empty, or one per color (UnusedAttachment allowed)
    std::vector<std::uint32_t>   preserves;
};

struct RenderPassDesc {
    std::vector<AttachmentDesc> attachments;
    std::vector<SubpassDesc>    subpasses;
};

// Checks indices, resolve counts, formats per role and preserve overlap.
[[nodiscard]] Result<void> validateRenderPass(const RenderPassDesc& desc);

enum class BarrierTiming : std::uint8_t {
    Full,
    SplitBegin,
    SplitEnd,
};

// A barrier on one attachment. The recorder resolves the attachment index to
// the framebuffer's image when it emits the barrier.
struct PlannedBarrier {
    std::uint32_t attachment = 0;
    ImageLayout   oldLayout  = ImageLayout::Undefined;
    ImageLayout   newLayout  = ImageLayout::Undefined;
    PipelineStage srcStages  = PipelineStage::None;
    Access        srcAccess  = Access::None;
    PipelineStage dstStages  = PipelineStage::None;
    Access        dstAccess  = Access::None;
    BarrierTiming timing     = BarrierTiming::Full;
    std::uint32_t splitId    = 0; // pairs SplitBegin with SplitEnd
};

struct SubpassBarriers {
    std::vector<PlannedBarrier> before; // emitted on entering the subpass
    std::vector<PlannedBarrier> after;  // emitted on leaving it
};

struct RenderPassPlan {
    std::vector<PlannedBarrier>  entry; // before pass begin
    std::vector<SubpassBarriers> subpasses;
    std::vector<PlannedBarrier>  exit;  // after pass end

    // layouts[subpass][attachment]: layout the subpass needs, or nullopt when
    // the subpass does not reference the attachment.
    std::vector<std::vector<std::optional<ImageLayout>>> layouts;

    // Attachments whose entry / exit transition the native pass performs.
    std::vector<std::uint32_t> implicitEntry;
    std::vector<std::uint32_t> implicitExit;

    [[nodiscard]] std::size_t interSubpassBarrierCount() const;
    [[nodiscard]] std::size_t barrierCount() const;
};

// What the native render pass does on its own.
struct PlannerOptions {
    bool implicitEntryExit          = false; // pass begin/end transitions
    bool implicitSubpassTransitions = false; // subpass-to-subpass transitions
    bool splitBarriers              = false; // begin/end halves supported
};

// Scans each attachment's referencing subpasses in declaration order and
// emits at most one entry barrier, one barrier per conflicting consecutive
// pair, and at most one exit barrier.
[[nodiscard]] Result<RenderPassPlan> planRenderPass(const RenderPassDesc& desc,
                                                    const PlannerOptions& options = {});

// Every SplitBegin must be matched by exactly one later SplitEnd with the
// same id and layouts, and no SplitEnd may lack its begin.
[[nodiscard]] Result<void> validateSplitPairs(const RenderPassPlan& plan);

} // namespace gfxhal

#include <gfxhal/command.hpp>
#include <gfxhal/descriptor_set.hpp>
#include <gfxhal/pipeline.hpp>
#include <gfxhal/pipeline_layout.hpp>
#include <gfxhal/render_pass.hpp>
#include <gfxhal/resource.hpp>

#include "../core/device_core.hpp"
#include "recorder_state.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace gfxhal {

const char* toString(CommandBufferState state) {
    switch (state) {
    case CommandBufferState::Initial:    return "Initial";
    case CommandBufferState::Recording:  return "Recording";
    case CommandBufferState::RenderPass: return "RenderPass";
    case CommandBufferState::Executable: return "Executable";
    case CommandBufferState::Pending:    return "Pending";
    case CommandBufferState::Invalid:    return "Invalid";
    }
    return "Unknown";
}

namespace detail {

void RecorderState::refresh() {
    if (state != CommandBufferState::Pending) return;
    for (const auto& p : pending) {
        if (core->completedSerial(p.queue) < p.serial) return;
    }
    if (any(usage & CommandBufferUsage::OneTimeSubmit)) {
        pending.clear();
        state = CommandBufferState::Invalid;
        return;
    }
    clear();
}

void RecorderState::clear() {
    usage    = CommandBufferUsage::None;
    state    = CommandBufferState::Initial;
    poisoned = false;
    stream.reset();
    pass.reset();
    inherited.reset();
    graphicsBound      = false;
    pipelineRenderPass = Handle{};
    pipelineSubpass    = 0;
    computeBound       = false;
    openSplits.clear();
    boundSets.clear();
    pending.clear();
    executed.clear();
}

void RecorderState::markPending(PendingSubmission submission) {
    state = CommandBufferState::Pending;
    for (const auto& p : pending) {
        if (p.queue == submission.queue && p.serial == submission.serial) return;
    }
    pending.push_back(submission);
}

void RecorderState::use(Handle handle) {
    auto& resources = stream->resources;
    if (std::find(resources.begin(), resources.end(), handle) == resources.end()) {
        resources.push_back(handle);
    }
}

} // namespace detail

namespace {

using detail::ExecutedSecondary;
using detail::PassContext;
using detail::RecorderState;

// Split ids at or above this are issued by render pass barrier plans.
constexpr std::uint32_t kPlannedSplitBase = 0x8000'0000u;

constexpr std::uint64_t kMaxUpdateSize = 65536;

Result<void> reject(RecorderState& s, const char* opName, std::string message) {
    s.poisoned = true;
    return s.core->report(Error{opName, ErrorCode::InvalidUsage, 0, std::move(message)});
}

Error emptyBuffer(const char* opName) {
    return Error{opName, ErrorCode::InvalidUsage, 0, "command buffer is empty"};
}

bool recording(const RecorderState& s) {
    return s.state == CommandBufferState::Recording || s.state == CommandBufferState::RenderPass;
}

// The pass draws land in: the one this buffer began, or the inherited one.
const PassContext* activePass(const RecorderState& s) {
    if (s.state == CommandBufferState::RenderPass) return &*s.pass;
    if (s.state == CommandBufferState::Recording && s.inherited) return &*s.inherited;
    return nullptr;
}

Result<void> requireRecording(RecorderState& s, const char* opName) {
    if (!recording(s)) {
        return reject(s, opName,
                      std::string("command buffer is ") + toString(s.state) + ", not recording");
    }
    return {};
}

// Binds and dynamic state: anywhere except a subpass that only executes
// secondary buffers.
Result<void> requireStateCommand(RecorderState& s, const char* opName) {
    if (auto r = requireRecording(s, opName); !r.ok()) return r;
    if (s.state == CommandBufferState::RenderPass &&
        s.pass->contents == SubpassContents::SecondaryBuffers) {
        return reject(s, opName, "subpass " + std::to_string(s.pass->subpass) +
                                 " records secondary buffers only");
    }
    return {};
}

Result<void> requireOutsidePass(RecorderState& s, const char* opName) {
    if (auto r = requireRecording(s, opName); !r.ok()) return r;
    if (activePass(s)) return reject(s, opName, "not allowed inside a render pass");
    return {};
}

Result<void> requireDraw(RecorderState& s, const char* opName) {
    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    const PassContext* pass = activePass(s);
    if (!pass) return reject(s, opName, "draws need an active render pass");
    if (!s.graphicsBound) return reject(s, opName, "no graphics pipeline is bound");
    if (s.pipelineRenderPass != pass->renderPass || s.pipelineSubpass != pass->subpass) {
        return reject(s, opName, "bound graphics pipeline was built for subpass " +
                                 std::to_string(s.pipelineSubpass) +
                                 " of another render pass than the active one");
    }
    return {};
}

Result<void> requireLive(RecorderState& s, const char* opName, const DeviceObject& object,
                         const char* what) {
    if (!object.valid() || !s.core->live(object.handle())) {
        return reject(s, opName, std::string(what) + " is empty or destroyed");
    }
    s.use(object.handle());
    return {};
}

Result<void> requireBuffer(RecorderState& s, const char* opName, const Buffer& buffer,
                           BufferUsage usage, const char* what) {
    if (auto r = requireLive(s, opName, buffer, what); !r.ok()) return r;
    if (!contains(buffer.desc().usage, usage)) {
        return reject(s, opName, std::string(what) + " was not created with the usage this needs");
    }
    if (!buffer.bound()) return reject(s, opName, std::string(what) + " has no memory bound");
    return {};
}

Result<void> requireImage(RecorderState& s, const char* opName, const Image& image,
                          FormatFeature usage, const char* what) {
    if (auto r = requireLive(s, opName, image, what); !r.ok()) return r;
    if (!contains(image.desc().usage, usage)) {
        return reject(s, opName, std::string(what) + " was not created with the usage this needs");
    }
    if (!image.bound()) return reject(s, opName, std::string(what) + " has no memory bound");
    return {};
}

bool inRange(std::uint64_t offset, std::uint64_t size, std::uint64_t limit) {
    return offset <= limit && size <= limit - offset;
}

ImageBarrier resolve(const PassContext& pass, const PlannedBarrier& planned) {
    ImageBarrier b;
    b.image     = pass.attachments[planned.attachment];
    b.oldLayout = planned.oldLayout;
    b.newLayout = planned.newLayout;
    b.srcStages = planned.srcStages;
    b.srcAccess = planned.srcAccess;
    b.dstStages = planned.dstStages;
    b.dstAccess = planned.dstAccess;
    return b;
}

// Records planned attachment barriers: full ones batched into one barrier
// command, split halves grouped per split id.
void emitPlanned(RecorderState& s, const PassContext& pass,
                 const std::vector<PlannedBarrier>& planned) {
    BarrierSet                           full;
    std::map<std::uint32_t, BarrierSet>  begins;
    std::map<std::uint32_t, BarrierSet>  ends;
    for (const auto& p : planned) {
        switch (p.timing) {
        case BarrierTiming::Full:       full.images.push_back(resolve(pass, p)); break;
        case BarrierTiming::SplitBegin: begins[p.splitId].images.push_back(resolve(pass, p)); break;
        case BarrierTiming::SplitEnd:   ends[p.splitId].images.push_back(resolve(pass, p)); break;
        }
    }
    for (auto& [id, set] : ends) {
        s.stream->commands.emplace_back(op::SplitBarrierEnd{kPlannedSplitBase + id, std::move(set)});
    }
    if (!full.empty()) s.stream->commands.emplace_back(op::PipelineBarrier{std::move(full)});
    for (auto& [id, set] : begins) {
        s.stream->commands.emplace_back(
            op::SplitBarrierBegin{kPlannedSplitBase + id, std::move(set)});
    }
}

Result<void> checkBarrierResources(RecorderState& s, const char* opName, const BarrierSet& barriers) {
    for (const auto& b : barriers.buffers) {
        if (!s.core->live(b.buffer.handle)) {
            return reject(s, opName, "buffer barrier names a destroyed buffer");
        }
        s.use(b.buffer.handle);
    }
    for (const auto& b : barriers.images) {
        if (!s.core->live(b.image.handle)) {
            return reject(s, opName, "image barrier names a destroyed image");
        }
        if (b.newLayout == ImageLayout::Undefined || b.newLayout == ImageLayout::Preinitialized) {
            return reject(s, opName, std::string("images cannot transition to ") +
                                     toString(b.newLayout));
        }
        s.use(b.image.handle);
    }
    return {};
}

// Bytes a buffer/image copy region touches on the buffer side.
std::uint64_t regionBytes(const Image& image, const BufferImageCopy& region) {
    const std::uint64_t texel  = formatInfo(image.format()).bytesPerBlock;
    const std::uint64_t row    = region.bufferRowLength ? region.bufferRowLength
                                                        : region.imageExtent.width;
    const std::uint64_t height = region.bufferImageHeight ? region.bufferImageHeight
                                                          : region.imageExtent.height;
    const std::uint64_t slices =
        std::uint64_t{region.imageExtent.depth} * std::uint64_t{region.layerCount};
    if (region.imageExtent.width == 0 || region.imageExtent.height == 0 || slices == 0) return 0;
    return texel * (row * height * (slices - 1) + row * (region.imageExtent.height - 1) +
                    region.imageExtent.width);
}

Result<void> checkImageRegions(RecorderState& s, const char* opName, const Buffer& buffer,
                               const Image& image, const std::vector<BufferImageCopy>& regions) {
    if (regions.empty()) return reject(s, opName, "no copy regions");
    const ImageDesc& desc = image.desc();
    for (const auto& r : regions) {
        if (r.mipLevel >= desc.mipLevels) {
            return reject(s, opName, "mip level " + std::to_string(r.mipLevel) + " does not exist");
        }
        if (r.layerCount == 0 || r.baseLayer + r.layerCount > desc.arrayLayers) {
            return reject(s, opName, "copy layers exceed the image's array layers");
        }
        const std::uint32_t w = std::max(1u, desc.extent.width >> r.mipLevel);
        const std::uint32_t h = std::max(1u, desc.extent.height >> r.mipLevel);
        const std::uint32_t d = std::max(1u, desc.extent.depth >> r.mipLevel);
        if (r.imageOffset.x < 0 || r.imageOffset.y < 0 || r.imageOffset.z < 0 ||
            r.imageOffset.x + r.imageExtent.width > w ||
            r.imageOffset.y + r.imageExtent.height > h ||
            r.imageOffset.z + r.imageExtent.depth > d) {
            return reject(s, opName, "copy region lies outside mip level " +
                                     std::to_string(r.mipLevel));
        }
        if ((r.bufferRowLength != 0 && r.bufferRowLength < r.imageExtent.width) ||
            (r.bufferImageHeight != 0 && r.bufferImageHeight < r.imageExtent.height)) {
            return reject(s, opName, "buffer row length or image height is smaller than the region");
        }
        if (!inRange(r.bufferOffset, regionBytes(image, r), buffer.size())) {
            return reject(s, opName, "copy region runs past the end of the buffer");
        }
    }
    return {};
}

} // namespace

CommandBuffer::~CommandBuffer() = default;
CommandBuffer::CommandBuffer(CommandBuffer&&) noexcept = default;
CommandBuffer& CommandBuffer::operator=(CommandBuffer&&) noexcept = default;

CommandBufferLevel CommandBuffer::level() const {
    return state_ ? state_->level : CommandBufferLevel::Primary;
}

CommandBufferUsage CommandBuffer::usage() const {
    return state_ ? state_->usage : CommandBufferUsage::None;
}

CommandBufferState CommandBuffer::state() const {
    if (!state_) return CommandBufferState::Invalid;
    state_->refresh();
    return state_->state;
}

bool CommandBuffer::poisoned() const { return state_ && state_->poisoned; }

std::uint32_t CommandBuffer::subpass() const {
    if (!state_) return 0;
    if (state_->pass) return state_->pass->subpass;
    if (state_->inherited) return state_->inherited->subpass;
    return 0;
}

std::size_t CommandBuffer::commandCount() const {
    return state_ && state_->stream ? state_->stream->commands.size() : 0;
}

std::shared_ptr<const CommandStream> CommandBuffer::stream() const {
    const CommandBufferState s = state();
    if (s != CommandBufferState::Executable && s != CommandBufferState::Pending) return nullptr;
    return state_->stream;
}

Result<void> CommandBuffer::begin(CommandBufferUsage usage,
                                  const CommandBufferInheritance* inheritance) {
    constexpr const char* opName = "begin command buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;
    s.refresh();

    if (s.state != CommandBufferState::Initial && s.state != CommandBufferState::Executable) {
        return reject(s, opName, std::string("command buffer is ") + toString(s.state) +
                                 (s.state == CommandBufferState::Invalid
                                      ? "; it was recorded for one-time submission, reset its pool"
                                      : "; only Initial or Executable buffers can begin"));
    }

    std::optional<PassContext> inherited;
    if (any(usage & CommandBufferUsage::RenderPassContinue)) {
        if (s.level != CommandBufferLevel::Secondary) {
            return reject(s, opName, "RenderPassContinue is only valid on secondary buffers");
        }
        if (!inheritance || !inheritance->renderPass || !inheritance->renderPass->valid() ||
            !s.core->live(inheritance->renderPass->handle())) {
            return reject(s, opName, "RenderPassContinue needs a live inherited render pass");
        }
        const RenderPass& rp = *inheritance->renderPass;
        if (inheritance->subpass >= rp.subpassCount()) {
            return reject(s, opName, "inherited subpass " + std::to_string(inheritance->subpass) +
                                     " does not exist");
        }
        PassContext ctx;
        ctx.renderPass = rp.handle();
        ctx.desc       = rp.desc_;
        ctx.plan       = rp.plan_;
        ctx.subpass    = inheritance->subpass;
        if (const Framebuffer* fb = inheritance->framebuffer) {
            if (!fb->valid() || !s.core->live(fb->handle()) || fb->renderPass() != rp.handle()) {
                return reject(s, opName, "inherited framebuffer is destroyed or belongs to another "
                                     "render pass");
            }
            ctx.attachments = fb->attachments();
        }
        inherited = std::move(ctx);
    }

    s.clear();
    s.usage     = usage;
    s.state     = CommandBufferState::Recording;
    s.stream    = std::make_shared<CommandStream>();
    s.inherited = std::move(inherited);
    if (s.inherited) {
        s.use(s.inherited->renderPass);
        for (const auto& a : s.inherited->attachments) s.use(a.handle);
    }
    return {};
}

Result<void> CommandBuffer::finish() {
    constexpr const char* opName = "finish command buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireRecording(s, opName); !r.ok()) return r;
    if (s.state == CommandBufferState::RenderPass) {
        return reject(s, opName, "render pass still open in subpass " +
                                 std::to_string(s.pass->subpass));
    }
    if (!s.openSplits.empty()) {
        return reject(s, opName, "split barrier " + std::to_string(s.openSplits.begin()->first) +
                                 " was begun but never ended");
    }
    if (s.poisoned) {
        return reject(s, opName, "an earlier command was rejected; reset the buffer and record again");
    }

    for (const auto& bound : s.boundSets) {
        s.stream->descriptorSets.push_back(
            DescriptorSetUse{bound.handle, bound.version,
                             bound.version->load(std::memory_order_acquire)});
    }
    s.state = CommandBufferState::Executable;
    return {};
}

Result<void> CommandBuffer::reset() {
    constexpr const char* opName = "reset command buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;
    s.refresh();

    if (s.state == CommandBufferState::Pending) {
        return reject(s, opName, "command buffer is still pending on a queue");
    }
    if (s.state == CommandBufferState::Invalid) {
        return reject(s, opName, "one-time-submit buffer was consumed; reset its pool");
    }
    s.clear();
    return {};
}

Result<void> CommandBuffer::beginRenderPass(const RenderPass& renderPass,
                                            const Framebuffer& framebuffer, Rect2D area,
                                            std::vector<ClearValue> clears,
                                            SubpassContents contents) {
    constexpr const char* opName = "begin render pass";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireRecording(s, opName); !r.ok()) return r;
    if (s.level != CommandBufferLevel::Primary) {
        return reject(s, opName, "secondary buffers cannot begin render passes");
    }
    if (s.state == CommandBufferState::RenderPass) {
        return reject(s, opName, "a render pass is already active; end it first");
    }
    if (!renderPass.valid() || !s.core->live(renderPass.handle())) {
        return reject(s, opName, "render pass is empty or destroyed");
    }
    if (!framebuffer.valid() || !s.core->live(framebuffer.handle())) {
        return reject(s, opName, "framebuffer is empty or destroyed");
    }
    if (framebuffer.renderPass() != renderPass.handle()) {
        return reject(s, opName, "framebuffer was created for another render pass");
    }
    for (const auto& a : framebuffer.attachments()) {
        if (!s.core->live(a.handle)) {
            return reject(s, opName, "a framebuffer attachment was destroyed");
        }
    }

    const Extent2D fb = framebuffer.extent();
    if (area.x < 0 || area.y < 0 ||
        static_cast<std::uint64_t>(area.x) + area.extent.width > fb.width ||
        static_cast<std::uint64_t>(area.y) + area.extent.height > fb.height) {
        return reject(s, opName, "render area lies outside the framebuffer");
    }

    const RenderPassDesc& desc = renderPass.desc();
    for (std::size_t i = 0; i < desc.attachments.size(); ++i) {
        const auto& a = desc.attachments[i];
        const bool cleared = a.load == LoadOp::Clear ||
                             (isDepthFormat(a.format) && a.stencilLoad == LoadOp::Clear);
        if (cleared && i >= clears.size()) {
            return reject(s, opName, "attachment " + std::to_string(i) +
                                     " is cleared but has no clear value");
        }
    }

    PassContext ctx;
    ctx.renderPass  = renderPass.handle();
    ctx.desc        = renderPass.desc_;
    ctx.plan        = renderPass.plan_;
    ctx.attachments = framebuffer.attachments();
    ctx.subpass     = 0;
    ctx.contents    = contents;

    s.use(renderPass.handle());
    s.use(framebuffer.handle());
    for (const auto& a : ctx.attachments) s.use(a.handle);

    emitPlanned(s, ctx, ctx.plan->entry);
    s.stream->commands.emplace_back(op::BeginRenderPass{renderPass.native(), framebuffer.native(),
                                                        area, std::move(clears), contents});
    emitPlanned(s, ctx, ctx.plan->subpasses[0].before);

    s.pass  = std::move(ctx);
    s.state = CommandBufferState::RenderPass;
    return {};
}

Result<void> CommandBuffer::nextSubpass(SubpassContents contents) {
    constexpr const char* opName = "next subpass";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (s.state != CommandBufferState::RenderPass) {
        return reject(s, opName, std::string("command buffer is ") + toString(s.state) +
                                 ", not inside a render pass");
    }
    PassContext& pass = *s.pass;
    const auto count = static_cast<std::uint32_t>(pass.desc->subpasses.size());
    if (pass.subpass + 1 >= count) {
        return reject(s, opName, "already in the last subpass (" + std::to_string(pass.subpass) + ")");
    }

    emitPlanned(s, pass, pass.plan->subpasses[pass.subpass].after);
    s.stream->commands.emplace_back(op::NextSubpass{contents});
    ++pass.subpass;
    pass.contents = contents;
    emitPlanned(s, pass, pass.plan->subpasses[pass.subpass].before);
    return {};
}

Result<void> CommandBuffer::endRenderPass() {
    constexpr const char* opName = "end render pass";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (s.state != CommandBufferState::RenderPass) {
        return reject(s, opName, std::string("command buffer is ") + toString(s.state) +
                                 ", not inside a render pass");
    }
    const PassContext& pass = *s.pass;
    const auto count = static_cast<std::uint32_t>(pass.desc->subpasses.size());
    if (pass.subpass + 1 != count) {
        return reject(s, opName, "in subpass " + std::to_string(pass.subpass) + " of " +
                                 std::to_string(count) + "; advance to the last subpass first");
    }

    emitPlanned(s, pass, pass.plan->subpasses[pass.subpass].after);
    s.stream->commands.emplace_back(op::EndRenderPass{});
    emitPlanned(s, pass, pass.plan->exit);

    s.pass.reset();
    s.state = CommandBufferState::Recording;
    return {};
}

Result<void> CommandBuffer::bindPipeline(const Pipeline& pipeline) {
    constexpr const char* opName = "bind pipeline";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (auto r = requireLive(s, opName, pipeline, "pipeline"); !r.ok()) return r;

    auto layout = s.core->lookup(pipeline.layout());
    if (!layout) return reject(s, opName, "the pipeline's layout was destroyed");
    s.use(pipeline.layout());

    if (pipeline.bindPoint() == PipelineBindPoint::Graphics) {
        s.graphicsBound      = true;
        s.pipelineRenderPass = pipeline.renderPass();
        s.pipelineSubpass    = pipeline.subpass();
    } else {
        s.computeBound = true;
    }
    s.stream->commands.emplace_back(
        op::BindPipeline{pipeline.bindPoint(), pipeline.native(), layout->native});
    return {};
}

Result<void> CommandBuffer::bindDescriptorSets(PipelineBindPoint bindPoint,
                                               const PipelineLayout& layout,
                                               std::uint32_t firstSet,
                                               const std::vector<const DescriptorSet*>& sets,
                                               std::vector<std::uint32_t> dynamicOffsets) {
    constexpr const char* opName = "bind descriptor sets";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (auto r = requireLive(s, opName, layout, "pipeline layout"); !r.ok()) return r;
    if (sets.empty()) return reject(s, opName, "no sets to bind");
    if (firstSet + sets.size() > layout.sets().size()) {
        return reject(s, opName, "sets " + std::to_string(firstSet) + ".." +
                                 std::to_string(firstSet + sets.size() - 1) +
                                 " exceed the layout's " + std::to_string(layout.sets().size()) +
                                 " sets");
    }

    const AdapterLimits& limits = s.core->adapter().limits;
    std::size_t dynamicIndex = 0;
    std::vector<NativeHandle> natives;
    natives.reserve(sets.size());
    for (std::size_t i = 0; i < sets.size(); ++i) {
        const DescriptorSet* set = sets[i];
        const auto index = static_cast<std::uint32_t>(firstSet + i);
        if (!set || !set->valid() || !s.core->live(set->handle())) {
            return reject(s, opName, "set " + std::to_string(index) + " is null, freed or from a "
                                                                   "reset pool");
        }
        if (!layout.setCompatible(index, *set->layout())) {
            return reject(s, opName, "set " + std::to_string(index) +
                                     " was allocated with a layout the pipeline layout does "
                                     "not declare there");
        }
        for (const auto& b : set->layout()->bindings()) {
            if (!isDynamicKind(b.kind)) continue;
            const std::uint64_t align = b.kind == DescriptorKind::UniformBufferDynamic
                                            ? limits.minUniformBufferOffsetAlignment
                                            : limits.minStorageBufferOffsetAlignment;
            for (std::uint32_t e = 0; e < b.count; ++e, ++dynamicIndex) {
                if (dynamicIndex < dynamicOffsets.size() && align > 1 &&
                    dynamicOffsets[dynamicIndex] % align != 0) {
                    return reject(s, opName, "dynamic offset " +
                                             std::to_string(dynamicOffsets[dynamicIndex]) +
                                             " is not a multiple of " + std::to_string(align));
                }
            }
        }
        natives.push_back(set->native());
    }
    if (dynamicIndex != dynamicOffsets.size()) {
        return reject(s, opName, std::to_string(dynamicOffsets.size()) + " dynamic offsets for " +
                                 std::to_string(dynamicIndex) + " dynamic descriptors");
    }

    for (const DescriptorSet* set : sets) {
        s.use(set->handle());
        s.boundSets.push_back(detail::BoundSet{set->handle(), set->state_->version});
    }
    s.stream->commands.emplace_back(op::BindDescriptorSets{
        bindPoint, layout.native(), firstSet, std::move(natives), std::move(dynamicOffsets)});
    return {};
}

Result<void> CommandBuffer::pushConstants(const PipelineLayout& layout, ShaderStage stages,
                                          std::uint32_t offset, const void* data,
                                          std::uint32_t size) {
    constexpr const char* opName = "push constants";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (auto r = requireLive(s, opName, layout, "pipeline layout"); !r.ok()) return r;

    const auto& range = layout.pushConstants();
    if (!range) return reject(s, opName, "the pipeline layout declares no push constants");
    if (!data || size == 0) return reject(s, opName, "no push constant data");
    if (offset % 4 != 0 || size % 4 != 0) {
        return reject(s, opName, "push constant offset and size must be multiples of 4");
    }
    if (stages == ShaderStage::None || (stages & ~range->stages) != ShaderStage::None) {
        return reject(s, opName, "stages are not covered by the layout's push constant range");
    }
    if (offset < range->offset ||
        static_cast<std::uint64_t>(offset) + size > range->offset + range->size) {
        return reject(s, opName, "push constant update [" + std::to_string(offset) + ", " +
                                 std::to_string(offset + size) + ") is outside the range [" +
                                 std::to_string(range->offset) + ", " +
                                 std::to_string(range->offset + range->size) + ")");
    }

    op::PushConstants cmd;
    cmd.layout = layout.native();
    cmd.stages = stages;
    cmd.offset = offset;
    cmd.data.resize(size);
    std::memcpy(cmd.data.data(), data, size);
    s.stream->commands.emplace_back(std::move(cmd));
    return {};
}

Result<void> CommandBuffer::bindVertexBuffers(std::uint32_t firstBinding,
                                              const std::vector<const Buffer*>& buffers,
                                              std::vector<std::uint64_t> offsets) {
    constexpr const char* opName = "bind vertex buffers";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (buffers.empty()) return reject(s, opName, "no vertex buffers");
    if (offsets.empty()) offsets.assign(buffers.size(), 0);
    if (offsets.size() != buffers.size()) {
        return reject(s, opName, std::to_string(offsets.size()) + " offsets for " +
                                 std::to_string(buffers.size()) + " buffers");
    }

    op::BindVertexBuffers cmd;
    cmd.firstBinding = firstBinding;
    for (std::size_t i = 0; i < buffers.size(); ++i) {
        if (!buffers[i]) return reject(s, opName, "vertex buffer is null");
        if (auto r = requireBuffer(s, opName, *buffers[i], BufferUsage::Vertex, "vertex buffer");
            !r.ok())
            return r;
        if (offsets[i] >= buffers[i]->size()) {
            return reject(s, opName, "vertex buffer offset is past the end of the buffer");
        }
        cmd.buffers.push_back(buffers[i]->ref());
    }
    cmd.offsets = std::move(offsets);
    s.stream->commands.emplace_back(std::move(cmd));
    return {};
}

Result<void> CommandBuffer::bindIndexBuffer(const Buffer& buffer, std::uint64_t offset,
                                            IndexType type) {
    constexpr const char* opName = "bind index buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, buffer, BufferUsage::Index, "index buffer"); !r.ok())
        return r;
    const std::uint64_t width = type == IndexType::Uint16 ? 2 : 4;
    if (offset % width != 0 || offset >= buffer.size()) {
        return reject(s, opName, "index buffer offset is misaligned or past the end");
    }
    s.stream->commands.emplace_back(op::BindIndexBuffer{buffer.ref(), offset, type});
    return {};
}

Result<void> CommandBuffer::setViewport(const Viewport& viewport) {
    constexpr const char* opName = "set viewport";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (viewport.width <= 0.0f || viewport.minDepth < 0.0f || viewport.maxDepth > 1.0f) {
        return reject(s, opName, "viewport needs a positive width and depth bounds in [0, 1]");
    }
    s.stream->commands.emplace_back(op::SetViewport{viewport});
    return {};
}

Result<void> CommandBuffer::setScissor(const Rect2D& scissor) {
    constexpr const char* opName = "set scissor";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireStateCommand(s, opName); !r.ok()) return r;
    if (scissor.x < 0 || scissor.y < 0) return reject(s, opName, "scissor offset is negative");
    s.stream->commands.emplace_back(op::SetScissor{scissor});
    return {};
}

Result<void> CommandBuffer::draw(std::uint32_t vertexCount, std::uint32_t instanceCount,
                                 std::uint32_t firstVertex, std::uint32_t firstInstance) {
    constexpr const char* opName = "draw";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireDraw(s, opName); !r.ok()) return r;
    s.stream->commands.emplace_back(
        op::Draw{vertexCount, instanceCount, firstVertex, firstInstance});
    return {};
}

Result<void> CommandBuffer::drawIndexed(std::uint32_t indexCount, std::uint32_t instanceCount,
                                        std::uint32_t firstIndex, std::int32_t vertexOffset,
                                        std::uint32_t firstInstance) {
    constexpr const char* opName = "draw indexed";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireDraw(s, opName); !r.ok()) return r;
    s.stream->commands.emplace_back(
        op::DrawIndexed{indexCount, instanceCount, firstIndex, vertexOffset, firstInstance});
    return {};
}

Result<void> CommandBuffer::drawIndirect(const Buffer& buffer, std::uint64_t offset,
                                         std::uint32_t drawCount, std::uint32_t stride) {
    constexpr const char* opName = "draw indirect";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireDraw(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, buffer, BufferUsage::Indirect, "indirect buffer"); !r.ok())
        return r;
    if (offset % 4 != 0) return reject(s, opName, "indirect offset must be a multiple of 4");
    if (drawCount > 1 && (stride < 16 || stride % 4 != 0)) {
        return reject(s, opName, "indirect stride must be a multiple of 4 and at least 16");
    }
    const std::uint64_t span =
        drawCount == 0 ? 0 : std::uint64_t{drawCount - 1} * stride + 16;
    if (!inRange(offset, span, buffer.size())) {
        return reject(s, opName, "indirect draws run past the end of the buffer");
    }
    s.stream->commands.emplace_back(op::DrawIndirect{buffer.ref(), offset, drawCount, stride});
    return {};
}

Result<void> CommandBuffer::dispatch(std::uint32_t x, std::uint32_t y, std::uint32_t z) {
    constexpr const char* opName = "dispatch";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (!s.computeBound) return reject(s, opName, "no compute pipeline is bound");
    s.stream->commands.emplace_back(op::Dispatch{x, y, z});
    return {};
}

Result<void> CommandBuffer::dispatchIndirect(const Buffer& buffer, std::uint64_t offset) {
    constexpr const char* opName = "dispatch indirect";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (!s.computeBound) return reject(s, opName, "no compute pipeline is bound");
    if (auto r = requireBuffer(s, opName, buffer, BufferUsage::Indirect, "indirect buffer"); !r.ok())
        return r;
    if (offset % 4 != 0 || !inRange(offset, 12, buffer.size())) {
        return reject(s, opName, "indirect dispatch offset is misaligned or past the end");
    }
    s.stream->commands.emplace_back(op::DispatchIndirect{buffer.ref(), offset});
    return {};
}

Result<void> CommandBuffer::copyBuffer(const Buffer& src, const Buffer& dst,
                                       std::vector<BufferCopy> regions) {
    constexpr const char* opName = "copy buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, src, BufferUsage::TransferSrc, "source buffer"); !r.ok())
        return r;
    if (auto r = requireBuffer(s, opName, dst, BufferUsage::TransferDst, "destination buffer");
        !r.ok())
        return r;
    if (regions.empty()) return reject(s, opName, "no copy regions");

    const bool same = src.handle() == dst.handle();
    for (const auto& r : regions) {
        if (r.size == 0) return reject(s, opName, "copy region has zero size");
        if (!inRange(r.srcOffset, r.size, src.size()) || !inRange(r.dstOffset, r.size, dst.size())) {
            return reject(s, opName, "copy region runs past the end of a buffer");
        }
        if (same && r.srcOffset < r.dstOffset + r.size && r.dstOffset < r.srcOffset + r.size) {
            return reject(s, opName, "source and destination ranges overlap");
        }
    }
    s.stream->commands.emplace_back(op::CopyBuffer{src.ref(), dst.ref(), std::move(regions)});
    return {};
}

Result<void> CommandBuffer::copyBufferToImage(const Buffer& src, const Image& dst,
                                              ImageLayout dstLayout,
                                              std::vector<BufferImageCopy> regions) {
    constexpr const char* opName = "copy buffer to image";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, src, BufferUsage::TransferSrc, "source buffer"); !r.ok())
        return r;
    if (auto r = requireImage(s, opName, dst, FormatFeature::TransferDst, "destination image");
        !r.ok())
        return r;
    if (dstLayout != ImageLayout::TransferDst && dstLayout != ImageLayout::General) {
        return reject(s, opName, std::string("destination image cannot be written in ") +
                                 toString(dstLayout));
    }
    if (auto r = checkImageRegions(s, opName, src, dst, regions); !r.ok()) return r;

    s.stream->commands.emplace_back(
        op::CopyBufferToImage{src.ref(), dst.ref(), dstLayout, std::move(regions)});
    return {};
}

Result<void> CommandBuffer::copyImageToBuffer(const Image& src, ImageLayout srcLayout,
                                              const Buffer& dst,
                                              std::vector<BufferImageCopy> regions) {
    constexpr const char* opName = "copy image to buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = requireImage(s, opName, src, FormatFeature::TransferSrc, "source image"); !r.ok())
        return r;
    if (auto r = requireBuffer(s, opName, dst, BufferUsage::TransferDst, "destination buffer");
        !r.ok())
        return r;
    if (srcLayout != ImageLayout::TransferSrc && srcLayout != ImageLayout::General) {
        return reject(s, opName, std::string("source image cannot be read in ") +
                                 toString(srcLayout));
    }
    if (auto r = checkImageRegions(s, opName, dst, src, regions); !r.ok()) return r;

    s.stream->commands.emplace_back(
        op::CopyImageToBuffer{src.ref(), srcLayout, dst.ref(), std::move(regions)});
    return {};
}

Result<void> CommandBuffer::fillBuffer(const Buffer& buffer, std::uint64_t offset,
                                       std::uint64_t size, std::uint32_t value) {
    constexpr const char* opName = "fill buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, buffer, BufferUsage::TransferDst, "buffer"); !r.ok())
        return r;
    if (offset % 4 != 0 || offset >= buffer.size()) {
        return reject(s, opName, "fill offset is misaligned or past the end");
    }
    if (size != WholeSize && (size == 0 || size % 4 != 0 || !inRange(offset, size, buffer.size()))) {
        return reject(s, opName, "fill size must be a non-zero multiple of 4 inside the buffer");
    }
    s.stream->commands.emplace_back(op::FillBuffer{buffer.ref(), offset, size, value});
    return {};
}

Result<void> CommandBuffer::updateBuffer(const Buffer& buffer, std::uint64_t offset,
                                         const void* data, std::uint64_t size) {
    constexpr const char* opName = "update buffer";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = requireBuffer(s, opName, buffer, BufferUsage::TransferDst, "buffer"); !r.ok())
        return r;
    if (!data || size == 0 || size > kMaxUpdateSize || size % 4 != 0 || offset % 4 != 0) {
        return reject(s, opName, "inline updates carry 4 to 65536 bytes, 4-byte aligned");
    }
    if (!inRange(offset, size, buffer.size())) {
        return reject(s, opName, "update runs past the end of the buffer");
    }

    op::UpdateBuffer cmd;
    cmd.buffer = buffer.ref();
    cmd.offset = offset;
    cmd.data.resize(static_cast<std::size_t>(size));
    std::memcpy(cmd.data.data(), data, cmd.data.size());
    s.stream->commands.emplace_back(std::move(cmd));
    return {};
}

Result<void> CommandBuffer::pipelineBarrier(BarrierSet barriers) {
    constexpr const char* opName = "pipeline barrier";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (auto r = checkBarrierResources(s, opName, barriers); !r.ok()) return r;
    if (barriers.empty()) return {};
    s.stream->commands.emplace_back(op::PipelineBarrier{std::move(barriers)});
    return {};
}

Result<void> CommandBuffer::beginSplitBarrier(std::uint32_t id, BarrierSet barriers) {
    constexpr const char* opName = "begin split barrier";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    if (id >= kPlannedSplitBase) {
        return reject(s, opName, "split barrier ids from 0x80000000 up are reserved");
    }
    if (s.openSplits.count(id) != 0) {
        return reject(s, opName, "split barrier " + std::to_string(id) + " is already open");
    }
    if (barriers.empty()) return reject(s, opName, "split barrier carries no barriers");
    if (auto r = checkBarrierResources(s, opName, barriers); !r.ok()) return r;

    s.stream->commands.emplace_back(op::SplitBarrierBegin{id, barriers});
    s.openSplits.emplace(id, std::move(barriers));
    return {};
}

Result<void> CommandBuffer::endSplitBarrier(std::uint32_t id) {
    constexpr const char* opName = "end split barrier";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireOutsidePass(s, opName); !r.ok()) return r;
    auto it = s.openSplits.find(id);
    if (it == s.openSplits.end()) {
        return reject(s, opName, "split barrier " + std::to_string(id) + " was never begun");
    }
    s.stream->commands.emplace_back(op::SplitBarrierEnd{id, std::move(it->second)});
    s.openSplits.erase(it);
    return {};
}

Result<void> CommandBuffer::executeCommands(const std::vector<const CommandBuffer*>& secondaries) {
    constexpr const char* opName = "execute commands";
    if (!state_) return emptyBuffer(opName);
    RecorderState& s = *state_;

    if (auto r = requireRecording(s, opName); !r.ok()) return r;
    if (s.level != CommandBufferLevel::Primary) {
        return reject(s, opName, "only primary buffers execute secondaries");
    }
    if (secondaries.empty()) return reject(s, opName, "no secondary buffers");

    const bool inPass = s.state == CommandBufferState::RenderPass;
    if (inPass && s.pass->contents != SubpassContents::SecondaryBuffers) {
        return reject(s, opName, "subpass " + std::to_string(s.pass->subpass) +
                                 " records inline; begin it with SecondaryBuffers contents");
    }

    op::ExecuteCommands cmd;
    for (const CommandBuffer* cb : secondaries) {
        if (!cb || !cb->state_) return reject(s, opName, "secondary buffer is null or empty");
        RecorderState& sec = *cb->state_;
        sec.refresh();
        if (sec.core != s.core) return reject(s, opName, "secondary buffer is from another device");
        if (sec.level != CommandBufferLevel::Secondary) {
            return reject(s, opName, "primary buffers cannot be executed as secondaries");
        }
        const bool pendingReuse = sec.state == CommandBufferState::Pending &&
                                  any(sec.usage & CommandBufferUsage::SimultaneousUse);
        if (sec.state != CommandBufferState::Executable && !pendingReuse) {
            return reject(s, opName, std::string("secondary buffer is ") + toString(sec.state) +
                                     ", not Executable");
        }
        if (inPass) {
            if (!sec.inherited || sec.inherited->renderPass != s.pass->renderPass ||
                sec.inherited->subpass != s.pass->subpass) {
                return reject(s, opName, "secondary buffer does not continue subpass " +
                                         std::to_string(s.pass->subpass) +
                                         " of the active render pass");
            }
        } else if (sec.inherited) {
            return reject(s, opName, "secondary buffer continues a render pass; execute it inside "
                                 "one");
        }
        cmd.secondaries.push_back(sec.stream);
    }

    for (const CommandBuffer* cb : secondaries) {
        const bool seen = std::any_of(s.executed.begin(), s.executed.end(),
                                      [&](const ExecutedSecondary& e) {
                                          return e.state == cb->state_;
                                      });
        if (!seen) s.executed.push_back(ExecutedSecondary{cb->state_, cb->state_->stream});
    }

    for (const auto& stream : cmd.secondaries) {
        for (Handle h : stream->resources) s.use(h);
        for (const auto& set : stream->descriptorSets) s.stream->descriptorSets.push_back(set);
    }
    s.stream->commands.emplace_back(std::move(cmd));

    // Secondaries leave the bound pipelines undefined.
    s.graphicsBound = false;
    s.computeBound  = false;
    return {};
}

} // namespace gfxhal

#include <gfxhal/device.hpp>
#include <gfxhal/pipeline.hpp>

#include "../core/device_core.hpp"

#include <string>
#include <utility>

namespace gfxhal {

namespace {

bool singleStage(ShaderStage stage) {
    const auto bits = static_cast<std::uint32_t>(stage);
    return bits != 0 && (bits & (bits - 1)) == 0;
}

// Releases translated modules when a pipeline build stops early or ends.
class ModuleGuard {
public:
    explicit ModuleGuard(ShaderTranslator& translator) : translator_(translator) {}
    ~ModuleGuard() {
        for (NativeHandle m : modules_) translator_.release(m);
    }
    ModuleGuard(const ModuleGuard&) = delete;
    ModuleGuard& operator=(const ModuleGuard&) = delete;

    void add(NativeHandle module) { modules_.push_back(module); }

private:
    ShaderTranslator&         translator_;
    std::vector<NativeHandle> modules_;
};

Result<NativeShaderStage> buildStage(detail::DeviceCore& core, ModuleGuard& guard,
                                     const PipelineLayout& layout, const ShaderSource& source) {
    auto translated = core.observed(core.native().translator().translate(source,
                                                                         layout.assignment()));
    if (!translated.ok()) return std::move(translated.error());
    guard.add(translated.value().module);

    auto remaps = core.allocator().remap(layout.assignment(), layout.sets(),
                                         translated.value().reflected, source.stage);
    if (!remaps.ok()) return std::move(remaps.error());

    NativeShaderStage stage;
    stage.stage      = source.stage;
    stage.module     = translated.value().module;
    stage.entryPoint = source.entryPoint;
    stage.remaps     = std::move(remaps).value();
    return stage;
}

Result<void> checkLayout(const detail::DeviceCore& core, const PipelineLayout* layout,
                         const char* operation) {
    if (!layout || !layout->valid() || !core.live(layout->handle())) {
        return Error{operation, ErrorCode::InvalidUsage, 0,
                     "pipeline layout is null, empty or destroyed"};
    }
    return {};
}

} // namespace

Result<Pipeline> Device::createGraphicsPipeline(const GraphicsPipelineDesc& desc) {
    constexpr const char* op = "create graphics pipeline";
    if (auto lost = core_->checkLost(op); !lost.ok()) return std::move(lost.error());
    if (auto r = checkLayout(*core_, desc.layout, op); !r.ok()) return std::move(r.error());

    if (!desc.renderPass || !desc.renderPass->valid() || !core_->live(desc.renderPass->handle())) {
        return Error{op, ErrorCode::InvalidUsage, 0, "render pass is null, empty or destroyed"};
    }
    if (desc.subpass >= desc.renderPass->subpassCount()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "subpass " + std::to_string(desc.subpass) + " does not exist"};
    }

    ShaderStage seen = ShaderStage::None;
    for (const auto& s : desc.stages) {
        if (!singleStage(s.stage) || s.stage == ShaderStage::Compute) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "each shader must name exactly one graphics stage"};
        }
        if (any(seen & s.stage)) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         std::string("two shaders for the ") + toString(s.stage) + " stage"};
        }
        seen |= s.stage;
    }
    if (!any(seen & ShaderStage::Vertex)) {
        return Error{op, ErrorCode::InvalidUsage, 0, "a graphics pipeline needs a vertex shader"};
    }

    const auto& subpass = desc.renderPass->desc().subpasses[desc.subpass];
    const auto colorCount = static_cast<std::uint32_t>(subpass.colors.size());
    if (!desc.blend.empty() && desc.blend.size() != colorCount) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     std::to_string(desc.blend.size()) + " blend states for " +
                         std::to_string(colorCount) + " color attachments"};
    }

    auto slots = core_->allocator().verifyRenderTargetSlots(desc.layout->assignment(), colorCount);
    if (!slots.ok()) return std::move(slots.error());

    ModuleGuard guard(core_->native().translator());

    NativeGraphicsPipelineDesc native;
    native.layout           = desc.layout->native();
    native.renderPass       = desc.renderPass->native();
    native.subpass          = desc.subpass;
    native.vertexBindings   = desc.vertexBindings;
    native.vertexAttributes = desc.vertexAttributes;
    native.raster           = desc.raster;
    native.depth            = desc.depth;
    native.blend            = desc.blend.empty() ? std::vector<BlendState>(colorCount)
                                                 : desc.blend;
    native.samples = 1;
    for (std::uint32_t c : subpass.colors) {
        if (c != UnusedAttachment) native.samples = desc.renderPass->desc().attachments[c].samples;
    }

    Pipeline p;
    for (const auto& source : desc.stages) {
        auto stage = buildStage(*core_, guard, *desc.layout, source);
        if (!stage.ok()) return std::move(stage.error());
        p.remaps_.emplace_back(source.stage, stage.value().remaps);
        native.stages.push_back(std::move(stage).value());
    }

    auto handle = core_->observed(core_->native().createGraphicsPipeline(native));
    if (!handle.ok()) return std::move(handle.error());

    static_cast<DeviceObject&>(p).attach(core_, ObjectKind::Pipeline, handle.value());
    p.bindPoint_  = PipelineBindPoint::Graphics;
    p.layout_     = desc.layout->handle();
    p.renderPass_ = desc.renderPass->handle();
    p.subpass_    = desc.subpass;
    return p;
}

Result<Pipeline> Device::createComputePipeline(const ComputePipelineDesc& desc) {
    constexpr const char* op = "create compute pipeline";
    if (auto lost = core_->checkLost(op); !lost.ok()) return std::move(lost.error());
    if (auto r = checkLayout(*core_, desc.layout, op); !r.ok()) return std::move(r.error());

    if (desc.shader.stage != ShaderStage::Compute) {
        return Error{op, ErrorCode::InvalidUsage, 0, "a compute pipeline needs a compute shader"};
    }

    ModuleGuard guard(core_->native().translator());

    auto stage = buildStage(*core_, guard, *desc.layout, desc.shader);
    if (!stage.ok()) return std::move(stage.error());

    Pipeline p;
    p.remaps_.emplace_back(ShaderStage::Compute, stage.value().remaps);

    NativeComputePipelineDesc native;
    native.layout = desc.layout->native();
    native.stage  = std::move(stage).value();

    auto handle = core_->observed(core_->native().createComputePipeline(native));
    if (!handle.ok()) return std::move(handle.error());

    static_cast<DeviceObject&>(p).attach(core_, ObjectKind::Pipeline, handle.value());
    p.bindPoint_ = PipelineBindPoint::Compute;
    p.layout_    = desc.layout->handle();
    return p;
}

} // namespace gfxhal

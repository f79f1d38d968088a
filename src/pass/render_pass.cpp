#include <gfxhal/device.hpp>
#include <gfxhal/render_pass.hpp>

#include "../core/device_core.hpp"

#include <string>
#include <utility>

namespace gfxhal {

namespace {

PlannerOptions plannerOptionsFor(const AdapterFeatures& features) {
    PlannerOptions options;
    options.implicitEntryExit          = features.implicitPassTransitions;
    options.implicitSubpassTransitions = features.implicitPassTransitions;
    options.splitBarriers              = features.splitBarriers;
    return options;
}

} // namespace

Result<RenderPass> Device::createRenderPass(const RenderPassDesc& desc) {
    if (auto lost = core_->checkLost("create render pass"); !lost.ok())
        return std::move(lost.error());

    const AdapterInfo& adapter = core_->adapter();
    for (const auto& subpass : desc.subpasses) {
        if (subpass.colors.size() > adapter.limits.maxColorAttachments) {
            return Error{"create render pass", ErrorCode::TooManyObjects, 0,
                         std::to_string(subpass.colors.size()) +
                             " color attachments exceed the adapter limit of " +
                             std::to_string(adapter.limits.maxColorAttachments)};
        }
    }
    for (std::size_t i = 0; i < desc.attachments.size(); ++i) {
        const Format format = desc.attachments[i].format;
        const FormatFeature needed =
            isDepthFormat(format) ? FormatFeature::DepthStencil : FormatFeature::ColorTarget;
        if (!supports(adapter.backend, format, needed)) {
            return Error{"create render pass", ErrorCode::UnsupportedFormat, 0,
                         "attachment " + std::to_string(i) + " (" + toString(format) +
                             ") cannot be rendered to on " + toString(adapter.backend)};
        }
    }

    auto plan = planRenderPass(desc, plannerOptionsFor(adapter.features));
    if (!plan.ok()) return std::move(plan.error());

    auto split = validateSplitPairs(plan.value());
    if (!split.ok()) return std::move(split.error());

    auto native = core_->observed(core_->native().createRenderPass(desc, plan.value()));
    if (!native.ok()) return std::move(native.error());

    RenderPass rp;
    static_cast<DeviceObject&>(rp).attach(core_, ObjectKind::RenderPass, native.value());
    rp.desc_ = std::make_shared<const RenderPassDesc>(desc);
    rp.plan_ = std::make_shared<const RenderPassPlan>(std::move(plan).value());
    return rp;
}

Result<Framebuffer> Device::createFramebuffer(const RenderPass& renderPass,
                                              const std::vector<const Image*>& attachments,
                                              Extent2D extent, std::uint32_t layers) {
    if (auto lost = core_->checkLost("create framebuffer"); !lost.ok())
        return std::move(lost.error());

    if (!renderPass.valid() || !core_->live(renderPass.handle())) {
        return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                     "render pass is empty or destroyed"};
    }
    const RenderPassDesc& desc = renderPass.desc();
    if (attachments.size() != desc.attachments.size()) {
        return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                     "render pass declares " + std::to_string(desc.attachments.size()) +
                         " attachments, " + std::to_string(attachments.size()) + " given"};
    }
    if (extent.width == 0 || extent.height == 0 || layers == 0) {
        return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                     "framebuffer extent and layer count must be non-zero"};
    }

    std::vector<ResourceRef> refs;
    refs.reserve(attachments.size());
    for (std::size_t i = 0; i < attachments.size(); ++i) {
        const Image* image = attachments[i];
        if (!image || !image->valid() || !core_->live(image->handle())) {
            return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                         "attachment " + std::to_string(i) + " is empty or destroyed"};
        }
        if (image->format() != desc.attachments[i].format ||
            image->desc().samples != desc.attachments[i].samples) {
            return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                         "attachment " + std::to_string(i) + " is " + toString(image->format()) +
                             " x" + std::to_string(image->desc().samples) +
                             " but the render pass expects " +
                             toString(desc.attachments[i].format) + " x" +
                             std::to_string(desc.attachments[i].samples)};
        }
        if (image->extent().width < extent.width || image->extent().height < extent.height ||
            image->desc().arrayLayers < layers) {
            return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                         "attachment " + std::to_string(i) + " is smaller than the framebuffer"};
        }
        refs.push_back(image->ref());
    }

    auto native = core_->observed(
        core_->native().createFramebuffer(renderPass.native(), refs, extent, layers));
    if (!native.ok()) return std::move(native.error());

    Framebuffer fb;
    static_cast<DeviceObject&>(fb).attach(core_, ObjectKind::Framebuffer, native.value());
    fb.renderPass_  = renderPass.handle();
    fb.attachments_ = std::move(refs);
    fb.extent_      = extent;
    fb.layers_      = layers;
    return fb;
}

} // namespace gfxhal

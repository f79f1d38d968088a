#include "device.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gfxhal::vulkan::detail {

namespace {

std::optional<ImageLayout> layoutAt(const RenderPassPlan& plan, std::size_t subpass,
                                    std::uint32_t attachment) {
    if (subpass >= plan.layouts.size() || attachment >= plan.layouts[subpass].size()) {
        return std::nullopt;
    }
    return plan.layouts[subpass][attachment];
}

bool contains(const std::vector<std::uint32_t>& list, std::uint32_t value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

struct Dependency {
    std::uint32_t      src = VK_SUBPASS_EXTERNAL;
    std::uint32_t      dst = VK_SUBPASS_EXTERNAL;
    VkMemoryBarrier2   barrier{};
    VkDependencyFlags  flags = 0;
};

Dependency dependency(std::uint32_t src, std::uint32_t dst, ImageLayout from, ImageLayout to,
                      VkDependencyFlags flags) {
    const LayoutUsage before = usageOf(from);
    const LayoutUsage after  = usageOf(to);

    Dependency d;
    d.src                   = src;
    d.dst                   = dst;
    d.flags                 = flags;
    d.barrier.sType         = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
    d.barrier.srcStageMask  = toVk(before.stages);
    d.barrier.srcAccessMask = toVk(before.access & kWriteAccess);
    d.barrier.dstStageMask  = toVk(after.stages);
    d.barrier.dstAccessMask = toVk(after.access);
    return d;
}

} // namespace

// Attachment layouts come from the plan. Transitions the plan leaves to the
// pass (implicitEntry, implicitExit, and every inter-subpass one) are
// expressed as attachment layouts plus subpass dependencies.
Result<NativeHandle> VulkanDevice::createRenderPass(const RenderPassDesc& desc,
                                                    const RenderPassPlan& plan) {
    constexpr const char* op = "create render pass";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    const std::size_t subpassCount = desc.subpasses.size();

    std::vector<VkAttachmentDescription2> attachments;
    std::vector<Dependency>               dependencies;
    attachments.reserve(desc.attachments.size());

    for (std::uint32_t a = 0; a < desc.attachments.size(); ++a) {
        const AttachmentDesc& ad = desc.attachments[a];

        std::optional<std::size_t> first;
        std::optional<std::size_t> last;
        std::optional<ImageLayout> previous;
        for (std::size_t s = 0; s < subpassCount; ++s) {
            auto layout = layoutAt(plan, s, a);
            if (!layout) continue;
            if (!first) first = s;
            if (last && previous) {
                dependencies.push_back(dependency(static_cast<std::uint32_t>(*last),
                                                  static_cast<std::uint32_t>(s), *previous,
                                                  *layout, VK_DEPENDENCY_BY_REGION_BIT));
            }
            last     = s;
            previous = layout;
        }

        const bool implicitEntry = contains(plan.implicitEntry, a);
        const bool implicitExit  = contains(plan.implicitExit, a);
        const ImageLayout firstLayout = first ? *layoutAt(plan, *first, a) : ad.initialLayout;
        const ImageLayout lastLayout  = last ? *layoutAt(plan, *last, a) : ad.finalLayout;

        VkAttachmentDescription2 vd{};
        vd.sType          = VK_STRUCTURE_TYPE_ATTACHMENT_DESCRIPTION_2;
        vd.format         = toVk(ad.format);
        vd.samples        = toVkSamples(ad.samples);
        vd.loadOp         = toVk(ad.load);
        vd.storeOp        = toVk(ad.store);
        vd.stencilLoadOp  = toVk(ad.stencilLoad);
        vd.stencilStoreOp = toVk(ad.stencilStore);
        vd.initialLayout  = toVk(implicitEntry || !first ? ad.initialLayout : firstLayout);
        vd.finalLayout    = toVk(implicitExit || !last ? ad.finalLayout : lastLayout);
        attachments.push_back(vd);

        if (implicitEntry && first) {
            dependencies.push_back(dependency(VK_SUBPASS_EXTERNAL,
                                              static_cast<std::uint32_t>(*first),
                                              ad.initialLayout, firstLayout, 0));
        }
        if (implicitExit && last) {
            dependencies.push_back(dependency(static_cast<std::uint32_t>(*last),
                                              VK_SUBPASS_EXTERNAL, lastLayout, ad.finalLayout, 0));
        }
    }

    auto reference = [&](std::size_t s, std::uint32_t a, ImageLayout fallback) {
        VkAttachmentReference2 ref{};
        ref.sType      = VK_STRUCTURE_TYPE_ATTACHMENT_REFERENCE_2;
        ref.attachment = a;
        if (a == UnusedAttachment) {
            ref.attachment = VK_ATTACHMENT_UNUSED;
            ref.layout     = VK_IMAGE_LAYOUT_UNDEFINED;
            return ref;
        }
        ref.layout = toVk(layoutAt(plan, s, a).value_or(fallback));
        return ref;
    };

    // Reference arrays must stay put once the subpass descriptions point at them.
    std::vector<std::vector<VkAttachmentReference2>> colors(subpassCount);
    std::vector<std::vector<VkAttachmentReference2>> inputs(subpassCount);
    std::vector<std::vector<VkAttachmentReference2>> resolves(subpassCount);
    std::vector<VkAttachmentReference2>              depths(subpassCount);

    for (std::size_t s = 0; s < subpassCount; ++s) {
        const SubpassDesc& sd = desc.subpasses[s];
        for (std::uint32_t a : sd.colors) {
            colors[s].push_back(reference(s, a, ImageLayout::ColorAttachment));
        }
        for (std::uint32_t a : sd.resolves) {
            resolves[s].push_back(reference(s, a, ImageLayout::ColorAttachment));
        }
        for (std::uint32_t a : sd.inputs) {
            auto ref       = reference(s, a, ImageLayout::ShaderReadOnly);
            ref.aspectMask = aspectsOf(desc.attachments[a].format);
            inputs[s].push_back(ref);
        }
        if (sd.depthStencil) {
            depths[s] = reference(s, *sd.depthStencil,
                                  sd.depthReadOnly ? ImageLayout::DepthStencilReadOnly
                                                   : ImageLayout::DepthStencilAttachment);
        }
    }

    std::vector<VkSubpassDescription2> subpasses(subpassCount);
    for (std::size_t s = 0; s < subpassCount; ++s) {
        const SubpassDesc& sd = desc.subpasses[s];
        VkSubpassDescription2& vs = subpasses[s];
        vs.sType                   = VK_STRUCTURE_TYPE_SUBPASS_DESCRIPTION_2;
        vs.pipelineBindPoint       = VK_PIPELINE_BIND_POINT_GRAPHICS;
        vs.colorAttachmentCount    = static_cast<std::uint32_t>(colors[s].size());
        vs.pColorAttachments       = colors[s].data();
        vs.pResolveAttachments     = resolves[s].empty() ? nullptr : resolves[s].data();
        vs.inputAttachmentCount    = static_cast<std::uint32_t>(inputs[s].size());
        vs.pInputAttachments       = inputs[s].data();
        vs.pDepthStencilAttachment = sd.depthStencil ? &depths[s] : nullptr;
        vs.preserveAttachmentCount = static_cast<std::uint32_t>(sd.preserves.size());
        vs.pPreserveAttachments    = sd.preserves.data();
    }

    // Stage masks live in the chained VkMemoryBarrier2.
    std::vector<VkSubpassDependency2> vkDependencies;
    vkDependencies.reserve(dependencies.size());
    for (const auto& d : dependencies) {
        VkSubpassDependency2 vd{};
        vd.sType           = VK_STRUCTURE_TYPE_SUBPASS_DEPENDENCY_2;
        vd.pNext           = &d.barrier;
        vd.srcSubpass      = d.src;
        vd.dstSubpass      = d.dst;
        vd.dependencyFlags = d.flags;
        vkDependencies.push_back(vd);
    }

    VkRenderPassCreateInfo2 ci{};
    ci.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO_2;
    ci.attachmentCount = static_cast<std::uint32_t>(attachments.size());
    ci.pAttachments    = attachments.data();
    ci.subpassCount    = static_cast<std::uint32_t>(subpasses.size());
    ci.pSubpasses      = subpasses.data();
    ci.dependencyCount = static_cast<std::uint32_t>(vkDependencies.size());
    ci.pDependencies   = vkDependencies.data();

    auto record  = std::make_shared<PassRecord>();
    record->desc = desc;
    VkResult vr  = vkCreateRenderPass2(device_, &ci, nullptr, &record->pass);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateRenderPass2 failed");
    return passes_.insert(std::move(record));
}

Result<NativeHandle> VulkanDevice::createFramebuffer(NativeHandle renderPass,
                                                     const std::vector<ResourceRef>& attachments,
                                                     Extent2D extent, std::uint32_t layers) {
    constexpr const char* op = "create framebuffer";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    auto pass = passes_.get(renderPass);
    if (!pass) return Error{op, ErrorCode::InvalidUsage, 0, "unknown render pass"};

    std::vector<VkImageView> views;
    views.reserve(attachments.size());
    for (const auto& ref : attachments) {
        auto img = images_.get(ref.native);
        if (!img || img->view == VK_NULL_HANDLE) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "attachment " + std::to_string(views.size()) + " has no bound image"};
        }
        views.push_back(img->view);
    }

    VkFramebufferCreateInfo ci{};
    ci.sType           = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    ci.renderPass      = pass->pass;
    ci.attachmentCount = static_cast<std::uint32_t>(views.size());
    ci.pAttachments    = views.data();
    ci.width           = extent.width;
    ci.height          = extent.height;
    ci.layers          = layers;

    VkFramebuffer framebuffer = VK_NULL_HANDLE;
    VkResult vr = vkCreateFramebuffer(device_, &ci, nullptr, &framebuffer);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateFramebuffer failed");
    return toNative(framebuffer);
}

Result<NativeHandle> VulkanDevice::createGraphicsPipeline(const NativeGraphicsPipelineDesc& desc) {
    constexpr const char* op = "create graphics pipeline";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    auto layout = layouts_.get(desc.layout);
    auto pass   = passes_.get(desc.renderPass);
    if (!layout || !pass) return Error{op, ErrorCode::InvalidUsage, 0, "unknown layout or render pass"};
    if (desc.subpass >= pass->desc.subpasses.size()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "subpass " + std::to_string(desc.subpass) + " does not exist"};
    }
    if (desc.raster.wireframe && !wireframe_) {
        return Error{op, ErrorCode::UnsupportedUsage, 0,
                     "wireframe rasterization needs fillModeNonSolid"};
    }

    std::vector<VkPipelineShaderStageCreateInfo> stages;
    stages.reserve(desc.stages.size());
    for (const auto& s : desc.stages) {
        VkPipelineShaderStageCreateInfo si{};
        si.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        si.stage  = toVkStage(s.stage);
        si.module = fromNative<VkShaderModule>(s.module);
        si.pName  = s.entryPoint.c_str();
        stages.push_back(si);
    }

    std::vector<VkVertexInputBindingDescription> bindings;
    for (const auto& b : desc.vertexBindings) {
        bindings.push_back({b.binding, b.stride,
                            b.rate == VertexRate::Instance ? VK_VERTEX_INPUT_RATE_INSTANCE
                                                           : VK_VERTEX_INPUT_RATE_VERTEX});
    }
    std::vector<VkVertexInputAttributeDescription> attributes;
    for (const auto& a : desc.vertexAttributes) {
        attributes.push_back({a.location, a.binding, toVk(a.format), a.offset});
    }

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType                           = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInput.vertexBindingDescriptionCount   = static_cast<std::uint32_t>(bindings.size());
    vertexInput.pVertexBindingDescriptions      = bindings.data();
    vertexInput.vertexAttributeDescriptionCount = static_cast<std::uint32_t>(attributes.size());
    vertexInput.pVertexAttributeDescriptions    = attributes.data();

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType    = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = toVk(desc.raster.topology);

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount  = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType       = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = desc.raster.wireframe ? VK_POLYGON_MODE_LINE : VK_POLYGON_MODE_FILL;
    rasterizer.cullMode    = toVk(desc.raster.cullMode);
    rasterizer.frontFace   = toVk(desc.raster.frontFace);
    rasterizer.lineWidth   = 1.0f;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = toVkSamples(desc.samples);

    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType            = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable  = desc.depth.test ? VK_TRUE : VK_FALSE;
    depthStencil.depthWriteEnable = desc.depth.write ? VK_TRUE : VK_FALSE;
    depthStencil.depthCompareOp   = toVk(desc.depth.compare);

    // One blend state per color attachment of the subpass.
    const std::size_t colorCount = pass->desc.subpasses[desc.subpass].colors.size();
    std::vector<VkPipelineColorBlendAttachmentState> blendAttachments(colorCount);
    for (std::size_t i = 0; i < colorCount; ++i) {
        VkPipelineColorBlendAttachmentState& ba = blendAttachments[i];
        ba.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                            VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
        if (i < desc.blend.size() && desc.blend[i].enable) {
            ba.blendEnable         = VK_TRUE;
            ba.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
            ba.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            ba.colorBlendOp        = VK_BLEND_OP_ADD;
            ba.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            ba.dstAlphaBlendFactor = VK_BLEND_FACTOR_ZERO;
            ba.alphaBlendOp        = VK_BLEND_OP_ADD;
        }
    }

    VkPipelineColorBlendStateCreateInfo colorBlending{};
    colorBlending.sType           = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlending.attachmentCount = static_cast<std::uint32_t>(blendAttachments.size());
    colorBlending.pAttachments    = blendAttachments.data();

    std::array<VkDynamicState, 2> dynamicStates = {
        VK_DYNAMIC_STATE_VIEWPORT,
        VK_DYNAMIC_STATE_SCISSOR,
    };
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType             = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = static_cast<std::uint32_t>(dynamicStates.size());
    dynamicState.pDynamicStates    = dynamicStates.data();

    VkGraphicsPipelineCreateInfo pipelineCI{};
    pipelineCI.sType               = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineCI.stageCount          = static_cast<std::uint32_t>(stages.size());
    pipelineCI.pStages             = stages.data();
    pipelineCI.pVertexInputState   = &vertexInput;
    pipelineCI.pInputAssemblyState = &inputAssembly;
    pipelineCI.pViewportState      = &viewportState;
    pipelineCI.pRasterizationState = &rasterizer;
    pipelineCI.pMultisampleState   = &multisampling;
    pipelineCI.pDepthStencilState  = &depthStencil;
    pipelineCI.pColorBlendState    = &colorBlending;
    pipelineCI.pDynamicState       = &dynamicState;
    pipelineCI.layout              = layout->layout;
    pipelineCI.renderPass          = pass->pass;
    pipelineCI.subpass             = desc.subpass;

    VkPipeline pipeline = VK_NULL_HANDLE;
    VkResult vr = vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipelineCI, nullptr,
                                            &pipeline);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateGraphicsPipelines failed");
    return toNative(pipeline);
}

Result<NativeHandle> VulkanDevice::createComputePipeline(const NativeComputePipelineDesc& desc) {
    constexpr const char* op = "create compute pipeline";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    auto layout = layouts_.get(desc.layout);
    if (!layout) return Error{op, ErrorCode::InvalidUsage, 0, "unknown pipeline layout"};

    VkComputePipelineCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    ci.stage.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    ci.stage.stage  = VK_SHADER_STAGE_COMPUTE_BIT;
    ci.stage.module = fromNative<VkShaderModule>(desc.stage.module);
    ci.stage.pName  = desc.stage.entryPoint.c_str();
    ci.layout       = layout->layout;

    VkPipeline pipeline = VK_NULL_HANDLE;
    VkResult vr = vkCreateComputePipelines(device_, VK_NULL_HANDLE, 1, &ci, nullptr, &pipeline);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateComputePipelines failed");
    return toNative(pipeline);
}

} // namespace gfxhal::vulkan::detail

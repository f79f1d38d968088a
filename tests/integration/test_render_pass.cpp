#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <array>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <vector>

using gfxhal::AttachmentDesc;
using gfxhal::Backend;
using gfxhal::BarrierTiming;
using gfxhal::Buffer;
using gfxhal::BufferDesc;
using gfxhal::BufferImageCopy;
using gfxhal::BufferUsage;
using gfxhal::ClearValue;
using gfxhal::CommandBuffer;
using gfxhal::CompareOp;
using gfxhal::DescriptorKind;
using gfxhal::DescriptorPoolDesc;
using gfxhal::DescriptorPoolSize;
using gfxhal::DescriptorSetLayoutBuilder;
using gfxhal::DescriptorWrite;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::Extent2D;
using gfxhal::Format;
using gfxhal::FormatFeature;
using gfxhal::GraphicsPipelineDesc;
using gfxhal::Image;
using gfxhal::ImageDesc;
using gfxhal::ImageDescriptor;
using gfxhal::ImageLayout;
using gfxhal::MemoryUsage;
using gfxhal::PipelineBindPoint;
using gfxhal::PushConstantRange;
using gfxhal::ReflectedBinding;
using gfxhal::Rect2D;
using gfxhal::RenderPassDesc;
using gfxhal::ShaderSource;
using gfxhal::ShaderStage;
using gfxhal::SubmitInfo;
using gfxhal::SubpassDesc;
namespace soft = gfxhal::soft;

namespace {

constexpr std::uint32_t kSize = 16;

// Fragment push block for the depth scene.
struct Fragment {
    std::array<float, 4> color;
    float                depth;
};

void addPrograms(soft::ProgramLibrary& programs) {
    programs.add("fullscreen_vs",
                 soft::Program{ShaderStage::Vertex, {}, [](soft::Invocation&) {}});

    // Encodes the pixel coordinate so the lighting pass can check it read
    // the right texel.
    programs.add("gbuffer_fs", soft::Program{ShaderStage::Fragment, {}, [](soft::Invocation& inv) {
        const auto px = inv.pixel();
        inv.setColor(0, {static_cast<float>(px[0] * 17) / 255.0f,
                         static_cast<float>(px[1] * 17) / 255.0f, 0.0f, 1.0f});
    }});

    programs.add("lighting_fs", soft::Program{
        ShaderStage::Fragment,
        {ReflectedBinding{"gbuffer", 0, 0, DescriptorKind::InputAttachment, 1, false}},
        [](soft::Invocation& inv) {
            const soft::Color g = inv.input("gbuffer");
            inv.setColor(0, {g[1], g[0], 1.0f, 1.0f});
        }});

    ReflectedBinding push;
    push.name         = "fragment";
    push.pushConstant = true;
    programs.add("depth_fs", soft::Program{ShaderStage::Fragment, {push}, [](soft::Invocation& inv) {
        inv.setDepth(inv.push<float>(16));
        inv.setColor(0, {inv.push<float>(0), inv.push<float>(4), inv.push<float>(8),
                         inv.push<float>(12)});
    }});
    programs.add("veil_fs", soft::Program{ShaderStage::Fragment, {}, [](soft::Invocation& inv) {
        inv.setColor(0, {1.0f, 1.0f, 1.0f, 0.5f});
    }});
}

Device makeDevice(soft::AdapterConfig adapter) {
    soft::InstanceConfig config;
    config.adapters = {std::move(adapter)};
    addPrograms(*config.programs);

    auto instance = gfxhal::InstanceBuilder(soft::createInstance(std::move(config)))
                        .appName("test_render_pass")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto device = gfxhal::DeviceBuilder(instance.value().adapters()[0]).build();
    assert(device.ok());
    return std::move(device).value();
}

Image makeImage(Device& device, Format format, FormatFeature usage) {
    auto image = device.createImage(ImageDesc{{kSize, kSize, 1}, format, 1, 1, 1, usage},
                                    MemoryUsage::GpuOnly);
    assert(image.ok());
    return std::move(image).value();
}

Buffer makeReadback(Device& device) {
    auto buffer = device.createBuffer(BufferDesc{kSize * kSize * 4, BufferUsage::TransferDst},
                                      MemoryUsage::Readback);
    assert(buffer.ok());
    return std::move(buffer).value();
}

void submitAndWait(Device& device, CommandBuffer& cb) {
    auto fence = device.createFence();
    assert(fence.ok());
    assert(device.queue(0).submit(SubmitInfo{{&cb}, {}, {}, &fence.value()}).ok());
    assert(fence.value().wait().ok());
}

GraphicsPipelineDesc pipelineDesc(const gfxhal::PipelineLayout& layout,
                                  const gfxhal::RenderPass& renderPass, std::uint32_t subpass,
                                  const char* fragment) {
    GraphicsPipelineDesc p;
    p.layout     = &layout;
    p.renderPass = &renderPass;
    p.subpass    = subpass;
    p.stages     = {ShaderSource::fromText(ShaderStage::Vertex, "fullscreen_vs"),
                    ShaderSource::fromText(ShaderStage::Fragment, fragment)};
    return p;
}

const std::uint8_t* pixelAt(const void* base, std::uint32_t x, std::uint32_t y) {
    return static_cast<const std::uint8_t*>(base) + (y * kSize + x) * 4;
}

// A geometry subpass writes a G-buffer; a lighting subpass reads it back as an
// input attachment and writes the output image.
void runDeferred(Device& device, bool implicitTransitions) {
    RenderPassDesc desc;
    AttachmentDesc gbuffer;
    gbuffer.finalLayout = ImageLayout::ShaderReadOnly;
    AttachmentDesc output;
    output.finalLayout = ImageLayout::TransferSrc;
    desc.attachments   = {gbuffer, output};
    SubpassDesc geometry;
    geometry.colors = {0};
    SubpassDesc lighting;
    lighting.colors = {1};
    lighting.inputs = {0};
    desc.subpasses  = {geometry, lighting};

    auto renderPass = device.createRenderPass(desc);
    assert(renderPass.ok());
    const gfxhal::RenderPassPlan& plan = renderPass.value().plan();
    if (implicitTransitions) {
        assert(plan.barrierCount() == 0);
        assert(plan.implicitEntry.size() == 2);
        assert(plan.implicitExit.size() == 1);
    } else {
        // Two entry transitions, the G-buffer hand-off and the output's exit.
        assert(plan.entry.size() == 2);
        assert(plan.exit.size() == 1);
        assert(plan.interSubpassBarrierCount() == 1);
        assert(plan.barrierCount() == 4);
        assert(plan.subpasses[0].after.size() == 1);
        assert(plan.subpasses[0].after[0].timing == BarrierTiming::SplitBegin);
        assert(plan.subpasses[0].after[0].newLayout == ImageLayout::ShaderReadOnly);
        assert(plan.subpasses[1].before.size() == 1);
        assert(plan.subpasses[1].before[0].timing == BarrierTiming::SplitEnd);
    }
    assert(plan.layouts[1][0] == ImageLayout::ShaderReadOnly);
    assert(!plan.layouts[0][1].has_value());

    Image gbufferImage = makeImage(device, Format::R8G8B8A8Unorm,
                                   FormatFeature::ColorTarget | FormatFeature::InputAttachment);
    Image outputImage  = makeImage(device, Format::R8G8B8A8Unorm,
                                   FormatFeature::ColorTarget | FormatFeature::TransferSrc);
    auto framebuffer = device.createFramebuffer(renderPass.value(), {&gbufferImage, &outputImage},
                                                Extent2D{kSize, kSize});
    assert(framebuffer.ok());

    auto setLayout = DescriptorSetLayoutBuilder().inputAttachment(0).build();
    assert(setLayout.ok());
    auto geometryLayout = device.createPipelineLayout({});
    auto lightingLayout = device.createPipelineLayout({setLayout.value()});
    assert(geometryLayout.ok() && lightingLayout.ok());
    auto geometryPipeline = device.createGraphicsPipeline(
        pipelineDesc(geometryLayout.value(), renderPass.value(), 0, "gbuffer_fs"));
    auto lightingPipeline = device.createGraphicsPipeline(
        pipelineDesc(lightingLayout.value(), renderPass.value(), 1, "lighting_fs"));
    assert(geometryPipeline.ok() && lightingPipeline.ok());

    // A pipeline only runs in the subpass it was built for.
    auto wrongSubpass = device.createGraphicsPipeline(
        pipelineDesc(lightingLayout.value(), renderPass.value(), 2, "lighting_fs"));
    assert(!wrongSubpass.ok());

    auto pool = device.createDescriptorPool(
        DescriptorPoolDesc{1, {DescriptorPoolSize{DescriptorKind::InputAttachment, 1}}});
    assert(pool.ok());
    auto set = pool.value().allocate(setLayout.value());
    assert(set.ok());
    assert(device
               .writeDescriptorSets({DescriptorWrite{
                   &set.value(), 0, 0,
                   {ImageDescriptor{gbufferImage.ref(), ImageLayout::ShaderReadOnly}}}})
               .ok());

    Buffer readback = makeReadback(device);
    auto commands   = device.createCommandPool(0);
    assert(commands.ok());
    auto cmd = commands.value().allocate();
    assert(cmd.ok());
    CommandBuffer& cb = cmd.value();

    const Rect2D area{0, 0, {kSize, kSize}};
    const std::vector<ClearValue> clears = {ClearValue::rgba(0.0f, 0.0f, 0.0f, 0.0f),
                                            ClearValue::rgba(0.0f, 0.0f, 0.0f, 0.0f)};

    // The lighting pipeline does not match subpass 0.
    assert(cb.begin().ok());
    assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
    assert(cb.bindPipeline(lightingPipeline.value()).ok());
    auto early = cb.draw(3);
    assert(!early.ok() && early.error().code == ErrorCode::InvalidUsage);
    assert(cb.poisoned());
    assert(cb.reset().ok());

    // Recorded twice: the second frame starts from the first one's final layouts.
    for (int frame = 0; frame < 2; ++frame) {
        assert(cb.begin().ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
        assert(cb.bindPipeline(geometryPipeline.value()).ok());
        assert(cb.draw(3).ok());
        assert(cb.nextSubpass().ok());
        assert(cb.subpass() == 1);
        assert(cb.bindPipeline(lightingPipeline.value()).ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Graphics, lightingLayout.value(), 0,
                                     {&set.value()})
                   .ok());
        assert(cb.draw(3).ok());
        assert(cb.endRenderPass().ok());
        assert(cb.copyImageToBuffer(outputImage, ImageLayout::TransferSrc, readback,
                                    {BufferImageCopy{0, 0, 0, 0, 0, 1, {}, {kSize, kSize, 1}}})
                   .ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);
    }

    auto mapped = readback.map();
    assert(mapped.ok());
    for (std::uint32_t y = 0; y < kSize; ++y) {
        for (std::uint32_t x = 0; x < kSize; ++x) {
            const std::uint8_t* p = pixelAt(mapped.value(), x, y);
            assert(p[0] == y * 17 && p[1] == x * 17 && p[2] == 255 && p[3] == 255);
        }
    }
    readback.unmap();

    auto* hooks = soft::hooks(device.native());
    assert(hooks->layoutErrors() == 0);
    assert(hooks->bindingErrors() == 0);
    assert(hooks->imageLayout(outputImage.native()) == ImageLayout::TransferSrc);
    assert(hooks->imageLayout(gbufferImage.native()) == ImageLayout::ShaderReadOnly);
}

// Depth test, scissor and blending in one subpass.
void runDepthBlend(Device& device) {
    RenderPassDesc desc;
    AttachmentDesc color;
    color.finalLayout = ImageLayout::TransferSrc;
    AttachmentDesc depth;
    depth.format      = Format::D32Sfloat;
    depth.store       = gfxhal::StoreOp::DontCare;
    depth.finalLayout = ImageLayout::DepthStencilAttachment;
    desc.attachments  = {color, depth};
    SubpassDesc subpass;
    subpass.colors       = {0};
    subpass.depthStencil = 1;
    desc.subpasses       = {subpass};

    auto renderPass = device.createRenderPass(desc);
    assert(renderPass.ok());
    assert(renderPass.value().plan().layouts[0][1] == ImageLayout::DepthStencilAttachment);

    Image colorImage = makeImage(device, Format::R8G8B8A8Unorm,
                                 FormatFeature::ColorTarget | FormatFeature::TransferSrc);
    Image depthImage = makeImage(device, Format::D32Sfloat, FormatFeature::DepthStencil);
    auto framebuffer = device.createFramebuffer(renderPass.value(), {&colorImage, &depthImage},
                                                Extent2D{kSize, kSize});
    assert(framebuffer.ok());

    auto layout = device.createPipelineLayout(
        {}, {PushConstantRange{ShaderStage::Fragment, 0, sizeof(Fragment)}});
    assert(layout.ok());

    GraphicsPipelineDesc depthDesc = pipelineDesc(layout.value(), renderPass.value(), 0, "depth_fs");
    depthDesc.depth.test    = true;
    depthDesc.depth.write   = true;
    depthDesc.depth.compare = CompareOp::Less;
    auto depthPipeline = device.createGraphicsPipeline(depthDesc);
    assert(depthPipeline.ok());

    GraphicsPipelineDesc veilDesc = pipelineDesc(layout.value(), renderPass.value(), 0, "veil_fs");
    veilDesc.blend = {gfxhal::BlendState{true}};
    auto veilPipeline = device.createGraphicsPipeline(veilDesc);
    assert(veilPipeline.ok());

    GraphicsPipelineDesc badBlend = veilDesc;
    badBlend.blend = {gfxhal::BlendState{true}, gfxhal::BlendState{false}};
    auto mismatch = device.createGraphicsPipeline(badBlend);
    assert(!mismatch.ok() && mismatch.error().code == ErrorCode::InvalidUsage);

    Buffer readback = makeReadback(device);
    auto commands   = device.createCommandPool(0);
    assert(commands.ok());
    auto cmd = commands.value().allocate();
    assert(cmd.ok());
    CommandBuffer& cb = cmd.value();

    const Rect2D full{0, 0, {kSize, kSize}};
    const Rect2D left{0, 0, {kSize / 2, kSize}};
    const Rect2D right{static_cast<std::int32_t>(kSize / 2), 0, {kSize / 2, kSize}};
    const Rect2D top{0, 0, {kSize, 4}};
    auto drawFragment = [&](const Rect2D& scissor, const Fragment& f) {
        assert(cb.setScissor(scissor).ok());
        assert(cb.pushConstants(layout.value(), ShaderStage::Fragment, 0, &f, sizeof(f)).ok());
        assert(cb.draw(3).ok());
    };

    assert(cb.begin().ok());
    assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), full,
                              {ClearValue::rgba(0.0f, 0.0f, 0.0f, 1.0f),
                               ClearValue::depthStencil(1.0f)})
               .ok());
    assert(cb.bindPipeline(depthPipeline.value()).ok());
    drawFragment(full, Fragment{{1.0f, 0.0f, 0.0f, 1.0f}, 0.5f});
    drawFragment(left, Fragment{{0.0f, 1.0f, 0.0f, 1.0f}, 0.7f}); // behind: rejected
    drawFragment(right, Fragment{{0.0f, 0.0f, 1.0f, 1.0f}, 0.3f});
    assert(cb.bindPipeline(veilPipeline.value()).ok());
    assert(cb.setScissor(top).ok());
    assert(cb.draw(3).ok());
    assert(cb.endRenderPass().ok());
    assert(cb.copyImageToBuffer(colorImage, ImageLayout::TransferSrc, readback,
                                {BufferImageCopy{0, 0, 0, 0, 0, 1, {}, {kSize, kSize, 1}}})
               .ok());
    assert(cb.finish().ok());
    submitAndWait(device, cb);

    auto mapped = readback.map();
    assert(mapped.ok());
    for (std::uint32_t y = 0; y < kSize; ++y) {
        for (std::uint32_t x = 0; x < kSize; ++x) {
            const std::uint8_t* p = pixelAt(mapped.value(), x, y);
            const bool          veiled = y < 4;
            if (x < kSize / 2) {
                assert(p[0] == 255);
                assert(p[1] == (veiled ? 128 : 0) && p[2] == (veiled ? 128 : 0));
            } else {
                assert(p[0] == (veiled ? 128 : 0) && p[1] == (veiled ? 128 : 0));
                assert(p[2] == 255);
            }
            assert(p[3] == 255);
        }
    }
    readback.unmap();

    auto* hooks = soft::hooks(device.native());
    assert(hooks->layoutErrors() == 0);
    assert(hooks->imageLayout(depthImage.native()) == ImageLayout::DepthStencilAttachment);
}

} // namespace

int main() {
    // Explicit transitions: the recorder emits every planned barrier
    {
        Device device = makeDevice(soft::AdapterConfig{});
        assert(!device.adapter().features.implicitPassTransitions);
        runDeferred(device, false);
        runDepthBlend(device);
        std::printf("  explicit transitions: ok\n");
    }

    // Native passes that transition attachments on their own
    {
        Device device = makeDevice(soft::AdapterConfig::forBackend(Backend::Vulkan));
        assert(device.adapter().features.implicitPassTransitions);
        runDeferred(device, true);
        runDepthBlend(device);
        std::printf("  implicit transitions: ok\n");
    }

    // Heap/table binding model with explicit barriers
    {
        Device device = makeDevice(soft::AdapterConfig::forBackend(Backend::Dx12));
        runDeferred(device, false);
        runDepthBlend(device);

        RenderPassDesc desc;
        AttachmentDesc rgb;
        rgb.format       = Format::R8G8B8Unorm;
        desc.attachments = {rgb};
        SubpassDesc subpass;
        subpass.colors = {0};
        desc.subpasses = {subpass};
        auto unsupported = device.createRenderPass(desc);
        assert(!unsupported.ok());
        assert(unsupported.error().code == ErrorCode::UnsupportedFormat);
        std::printf("  dx12 binding model: ok\n");
    }

    // Framebuffers must match their render pass
    {
        Device device = makeDevice(soft::AdapterConfig{});
        RenderPassDesc desc;
        desc.attachments = {AttachmentDesc{}};
        SubpassDesc subpass;
        subpass.colors = {0};
        desc.subpasses = {subpass};
        auto renderPass = device.createRenderPass(desc);
        assert(renderPass.ok());

        Image color = makeImage(device, Format::R8G8B8A8Unorm, FormatFeature::ColorTarget);
        Image other = makeImage(device, Format::R32Sfloat, FormatFeature::ColorTarget);

        auto count = device.createFramebuffer(renderPass.value(), {&color, &color},
                                              Extent2D{kSize, kSize});
        assert(!count.ok() && count.error().code == ErrorCode::InvalidUsage);
        auto format = device.createFramebuffer(renderPass.value(), {&other},
                                               Extent2D{kSize, kSize});
        assert(!format.ok() && format.error().code == ErrorCode::InvalidUsage);
        auto large = device.createFramebuffer(renderPass.value(), {&color},
                                              Extent2D{kSize * 2, kSize});
        assert(!large.ok() && large.error().code == ErrorCode::InvalidUsage);
        auto empty = device.createFramebuffer(renderPass.value(), {&color}, Extent2D{0, kSize});
        assert(!empty.ok() && empty.error().code == ErrorCode::InvalidUsage);

        // A smaller framebuffer over a larger image is fine.
        auto small = device.createFramebuffer(renderPass.value(), {&color}, Extent2D{8, 8});
        assert(small.ok());

        RenderPassDesc dangling = desc;
        dangling.subpasses[0].colors = {3};
        assert(!device.createRenderPass(dangling).ok());

        RenderPassDesc depthAsColor = desc;
        depthAsColor.attachments[0].format = Format::D32Sfloat;
        assert(!device.createRenderPass(depthAsColor).ok());

        // Destroyed attachments are caught when the pass begins.
        auto commands = device.createCommandPool(0);
        assert(commands.ok());
        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        color.destroy();
        assert(cmd.value().begin().ok());
        auto begin = cmd.value().beginRenderPass(renderPass.value(), small.value(),
                                                 Rect2D{0, 0, {8, 8}},
                                                 {ClearValue::rgba(0.0f, 0.0f, 0.0f, 0.0f)});
        assert(!begin.ok() && begin.error().code == ErrorCode::InvalidUsage);
        std::printf("  framebuffer checks: ok\n");
    }

    std::printf("render pass tests passed\n");
    return 0;
}

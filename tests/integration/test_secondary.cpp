#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <array>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <thread>
#include <vector>

using gfxhal::AttachmentDesc;
using gfxhal::Buffer;
using gfxhal::BufferDesc;
using gfxhal::BufferImageCopy;
using gfxhal::BufferUsage;
using gfxhal::ClearValue;
using gfxhal::CommandBuffer;
using gfxhal::CommandBufferInheritance;
using gfxhal::CommandBufferLevel;
using gfxhal::CommandBufferState;
using gfxhal::CommandBufferUsage;
using gfxhal::CommandPool;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::Extent2D;
using gfxhal::Format;
using gfxhal::FormatFeature;
using gfxhal::GraphicsPipelineDesc;
using gfxhal::ImageDesc;
using gfxhal::ImageLayout;
using gfxhal::MemoryUsage;
using gfxhal::PushConstantRange;
using gfxhal::ReflectedBinding;
using gfxhal::Rect2D;
using gfxhal::RenderPassDesc;
using gfxhal::ShaderSource;
using gfxhal::ShaderStage;
using gfxhal::SubmitInfo;
using gfxhal::SubpassContents;
using gfxhal::SubpassDesc;
namespace soft = gfxhal::soft;

int main() {
    soft::InstanceConfig config;
    config.programs->add("pass_vs", soft::Program{ShaderStage::Vertex, {},
                                                  [](soft::Invocation&) {}});
    ReflectedBinding tint;
    tint.name         = "tint";
    tint.pushConstant = true;
    config.programs->add("tint_fs", soft::Program{
        ShaderStage::Fragment, {tint}, [](soft::Invocation& inv) {
            inv.setColor(0, {inv.push<float>(0), inv.push<float>(4), inv.push<float>(8),
                             inv.push<float>(12)});
        }});

    auto instance = gfxhal::InstanceBuilder(soft::createInstance(std::move(config)))
                        .appName("test_secondary")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Cpu);
    assert(adapter.ok());
    auto built = gfxhal::DeviceBuilder(adapter.value()).build();
    assert(built.ok());
    Device device = std::move(built).value();
    auto queue    = device.queue(0);

    // Two subpasses drawing into one color target.
    RenderPassDesc desc;
    AttachmentDesc color;
    color.format      = Format::R8G8B8A8Unorm;
    color.finalLayout = ImageLayout::TransferSrc;
    desc.attachments  = {color};
    SubpassDesc subpass;
    subpass.colors = {0};
    desc.subpasses = {subpass, subpass};

    auto renderPass = device.createRenderPass(desc);
    assert(renderPass.ok());
    auto target = device.createImage(
        ImageDesc{{16, 16, 1}, Format::R8G8B8A8Unorm, 1, 1, 1,
                  FormatFeature::ColorTarget | FormatFeature::TransferSrc},
        MemoryUsage::GpuOnly);
    assert(target.ok());
    auto framebuffer =
        device.createFramebuffer(renderPass.value(), {&target.value()}, Extent2D{16, 16});
    assert(framebuffer.ok());
    auto readback = device.createBuffer(BufferDesc{16 * 16 * 4, BufferUsage::TransferDst},
                                        MemoryUsage::Readback);
    assert(readback.ok());

    auto layout = device.createPipelineLayout({}, {PushConstantRange{ShaderStage::Fragment, 0, 16}});
    assert(layout.ok());
    auto pipelineFor = [&](std::uint32_t subpassIndex) {
        GraphicsPipelineDesc p;
        p.layout     = &layout.value();
        p.renderPass = &renderPass.value();
        p.subpass    = subpassIndex;
        p.stages     = {ShaderSource::fromText(ShaderStage::Vertex, "pass_vs"),
                        ShaderSource::fromText(ShaderStage::Fragment, "tint_fs")};
        auto pipeline = device.createGraphicsPipeline(p);
        assert(pipeline.ok());
        return std::move(pipeline).value();
    };
    auto pipeline0 = pipelineFor(0);
    auto pipeline1 = pipelineFor(1);

    const Rect2D area{0, 0, {16, 16}};
    const std::vector<ClearValue> clears = {ClearValue::rgba(0.0f, 0.0f, 0.0f, 1.0f)};

    // Records one half of the target in a RenderPassContinue secondary.
    auto recordHalf = [&](CommandPool& pool, std::uint32_t subpassIndex, std::int32_t x,
                          std::array<float, 4> rgba) {
        auto cmd = pool.allocate(CommandBufferLevel::Secondary);
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        CommandBufferInheritance inherit{&renderPass.value(), subpassIndex, &framebuffer.value()};
        assert(cb.begin(CommandBufferUsage::RenderPassContinue, &inherit).ok());
        assert(cb.bindPipeline(subpassIndex == 0 ? pipeline0 : pipeline1).ok());
        assert(cb.setScissor(Rect2D{x, 0, {8, 16}}).ok());
        assert(cb.pushConstants(layout.value(), ShaderStage::Fragment, 0, rgba.data(), 16).ok());
        assert(cb.draw(3).ok());
        assert(cb.finish().ok());
        return std::move(cmd).value();
    };

    // Secondaries recorded on two threads, executed in one subpass
    {
        auto left  = device.createCommandPool(0);
        auto right = device.createCommandPool(0);
        assert(left.ok() && right.ok());

        CommandBuffer leftCmd;
        CommandBuffer rightCmd;
        std::thread a([&] { leftCmd = recordHalf(left.value(), 1, 0, {1.0f, 0.0f, 0.0f, 1.0f}); });
        std::thread b([&] { rightCmd = recordHalf(right.value(), 1, 8, {0.0f, 0.0f, 1.0f, 1.0f}); });
        a.join();
        b.join();
        assert(leftCmd.state() == CommandBufferState::Executable);
        assert(rightCmd.state() == CommandBufferState::Executable);
        assert(leftCmd.level() == CommandBufferLevel::Secondary);

        auto pool = device.createCommandPool(0);
        assert(pool.ok());
        auto primary = pool.value().allocate();
        assert(primary.ok());
        CommandBuffer& cb = primary.value();
        assert(cb.begin(CommandBufferUsage::OneTimeSubmit).ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
        assert(cb.nextSubpass(SubpassContents::SecondaryBuffers).ok());

        // Inline commands are not allowed in a SecondaryBuffers subpass.
        auto inlineDraw = cb.setScissor(area);
        assert(!inlineDraw.ok() && inlineDraw.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin(CommandBufferUsage::OneTimeSubmit).ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
        assert(cb.nextSubpass(SubpassContents::SecondaryBuffers).ok());
        assert(cb.executeCommands({&leftCmd, &rightCmd}).ok());
        assert(cb.endRenderPass().ok());
        assert(cb.copyImageToBuffer(target.value(), ImageLayout::TransferSrc, readback.value(),
                                    {BufferImageCopy{0, 0, 0, 0, 0, 1, {}, {16, 16, 1}}})
                   .ok());
        assert(cb.finish().ok());

        auto fence = device.createFence();
        assert(fence.ok());
        assert(queue.submit(SubmitInfo{{&cb}, {}, {}, &fence.value()}).ok());
        assert(fence.value().wait().ok());

        auto mapped = readback.value().map();
        assert(mapped.ok());
        const auto* px = static_cast<const std::uint8_t*>(mapped.value());
        for (std::uint32_t y = 0; y < 16; ++y) {
            for (std::uint32_t x = 0; x < 16; ++x) {
                const std::uint8_t* p = px + (y * 16 + x) * 4;
                if (x < 8) {
                    assert(p[0] == 255 && p[1] == 0 && p[2] == 0 && p[3] == 255);
                } else {
                    assert(p[0] == 0 && p[1] == 0 && p[2] == 255 && p[3] == 255);
                }
            }
        }
        readback.value().unmap();

        auto* hooks = soft::hooks(device.native());
        assert(hooks->layoutErrors() == 0);
        assert(hooks->bindingErrors() == 0);
        assert(cb.state() == CommandBufferState::Invalid);
        std::printf("  threaded secondaries: ok\n");
    }

    auto pool = device.createCommandPool(0);
    assert(pool.ok());

    // Secondaries must continue the active subpass of the active pass
    {
        CommandBuffer subpass0 = recordHalf(pool.value(), 0, 0, {1.0f, 1.0f, 1.0f, 1.0f});

        auto primary = pool.value().allocate();
        assert(primary.ok());
        CommandBuffer& cb = primary.value();
        assert(cb.begin().ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
        assert(cb.nextSubpass(SubpassContents::SecondaryBuffers).ok());
        auto wrongSubpass = cb.executeCommands({&subpass0});
        assert(!wrongSubpass.ok() && wrongSubpass.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        // Subpass 0 records inline.
        assert(cb.begin().ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears).ok());
        auto inlineSubpass = cb.executeCommands({&subpass0});
        assert(!inlineSubpass.ok() && inlineSubpass.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        // A continuing secondary needs a pass around it.
        assert(cb.begin().ok());
        auto noPass = cb.executeCommands({&subpass0});
        assert(!noPass.ok() && noPass.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        // Another render pass, even an identical one, is not the active pass.
        auto otherPass = device.createRenderPass(desc);
        assert(otherPass.ok());
        auto other = pool.value().allocate(CommandBufferLevel::Secondary);
        assert(other.ok());
        CommandBufferInheritance inherit{&otherPass.value(), 0, nullptr};
        assert(other.value().begin(CommandBufferUsage::RenderPassContinue, &inherit).ok());
        assert(other.value().finish().ok());
        assert(cb.begin().ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears,
                                  SubpassContents::SecondaryBuffers)
                   .ok());
        auto foreign = cb.executeCommands({&other.value()});
        assert(!foreign.ok() && foreign.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        // The right subpass is accepted.
        assert(cb.begin().ok());
        assert(cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears,
                                  SubpassContents::SecondaryBuffers)
                   .ok());
        assert(cb.executeCommands({&subpass0}).ok());
        assert(cb.nextSubpass().ok());
        assert(cb.endRenderPass().ok());
        assert(cb.finish().ok());
        std::printf("  inheritance checks: ok\n");
    }

    // Secondary buffers have their own rules
    {
        auto sec = pool.value().allocate(CommandBufferLevel::Secondary);
        assert(sec.ok());
        CommandBuffer& cb = sec.value();

        CommandBufferInheritance missingSubpass{&renderPass.value(), 2, nullptr};
        auto badSubpass = cb.begin(CommandBufferUsage::RenderPassContinue, &missingSubpass);
        assert(!badSubpass.ok() && badSubpass.error().code == ErrorCode::InvalidUsage);
        assert(cb.state() == CommandBufferState::Initial);
        assert(cb.reset().ok());

        auto noInheritance = cb.begin(CommandBufferUsage::RenderPassContinue);
        assert(!noInheritance.ok());
        assert(cb.reset().ok());

        // A plain secondary records transfers and runs outside passes.
        assert(cb.begin().ok());
        auto pass = cb.beginRenderPass(renderPass.value(), framebuffer.value(), area, clears);
        assert(!pass.ok() && pass.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        auto scratch = device.createBuffer(
            BufferDesc{64, BufferUsage::TransferDst | BufferUsage::TransferSrc}, MemoryUsage::Readback);
        assert(scratch.ok());
        assert(cb.begin().ok());
        assert(cb.fillBuffer(scratch.value(), 0, 64, 0x5A5A5A5Au).ok());
        assert(cb.finish().ok());

        auto primary = pool.value().allocate();
        assert(primary.ok());
        assert(primary.value().begin().ok());
        assert(primary.value().executeCommands({&cb}).ok());
        assert(primary.value().finish().ok());
        assert(queue.submit(SubmitInfo{{&primary.value()}, {}, {}, nullptr}).ok());
        assert(queue.waitIdle().ok());

        auto mapped = scratch.value().map();
        assert(mapped.ok());
        assert(static_cast<const std::uint32_t*>(mapped.value())[15] == 0x5A5A5A5Au);
        scratch.value().unmap();
        std::printf("  plain secondary: ok\n");
    }

    // Executed secondaries are pending for as long as their primary is
    {
        auto* hooks   = soft::hooks(device.native());
        auto  scratch = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                            MemoryUsage::Readback);
        assert(scratch.ok());

        auto once = pool.value().allocate(CommandBufferLevel::Secondary);
        auto kept = pool.value().allocate(CommandBufferLevel::Secondary);
        assert(once.ok() && kept.ok());
        assert(once.value().begin(CommandBufferUsage::OneTimeSubmit).ok());
        assert(once.value().fillBuffer(scratch.value(), 0, 32, 0x11111111u).ok());
        assert(once.value().finish().ok());
        assert(kept.value().begin().ok());
        assert(kept.value().fillBuffer(scratch.value(), 32, 32, 0x22222222u).ok());
        assert(kept.value().finish().ok());

        auto primary = pool.value().allocate();
        assert(primary.ok());
        assert(primary.value().begin().ok());
        assert(primary.value().executeCommands({&once.value(), &kept.value()}).ok());
        assert(primary.value().finish().ok());

        hooks->holdQueue(0, true);
        assert(queue.submit(SubmitInfo{{&primary.value()}, {}, {}, nullptr}).ok());
        assert(once.value().state() == CommandBufferState::Pending);
        assert(kept.value().state() == CommandBufferState::Pending);

        auto earlyReset = kept.value().reset();
        assert(!earlyReset.ok() && earlyReset.error().code == ErrorCode::InvalidUsage);
        auto earlyBegin = kept.value().begin();
        assert(!earlyBegin.ok() && earlyBegin.error().code == ErrorCode::InvalidUsage);

        // Without SimultaneousUse a pending secondary cannot be executed again.
        auto other = pool.value().allocate();
        assert(other.ok());
        assert(other.value().begin().ok());
        auto busy = other.value().executeCommands({&kept.value()});
        assert(!busy.ok() && busy.error().code == ErrorCode::InvalidUsage);
        assert(other.value().reset().ok());

        hooks->holdQueue(0, false);
        assert(queue.waitIdle().ok());
        assert(primary.value().state() == CommandBufferState::Initial);
        assert(once.value().state() == CommandBufferState::Invalid);
        assert(kept.value().state() == CommandBufferState::Initial);

        assert(other.value().begin().ok());
        auto consumed = other.value().executeCommands({&once.value()});
        assert(!consumed.ok() && consumed.error().code == ErrorCode::InvalidUsage);
        assert(other.value().reset().ok());

        auto mapped = scratch.value().map();
        assert(mapped.ok());
        const auto* words = static_cast<const std::uint32_t*>(mapped.value());
        assert(words[0] == 0x11111111u && words[7] == 0x11111111u);
        assert(words[8] == 0x22222222u && words[15] == 0x22222222u);
        scratch.value().unmap();

        // A secondary re-recorded after being executed invalidates the primary.
        auto fill = pool.value().allocate(CommandBufferLevel::Secondary);
        assert(fill.ok());
        assert(fill.value().begin().ok());
        assert(fill.value().fillBuffer(scratch.value(), 0, gfxhal::WholeSize, 1u).ok());
        assert(fill.value().finish().ok());
        assert(other.value().begin().ok());
        assert(other.value().executeCommands({&fill.value()}).ok());
        assert(other.value().finish().ok());
        assert(fill.value().reset().ok());
        assert(fill.value().begin().ok());
        assert(fill.value().fillBuffer(scratch.value(), 0, gfxhal::WholeSize, 2u).ok());
        assert(fill.value().finish().ok());
        auto stale = queue.submit(SubmitInfo{{&other.value()}, {}, {}, nullptr});
        assert(!stale.ok() && stale.error().code == ErrorCode::InvalidUsage);
        assert(other.value().state() == CommandBufferState::Executable);
        assert(fill.value().state() == CommandBufferState::Executable);
        std::printf("  pending secondaries: ok\n");
    }

    // Primaries recorded on separate threads go out in one submission
    {
        auto first  = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                          MemoryUsage::Readback);
        auto second = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                          MemoryUsage::Readback);
        assert(first.ok() && second.ok());

        auto poolA = device.createCommandPool(0);
        auto poolB = device.createCommandPool(0);
        assert(poolA.ok() && poolB.ok());
        CommandBuffer a;
        CommandBuffer b;
        auto record = [](CommandPool& p, Buffer& target, std::uint32_t value, CommandBuffer& out) {
            auto cmd = p.allocate();
            assert(cmd.ok());
            assert(cmd.value().begin().ok());
            assert(cmd.value().fillBuffer(target, 0, gfxhal::WholeSize, value).ok());
            assert(cmd.value().finish().ok());
            out = std::move(cmd).value();
        };
        std::thread ta([&] { record(poolA.value(), first.value(), 1u, a); });
        std::thread tb([&] { record(poolB.value(), second.value(), 2u, b); });
        ta.join();
        tb.join();

        auto fence = device.createFence();
        assert(fence.ok());
        assert(queue.submit(SubmitInfo{{&a, &b}, {}, {}, &fence.value()}).ok());
        assert(device.waitForFence(fence.value()).ok());
        assert(a.state() == CommandBufferState::Initial);
        assert(b.state() == CommandBufferState::Initial);

        auto ma = first.value().map();
        auto mb = second.value().map();
        assert(ma.ok() && mb.ok());
        assert(static_cast<const std::uint32_t*>(ma.value())[0] == 1u);
        assert(static_cast<const std::uint32_t*>(mb.value())[0] == 2u);
        first.value().unmap();
        second.value().unmap();
        std::printf("  multi-pool submission: ok\n");
    }

    assert(device.waitIdle().ok());
    std::printf("secondary tests passed\n");
    return 0;
}

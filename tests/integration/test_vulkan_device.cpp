#include <gfxhal/gfxhal.hpp>
#include <gfxhal/vulkan/vulkan.hpp>
#include <vulkan/vulkan.h>

#include <cassert>
#include <cstdint>
#include <cstdio>

using gfxhal::AttachmentDesc;
using gfxhal::BufferCopy;
using gfxhal::BufferDesc;
using gfxhal::BufferImageCopy;
using gfxhal::BufferUsage;
using gfxhal::ClearValue;
using gfxhal::CommandBufferState;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::Extent2D;
using gfxhal::Format;
using gfxhal::FormatFeature;
using gfxhal::ImageDesc;
using gfxhal::ImageLayout;
using gfxhal::MemoryUsage;
using gfxhal::PipelineStage;
using gfxhal::QueueCapability;
using gfxhal::Rect2D;
using gfxhal::RenderPassDesc;
using gfxhal::SemaphoreWait;
using gfxhal::SubmitInfo;
using gfxhal::SubpassDesc;

int main() {
    gfxhal::vulkan::InstanceConfig config;
    config.appName          = "test_vulkan_device";
    config.validationLayers = true;
    auto native = gfxhal::vulkan::createInstance(config);
    if (!native.ok()) {
        std::printf("  no Vulkan 1.3 loader (%s), skipped\n", native.error().format().c_str());
        std::printf("vulkan device tests passed\n");
        return 0;
    }

    auto instance = gfxhal::InstanceBuilder(native.value())
                        .appName("test_vulkan_device")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    assert(instance.value().backend() == gfxhal::Backend::Vulkan);
    if (instance.value().adapters().empty()) {
        std::printf("  no adapter with Vulkan 1.3, synchronization2 and timeline semaphores, "
                    "skipped\n");
        std::printf("vulkan device tests passed\n");
        return 0;
    }

    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Discrete);
    assert(adapter.ok());
    const gfxhal::AdapterInfo& info = adapter.value().info();
    std::printf("  adapter: %s\n", info.name.c_str());
    assert(info.features.splitBarriers);
    assert(!info.memory.types.empty());

    auto graphicsFamily = adapter.value().findQueueFamily(QueueCapability::Graphics);
    assert(graphicsFamily);
    assert(gfxhal::any(info.queueFamilies[*graphicsFamily].capabilities & QueueCapability::Present));

    auto built = gfxhal::DeviceBuilder(adapter.value()).queues(*graphicsFamily, 1).build();
    assert(built.ok());
    Device device = std::move(built).value();
    auto   queue  = device.queue(0);

    auto objects = gfxhal::vulkan::deviceObjects(device.native());
    assert(objects.instance != VK_NULL_HANDLE);
    assert(objects.physicalDevice != VK_NULL_HANDLE);
    assert(objects.device != VK_NULL_HANDLE);
    std::printf("  device: ok\n");

    auto pool = device.createCommandPool(*graphicsFamily);
    assert(pool.ok());

    // Transfers ordered by a semaphore and read back through mapped memory
    {
        auto staging = device.createBuffer(
            BufferDesc{1024, BufferUsage::TransferSrc | BufferUsage::TransferDst},
            MemoryUsage::Upload);
        auto gpu = device.createBuffer(
            BufferDesc{1024, BufferUsage::TransferSrc | BufferUsage::TransferDst},
            MemoryUsage::GpuOnly);
        auto readback = device.createBuffer(BufferDesc{1024, BufferUsage::TransferDst},
                                            MemoryUsage::Readback);
        assert(staging.ok() && gpu.ok() && readback.ok());

        auto mapped = staging.value().map();
        assert(mapped.ok());
        auto* words = static_cast<std::uint32_t*>(mapped.value());
        for (std::uint32_t i = 0; i < 256; ++i) words[i] = i * 7;
        staging.value().unmap();

        auto upload = pool.value().allocate();
        auto download = pool.value().allocate();
        assert(upload.ok() && download.ok());
        assert(upload.value().begin(gfxhal::CommandBufferUsage::OneTimeSubmit).ok());
        assert(upload.value().copyBuffer(staging.value(), gpu.value(), {BufferCopy{0, 0, 1024}}).ok());
        assert(upload.value().fillBuffer(gpu.value(), 1020, 4, 0xFFFFFFFFu).ok());
        assert(upload.value().finish().ok());

        assert(download.value().begin().ok());
        assert(download.value().copyBuffer(gpu.value(), readback.value(), {BufferCopy{0, 0, 1024}}).ok());
        assert(download.value().finish().ok());

        auto uploaded = device.createSemaphore();
        auto done     = device.createFence();
        assert(uploaded.ok() && done.ok());
        assert(queue.submit(SubmitInfo{{&upload.value()}, {}, {&uploaded.value()}, nullptr}).ok());
        assert(queue
                   .submit(SubmitInfo{{&download.value()},
                                      {SemaphoreWait{&uploaded.value(), PipelineStage::Transfer}},
                                      {},
                                      &done.value()})
                   .ok());
        assert(device.waitForFence(done.value()).ok());
        assert(queue.completedSerial() == queue.submittedSerial());
        assert(upload.value().state() == CommandBufferState::Invalid);
        assert(download.value().state() == CommandBufferState::Initial);

        auto out = readback.value().map();
        assert(out.ok());
        const auto* result = static_cast<const std::uint32_t*>(out.value());
        for (std::uint32_t i = 0; i < 255; ++i) assert(result[i] == i * 7);
        assert(result[255] == 0xFFFFFFFFu);
        readback.value().unmap();
        std::printf("  transfers: ok\n");
    }

    // A cleared render pass, transitioned by its barrier plan
    {
        RenderPassDesc desc;
        AttachmentDesc color;
        color.finalLayout = ImageLayout::TransferSrc;
        desc.attachments  = {color};
        SubpassDesc subpass;
        subpass.colors = {0};
        desc.subpasses = {subpass};
        auto renderPass = device.createRenderPass(desc);
        assert(renderPass.ok());

        auto image = device.createImage(
            ImageDesc{{32, 32, 1}, Format::R8G8B8A8Unorm, 1, 1, 1,
                      FormatFeature::ColorTarget | FormatFeature::TransferSrc},
            MemoryUsage::GpuOnly);
        assert(image.ok());
        auto framebuffer =
            device.createFramebuffer(renderPass.value(), {&image.value()}, Extent2D{32, 32});
        assert(framebuffer.ok());
        auto readback = device.createBuffer(BufferDesc{32 * 32 * 4, BufferUsage::TransferDst},
                                            MemoryUsage::Readback);
        assert(readback.ok());

        auto cmd = pool.value().allocate();
        assert(cmd.ok());
        assert(cmd.value().begin().ok());
        assert(cmd.value()
                   .beginRenderPass(renderPass.value(), framebuffer.value(), Rect2D{0, 0, {32, 32}},
                                    {ClearValue::rgba(1.0f, 0.0f, 1.0f, 1.0f)})
                   .ok());
        assert(cmd.value().endRenderPass().ok());
        assert(cmd.value()
                   .copyImageToBuffer(image.value(), ImageLayout::TransferSrc, readback.value(),
                                      {BufferImageCopy{0, 0, 0, 0, 0, 1, {}, {32, 32, 1}}})
                   .ok());
        assert(cmd.value().finish().ok());
        assert(queue.submit(SubmitInfo{{&cmd.value()}, {}, {}, nullptr}).ok());
        assert(queue.waitIdle().ok());

        auto out = readback.value().map();
        assert(out.ok());
        const auto* px = static_cast<const std::uint8_t*>(out.value());
        for (std::uint32_t i = 0; i < 32 * 32; ++i) {
            assert(px[i * 4 + 0] == 255 && px[i * 4 + 1] == 0);
            assert(px[i * 4 + 2] == 255 && px[i * 4 + 3] == 255);
        }
        readback.value().unmap();
        std::printf("  render pass clear: ok\n");
    }

    // The portable recorder rules hold on a native device too
    {
        auto cmd = pool.value().allocate();
        assert(cmd.ok());
        auto early = cmd.value().endRenderPass();
        assert(!early.ok() && early.error().code == ErrorCode::InvalidUsage);
        assert(cmd.value().reset().ok());

        auto gpuOnly = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                           MemoryUsage::GpuOnly);
        assert(gpuOnly.ok());
        if (!gfxhal::any(gpuOnly.value().ownedMemory()->properties() &
                         gfxhal::MemoryProperty::HostVisible)) {
            auto mapped = gpuOnly.value().map();
            assert(!mapped.ok() && mapped.error().code == ErrorCode::WrongMemoryType);
        }
        std::printf("  validation: ok\n");
    }

    assert(device.waitIdle().ok());
    assert(device.pendingGarbage() == 0);
    std::printf("vulkan device tests passed\n");
    return 0;
}

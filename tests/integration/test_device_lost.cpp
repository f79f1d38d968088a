#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <string>

using gfxhal::BufferDesc;
using gfxhal::BufferUsage;
using gfxhal::Device;
using gfxhal::ErrorCategory;
using gfxhal::ErrorCode;
using gfxhal::MemoryUsage;
using gfxhal::SubmitInfo;
namespace soft = gfxhal::soft;

namespace {

Device makeDevice(const gfxhal::Adapter& adapter) {
    auto built = gfxhal::DeviceBuilder(adapter).build();
    assert(built.ok());
    return std::move(built).value();
}

} // namespace

int main() {
    auto instance = gfxhal::InstanceBuilder(soft::createInstance())
                        .appName("test_device_lost")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Cpu);
    assert(adapter.ok());

    // Loss is noticed by the first native call after it and then sticks
    {
        Device device = makeDevice(adapter.value());
        auto*  hooks  = soft::hooks(device.native());
        assert(hooks);
        auto queue = device.queue(0);

        auto buffer = device.createBuffer(BufferDesc{256, BufferUsage::TransferDst},
                                          MemoryUsage::Readback);
        assert(buffer.ok());
        auto pool = device.createCommandPool(0);
        assert(pool.ok());
        auto cmd = pool.value().allocate();
        assert(cmd.ok());
        assert(cmd.value().begin().ok());
        assert(cmd.value().fillBuffer(buffer.value(), 0, gfxhal::WholeSize, 7u).ok());
        assert(cmd.value().finish().ok());

        auto fence = device.createFence();
        assert(fence.ok());
        hooks->holdQueue(0, true);
        assert(queue.submit(SubmitInfo{{&cmd.value()}, {}, {}, &fence.value()}).ok());

        hooks->loseDevice();
        assert(!device.lost());

        // The wait wakes up instead of timing out.
        auto wait = fence.value().wait();
        assert(!wait.ok());
        assert(wait.error().code == ErrorCode::DeviceLost);
        assert(wait.error().category() == ErrorCategory::Wait);
        assert(!gfxhal::isRecoverable(wait.error().code));
        assert(device.lost());

        auto created = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                           MemoryUsage::Readback);
        assert(!created.ok() && created.error().code == ErrorCode::DeviceLost);
        assert(created.error().format().find("device lost") != std::string::npos);

        auto again = device.createFence();
        assert(!again.ok() && again.error().code == ErrorCode::DeviceLost);
        auto sem = device.createSemaphore();
        assert(!sem.ok() && sem.error().code == ErrorCode::DeviceLost);
        auto otherPool = device.createCommandPool(0);
        assert(!otherPool.ok() && otherPool.error().code == ErrorCode::DeviceLost);
        auto allocated = pool.value().allocate();
        assert(!allocated.ok() && allocated.error().code == ErrorCode::DeviceLost);

        auto submit = queue.submit(SubmitInfo{});
        assert(!submit.ok() && submit.error().code == ErrorCode::DeviceLost);
        auto status = fence.value().signaled();
        assert(!status.ok() && status.error().code == ErrorCode::DeviceLost);
        auto waitAll = device.waitForFence(fence.value(), 0);
        assert(!waitAll.ok() && waitAll.error().code == ErrorCode::DeviceLost);

        auto idle = device.waitIdle();
        assert(!idle.ok() && idle.error().code == ErrorCode::DeviceLost);
        auto queueIdle = queue.waitIdle();
        assert(!queueIdle.ok() && queueIdle.error().code == ErrorCode::DeviceLost);

        auto mapped = buffer.value().map();
        assert(!mapped.ok() && mapped.error().code == ErrorCode::DeviceLost);
        assert(device.lost());
        std::printf("  sticky loss: ok\n");
    }

    // A lost device does not affect devices created after it
    {
        Device device = makeDevice(adapter.value());
        assert(!device.lost());
        auto buffer = device.createBuffer(BufferDesc{64, BufferUsage::TransferDst},
                                          MemoryUsage::Readback);
        assert(buffer.ok());
        auto pool = device.createCommandPool(0);
        assert(pool.ok());
        auto cmd = pool.value().allocate();
        assert(cmd.ok());
        assert(cmd.value().begin().ok());
        assert(cmd.value().fillBuffer(buffer.value(), 0, gfxhal::WholeSize, 9u).ok());
        assert(cmd.value().finish().ok());
        assert(device.queue(0).submit(SubmitInfo{{&cmd.value()}, {}, {}, nullptr}).ok());
        assert(device.waitIdle().ok());

        auto mapped = buffer.value().map();
        assert(mapped.ok());
        assert(static_cast<const std::uint32_t*>(mapped.value())[3] == 9u);
        buffer.value().unmap();
        std::printf("  fresh device: ok\n");
    }

    // Loss seen through a submit
    {
        Device device = makeDevice(adapter.value());
        soft::hooks(device.native())->loseDevice();
        auto submit = device.queue(0).submit(SubmitInfo{});
        assert(!submit.ok() && submit.error().code == ErrorCode::DeviceLost);
        assert(device.lost());
        std::printf("  loss at submit: ok\n");
    }

    std::printf("device lost tests passed\n");
    return 0;
}

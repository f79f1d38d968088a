#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>

using gfxhal::Buffer;
using gfxhal::BufferCopy;
using gfxhal::BufferDesc;
using gfxhal::BufferUsage;
using gfxhal::CommandBuffer;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::Fence;
using gfxhal::MemoryUsage;
using gfxhal::PipelineStage;
using gfxhal::QueueCapability;
using gfxhal::Semaphore;
using gfxhal::SemaphoreWait;
using gfxhal::SubmitInfo;
namespace soft = gfxhal::soft;

int main() {
    auto instance = gfxhal::InstanceBuilder(soft::createInstance())
                        .appName("test_queue_sync")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Cpu);
    assert(adapter.ok());

    auto graphicsFamily = adapter.value().findQueueFamily(QueueCapability::Graphics);
    assert(graphicsFamily && *graphicsFamily == 0);
    // First match wins, so ask for a family without graphics by its index.
    auto computeFamily = adapter.value().findQueueFamily(QueueCapability::Compute);
    assert(computeFamily && *computeFamily == 0);
    const std::uint32_t asyncFamily = 1;
    assert(gfxhal::any(adapter.value().info().queueFamilies[asyncFamily].capabilities &
                       QueueCapability::Compute));

    // Requested queues are numbered in request order
    {
        auto tooMany = gfxhal::DeviceBuilder(adapter.value()).queues(asyncFamily, 2).build();
        assert(!tooMany.ok());
        assert(tooMany.error().code == ErrorCode::InvalidUsage);

        auto fallback = gfxhal::DeviceBuilder(adapter.value()).build();
        assert(fallback.ok());
        assert(fallback.value().queueCount() == 1);
        assert(fallback.value().queue(0).family() == 0);
        assert(!fallback.value().queue(1).valid());
        std::printf("  queue requests: ok\n");
    }

    auto built = gfxhal::DeviceBuilder(adapter.value()).queues(0, 1).queues(asyncFamily, 1).build();
    assert(built.ok());
    Device device = std::move(built).value();
    assert(device.queueCount() == 2);
    auto graphics = device.queue(0);
    auto async    = device.queue(1);
    assert(graphics.family() == 0);
    assert(async.family() == asyncFamily);

    auto* hooks = soft::hooks(device.native());
    assert(hooks);

    // Fence status, reset and reuse
    {
        auto signaled = device.createFence(true);
        assert(signaled.ok());
        auto status = signaled.value().signaled();
        assert(status.ok() && status.value());
        assert(signaled.value().wait(0).ok());

        auto reused = graphics.submit(SubmitInfo{{}, {}, {}, &signaled.value()});
        assert(!reused.ok() && reused.error().code == ErrorCode::InvalidUsage);

        assert(signaled.value().reset().ok());
        status = signaled.value().signaled();
        assert(status.ok() && !status.value());

        Fence& fence = signaled.value();
        assert(graphics.submit(SubmitInfo{{}, {}, {}, &fence}).ok());
        auto armed = graphics.submit(SubmitInfo{{}, {}, {}, &fence});
        assert(!armed.ok() && armed.error().code == ErrorCode::InvalidUsage);

        assert(fence.wait().ok());
        assert(fence.reset().ok());
        assert(graphics.submit(SubmitInfo{{}, {}, {}, &fence}).ok());
        assert(device.waitForFence(fence).ok());
        std::printf("  fence reuse: ok\n");
    }

    // A held queue leaves its fence unsignaled
    {
        auto fence = device.createFence();
        assert(fence.ok());
        hooks->holdQueue(0, true);
        assert(graphics.submit(SubmitInfo{{}, {}, {}, &fence.value()}).ok());

        auto now = fence.value().wait(0);
        assert(!now.ok());
        assert(now.error().code == ErrorCode::Timeout);
        assert(gfxhal::isRecoverable(now.error().code));
        auto polled = device.waitForFence(fence.value(), 1'000'000);
        assert(!polled.ok() && polled.error().code == ErrorCode::Timeout);
        auto status = fence.value().signaled();
        assert(status.ok() && !status.value());
        assert(graphics.completedSerial() < graphics.submittedSerial());

        hooks->holdQueue(0, false);
        assert(device.waitForFence(fence.value()).ok());
        assert(graphics.completedSerial() == graphics.submittedSerial());
        std::printf("  held queue timeout: ok\n");
    }

    // A fence cannot be reset while its submission is still executing
    {
        auto fence = device.createFence();
        assert(fence.ok());
        Fence& f = fence.value();
        hooks->holdQueue(0, true);
        assert(graphics.submit(SubmitInfo{{}, {}, {}, &f}).ok());
        const std::uint64_t first = graphics.submittedSerial();

        auto early = f.reset();
        assert(!early.ok() && early.error().code == ErrorCode::InvalidUsage);
        auto reuse = graphics.submit(SubmitInfo{{}, {}, {}, &f});
        assert(!reuse.ok() && reuse.error().code == ErrorCode::InvalidUsage);
        assert(graphics.submittedSerial() == first);

        hooks->holdQueue(0, false);
        assert(f.wait().ok());
        assert(graphics.completedSerial() >= first);
        assert(f.reset().ok());

        // Rearmed on the second queue, it tracks that queue's progress.
        hooks->holdQueue(1, true);
        assert(async.submit(SubmitInfo{{}, {}, {}, &f}).ok());
        auto busy = f.reset();
        assert(!busy.ok() && busy.error().code == ErrorCode::InvalidUsage);
        hooks->holdQueue(1, false);
        assert(device.waitForFence(f).ok());
        assert(f.reset().ok());
        auto status = f.signaled();
        assert(status.ok() && !status.value());
        std::printf("  pending fence reset: ok\n");
    }

    // Waiting for any or all of several fences
    {
        auto fast = device.createFence();
        auto slow = device.createFence();
        assert(fast.ok() && slow.ok());
        hooks->holdQueue(1, true);
        assert(graphics.submit(SubmitInfo{{}, {}, {}, &fast.value()}).ok());
        assert(async.submit(SubmitInfo{{}, {}, {}, &slow.value()}).ok());

        assert(device.waitForFences({&fast.value(), &slow.value()}, false).ok());
        auto all = device.waitForFences({&fast.value(), &slow.value()}, true, 0);
        assert(!all.ok() && all.error().code == ErrorCode::Timeout);

        hooks->holdQueue(1, false);
        assert(device.waitForFences({&fast.value(), &slow.value()}, true).ok());
        std::printf("  wait any / all: ok\n");
    }

    // Serials advance one per submission
    {
        const std::uint64_t before = graphics.submittedSerial();
        for (int i = 0; i < 3; ++i) assert(graphics.submit(SubmitInfo{}).ok());
        assert(graphics.submittedSerial() == before + 3);
        assert(graphics.waitIdle().ok());
        assert(graphics.completedSerial() == before + 3);
        std::printf("  serials: ok\n");
    }

    // A semaphore orders work across queues
    {
        auto src = device.createBuffer(
            BufferDesc{256, BufferUsage::TransferSrc | BufferUsage::TransferDst},
            MemoryUsage::Readback);
        auto dst = device.createBuffer(BufferDesc{256, BufferUsage::TransferDst},
                                       MemoryUsage::Readback);
        assert(src.ok() && dst.ok());

        auto graphicsPool = device.createCommandPool(0);
        auto asyncPool    = device.createCommandPool(asyncFamily);
        assert(graphicsPool.ok() && asyncPool.ok());

        auto produce = graphicsPool.value().allocate();
        assert(produce.ok());
        assert(produce.value().begin().ok());
        assert(produce.value().fillBuffer(src.value(), 0, gfxhal::WholeSize, 0xC0FFEEu).ok());
        assert(produce.value().finish().ok());

        auto consume = asyncPool.value().allocate();
        assert(consume.ok());
        assert(consume.value().begin().ok());
        assert(consume.value().copyBuffer(src.value(), dst.value(), {BufferCopy{0, 0, 256}}).ok());
        assert(consume.value().finish().ok());

        // Buffers go to queues of their own family only.
        auto wrongFamily = async.submit(SubmitInfo{{&produce.value()}, {}, {}, nullptr});
        assert(!wrongFamily.ok() && wrongFamily.error().code == ErrorCode::InvalidUsage);

        auto ready = device.createSemaphore();
        auto done  = device.createFence();
        assert(ready.ok() && done.ok());
        const Semaphore* readyPtr = &ready.value();

        // Nothing has signaled yet.
        auto early = async.submit(
            SubmitInfo{{&consume.value()}, {SemaphoreWait{readyPtr, PipelineStage::Transfer}}, {},
                       nullptr});
        assert(!early.ok() && early.error().code == ErrorCode::InvalidUsage);

        hooks->holdQueue(0, true);
        assert(graphics.submit(SubmitInfo{{&produce.value()}, {}, {readyPtr}, nullptr}).ok());
        assert(ready.value().signalPending());

        auto doubleSignal = graphics.submit(SubmitInfo{{}, {}, {readyPtr}, nullptr});
        assert(!doubleSignal.ok() && doubleSignal.error().code == ErrorCode::InvalidUsage);

        assert(async
                   .submit(SubmitInfo{{&consume.value()},
                                      {SemaphoreWait{readyPtr, PipelineStage::Transfer}},
                                      {},
                                      &done.value()})
                   .ok());
        assert(!ready.value().signalPending());

        // The consumer waits on the producer's queue.
        auto blocked = done.value().wait(0);
        assert(!blocked.ok() && blocked.error().code == ErrorCode::Timeout);

        hooks->holdQueue(0, false);
        assert(done.value().wait().ok());

        auto mapped = dst.value().map();
        assert(mapped.ok());
        const auto* words = static_cast<const std::uint32_t*>(mapped.value());
        for (int i = 0; i < 64; ++i) assert(words[i] == 0xC0FFEEu);
        dst.value().unmap();

        // The wait consumed the signal.
        auto consumed = async.submit(
            SubmitInfo{{}, {SemaphoreWait{readyPtr, PipelineStage::Transfer}}, {}, nullptr});
        assert(!consumed.ok() && consumed.error().code == ErrorCode::InvalidUsage);

        // Signal and wait again on the same semaphore.
        assert(graphics.submit(SubmitInfo{{}, {}, {readyPtr}, nullptr}).ok());
        assert(async.submit(SubmitInfo{{}, {SemaphoreWait{readyPtr}}, {}, nullptr}).ok());
        assert(device.waitIdle().ok());
        std::printf("  cross-queue semaphore: ok\n");
    }

    // Destroyed sync objects are refused
    {
        auto sem = device.createSemaphore();
        assert(sem.ok());
        Semaphore& s = sem.value();
        s.destroy();
        assert(!s.valid());
        auto r = graphics.submit(SubmitInfo{{}, {}, {&s}, nullptr});
        assert(!r.ok() && r.error().code == ErrorCode::InvalidUsage);
        std::printf("  destroyed semaphore: ok\n");
    }

    assert(device.waitIdle().ok());
    std::printf("queue sync tests passed\n");
    return 0;
}

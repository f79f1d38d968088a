#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>

using gfxhal::Device;
using gfxhal::ErrorCategory;
using gfxhal::ErrorCode;
using gfxhal::PresentTarget;
using gfxhal::Semaphore;
using gfxhal::SubmitInfo;
namespace soft = gfxhal::soft;

int main() {
    auto instance = gfxhal::InstanceBuilder(soft::createInstance())
                        .appName("test_present")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Cpu);
    assert(adapter.ok());
    auto presentFamily = adapter.value().findQueueFamily(gfxhal::QueueCapability::Present);
    assert(presentFamily && *presentFamily == 0);

    auto built = gfxhal::DeviceBuilder(adapter.value()).queues(*presentFamily, 1).build();
    assert(built.ok());
    Device device = std::move(built).value();
    auto   queue  = device.queue(0);
    auto*  hooks  = soft::hooks(device.native());
    assert(hooks);

    const gfxhal::NativeHandle surface = hooks->createSurface(3);
    assert(surface != gfxhal::NullHandle);
    assert(hooks->presentCount(surface) == 0);

    auto rendered = device.createSemaphore();
    assert(rendered.ok());
    const Semaphore* renderedPtr = &rendered.value();

    // A frame loop cycling through the surface's images
    {
        for (std::uint32_t frame = 0; frame < 6; ++frame) {
            assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());
            assert(rendered.value().signalPending());
            assert(queue.present(PresentTarget{surface, frame % 3}, {renderedPtr}).ok());
            assert(!rendered.value().signalPending());
        }
        assert(queue.waitIdle().ok());
        assert(hooks->presentCount(surface) == 6);
        std::printf("  frame loop: ok\n");
    }

    // Presentation needs a pending signal on every wait
    {
        auto r = queue.present(PresentTarget{surface, 0}, {renderedPtr});
        assert(!r.ok() && r.error().code == ErrorCode::InvalidUsage);

        assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());
        auto twice = queue.present(PresentTarget{surface, 0}, {renderedPtr, renderedPtr});
        assert(!twice.ok() && twice.error().code == ErrorCode::InvalidUsage);
        assert(rendered.value().signalPending());

        // No waits at all is fine.
        assert(queue.present(PresentTarget{surface, 1}, {}).ok());
        assert(queue.present(PresentTarget{surface, 2}, {renderedPtr}).ok());
        assert(queue.waitIdle().ok());
        assert(hooks->presentCount(surface) == 8);
        std::printf("  wait checks: ok\n");
    }

    // Bad targets leave the waits untouched
    {
        assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());

        auto index = queue.present(PresentTarget{surface, 3}, {renderedPtr});
        assert(!index.ok() && index.error().code == ErrorCode::InvalidUsage);
        assert(rendered.value().signalPending());

        auto unknown = queue.present(PresentTarget{surface + 1000, 0}, {renderedPtr});
        assert(!unknown.ok() && unknown.error().code == ErrorCode::InvalidUsage);
        assert(rendered.value().signalPending());

        assert(queue.present(PresentTarget{surface, 0}, {renderedPtr}).ok());
        assert(queue.waitIdle().ok());
        std::printf("  bad targets: ok\n");
    }

    // A stale surface still consumes the waits
    {
        const std::uint64_t before = hooks->presentCount(surface);

        hooks->setSurfaceState(surface, soft::SurfaceState::OutOfDate);
        assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());
        auto stale = queue.present(PresentTarget{surface, 0}, {renderedPtr});
        assert(!stale.ok());
        assert(stale.error().code == ErrorCode::OutOfDate);
        assert(stale.error().category() == ErrorCategory::Present);
        assert(gfxhal::isRecoverable(stale.error().code));
        assert(!rendered.value().signalPending());
        assert(hooks->presentCount(surface) == before);

        // Recreated swapchain: the same surface presents again.
        hooks->setSurfaceState(surface, soft::SurfaceState::Ok);
        assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());
        assert(queue.present(PresentTarget{surface, 0}, {renderedPtr}).ok());
        assert(hooks->presentCount(surface) == before + 1);

        hooks->setSurfaceState(surface, soft::SurfaceState::Lost);
        assert(queue.submit(SubmitInfo{{}, {}, {renderedPtr}, nullptr}).ok());
        auto lost = queue.present(PresentTarget{surface, 1}, {renderedPtr});
        assert(!lost.ok() && lost.error().code == ErrorCode::SurfaceLost);
        assert(!gfxhal::isRecoverable(lost.error().code));
        assert(!rendered.value().signalPending());
        assert(!device.lost());

        assert(queue.waitIdle().ok());
        assert(hooks->presentCount(surface) == before + 1);
        std::printf("  stale surfaces: ok\n");
    }

    // Surfaces are independent
    {
        const gfxhal::NativeHandle second = hooks->createSurface(2);
        assert(second != surface);
        assert(queue.present(PresentTarget{second, 1}, {}).ok());
        assert(hooks->presentCount(second) == 1);
        auto index = queue.present(PresentTarget{second, 2}, {});
        assert(!index.ok() && index.error().code == ErrorCode::InvalidUsage);
        std::printf("  multiple surfaces: ok\n");
    }

    assert(device.waitIdle().ok());
    std::printf("present tests passed\n");
    return 0;
}

#include <gfxhal/memory.hpp>

#include <cassert>
#include <cstdio>

using gfxhal::MemoryProperty;
using gfxhal::MemoryUsage;

namespace {

// Discrete GPU: 0 device local, 1 host coherent, 2 host cached, 3 BAR.
gfxhal::MemoryProperties discrete() {
    gfxhal::MemoryProperties p;
    p.heaps = {{8ull << 30, true}, {16ull << 30, false}};
    p.types = {
        {MemoryProperty::DeviceLocal, 0},
        {MemoryProperty::HostVisible | MemoryProperty::HostCoherent, 1},
        {MemoryProperty::HostVisible | MemoryProperty::HostCoherent | MemoryProperty::HostCached, 1},
        {MemoryProperty::DeviceLocal | MemoryProperty::HostVisible | MemoryProperty::HostCoherent, 0},
    };
    return p;
}

} // namespace

int main() {
    // Each usage finds its natural type
    {
        auto p = discrete();
        auto gpu = gfxhal::findMemoryType(p, 0xF, MemoryUsage::GpuOnly);
        assert(gpu.ok() && gpu.value() == 0);

        auto upload = gfxhal::findMemoryType(p, 0xF, MemoryUsage::Upload);
        assert(upload.ok());
        assert(upload.value() == 1 || upload.value() == 3);
        assert(contains(p.types[upload.value()].properties, MemoryProperty::HostVisible));

        auto readback = gfxhal::findMemoryType(p, 0xF, MemoryUsage::Readback);
        assert(readback.ok() && readback.value() == 2);

        auto cpu = gfxhal::findMemoryType(p, 0xF, MemoryUsage::CpuOnly);
        assert(cpu.ok());
        assert(!any(p.types[cpu.value()].properties & MemoryProperty::DeviceLocal));
        std::printf("  discrete usages: ok\n");
    }

    // Type mask restricts the choice
    {
        auto p = discrete();
        auto r = gfxhal::findMemoryType(p, 1u << 3, MemoryUsage::Upload);
        assert(r.ok() && r.value() == 3);

        auto none = gfxhal::findMemoryType(p, 1u << 0, MemoryUsage::Readback);
        assert(!none.ok());
        assert(none.error().code == gfxhal::ErrorCode::UnsupportedUsage);
        std::printf("  type mask: ok\n");
    }

    // GpuOnly falls back when nothing is device local
    {
        gfxhal::MemoryProperties host;
        host.heaps = {{1ull << 30, false}};
        host.types = {{MemoryProperty::HostVisible | MemoryProperty::HostCoherent, 0}};
        auto r = gfxhal::findMemoryType(host, 0x1, MemoryUsage::GpuOnly);
        assert(r.ok() && r.value() == 0);
        std::printf("  gpu-only fallback: ok\n");
    }

    // Policies
    {
        auto gpu = gfxhal::policyFor(MemoryUsage::GpuOnly);
        assert(gpu.required == MemoryProperty::DeviceLocal);
        auto upload = gfxhal::policyFor(MemoryUsage::Upload);
        assert(contains(upload.required, MemoryProperty::HostVisible));
    }

    std::printf("memory type tests passed\n");
    return 0;
}

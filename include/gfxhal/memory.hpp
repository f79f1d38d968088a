#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <vector>

namespace gfxhal {

enum class MemoryProperty : std::uint8_t {
    None         = 0,
    DeviceLocal  = 1u << 0,
    HostVisible  = 1u << 1,
    HostCoherent = 1u << 2,
    HostCached   = 1u << 3,
};
GFXHAL_FLAGS(MemoryProperty)

struct MemoryType {
    MemoryProperty properties = MemoryProperty::None;
    std::uint32_t  heapIndex  = 0;
};

struct MemoryHeap {
    std::uint64_t size        = 0;
    bool          deviceLocal = false;
};

struct MemoryProperties {
    std::vector<MemoryType> types;
    std::vector<MemoryHeap> heaps;
};

// What the CPU does with the memory. Each class has required and preferred
// properties; see findMemoryType.
enum class MemoryUsage : std::uint8_t {
    GpuOnly,  // device local, never mapped
    Upload,   // CPU writes, GPU reads (staging, per-frame uniforms)
    Readback, // GPU writes, CPU reads
    CpuOnly,  // host memory the GPU may touch slowly
};

[[nodiscard]] const char* toString(MemoryUsage usage);

struct MemoryRequirements {
    std::uint64_t size      = 0;
    std::uint64_t alignment = 1;
    std::uint32_t typeMask  = 0; // bit i set: memory type i is acceptable
};

struct MemoryPolicy {
    MemoryProperty required  = MemoryProperty::None;
    MemoryProperty preferred = MemoryProperty::None;
    MemoryProperty avoided   = MemoryProperty::None;
};

[[nodiscard]] MemoryPolicy policyFor(MemoryUsage usage);

// Picks the type in typeMask that has every required property and matches
// the most preferred (and fewest avoided) ones; lowest index wins ties.
// GpuOnly falls back to any allowed type when no device-local one exists
// (integrated and software adapters). No candidate is UnsupportedUsage.
[[nodiscard]] Result<std::uint32_t> findMemoryType(const MemoryProperties& properties,
                                                   std::uint32_t typeMask, MemoryUsage usage);

} // namespace gfxhal

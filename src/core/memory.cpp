#include <gfxhal/memory.hpp>

#include <bit>
#include <cstdio>
#include <optional>
#include <string>

namespace gfxhal {

const char* toString(MemoryUsage usage) {
    switch (usage) {
    case MemoryUsage::GpuOnly:  return "gpu-only";
    case MemoryUsage::Upload:   return "upload";
    case MemoryUsage::Readback: return "readback";
    case MemoryUsage::CpuOnly:  return "cpu-only";
    }
    return "unknown";
}

MemoryPolicy policyFor(MemoryUsage usage) {
    switch (usage) {
    case MemoryUsage::GpuOnly:
        return {MemoryProperty::DeviceLocal, MemoryProperty::None, MemoryProperty::HostVisible};
    case MemoryUsage::Upload:
        return {MemoryProperty::HostVisible, MemoryProperty::HostCoherent,
                MemoryProperty::HostCached};
    case MemoryUsage::Readback:
        return {MemoryProperty::HostVisible, MemoryProperty::HostCached | MemoryProperty::HostCoherent,
                MemoryProperty::None};
    case MemoryUsage::CpuOnly:
        return {MemoryProperty::HostVisible | MemoryProperty::HostCoherent, MemoryProperty::None,
                MemoryProperty::DeviceLocal};
    }
    return {};
}

namespace {

int score(MemoryProperty props, const MemoryPolicy& policy) {
    using U = std::underlying_type_t<MemoryProperty>;
    const int hits   = std::popcount(static_cast<U>(props & policy.preferred));
    const int misses = std::popcount(static_cast<U>(props & policy.avoided));
    return hits * 2 - misses;
}

std::optional<std::uint32_t> pick(const MemoryProperties& properties, std::uint32_t typeMask,
                                  const MemoryPolicy& policy) {
    std::optional<std::uint32_t> best;
    int bestScore = 0;
    for (std::uint32_t i = 0; i < properties.types.size() && i < 32; ++i) {
        if (!(typeMask & (1u << i))) continue;
        const MemoryProperty props = properties.types[i].properties;
        if (!contains(props, policy.required)) continue;
        const int s = score(props, policy);
        if (!best || s > bestScore) {
            best      = i;
            bestScore = s;
        }
    }
    return best;
}

} // namespace

Result<std::uint32_t> findMemoryType(const MemoryProperties& properties, std::uint32_t typeMask,
                                     MemoryUsage usage) {
    const MemoryPolicy policy = policyFor(usage);

    if (auto index = pick(properties, typeMask, policy)) return *index;

    if (usage == MemoryUsage::GpuOnly) {
        MemoryPolicy relaxed = policy;
        relaxed.required     = MemoryProperty::None;
        relaxed.preferred    = MemoryProperty::DeviceLocal;
        if (auto index = pick(properties, typeMask, relaxed)) return *index;
    }

    char mask[16];
    std::snprintf(mask, sizeof(mask), "0x%x", typeMask);
    return Error{"find memory type", ErrorCode::UnsupportedUsage, 0,
                 std::string("no memory type in mask ") + mask + " satisfies " + toString(usage) +
                     " usage"};
}

} // namespace gfxhal

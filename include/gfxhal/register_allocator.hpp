#pragma once

#include <gfxhal/descriptor.hpp>
#include <gfxhal/registers/assignment.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace gfxhal {

// Explicit descriptor sets: (set, binding) is the native address.
class ExplicitSetAllocator {
public:
    [[nodiscard]] Result<RegisterAssignment> assign(const std::vector<SetLayoutRef>& sets,
                                                    const PushConstantRange* push) const;
};

struct FlatRegisterLimits {
    std::uint32_t constantBuffers = 14; // last one reserved for push constants
    std::uint32_t textures        = 128;
    std::uint32_t samplers        = 16;
    std::uint32_t unorderedAccess = 8;
};

// D3D11-style flat registers. Per stage one counter per register class,
// walked in declaration order within a set and sets in ascending order.
// Compute UAVs grow up from u0; graphics UAVs grow down from the top so they
// stay clear of the render-target slots at the bottom.
class FlatRegisterAllocator {
public:
    FlatRegisterAllocator() = default;
    explicit FlatRegisterAllocator(FlatRegisterLimits limits) : limits_(limits) {}

    [[nodiscard]] const FlatRegisterLimits& limits() const { return limits_; }
    [[nodiscard]] std::uint32_t pushConstantSlot() const { return limits_.constantBuffers - 1; }

    [[nodiscard]] Result<RegisterAssignment> assign(const std::vector<SetLayoutRef>& sets,
                                                    const PushConstantRange* push) const;

private:
    FlatRegisterLimits limits_;
};

// Position of each binding (declaration order) inside its set's resource and
// sampler tables. Combined image samplers occupy both.
struct HeapOffsets {
    std::uint32_t resource = 0;
    std::uint32_t sampler  = 0;
};

[[nodiscard]] std::vector<HeapOffsets> heapTableOffsets(const DescriptorSetLayout& layout);

struct HeapTableLimits {
    std::uint32_t rootSignatureDwords = 64;
};

// D3D12-style heaps. Each set gets one CBV/SRV/UAV table and one sampler
// table (when it has entries of that heap type). Root parameter 0 is the
// root-constant block when push constants exist.
class HeapTableAllocator {
public:
    HeapTableAllocator() = default;
    explicit HeapTableAllocator(HeapTableLimits limits) : limits_(limits) {}

    [[nodiscard]] const HeapTableLimits& limits() const { return limits_; }

    [[nodiscard]] Result<RegisterAssignment> assign(const std::vector<SetLayoutRef>& sets,
                                                    const PushConstantRange* push) const;

private:
    HeapTableLimits limits_;
};

struct ArgumentBufferLimits {
    std::uint32_t buffers  = 31; // last one reserved for push constants
    std::uint32_t textures = 128;
    std::uint32_t samplers = 16;
};

// Metal-style indices. Direct mode hands out per-stage buffer / texture /
// sampler runs. Argument-buffer mode gives each set one buffer index per
// stage and numbers the set's bindings inside that buffer.
class ArgumentBufferAllocator {
public:
    enum class Mode : std::uint8_t {
        Direct,
        ArgumentBuffers,
    };

    ArgumentBufferAllocator() = default;
    explicit ArgumentBufferAllocator(Mode mode, ArgumentBufferLimits limits = {})
        : mode_(mode), limits_(limits) {}

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] const ArgumentBufferLimits& limits() const { return limits_; }
    [[nodiscard]] std::uint32_t pushConstantSlot() const { return limits_.buffers - 1; }

    [[nodiscard]] Result<RegisterAssignment> assign(const std::vector<SetLayoutRef>& sets,
                                                    const PushConstantRange* push) const;

private:
    Mode mode_ = Mode::Direct;
    ArgumentBufferLimits limits_;
};

struct FlatUniformLimits {
    std::uint32_t textureUnits  = 80;
    std::uint32_t imageUnits    = 8;
    std::uint32_t uniformBlocks = 36; // last one reserved for push constants
    std::uint32_t storageBlocks = 8;
};

// GL-style flat namespace. Sets are merged: every (category, set, binding)
// gets one program-wide index per array element.
class FlatUniformAllocator {
public:
    FlatUniformAllocator() = default;
    explicit FlatUniformAllocator(FlatUniformLimits limits) : limits_(limits) {}

    [[nodiscard]] const FlatUniformLimits& limits() const { return limits_; }
    [[nodiscard]] std::uint32_t pushConstantBlock() const { return limits_.uniformBlocks - 1; }

    [[nodiscard]] Result<RegisterAssignment> assign(const std::vector<SetLayoutRef>& sets,
                                                    const PushConstantRange* push) const;

private:
    FlatUniformLimits limits_;
};

// A resource reference found by reflecting a compiled shader.
struct ReflectedBinding {
    std::string    name;
    std::uint32_t  set          = 0;
    std::uint32_t  binding      = 0;
    DescriptorKind kind         = DescriptorKind::UniformBuffer;
    std::uint32_t  count        = 1;
    bool           writable     = false;
    bool           pushConstant = false; // set/binding/kind ignored
};

// Where a translator must rebind one reflected resource.
struct ShaderRemap {
    std::string   name;
    std::uint32_t set          = 0;
    std::uint32_t binding      = 0;
    bool          pushConstant = false;
    std::vector<AddressPart> parts;
};

// Tagged variant over the five binding models, selected once per device.
//
// Thread safety: immutable, safe to share.
class RegisterAllocator {
public:
    using Strategy = std::variant<ExplicitSetAllocator, FlatRegisterAllocator,
                                  HeapTableAllocator, ArgumentBufferAllocator,
                                  FlatUniformAllocator>;

    // Default strategy and limits for a backend.
    [[nodiscard]] static RegisterAllocator forBackend(Backend backend);

    RegisterAllocator(Backend backend, Strategy strategy)
        : backend_(backend), strategy_(std::move(strategy)) {}

    [[nodiscard]] Backend backend() const { return backend_; }
    [[nodiscard]] const Strategy& strategy() const { return strategy_; }

    // Runs the strategy and the aliasing verifier. More than one push
    // constant range, or a range with zero size, is InvalidUsage.
    [[nodiscard]] Result<RegisterAssignment> assign(
        const std::vector<SetLayoutRef>& sets,
        const std::vector<PushConstantRange>& pushConstants) const;

    // Resolves each reflected resource of one stage against an assignment.
    [[nodiscard]] Result<std::vector<ShaderRemap>> remap(
        const RegisterAssignment& assignment, const std::vector<SetLayoutRef>& sets,
        const std::vector<ReflectedBinding>& reflected, ShaderStage stage) const;

    // Graphics UAVs share slots with render targets on flat-register
    // backends: every graphics u# must sit at or above colorCount.
    [[nodiscard]] Result<void> verifyRenderTargetSlots(const RegisterAssignment& assignment,
                                                       std::uint32_t colorCount) const;

private:
    Backend  backend_;
    Strategy strategy_;
};

} // namespace gfxhal

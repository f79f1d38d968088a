#pragma once

#include <gfxhal/descriptor.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace gfxhal {

// Shape of a native address. Which one a backend produces is fixed by its
// binding model.
enum class AddressKind : std::uint8_t {
    SetBinding,     // explicit sets: (set, binding) passes through
    FlatSlot,       // per-stage register / index (b#, t#, s#, u#, Metal indices)
    TableOffset,    // root descriptor table + offset into the table's heap run
    ArgumentIndex,  // argument id inside a set's argument buffer
    UniformIndices, // one flat index per array element (no sets)
    PushConstant,   // the single reserved push-constant address
};

// Index spaces inside which two addresses must never overlap.
enum class RegisterSpace : std::uint8_t {
    Set,
    ConstantBuffer,  // b#
    Texture,         // t#
    Sampler,         // s#
    UnorderedAccess, // u#
    ResourceHeap,    // CBV/SRV/UAV descriptor table
    SamplerHeap,     // sampler descriptor table
    RootConstants,
    Buffer,          // Metal buffer index
    MetalTexture,
    MetalSampler,
    Argument,        // argument id inside one argument buffer
    GlTexture,       // texture unit
    GlSampler,
    GlImage,         // image unit
    GlUniformBlock,
    GlStorageBlock,
    PushConstant,
};

[[nodiscard]] const char* toString(RegisterSpace space);
[[nodiscard]] const char* toString(AddressKind kind);

struct NativeAddress {
    AddressKind   kind  = AddressKind::FlatSlot;
    RegisterSpace space = RegisterSpace::Set;
    std::uint32_t group = 0;  // set index, root table index or argument buffer index
    std::uint32_t index = 0;  // first slot / offset / binding
    std::uint32_t count = 1;  // run length (array count)
    std::vector<std::uint32_t> elements; // UniformIndices: one index per element

    // Native slot of array element e.
    [[nodiscard]] std::uint32_t slot(std::uint32_t e) const {
        return elements.empty() ? index + e : elements[e];
    }

    // Slots occupied in the address space for aliasing purposes. An explicit
    // binding occupies one binding number whatever its array count.
    [[nodiscard]] std::uint32_t width() const {
        return kind == AddressKind::SetBinding ? 1u : count;
    }

    [[nodiscard]] std::string format() const;
    [[nodiscard]] bool operator==(const NativeAddress&) const = default;
};

// Which half of a descriptor an address carries. Split backends place the
// image and sampler of a combined image sampler in different spaces.
enum class DescriptorPart : std::uint8_t {
    Whole,
    Texture,
    Sampler,
};

struct AddressPart {
    DescriptorPart part = DescriptorPart::Whole;
    NativeAddress  address;

    [[nodiscard]] bool operator==(const AddressPart&) const = default;
};

// One (set, binding, stage) and everything it resolves to.
struct RegisterEntry {
    std::uint32_t  set     = 0;
    std::uint32_t  binding = 0;
    ShaderStage    stage   = ShaderStage::None;
    DescriptorKind kind    = DescriptorKind::UniformBuffer;
    std::vector<AddressPart> parts;
};

// Addresses occupied by something other than a binding (push constants,
// argument buffers). Included in aliasing checks.
struct ReservedAddress {
    ShaderStage   stage = ShaderStage::None;
    NativeAddress address;
    std::string   what;
};

// Per-set data the heap/table and argument-buffer models need at bind time.
struct SetAddressing {
    std::optional<std::uint32_t> resourceTable;  // root parameter index
    std::optional<std::uint32_t> samplerTable;
    std::uint32_t resourceDescriptors = 0;       // heap run length
    std::uint32_t samplerDescriptors  = 0;
    std::map<ShaderStage, std::uint32_t> argumentBuffers; // stage -> buffer index
};

// Stable (set, binding, stage) -> native address mapping computed once per
// pipeline layout.
//
// Thread safety: immutable after construction.
class RegisterAssignment {
public:
    RegisterAssignment() = default;
    explicit RegisterAssignment(Backend backend) : backend_(backend) {}

    [[nodiscard]] Backend backend() const { return backend_; }

    [[nodiscard]] const RegisterEntry* find(std::uint32_t set, std::uint32_t binding,
                                            ShaderStage stage) const;

    [[nodiscard]] const std::vector<RegisterEntry>& entries() const { return entries_; }
    [[nodiscard]] const std::vector<ReservedAddress>& reserved() const { return reserved_; }
    [[nodiscard]] const std::vector<SetAddressing>& sets() const { return sets_; }

    [[nodiscard]] const std::optional<NativeAddress>& pushConstants() const {
        return pushConstants_;
    }
    [[nodiscard]] ShaderStage pushConstantStages() const { return pushStages_; }

    // Builders used by the allocation strategies.
    void addEntry(RegisterEntry entry);
    void reserve(ShaderStage stage, NativeAddress address, std::string what);
    void setPushConstants(ShaderStage stages, NativeAddress address);
    SetAddressing& addSet() { return sets_.emplace_back(); }

private:
    using Key = std::tuple<std::uint32_t, std::uint32_t, ShaderStage>;

    Backend backend_ = Backend::Vulkan;
    std::vector<RegisterEntry> entries_;
    std::map<Key, std::size_t> index_;
    std::vector<ReservedAddress> reserved_;
    std::vector<SetAddressing> sets_;
    std::optional<NativeAddress> pushConstants_;
    ShaderStage pushStages_ = ShaderStage::None;
};

// Fails with InvalidUsage when two entries (or an entry and a reserved
// address) of the same stage overlap in one register space and group.
[[nodiscard]] Result<void> verifyNoAliasing(const RegisterAssignment& assignment);

} // namespace gfxhal

#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace gfxhal {

enum class DescriptorKind : std::uint8_t {
    Sampler,
    CombinedImageSampler,
    SampledImage,
    StorageImage,
    UniformTexelBuffer,
    StorageTexelBuffer,
    UniformBuffer,
    StorageBuffer,
    UniformBufferDynamic,
    StorageBufferDynamic,
    InputAttachment,
};

[[nodiscard]] const char* toString(DescriptorKind kind);

[[nodiscard]] bool isBufferKind(DescriptorKind kind);
[[nodiscard]] bool isDynamicKind(DescriptorKind kind);

// True for kinds whose shader access may write. Storage kinds declared
// readOnly are not writable even though the kind is.
[[nodiscard]] bool isStorageKind(DescriptorKind kind);

struct DescriptorSetLayoutBinding {
    std::uint32_t  binding  = 0;
    DescriptorKind kind     = DescriptorKind::UniformBuffer;
    std::uint32_t  count    = 1;
    ShaderStage    stages   = ShaderStage::None;
    bool           readOnly = false; // storage kinds only

    [[nodiscard]] bool writable() const { return isStorageKind(kind) && !readOnly; }
    [[nodiscard]] bool operator==(const DescriptorSetLayoutBinding&) const = default;
};

// Ordered, immutable binding list. Shared (not owned) by pipeline layouts and
// descriptor sets via std::shared_ptr<const DescriptorSetLayout>.
//
// Thread safety: immutable after construction.
class DescriptorSetLayout {
public:
    // Validates: at least one binding, non-zero counts, non-empty stage masks,
    // unique binding indices, readOnly only on storage kinds.
    [[nodiscard]] static Result<std::shared_ptr<const DescriptorSetLayout>> create(
        std::vector<DescriptorSetLayoutBinding> bindings);

    [[nodiscard]] const std::vector<DescriptorSetLayoutBinding>& bindings() const {
        return bindings_;
    }

    // Declaration-order index of a binding number.
    [[nodiscard]] std::optional<std::size_t> indexOf(std::uint32_t binding) const;
    [[nodiscard]] const DescriptorSetLayoutBinding* find(std::uint32_t binding) const;

    // Sum of counts over bindings of the given kind.
    [[nodiscard]] std::uint32_t descriptorCount(DescriptorKind kind) const;
    [[nodiscard]] std::uint32_t totalDescriptorCount() const;
    [[nodiscard]] std::uint32_t dynamicDescriptorCount() const;
    [[nodiscard]] ShaderStage   stages() const;

private:
    DescriptorSetLayout() = default;

    std::vector<DescriptorSetLayoutBinding> bindings_;
};

using SetLayoutRef = std::shared_ptr<const DescriptorSetLayout>;

struct PushConstantRange {
    ShaderStage   stages = ShaderStage::None;
    std::uint32_t offset = 0;
    std::uint32_t size   = 0;
};

struct BufferDescriptor {
    ResourceRef   buffer;
    std::uint64_t offset = 0;
    std::uint64_t range  = WholeSize;
};

struct ImageDescriptor {
    ResourceRef image;
    ImageLayout layout = ImageLayout::ShaderReadOnly;
};

struct SamplerDescriptor {
    ResourceRef sampler;
};

struct CombinedImageSamplerDescriptor {
    ResourceRef image;
    ImageLayout layout = ImageLayout::ShaderReadOnly;
    ResourceRef sampler;
};

struct TexelBufferDescriptor {
    ResourceRef   buffer;
    Format        format = Format::R32Uint;
    std::uint64_t offset = 0;
    std::uint64_t range  = WholeSize;
};

// One array element of a binding. monostate is an unwritten slot.
using Descriptor = std::variant<std::monostate, BufferDescriptor, ImageDescriptor,
                                SamplerDescriptor, CombinedImageSamplerDescriptor,
                                TexelBufferDescriptor>;

// True when the descriptor's shape fits a binding of the given kind.
[[nodiscard]] bool accepts(DescriptorKind kind, const Descriptor& descriptor);

// Fluent helper mirroring the explicit API's binding declarations.
class DescriptorSetLayoutBuilder {
public:
    DescriptorSetLayoutBuilder& uniformBuffer(std::uint32_t binding, ShaderStage stages,
                                              std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& dynamicUniformBuffer(std::uint32_t binding, ShaderStage stages);
    DescriptorSetLayoutBuilder& storageBuffer(std::uint32_t binding, ShaderStage stages,
                                              bool readOnly = false, std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& sampledImage(std::uint32_t binding, ShaderStage stages,
                                             std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& storageImage(std::uint32_t binding, ShaderStage stages,
                                             bool readOnly = false, std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& sampler(std::uint32_t binding, ShaderStage stages,
                                        std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& combinedImageSampler(std::uint32_t binding, ShaderStage stages,
                                                     std::uint32_t count = 1);
    DescriptorSetLayoutBuilder& inputAttachment(std::uint32_t binding);
    DescriptorSetLayoutBuilder& add(const DescriptorSetLayoutBinding& binding);

    [[nodiscard]] Result<SetLayoutRef> build() const;

private:
    std::vector<DescriptorSetLayoutBinding> bindings_;
};

} // namespace gfxhal

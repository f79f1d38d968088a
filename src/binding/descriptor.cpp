#include <gfxhal/descriptor.hpp>

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace gfxhal {

const char* toString(DescriptorKind kind) {
    switch (kind) {
    case DescriptorKind::Sampler:              return "sampler";
    case DescriptorKind::CombinedImageSampler: return "combined image sampler";
    case DescriptorKind::SampledImage:         return "sampled image";
    case DescriptorKind::StorageImage:         return "storage image";
    case DescriptorKind::UniformTexelBuffer:   return "uniform texel buffer";
    case DescriptorKind::StorageTexelBuffer:   return "storage texel buffer";
    case DescriptorKind::UniformBuffer:        return "uniform buffer";
    case DescriptorKind::StorageBuffer:        return "storage buffer";
    case DescriptorKind::UniformBufferDynamic: return "dynamic uniform buffer";
    case DescriptorKind::StorageBufferDynamic: return "dynamic storage buffer";
    case DescriptorKind::InputAttachment:      return "input attachment";
    }
    return "descriptor";
}

bool isBufferKind(DescriptorKind kind) {
    switch (kind) {
    case DescriptorKind::UniformBuffer:
    case DescriptorKind::StorageBuffer:
    case DescriptorKind::UniformBufferDynamic:
    case DescriptorKind::StorageBufferDynamic:
    case DescriptorKind::UniformTexelBuffer:
    case DescriptorKind::StorageTexelBuffer:
        return true;
    default:
        return false;
    }
}

bool isDynamicKind(DescriptorKind kind) {
    return kind == DescriptorKind::UniformBufferDynamic ||
           kind == DescriptorKind::StorageBufferDynamic;
}

bool isStorageKind(DescriptorKind kind) {
    return kind == DescriptorKind::StorageBuffer ||
           kind == DescriptorKind::StorageBufferDynamic ||
           kind == DescriptorKind::StorageImage ||
           kind == DescriptorKind::StorageTexelBuffer;
}

bool accepts(DescriptorKind kind, const Descriptor& descriptor) {
    switch (kind) {
    case DescriptorKind::Sampler:
        return std::holds_alternative<SamplerDescriptor>(descriptor);
    case DescriptorKind::CombinedImageSampler:
        return std::holds_alternative<CombinedImageSamplerDescriptor>(descriptor);
    case DescriptorKind::SampledImage:
    case DescriptorKind::StorageImage:
    case DescriptorKind::InputAttachment:
        return std::holds_alternative<ImageDescriptor>(descriptor);
    case DescriptorKind::UniformTexelBuffer:
    case DescriptorKind::StorageTexelBuffer:
        return std::holds_alternative<TexelBufferDescriptor>(descriptor);
    case DescriptorKind::UniformBuffer:
    case DescriptorKind::StorageBuffer:
    case DescriptorKind::UniformBufferDynamic:
    case DescriptorKind::StorageBufferDynamic:
        return std::holds_alternative<BufferDescriptor>(descriptor);
    }
    return false;
}

Result<SetLayoutRef> DescriptorSetLayout::create(
    std::vector<DescriptorSetLayoutBinding> bindings) {
    if (bindings.empty()) {
        return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                     "no bindings -- a set layout needs at least one binding"};
    }

    std::unordered_set<std::uint32_t> seen;
    for (const auto& b : bindings) {
        if (!seen.insert(b.binding).second) {
            return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                         "binding " + std::to_string(b.binding) + " declared twice"};
        }
        if (b.count == 0) {
            return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                         "binding " + std::to_string(b.binding) + " has a zero count"};
        }
        if (!any(b.stages)) {
            return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                         "binding " + std::to_string(b.binding) + " is visible to no stage"};
        }
        if (b.readOnly && !isStorageKind(b.kind)) {
            return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                         "binding " + std::to_string(b.binding) +
                             ": readOnly only applies to storage descriptors"};
        }
        if (b.kind == DescriptorKind::InputAttachment && b.stages != ShaderStage::Fragment) {
            return Error{"create descriptor set layout", ErrorCode::InvalidUsage, 0,
                         "input attachments are fragment-only"};
        }
    }

    // std::make_shared cannot reach the private constructor.
    std::shared_ptr<DescriptorSetLayout> layout(new DescriptorSetLayout());
    layout->bindings_ = std::move(bindings);
    return SetLayoutRef(std::move(layout));
}

std::optional<std::size_t> DescriptorSetLayout::indexOf(std::uint32_t binding) const {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
        [binding](const DescriptorSetLayoutBinding& b) { return b.binding == binding; });
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - bindings_.begin());
}

const DescriptorSetLayoutBinding* DescriptorSetLayout::find(std::uint32_t binding) const {
    auto idx = indexOf(binding);
    return idx ? &bindings_[*idx] : nullptr;
}

std::uint32_t DescriptorSetLayout::descriptorCount(DescriptorKind kind) const {
    std::uint32_t total = 0;
    for (const auto& b : bindings_) {
        if (b.kind == kind) total += b.count;
    }
    return total;
}

std::uint32_t DescriptorSetLayout::totalDescriptorCount() const {
    std::uint32_t total = 0;
    for (const auto& b : bindings_) total += b.count;
    return total;
}

std::uint32_t DescriptorSetLayout::dynamicDescriptorCount() const {
    std::uint32_t total = 0;
    for (const auto& b : bindings_) {
        if (isDynamicKind(b.kind)) total += b.count;
    }
    return total;
}

ShaderStage DescriptorSetLayout::stages() const {
    ShaderStage s = ShaderStage::None;
    for (const auto& b : bindings_) s |= b.stages;
    return s;
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::uniformBuffer(
    std::uint32_t binding, ShaderStage stages, std::uint32_t count) {
    return add({binding, DescriptorKind::UniformBuffer, count, stages, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::dynamicUniformBuffer(
    std::uint32_t binding, ShaderStage stages) {
    return add({binding, DescriptorKind::UniformBufferDynamic, 1, stages, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::storageBuffer(
    std::uint32_t binding, ShaderStage stages, bool readOnly, std::uint32_t count) {
    return add({binding, DescriptorKind::StorageBuffer, count, stages, readOnly});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::sampledImage(
    std::uint32_t binding, ShaderStage stages, std::uint32_t count) {
    return add({binding, DescriptorKind::SampledImage, count, stages, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::storageImage(
    std::uint32_t binding, ShaderStage stages, bool readOnly, std::uint32_t count) {
    return add({binding, DescriptorKind::StorageImage, count, stages, readOnly});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::sampler(
    std::uint32_t binding, ShaderStage stages, std::uint32_t count) {
    return add({binding, DescriptorKind::Sampler, count, stages, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::combinedImageSampler(
    std::uint32_t binding, ShaderStage stages, std::uint32_t count) {
    return add({binding, DescriptorKind::CombinedImageSampler, count, stages, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::inputAttachment(std::uint32_t binding) {
    return add({binding, DescriptorKind::InputAttachment, 1, ShaderStage::Fragment, false});
}

DescriptorSetLayoutBuilder& DescriptorSetLayoutBuilder::add(
    const DescriptorSetLayoutBinding& binding) {
    bindings_.push_back(binding);
    return *this;
}

Result<SetLayoutRef> DescriptorSetLayoutBuilder::build() const {
    return DescriptorSetLayout::create(bindings_);
}

} // namespace gfxhal

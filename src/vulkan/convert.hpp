#pragma once

#include <gfxhal/descriptor.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/format.hpp>
#include <gfxhal/pipeline_desc.hpp>
#include <gfxhal/render_pass.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/types.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <type_traits>

namespace gfxhal::vulkan::detail {

// Non-dispatchable handles are pointers on 64-bit targets and uint64_t
// elsewhere; either way they fit a NativeHandle.
template <typename T>
[[nodiscard]] NativeHandle toNative(T handle) {
    if constexpr (std::is_pointer_v<T>) {
        return static_cast<NativeHandle>(reinterpret_cast<std::uintptr_t>(handle));
    } else {
        return static_cast<NativeHandle>(handle);
    }
}

template <typename T>
[[nodiscard]] T fromNative(NativeHandle handle) {
    if constexpr (std::is_pointer_v<T>) {
        return reinterpret_cast<T>(static_cast<std::uintptr_t>(handle));
    } else {
        return static_cast<T>(handle);
    }
}

[[nodiscard]] VkFormat              toVk(Format format);
[[nodiscard]] VkImageLayout         toVk(ImageLayout layout);
[[nodiscard]] VkPipelineStageFlags2 toVk(PipelineStage stages);
[[nodiscard]] VkAccessFlags2        toVk(Access access);
[[nodiscard]] VkDescriptorType      toVk(DescriptorKind kind);
[[nodiscard]] VkBufferUsageFlags    toVk(BufferUsage usage);
[[nodiscard]] VkFilter              toVk(Filter filter);
[[nodiscard]] VkSamplerAddressMode  toVk(AddressMode mode);
[[nodiscard]] VkCompareOp           toVk(CompareOp op);
[[nodiscard]] VkPrimitiveTopology   toVk(PrimitiveTopology topology);
[[nodiscard]] VkCullModeFlags       toVk(CullMode mode);
[[nodiscard]] VkFrontFace           toVk(FrontFace face);
[[nodiscard]] VkIndexType           toVk(IndexType type);
[[nodiscard]] VkAttachmentLoadOp    toVk(LoadOp op);
[[nodiscard]] VkAttachmentStoreOp   toVk(StoreOp op);

[[nodiscard]] VkShaderStageFlags    toVkStages(ShaderStage stages);
[[nodiscard]] VkShaderStageFlagBits toVkStage(ShaderStage stage);
[[nodiscard]] VkImageUsageFlags     toVkImageUsage(FormatFeature usage);
[[nodiscard]] VkSampleCountFlagBits toVkSamples(std::uint32_t samples);
[[nodiscard]] VkImageAspectFlags    aspectsOf(Format format);

[[nodiscard]] const char* toString(VkResult vr);
[[nodiscard]] ErrorCode   codeOf(VkResult vr);

// Error for a failed Vulkan call, classified from the result code.
[[nodiscard]] Error vkError(const char* operation, VkResult vr, const std::string& message);

} // namespace gfxhal::vulkan::detail

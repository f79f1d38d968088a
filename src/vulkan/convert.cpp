#include "convert.hpp"

namespace gfxhal::vulkan::detail {

VkFormat toVk(Format format) {
    switch (format) {
    case Format::Undefined:          return VK_FORMAT_UNDEFINED;
    case Format::R8Unorm:            return VK_FORMAT_R8_UNORM;
    case Format::R8G8Unorm:          return VK_FORMAT_R8G8_UNORM;
    case Format::R8G8B8Unorm:        return VK_FORMAT_R8G8B8_UNORM;
    case Format::R8G8B8A8Unorm:      return VK_FORMAT_R8G8B8A8_UNORM;
    case Format::R8G8B8A8Srgb:       return VK_FORMAT_R8G8B8A8_SRGB;
    case Format::B8G8R8A8Unorm:      return VK_FORMAT_B8G8R8A8_UNORM;
    case Format::B8G8R8A8Srgb:       return VK_FORMAT_B8G8R8A8_SRGB;
    case Format::R16G16B16A16Sfloat: return VK_FORMAT_R16G16B16A16_SFLOAT;
    case Format::R32Uint:            return VK_FORMAT_R32_UINT;
    case Format::R32Sfloat:          return VK_FORMAT_R32_SFLOAT;
    case Format::R32G32Sfloat:       return VK_FORMAT_R32G32_SFLOAT;
    case Format::R32G32B32Sfloat:    return VK_FORMAT_R32G32B32_SFLOAT;
    case Format::R32G32B32A32Sfloat: return VK_FORMAT_R32G32B32A32_SFLOAT;
    case Format::A2B10G10R10Unorm:   return VK_FORMAT_A2B10G10R10_UNORM_PACK32;
    case Format::B11G11R10Ufloat:    return VK_FORMAT_B10G11R11_UFLOAT_PACK32;
    case Format::D16Unorm:           return VK_FORMAT_D16_UNORM;
    case Format::D24UnormS8Uint:     return VK_FORMAT_D24_UNORM_S8_UINT;
    case Format::D32Sfloat:          return VK_FORMAT_D32_SFLOAT;
    case Format::D32SfloatS8Uint:    return VK_FORMAT_D32_SFLOAT_S8_UINT;
    case Format::Bc1RgbaUnorm:       return VK_FORMAT_BC1_RGBA_UNORM_BLOCK;
    case Format::Bc7Unorm:           return VK_FORMAT_BC7_UNORM_BLOCK;
    }
    return VK_FORMAT_UNDEFINED;
}

VkImageLayout toVk(ImageLayout layout) {
    switch (layout) {
    case ImageLayout::Undefined:              return VK_IMAGE_LAYOUT_UNDEFINED;
    case ImageLayout::General:                return VK_IMAGE_LAYOUT_GENERAL;
    case ImageLayout::ColorAttachment:        return VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    case ImageLayout::DepthStencilAttachment: return VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    case ImageLayout::DepthStencilReadOnly:   return VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL;
    case ImageLayout::ShaderReadOnly:         return VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    case ImageLayout::TransferSrc:            return VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    case ImageLayout::TransferDst:            return VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
    case ImageLayout::Preinitialized:         return VK_IMAGE_LAYOUT_PREINITIALIZED;
    case ImageLayout::Present:                return VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
    }
    return VK_IMAGE_LAYOUT_UNDEFINED;
}

VkPipelineStageFlags2 toVk(PipelineStage stages) {
    VkPipelineStageFlags2 out = VK_PIPELINE_STAGE_2_NONE;
    auto map = [&](PipelineStage s, VkPipelineStageFlags2 f) {
        if (any(stages & s)) out |= f;
    };
    map(PipelineStage::TopOfPipe,             VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT);
    map(PipelineStage::DrawIndirect,          VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT);
    map(PipelineStage::VertexInput,           VK_PIPELINE_STAGE_2_VERTEX_INPUT_BIT);
    map(PipelineStage::VertexShader,          VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT);
    map(PipelineStage::FragmentShader,        VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT);
    map(PipelineStage::EarlyFragmentTests,    VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT);
    map(PipelineStage::LateFragmentTests,     VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT);
    map(PipelineStage::ColorAttachmentOutput, VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
    map(PipelineStage::ComputeShader,         VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT);
    map(PipelineStage::Transfer,              VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT);
    map(PipelineStage::BottomOfPipe,          VK_PIPELINE_STAGE_2_BOTTOM_OF_PIPE_BIT);
    map(PipelineStage::Host,                  VK_PIPELINE_STAGE_2_HOST_BIT);
    map(PipelineStage::AllCommands,           VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
    return out;
}

VkAccessFlags2 toVk(Access access) {
    VkAccessFlags2 out = VK_ACCESS_2_NONE;
    auto map = [&](Access a, VkAccessFlags2 f) {
        if (any(access & a)) out |= f;
    };
    map(Access::IndirectCommandRead,         VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT);
    map(Access::IndexRead,                   VK_ACCESS_2_INDEX_READ_BIT);
    map(Access::VertexAttributeRead,         VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT);
    map(Access::UniformRead,                 VK_ACCESS_2_UNIFORM_READ_BIT);
    map(Access::InputAttachmentRead,         VK_ACCESS_2_INPUT_ATTACHMENT_READ_BIT);
    map(Access::ShaderRead,                  VK_ACCESS_2_SHADER_READ_BIT);
    map(Access::ShaderWrite,                 VK_ACCESS_2_SHADER_WRITE_BIT);
    map(Access::ColorAttachmentRead,         VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT);
    map(Access::ColorAttachmentWrite,        VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT);
    map(Access::DepthStencilAttachmentRead,  VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT);
    map(Access::DepthStencilAttachmentWrite, VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT);
    map(Access::TransferRead,                VK_ACCESS_2_TRANSFER_READ_BIT);
    map(Access::TransferWrite,               VK_ACCESS_2_TRANSFER_WRITE_BIT);
    map(Access::HostRead,                    VK_ACCESS_2_HOST_READ_BIT);
    map(Access::HostWrite,                   VK_ACCESS_2_HOST_WRITE_BIT);
    map(Access::MemoryRead,                  VK_ACCESS_2_MEMORY_READ_BIT);
    map(Access::MemoryWrite,                 VK_ACCESS_2_MEMORY_WRITE_BIT);
    return out;
}

VkDescriptorType toVk(DescriptorKind kind) {
    switch (kind) {
    case DescriptorKind::Sampler:              return VK_DESCRIPTOR_TYPE_SAMPLER;
    case DescriptorKind::CombinedImageSampler: return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    case DescriptorKind::SampledImage:         return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
    case DescriptorKind::StorageImage:         return VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    case DescriptorKind::UniformTexelBuffer:   return VK_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER;
    case DescriptorKind::StorageTexelBuffer:   return VK_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER;
    case DescriptorKind::UniformBuffer:        return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    case DescriptorKind::StorageBuffer:        return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    case DescriptorKind::UniformBufferDynamic: return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
    case DescriptorKind::StorageBufferDynamic: return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC;
    case DescriptorKind::InputAttachment:      return VK_DESCRIPTOR_TYPE_INPUT_ATTACHMENT;
    }
    return VK_DESCRIPTOR_TYPE_MAX_ENUM;
}

VkBufferUsageFlags toVk(BufferUsage usage) {
    VkBufferUsageFlags out = 0;
    auto map = [&](BufferUsage u, VkBufferUsageFlags f) {
        if (any(usage & u)) out |= f;
    };
    map(BufferUsage::TransferSrc,  VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
    map(BufferUsage::TransferDst,  VK_BUFFER_USAGE_TRANSFER_DST_BIT);
    map(BufferUsage::UniformTexel, VK_BUFFER_USAGE_UNIFORM_TEXEL_BUFFER_BIT);
    map(BufferUsage::StorageTexel, VK_BUFFER_USAGE_STORAGE_TEXEL_BUFFER_BIT);
    map(BufferUsage::Uniform,      VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
    map(BufferUsage::Storage,      VK_BUFFER_USAGE_STORAGE_BUFFER_BIT);
    map(BufferUsage::Index,        VK_BUFFER_USAGE_INDEX_BUFFER_BIT);
    map(BufferUsage::Vertex,       VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
    map(BufferUsage::Indirect,     VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT);
    return out;
}

VkFilter toVk(Filter filter) {
    return filter == Filter::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;
}

VkSamplerAddressMode toVk(AddressMode mode) {
    switch (mode) {
    case AddressMode::Repeat:         return VK_SAMPLER_ADDRESS_MODE_REPEAT;
    case AddressMode::MirroredRepeat: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
    case AddressMode::ClampToEdge:    return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    case AddressMode::ClampToBorder:  return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_BORDER;
    }
    return VK_SAMPLER_ADDRESS_MODE_REPEAT;
}

VkCompareOp toVk(CompareOp op) {
    switch (op) {
    case CompareOp::Never:          return VK_COMPARE_OP_NEVER;
    case CompareOp::Less:           return VK_COMPARE_OP_LESS;
    case CompareOp::Equal:          return VK_COMPARE_OP_EQUAL;
    case CompareOp::LessOrEqual:    return VK_COMPARE_OP_LESS_OR_EQUAL;
    case CompareOp::Greater:        return VK_COMPARE_OP_GREATER;
    case CompareOp::NotEqual:       return VK_COMPARE_OP_NOT_EQUAL;
    case CompareOp::GreaterOrEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
    case CompareOp::Always:         return VK_COMPARE_OP_ALWAYS;
    }
    return VK_COMPARE_OP_ALWAYS;
}

VkPrimitiveTopology toVk(PrimitiveTopology topology) {
    switch (topology) {
    case PrimitiveTopology::PointList:     return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
    case PrimitiveTopology::LineList:      return VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
    case PrimitiveTopology::LineStrip:     return VK_PRIMITIVE_TOPOLOGY_LINE_STRIP;
    case PrimitiveTopology::TriangleList:  return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    case PrimitiveTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
    }
    return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
}

VkCullModeFlags toVk(CullMode mode) {
    switch (mode) {
    case CullMode::None:  return VK_CULL_MODE_NONE;
    case CullMode::Front: return VK_CULL_MODE_FRONT_BIT;
    case CullMode::Back:  return VK_CULL_MODE_BACK_BIT;
    }
    return VK_CULL_MODE_NONE;
}

VkFrontFace toVk(FrontFace face) {
    return face == FrontFace::Clockwise ? VK_FRONT_FACE_CLOCKWISE
                                        : VK_FRONT_FACE_COUNTER_CLOCKWISE;
}

VkIndexType toVk(IndexType type) {
    return type == IndexType::Uint16 ? VK_INDEX_TYPE_UINT16 : VK_INDEX_TYPE_UINT32;
}

VkAttachmentLoadOp toVk(LoadOp op) {
    switch (op) {
    case LoadOp::Load:     return VK_ATTACHMENT_LOAD_OP_LOAD;
    case LoadOp::Clear:    return VK_ATTACHMENT_LOAD_OP_CLEAR;
    case LoadOp::DontCare: return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    }
    return VK_ATTACHMENT_LOAD_OP_DONT_CARE;
}

VkAttachmentStoreOp toVk(StoreOp op) {
    return op == StoreOp::Store ? VK_ATTACHMENT_STORE_OP_STORE : VK_ATTACHMENT_STORE_OP_DONT_CARE;
}

VkShaderStageFlags toVkStages(ShaderStage stages) {
    VkShaderStageFlags out = 0;
    for (ShaderStage s : kShaderStages) {
        if (any(stages & s)) out |= toVkStage(s);
    }
    return out;
}

VkShaderStageFlagBits toVkStage(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:   return VK_SHADER_STAGE_VERTEX_BIT;
    case ShaderStage::Hull:     return VK_SHADER_STAGE_TESSELLATION_CONTROL_BIT;
    case ShaderStage::Domain:   return VK_SHADER_STAGE_TESSELLATION_EVALUATION_BIT;
    case ShaderStage::Geometry: return VK_SHADER_STAGE_GEOMETRY_BIT;
    case ShaderStage::Fragment: return VK_SHADER_STAGE_FRAGMENT_BIT;
    case ShaderStage::Compute:  return VK_SHADER_STAGE_COMPUTE_BIT;
    default:                    return VK_SHADER_STAGE_ALL;
    }
}

VkImageUsageFlags toVkImageUsage(FormatFeature usage) {
    VkImageUsageFlags out = 0;
    auto map = [&](FormatFeature u, VkImageUsageFlags f) {
        if (any(usage & u)) out |= f;
    };
    map(FormatFeature::Sampled,         VK_IMAGE_USAGE_SAMPLED_BIT);
    map(FormatFeature::Storage,         VK_IMAGE_USAGE_STORAGE_BIT);
    map(FormatFeature::ColorTarget,     VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT);
    map(FormatFeature::DepthStencil,    VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT);
    map(FormatFeature::TransferSrc,     VK_IMAGE_USAGE_TRANSFER_SRC_BIT);
    map(FormatFeature::TransferDst,     VK_IMAGE_USAGE_TRANSFER_DST_BIT);
    map(FormatFeature::InputAttachment, VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT);
    return out;
}

VkSampleCountFlagBits toVkSamples(std::uint32_t samples) {
    switch (samples) {
    case 2:  return VK_SAMPLE_COUNT_2_BIT;
    case 4:  return VK_SAMPLE_COUNT_4_BIT;
    case 8:  return VK_SAMPLE_COUNT_8_BIT;
    case 16: return VK_SAMPLE_COUNT_16_BIT;
    default: return VK_SAMPLE_COUNT_1_BIT;
    }
}

VkImageAspectFlags aspectsOf(Format format) {
    const FormatAspect aspects = formatInfo(format).aspects;
    VkImageAspectFlags out = 0;
    if (any(aspects & FormatAspect::Color))   out |= VK_IMAGE_ASPECT_COLOR_BIT;
    if (any(aspects & FormatAspect::Depth))   out |= VK_IMAGE_ASPECT_DEPTH_BIT;
    if (any(aspects & FormatAspect::Stencil)) out |= VK_IMAGE_ASPECT_STENCIL_BIT;
    return out == 0 ? VK_IMAGE_ASPECT_COLOR_BIT : out;
}

const char* toString(VkResult vr) {
    switch (vr) {
    case VK_SUCCESS:                        return "success";
    case VK_NOT_READY:                      return "not ready";
    case VK_TIMEOUT:                        return "timeout";
    case VK_INCOMPLETE:                     return "incomplete";
    case VK_SUBOPTIMAL_KHR:                 return "swapchain suboptimal";
    case VK_ERROR_OUT_OF_HOST_MEMORY:       return "out of host memory";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:     return "out of GPU memory";
    case VK_ERROR_INITIALIZATION_FAILED:    return "initialization failed";
    case VK_ERROR_DEVICE_LOST:              return "device lost (GPU crashed or was removed)";
    case VK_ERROR_MEMORY_MAP_FAILED:        return "memory map failed";
    case VK_ERROR_LAYER_NOT_PRESENT:        return "requested layer not present";
    case VK_ERROR_EXTENSION_NOT_PRESENT:    return "requested extension not present";
    case VK_ERROR_FEATURE_NOT_PRESENT:      return "requested feature not present";
    case VK_ERROR_INCOMPATIBLE_DRIVER:      return "incompatible Vulkan driver";
    case VK_ERROR_TOO_MANY_OBJECTS:         return "too many objects";
    case VK_ERROR_FORMAT_NOT_SUPPORTED:     return "format not supported";
    case VK_ERROR_FRAGMENTED_POOL:          return "descriptor pool fragmented";
    case VK_ERROR_OUT_OF_POOL_MEMORY:       return "descriptor pool exhausted";
    case VK_ERROR_SURFACE_LOST_KHR:         return "surface lost";
    case VK_ERROR_OUT_OF_DATE_KHR:          return "swapchain out of date";
    default:
        return "unknown error";
    }
}

ErrorCode codeOf(VkResult vr) {
    switch (vr) {
    case VK_TIMEOUT:                     return ErrorCode::Timeout;
    case VK_ERROR_OUT_OF_HOST_MEMORY:
    case VK_ERROR_FRAGMENTED_POOL:
    case VK_ERROR_OUT_OF_POOL_MEMORY:    return ErrorCode::OutOfHostMemory;
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:  return ErrorCode::OutOfDeviceMemory;
    case VK_ERROR_MEMORY_MAP_FAILED:     return ErrorCode::WrongMemoryType;
    case VK_ERROR_DEVICE_LOST:           return ErrorCode::DeviceLost;
    case VK_ERROR_TOO_MANY_OBJECTS:      return ErrorCode::TooManyObjects;
    case VK_ERROR_FORMAT_NOT_SUPPORTED:  return ErrorCode::UnsupportedFormat;
    case VK_ERROR_FEATURE_NOT_PRESENT:
    case VK_ERROR_EXTENSION_NOT_PRESENT:
    case VK_ERROR_INCOMPATIBLE_DRIVER:   return ErrorCode::UnsupportedUsage;
    case VK_ERROR_SURFACE_LOST_KHR:      return ErrorCode::SurfaceLost;
    case VK_ERROR_OUT_OF_DATE_KHR:       return ErrorCode::OutOfDate;
    default:                             return ErrorCode::Native;
    }
}

Error vkError(const char* operation, VkResult vr, const std::string& message) {
    return Error{operation, codeOf(vr), static_cast<std::int32_t>(vr),
                 message + " (" + toString(vr) + ")"};
}

} // namespace gfxhal::vulkan::detail

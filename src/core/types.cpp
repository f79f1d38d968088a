#include <gfxhal/types.hpp>

namespace gfxhal {

const char* toString(Backend backend) {
    switch (backend) {
    case Backend::Vulkan: return "vulkan";
    case Backend::Dx11:   return "dx11";
    case Backend::Dx12:   return "dx12";
    case Backend::Metal:  return "metal";
    case Backend::Gl:     return "gl";
    }
    return "unknown";
}

const char* toString(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:   return "vertex";
    case ShaderStage::Hull:     return "hull";
    case ShaderStage::Domain:   return "domain";
    case ShaderStage::Geometry: return "geometry";
    case ShaderStage::Fragment: return "fragment";
    case ShaderStage::Compute:  return "compute";
    default:                    return "multiple";
    }
}

const char* toString(ImageLayout layout) {
    switch (layout) {
    case ImageLayout::Undefined:              return "undefined";
    case ImageLayout::General:                return "general";
    case ImageLayout::ColorAttachment:        return "color-attachment";
    case ImageLayout::DepthStencilAttachment: return "depth-stencil-attachment";
    case ImageLayout::DepthStencilReadOnly:   return "depth-stencil-read-only";
    case ImageLayout::ShaderReadOnly:         return "shader-read-only";
    case ImageLayout::TransferSrc:            return "transfer-src";
    case ImageLayout::TransferDst:            return "transfer-dst";
    case ImageLayout::Preinitialized:         return "preinitialized";
    case ImageLayout::Present:                return "present";
    }
    return "unknown";
}

LayoutUsage usageOf(ImageLayout layout) {
    switch (layout) {
    case ImageLayout::Undefined:
    case ImageLayout::Preinitialized:
        return {PipelineStage::TopOfPipe, Access::None};
    case ImageLayout::General:
        return {PipelineStage::AllCommands, Access::MemoryRead | Access::MemoryWrite};
    case ImageLayout::ColorAttachment:
        return {PipelineStage::ColorAttachmentOutput,
                Access::ColorAttachmentRead | Access::ColorAttachmentWrite};
    case ImageLayout::DepthStencilAttachment:
        return {PipelineStage::EarlyFragmentTests | PipelineStage::LateFragmentTests,
                Access::DepthStencilAttachmentRead | Access::DepthStencilAttachmentWrite};
    case ImageLayout::DepthStencilReadOnly:
        return {PipelineStage::EarlyFragmentTests | PipelineStage::FragmentShader,
                Access::DepthStencilAttachmentRead | Access::ShaderRead};
    case ImageLayout::ShaderReadOnly:
        return {PipelineStage::FragmentShader, Access::ShaderRead | Access::InputAttachmentRead};
    case ImageLayout::TransferSrc:
        return {PipelineStage::Transfer, Access::TransferRead};
    case ImageLayout::TransferDst:
        return {PipelineStage::Transfer, Access::TransferWrite};
    case ImageLayout::Present:
        return {PipelineStage::BottomOfPipe, Access::None};
    }
    return {PipelineStage::AllCommands, Access::MemoryRead | Access::MemoryWrite};
}

const char* toString(ObjectKind kind) {
    switch (kind) {
    case ObjectKind::Buffer:         return "buffer";
    case ObjectKind::Image:          return "image";
    case ObjectKind::Memory:         return "memory";
    case ObjectKind::Sampler:        return "sampler";
    case ObjectKind::PipelineLayout: return "pipeline layout";
    case ObjectKind::DescriptorPool: return "descriptor pool";
    case ObjectKind::DescriptorSet:  return "descriptor set";
    case ObjectKind::RenderPass:     return "render pass";
    case ObjectKind::Framebuffer:    return "framebuffer";
    case ObjectKind::Pipeline:       return "pipeline";
    case ObjectKind::Fence:          return "fence";
    case ObjectKind::Semaphore:      return "semaphore";
    case ObjectKind::CommandPool:    return "command pool";
    }
    return "object";
}

} // namespace gfxhal

#include <gfxhal/format.hpp>

namespace gfxhal {

FormatInfo formatInfo(Format format) {
    constexpr auto C = FormatAspect::Color;
    constexpr auto D = FormatAspect::Depth;
    constexpr auto DS = FormatAspect::Depth | FormatAspect::Stencil;

    switch (format) {
    case Format::Undefined:          return {0, 1, FormatAspect::None, false, false};
    case Format::R8Unorm:            return {1, 1, C, false, false};
    case Format::R8G8Unorm:          return {2, 1, C, false, false};
    case Format::R8G8B8Unorm:        return {3, 1, C, false, false};
    case Format::R8G8B8A8Unorm:      return {4, 1, C, false, false};
    case Format::R8G8B8A8Srgb:       return {4, 1, C, true, false};
    case Format::B8G8R8A8Unorm:      return {4, 1, C, false, false};
    case Format::B8G8R8A8Srgb:       return {4, 1, C, true, false};
    case Format::R16G16B16A16Sfloat: return {8, 1, C, false, false};
    case Format::R32Uint:            return {4, 1, C, false, false};
    case Format::R32Sfloat:          return {4, 1, C, false, false};
    case Format::R32G32Sfloat:       return {8, 1, C, false, false};
    case Format::R32G32B32Sfloat:    return {12, 1, C, false, false};
    case Format::R32G32B32A32Sfloat: return {16, 1, C, false, false};
    case Format::A2B10G10R10Unorm:   return {4, 1, C, false, false};
    case Format::B11G11R10Ufloat:    return {4, 1, C, false, false};
    case Format::D16Unorm:           return {2, 1, D, false, false};
    case Format::D24UnormS8Uint:     return {4, 1, DS, false, false};
    case Format::D32Sfloat:          return {4, 1, D, false, false};
    case Format::D32SfloatS8Uint:    return {8, 1, DS, false, false};
    case Format::Bc1RgbaUnorm:       return {8, 4, C, false, true};
    case Format::Bc7Unorm:           return {16, 4, C, false, true};
    }
    return {};
}

const char* toString(Format format) {
    switch (format) {
    case Format::Undefined:          return "undefined";
    case Format::R8Unorm:            return "r8-unorm";
    case Format::R8G8Unorm:          return "rg8-unorm";
    case Format::R8G8B8Unorm:        return "rgb8-unorm";
    case Format::R8G8B8A8Unorm:      return "rgba8-unorm";
    case Format::R8G8B8A8Srgb:       return "rgba8-srgb";
    case Format::B8G8R8A8Unorm:      return "bgra8-unorm";
    case Format::B8G8R8A8Srgb:       return "bgra8-srgb";
    case Format::R16G16B16A16Sfloat: return "rgba16-float";
    case Format::R32Uint:            return "r32-uint";
    case Format::R32Sfloat:          return "r32-float";
    case Format::R32G32Sfloat:       return "rg32-float";
    case Format::R32G32B32Sfloat:    return "rgb32-float";
    case Format::R32G32B32A32Sfloat: return "rgba32-float";
    case Format::A2B10G10R10Unorm:   return "rgb10a2-unorm";
    case Format::B11G11R10Ufloat:    return "rg11b10-float";
    case Format::D16Unorm:           return "d16-unorm";
    case Format::D24UnormS8Uint:     return "d24s8";
    case Format::D32Sfloat:          return "d32-float";
    case Format::D32SfloatS8Uint:    return "d32s8";
    case Format::Bc1RgbaUnorm:       return "bc1-rgba";
    case Format::Bc7Unorm:           return "bc7";
    }
    return "unknown";
}

// Baseline features shared by every backend before per-backend exceptions.
static FormatFeature baseline(Format format) {
    constexpr auto transfer = FormatFeature::TransferSrc | FormatFeature::TransferDst;
    constexpr auto renderable = FormatFeature::Sampled | FormatFeature::ColorTarget |
                                FormatFeature::Blend | FormatFeature::InputAttachment |
                                transfer;

    switch (format) {
    case Format::Undefined:
        return FormatFeature::None;
    case Format::R8Unorm:
    case Format::R8G8Unorm:
    case Format::R8G8B8A8Unorm:
        return renderable | FormatFeature::Storage | FormatFeature::Vertex;
    case Format::R8G8B8A8Srgb:
    case Format::B8G8R8A8Unorm:
    case Format::B8G8R8A8Srgb:
    case Format::A2B10G10R10Unorm:
    case Format::B11G11R10Ufloat:
        return renderable;
    case Format::R8G8B8Unorm:
        return FormatFeature::Sampled | FormatFeature::Vertex | transfer;
    case Format::R16G16B16A16Sfloat:
    case Format::R32G32Sfloat:
    case Format::R32G32B32A32Sfloat:
        return renderable | FormatFeature::Storage | FormatFeature::Vertex;
    case Format::R32Uint:
        return FormatFeature::Sampled | FormatFeature::ColorTarget | FormatFeature::Storage |
               FormatFeature::Vertex | FormatFeature::InputAttachment | transfer;
    case Format::R32Sfloat:
        return renderable | FormatFeature::Storage | FormatFeature::Vertex;
    case Format::R32G32B32Sfloat:
        return FormatFeature::Vertex | FormatFeature::Sampled | transfer;
    case Format::D16Unorm:
    case Format::D24UnormS8Uint:
    case Format::D32Sfloat:
    case Format::D32SfloatS8Uint:
        return FormatFeature::Sampled | FormatFeature::DepthStencil |
               FormatFeature::InputAttachment | transfer;
    case Format::Bc1RgbaUnorm:
    case Format::Bc7Unorm:
        return FormatFeature::Sampled | transfer;
    }
    return FormatFeature::None;
}

FormatFeature supportedFeatures(Backend backend, Format format) {
    FormatFeature f = baseline(format);

    switch (backend) {
    case Backend::Vulkan:
        // RGB8 is sampled on almost no desktop driver.
        if (format == Format::R8G8B8Unorm)
            f &= ~FormatFeature::Sampled;
        break;
    case Backend::Dx11:
    case Backend::Dx12:
        // No three-component 8-bit DXGI format exists.
        if (format == Format::R8G8B8Unorm)
            f = FormatFeature::None;
        // Typed UAV loads on RGBA32 and RGBA16 only.
        if (format == Format::R8G8Unorm)
            f &= ~FormatFeature::Storage;
        break;
    case Backend::Metal:
        // Apple GPUs have no packed D24S8.
        if (format == Format::D24UnormS8Uint)
            f = FormatFeature::None;
        if (format == Format::R8G8B8Unorm)
            f &= ~FormatFeature::Sampled;
        break;
    case Backend::Gl:
        // Image load/store on BGRA and sRGB is not portable.
        if (format == Format::B8G8R8A8Unorm || format == Format::B8G8R8A8Srgb)
            f &= ~(FormatFeature::Storage | FormatFeature::ColorTarget);
        // BC7 requires ARB_texture_compression_bptc.
        if (format == Format::Bc7Unorm)
            f = FormatFeature::None;
        break;
    }

    return f;
}

} // namespace gfxhal

#include <gfxhal/format.hpp>

#include <cassert>
#include <cstdio>
#include <cstring>
#include <initializer_list>

using gfxhal::Backend;
using gfxhal::Format;
using gfxhal::FormatFeature;

int main() {
    // Block sizes and aspects
    {
        assert(gfxhal::formatInfo(Format::R8G8B8A8Unorm).bytesPerBlock == 4);
        assert(gfxhal::formatInfo(Format::R32G32B32Sfloat).bytesPerBlock == 12);
        assert(gfxhal::formatInfo(Format::Bc1RgbaUnorm).blockWidth == 4);
        assert(gfxhal::formatInfo(Format::Bc1RgbaUnorm).compressed);
        assert(gfxhal::formatInfo(Format::R8G8B8A8Srgb).srgb);
        assert(!gfxhal::formatInfo(Format::R8G8B8A8Unorm).srgb);

        assert(gfxhal::isDepthFormat(Format::D32Sfloat));
        assert(gfxhal::isDepthFormat(Format::D24UnormS8Uint));
        assert(!gfxhal::isDepthFormat(Format::R32Sfloat));
        assert(any(gfxhal::formatInfo(Format::D32SfloatS8Uint).aspects &
                   gfxhal::FormatAspect::Stencil));
        std::printf("  format info: ok\n");
    }

    // Undefined supports nothing anywhere
    {
        for (Backend b : {Backend::Vulkan, Backend::Dx11, Backend::Dx12, Backend::Metal,
                          Backend::Gl}) {
            assert(gfxhal::supportedFeatures(b, Format::Undefined) == FormatFeature::None);
            assert(gfxhal::supports(b, Format::R8G8B8A8Unorm,
                                    FormatFeature::Sampled | FormatFeature::ColorTarget));
        }
        std::printf("  common formats: ok\n");
    }

    // Per-backend exceptions
    {
        assert(!gfxhal::supports(Backend::Dx12, Format::R8G8B8Unorm, FormatFeature::Vertex));
        assert(gfxhal::supports(Backend::Vulkan, Format::R8G8B8Unorm, FormatFeature::Vertex));
        assert(!gfxhal::supports(Backend::Vulkan, Format::R8G8B8Unorm, FormatFeature::Sampled));
        assert(!gfxhal::supports(Backend::Metal, Format::D24UnormS8Uint,
                                 FormatFeature::DepthStencil));
        assert(gfxhal::supports(Backend::Vulkan, Format::D24UnormS8Uint,
                                FormatFeature::DepthStencil));
        assert(!gfxhal::supports(Backend::Gl, Format::Bc7Unorm, FormatFeature::Sampled));
        assert(!gfxhal::supports(Backend::Gl, Format::B8G8R8A8Unorm, FormatFeature::ColorTarget));
        std::printf("  backend exceptions: ok\n");
    }

    // Depth formats are never colour targets, compressed ones never render
    {
        assert(!gfxhal::supports(Backend::Vulkan, Format::D32Sfloat, FormatFeature::ColorTarget));
        assert(!gfxhal::supports(Backend::Vulkan, Format::Bc7Unorm, FormatFeature::ColorTarget));
        assert(!gfxhal::supports(Backend::Vulkan, Format::Bc7Unorm, FormatFeature::Storage));
    }

    // Names
    {
        assert(std::strcmp(gfxhal::toString(Format::D32Sfloat), "d32-float") == 0);
        assert(std::strcmp(gfxhal::toString(Format::R8G8B8A8Srgb), "rgba8-srgb") == 0);
    }

    std::printf("format tests passed\n");
    return 0;
}

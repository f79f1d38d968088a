#pragma once

#include <gfxhal/types.hpp>

#include <cstdint>

namespace gfxhal {

enum class Format : std::uint8_t {
    Undefined,
    R8Unorm,
    R8G8Unorm,
    R8G8B8Unorm,
    R8G8B8A8Unorm,
    R8G8B8A8Srgb,
    B8G8R8A8Unorm,
    B8G8R8A8Srgb,
    R16G16B16A16Sfloat,
    R32Uint,
    R32Sfloat,
    R32G32Sfloat,
    R32G32B32Sfloat,
    R32G32B32A32Sfloat,
    A2B10G10R10Unorm,
    B11G11R10Ufloat,
    D16Unorm,
    D24UnormS8Uint,
    D32Sfloat,
    D32SfloatS8Uint,
    Bc1RgbaUnorm,
    Bc7Unorm,
};

enum class FormatAspect : std::uint8_t {
    None    = 0,
    Color   = 1u << 0,
    Depth   = 1u << 1,
    Stencil = 1u << 2,
};
GFXHAL_FLAGS(FormatAspect)

// What a format can be used for. Also reused as image usage requests.
enum class FormatFeature : std::uint16_t {
    None          = 0,
    Sampled       = 1u << 0,
    Storage       = 1u << 1,
    ColorTarget   = 1u << 2,
    DepthStencil  = 1u << 3,
    Blend         = 1u << 4,
    Vertex        = 1u << 5,
    TransferSrc   = 1u << 6,
    TransferDst   = 1u << 7,
    InputAttachment = 1u << 8,
};
GFXHAL_FLAGS(FormatFeature)

struct FormatInfo {
    std::uint32_t bytesPerBlock = 0;
    std::uint32_t blockWidth    = 1; // 4 for BC formats
    FormatAspect  aspects       = FormatAspect::None;
    bool          srgb          = false;
    bool          compressed    = false;
};

[[nodiscard]] FormatInfo formatInfo(Format format);
[[nodiscard]] const char* toString(Format format);

[[nodiscard]] inline bool isDepthFormat(Format format) {
    return any(formatInfo(format).aspects & FormatAspect::Depth);
}

// Conservative per-backend support prediction. The native shim remains the
// authority on exotic formats; these tables only encode what every device of
// a backend's class is guaranteed or known not to do.
[[nodiscard]] FormatFeature supportedFeatures(Backend backend, Format format);

[[nodiscard]] inline bool supports(Backend backend, Format format, FormatFeature wanted) {
    return contains(supportedFeatures(backend, format), wanted);
}

} // namespace gfxhal

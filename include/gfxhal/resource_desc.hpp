#pragma once

#include <gfxhal/format.hpp>
#include <gfxhal/handle.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <optional>

namespace gfxhal {

inline constexpr std::uint64_t WholeSize = ~std::uint64_t{0};

// What a recorded command or descriptor points at: the arena handle (checked
// for staleness at submit) and the native object it resolved to at record
// time.
struct ResourceRef {
    Handle       handle;
    NativeHandle native = NullHandle;

    [[nodiscard]] bool operator==(const ResourceRef&) const = default;
};

enum class BufferUsage : std::uint16_t {
    None         = 0,
    TransferSrc  = 1u << 0,
    TransferDst  = 1u << 1,
    UniformTexel = 1u << 2,
    StorageTexel = 1u << 3,
    Uniform      = 1u << 4,
    Storage      = 1u << 5,
    Index        = 1u << 6,
    Vertex       = 1u << 7,
    Indirect     = 1u << 8,
};
GFXHAL_FLAGS(BufferUsage)

struct BufferDesc {
    std::uint64_t size  = 0;
    BufferUsage   usage = BufferUsage::None;
};

struct ImageDesc {
    Extent3D      extent;
    Format        format      = Format::R8G8B8A8Unorm;
    std::uint32_t mipLevels   = 1;
    std::uint32_t arrayLayers = 1;
    std::uint32_t samples     = 1;
    FormatFeature usage       = FormatFeature::Sampled | FormatFeature::TransferDst;
};

enum class Filter : std::uint8_t {
    Nearest,
    Linear,
};

enum class AddressMode : std::uint8_t {
    Repeat,
    MirroredRepeat,
    ClampToEdge,
    ClampToBorder,
};

enum class CompareOp : std::uint8_t {
    Never,
    Less,
    Equal,
    LessOrEqual,
    Greater,
    NotEqual,
    GreaterOrEqual,
    Always,
};

struct SamplerDesc {
    Filter      magFilter     = Filter::Linear;
    Filter      minFilter     = Filter::Linear;
    Filter      mipFilter     = Filter::Linear;
    AddressMode addressU      = AddressMode::Repeat;
    AddressMode addressV      = AddressMode::Repeat;
    AddressMode addressW      = AddressMode::Repeat;
    float       maxAnisotropy = 1.0f;
    float       minLod        = 0.0f;
    float       maxLod        = 1000.0f;
    std::optional<CompareOp> compare; // depth comparison sampler when set
};

enum class IndexType : std::uint8_t {
    Uint16,
    Uint32,
};

struct ImageSubresourceRange {
    std::uint32_t baseMip    = 0;
    std::uint32_t mipCount   = 1;
    std::uint32_t baseLayer  = 0;
    std::uint32_t layerCount = 1;
};

struct BufferCopy {
    std::uint64_t srcOffset = 0;
    std::uint64_t dstOffset = 0;
    std::uint64_t size      = 0;
};

struct BufferImageCopy {
    std::uint64_t bufferOffset      = 0;
    std::uint32_t bufferRowLength   = 0; // texels; 0 = tightly packed
    std::uint32_t bufferImageHeight = 0;
    std::uint32_t mipLevel          = 0;
    std::uint32_t baseLayer         = 0;
    std::uint32_t layerCount        = 1;
    Offset3D      imageOffset;
    Extent3D      imageExtent;
};

} // namespace gfxhal

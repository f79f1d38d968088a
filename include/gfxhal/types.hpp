#pragma once

#include <cstdint>
#include <type_traits>

namespace gfxhal {

// Opaque native object handle. Vulkan non-dispatchable handles, COM pointers
// and host-side object ids all fit in 64 bits. 0 is the null handle.
using NativeHandle = std::uint64_t;
inline constexpr NativeHandle NullHandle = 0;

// Bitwise operators for scoped flag enums.
#define GFXHAL_FLAGS(E)                                                              \
    [[nodiscard]] constexpr E operator|(E a, E b) {                                  \
        using U = std::underlying_type_t<E>;                                         \
        return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));               \
    }                                                                                \
    [[nodiscard]] constexpr E operator&(E a, E b) {                                  \
        using U = std::underlying_type_t<E>;                                         \
        return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));                \
    }                                                                                \
    [[nodiscard]] constexpr E operator~(E a) {                                       \
        using U = std::underlying_type_t<E>;                                         \
        return static_cast<E>(~static_cast<U>(a));                                   \
    }                                                                                \
    constexpr E& operator|=(E& a, E b) { return a = a | b; }                         \
    constexpr E& operator&=(E& a, E b) { return a = a & b; }                         \
    [[nodiscard]] constexpr bool any(E a) {                                          \
        return static_cast<std::underlying_type_t<E>>(a) != 0;                       \
    }                                                                                \
    [[nodiscard]] constexpr bool contains(E a, E b) { return (a & b) == b; }

// The five native binding models. Chosen once per device.
enum class Backend : std::uint8_t {
    Vulkan, // explicit descriptor sets
    Dx11,   // flat registers per stage
    Dx12,   // descriptor heaps + root tables
    Metal,  // argument buffers / direct per-stage indices
    Gl,     // legacy flat uniforms, no sets
};

[[nodiscard]] const char* toString(Backend backend);

enum class ShaderStage : std::uint32_t {
    None     = 0,
    Vertex   = 1u << 0,
    Hull     = 1u << 1,
    Domain   = 1u << 2,
    Geometry = 1u << 3,
    Fragment = 1u << 4,
    Compute  = 1u << 5,

    AllGraphics = Vertex | Hull | Domain | Geometry | Fragment,
    All         = AllGraphics | Compute,
};
GFXHAL_FLAGS(ShaderStage)

// Individual stages in allocation order.
inline constexpr ShaderStage kShaderStages[] = {
    ShaderStage::Vertex, ShaderStage::Hull,     ShaderStage::Domain,
    ShaderStage::Geometry, ShaderStage::Fragment, ShaderStage::Compute,
};

[[nodiscard]] const char* toString(ShaderStage stage);

enum class PipelineStage : std::uint32_t {
    None                  = 0,
    TopOfPipe             = 1u << 0,
    DrawIndirect          = 1u << 1,
    VertexInput           = 1u << 2,
    VertexShader          = 1u << 3,
    FragmentShader        = 1u << 4,
    EarlyFragmentTests    = 1u << 5,
    LateFragmentTests     = 1u << 6,
    ColorAttachmentOutput = 1u << 7,
    ComputeShader         = 1u << 8,
    Transfer              = 1u << 9,
    BottomOfPipe          = 1u << 10,
    Host                  = 1u << 11,
    AllCommands           = 1u << 12,
};
GFXHAL_FLAGS(PipelineStage)

enum class Access : std::uint32_t {
    None                       = 0,
    IndirectCommandRead        = 1u << 0,
    IndexRead                  = 1u << 1,
    VertexAttributeRead        = 1u << 2,
    UniformRead                = 1u << 3,
    InputAttachmentRead        = 1u << 4,
    ShaderRead                 = 1u << 5,
    ShaderWrite                = 1u << 6,
    ColorAttachmentRead        = 1u << 7,
    ColorAttachmentWrite       = 1u << 8,
    DepthStencilAttachmentRead = 1u << 9,
    DepthStencilAttachmentWrite = 1u << 10,
    TransferRead               = 1u << 11,
    TransferWrite              = 1u << 12,
    HostRead                   = 1u << 13,
    HostWrite                  = 1u << 14,
    MemoryRead                 = 1u << 15,
    MemoryWrite                = 1u << 16,
};
GFXHAL_FLAGS(Access)

inline constexpr Access kWriteAccess =
    Access::ShaderWrite | Access::ColorAttachmentWrite | Access::DepthStencilAttachmentWrite |
    Access::TransferWrite | Access::HostWrite | Access::MemoryWrite;

[[nodiscard]] inline bool isWriteAccess(Access access) { return any(access & kWriteAccess); }

enum class ImageLayout : std::uint8_t {
    Undefined,
    General,
    ColorAttachment,
    DepthStencilAttachment,
    DepthStencilReadOnly,
    ShaderReadOnly,
    TransferSrc,
    TransferDst,
    Preinitialized,
    Present,
};

[[nodiscard]] const char* toString(ImageLayout layout);

// Stage and access that a resource in the given layout is used with.
// Used by the barrier planner to fill in both halves of a transition.
struct LayoutUsage {
    PipelineStage stages = PipelineStage::None;
    Access        access = Access::None;
};

[[nodiscard]] LayoutUsage usageOf(ImageLayout layout);

struct Extent2D {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;

    [[nodiscard]] bool operator==(const Extent2D&) const = default;
};

struct Extent3D {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;
    std::uint32_t depth  = 1;

    [[nodiscard]] bool operator==(const Extent3D&) const = default;
};

struct Offset3D {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;
};

struct Rect2D {
    std::int32_t x = 0;
    std::int32_t y = 0;
    Extent2D     extent;
};

struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float minDepth = 0.0f;
    float maxDepth = 1.0f;
};

// Native object kinds, used when retiring handles to the garbage collector.
enum class ObjectKind : std::uint8_t {
    Buffer,
    Image,
    Memory,
    Sampler,
    PipelineLayout,
    DescriptorPool,
    DescriptorSet,
    RenderPass,
    Framebuffer,
    Pipeline,
    Fence,
    Semaphore,
    CommandPool,
};

[[nodiscard]] const char* toString(ObjectKind kind);

} // namespace gfxhal

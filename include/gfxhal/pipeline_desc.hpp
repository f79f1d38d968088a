#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/format.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gfxhal {

enum class PipelineBindPoint : std::uint8_t {
    Graphics,
    Compute,
};

// Backend-neutral shader input. SPIR-V for the Vulkan shim, a registered
// program name for the soft shim; the translator decides.
struct ShaderSource {
    ShaderStage               stage = ShaderStage::None;
    std::vector<std::uint8_t> bytecode;
    std::string               entryPoint = "main";

    [[nodiscard]] static ShaderSource fromWords(ShaderStage stage,
                                                const std::vector<std::uint32_t>& words,
                                                std::string entryPoint = "main");
    [[nodiscard]] static ShaderSource fromText(ShaderStage stage, std::string_view text,
                                               std::string entryPoint = "main");
    [[nodiscard]] static Result<ShaderSource> fromFile(ShaderStage stage,
                                                       const std::filesystem::path& path,
                                                       std::string entryPoint = "main");
};

enum class PrimitiveTopology : std::uint8_t {
    PointList,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip,
};

enum class CullMode : std::uint8_t {
    None,
    Front,
    Back,
};

enum class FrontFace : std::uint8_t {
    CounterClockwise,
    Clockwise,
};

enum class VertexRate : std::uint8_t {
    Vertex,
    Instance,
};

struct VertexBinding {
    std::uint32_t binding = 0;
    std::uint32_t stride  = 0;
    VertexRate    rate    = VertexRate::Vertex;
};

struct VertexAttribute {
    std::uint32_t location = 0;
    std::uint32_t binding  = 0;
    Format        format   = Format::R32G32B32Sfloat;
    std::uint32_t offset   = 0;
};

struct RasterState {
    PrimitiveTopology topology  = PrimitiveTopology::TriangleList;
    CullMode          cullMode  = CullMode::None;
    FrontFace         frontFace = FrontFace::CounterClockwise;
    bool              wireframe = false;
};

struct DepthState {
    bool      test    = false;
    bool      write   = false;
    CompareOp compare = CompareOp::Less;
};

// Standard src-alpha / one-minus-src-alpha blending when enabled.
struct BlendState {
    bool enable = false;
};

} // namespace gfxhal

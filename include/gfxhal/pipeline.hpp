#pragma once

#include <gfxhal/device_object.hpp>
#include <gfxhal/pipeline_desc.hpp>
#include <gfxhal/register_allocator.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace gfxhal {

class PipelineLayout;
class RenderPass;

struct GraphicsPipelineDesc {
    const PipelineLayout*        layout     = nullptr;
    const RenderPass*            renderPass = nullptr;
    std::uint32_t                subpass    = 0;
    std::vector<ShaderSource>    stages;
    std::vector<VertexBinding>   vertexBindings;
    std::vector<VertexAttribute> vertexAttributes;
    RasterState                  raster;
    DepthState                   depth;
    std::vector<BlendState>      blend; // empty: blending off on every color attachment
};

struct ComputePipelineDesc {
    const PipelineLayout* layout = nullptr;
    ShaderSource          shader;
};

// Thread safety: immutable after construction.
class Pipeline : public DeviceObject {
public:
    Pipeline() = default;

    [[nodiscard]] PipelineBindPoint bindPoint()  const { return bindPoint_; }
    [[nodiscard]] Handle            layout()     const { return layout_; }
    [[nodiscard]] Handle            renderPass() const { return renderPass_; }
    [[nodiscard]] std::uint32_t     subpass()    const { return subpass_; }

    // Where each reflected resource of each stage was rebound.
    [[nodiscard]] const std::vector<std::pair<ShaderStage, std::vector<ShaderRemap>>>& remaps()
        const {
        return remaps_;
    }

private:
    friend class Device;

    PipelineBindPoint bindPoint_ = PipelineBindPoint::Graphics;
    Handle            layout_;
    Handle            renderPass_;
    std::uint32_t     subpass_ = 0;
    std::vector<std::pair<ShaderStage, std::vector<ShaderRemap>>> remaps_;
};

} // namespace gfxhal

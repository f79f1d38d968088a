#pragma once

#include <gfxhal/device_object.hpp>
#include <gfxhal/pass_planner.hpp>
#include <gfxhal/resource_desc.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace gfxhal {

// Attachments, subpasses and the barrier plan computed at creation.
//
// Thread safety: immutable after construction.
class RenderPass : public DeviceObject {
public:
    RenderPass() = default;

    [[nodiscard]] const RenderPassDesc& desc() const { return *desc_; }
    [[nodiscard]] const RenderPassPlan& plan() const { return *plan_; }
    [[nodiscard]] std::uint32_t subpassCount() const {
        return static_cast<std::uint32_t>(desc_->subpasses.size());
    }

private:
    friend class Device;
    friend class CommandBuffer;

    std::shared_ptr<const RenderPassDesc> desc_;
    std::shared_ptr<const RenderPassPlan> plan_;
};

class Framebuffer : public DeviceObject {
public:
    Framebuffer() = default;

    [[nodiscard]] Handle                          renderPass()  const { return renderPass_; }
    [[nodiscard]] const std::vector<ResourceRef>& attachments() const { return attachments_; }
    [[nodiscard]] Extent2D                        extent()      const { return extent_; }
    [[nodiscard]] std::uint32_t                   layers()      const { return layers_; }

private:
    friend class Device;

    Handle                   renderPass_;
    std::vector<ResourceRef> attachments_;
    Extent2D                 extent_;
    std::uint32_t            layers_ = 1;
};

} // namespace gfxhal

#pragma once

#include <gfxhal/descriptor.hpp>
#include <gfxhal/device_object.hpp>
#include <gfxhal/registers/assignment.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace gfxhal {

// Set layouts, the optional push-constant range, the register assignment
// computed for them, and the native layout object built from all three.
//
// Thread safety: immutable after construction.
class PipelineLayout : public DeviceObject {
public:
    PipelineLayout() = default;

    [[nodiscard]] const std::vector<SetLayoutRef>&      sets()          const { return sets_; }
    [[nodiscard]] const std::optional<PushConstantRange>& pushConstants() const { return push_; }
    [[nodiscard]] const RegisterAssignment&             assignment()    const { return *assignment_; }

    // Pipelines and command buffers keep the assignment alive past the layout.
    [[nodiscard]] std::shared_ptr<const RegisterAssignment> sharedAssignment() const {
        return assignment_;
    }

    // Sets s of both layouts were created from equal binding lists.
    [[nodiscard]] bool setCompatible(std::uint32_t set, const DescriptorSetLayout& layout) const;

private:
    friend class Device;

    std::vector<SetLayoutRef>                 sets_;
    std::optional<PushConstantRange>          push_;
    std::shared_ptr<const RegisterAssignment> assignment_;
};

} // namespace gfxhal

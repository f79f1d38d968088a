#include <gfxhal/register_allocator.hpp>

#include <utility>

namespace gfxhal {

Result<RegisterAssignment> ExplicitSetAllocator::assign(const std::vector<SetLayoutRef>& sets,
                                                        const PushConstantRange* push) const {
    RegisterAssignment out(Backend::Vulkan);

    for (std::uint32_t s = 0; s < sets.size(); ++s) {
        out.addSet();
        for (const auto& b : sets[s]->bindings()) {
            for (ShaderStage stage : kShaderStages) {
                if (!any(b.stages & stage)) continue;

                RegisterEntry e{s, b.binding, stage, b.kind, {}};
                e.parts.push_back(AddressPart{
                    DescriptorPart::Whole,
                    NativeAddress{AddressKind::SetBinding, RegisterSpace::Set, s, b.binding,
                                  b.count, {}}});
                out.addEntry(std::move(e));
            }
        }
    }

    // Native push constants: one block, no register.
    if (push) {
        out.setPushConstants(push->stages,
                             NativeAddress{AddressKind::PushConstant, RegisterSpace::PushConstant,
                                           0, 0, 1, {}});
    }
    return out;
}

} // namespace gfxhal

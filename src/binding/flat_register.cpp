#include <gfxhal/register_allocator.hpp>

#include <array>
#include <string>
#include <utility>

namespace gfxhal {

namespace {

struct StageCounters {
    std::uint32_t constantBuffers = 0;
    std::uint32_t textures        = 0;
    std::uint32_t samplers        = 0;
    std::uint32_t unorderedAccess = 0;
};

std::size_t stageSlot(ShaderStage stage) {
    for (std::size_t i = 0; i < std::size(kShaderStages); ++i) {
        if (kShaderStages[i] == stage) return i;
    }
    return 0;
}

Error exhausted(RegisterSpace space, ShaderStage stage, std::uint32_t limit,
                const DescriptorSetLayoutBinding& b, std::uint32_t set) {
    return Error{"create pipeline layout", ErrorCode::TooManyObjects, 0,
                 std::string(toString(space)) + "# registers exhausted in " +
                     toString(stage) + " stage by set " + std::to_string(set) +
                     " binding " + std::to_string(b.binding) + " (limit " +
                     std::to_string(limit) + ")"};
}

} // namespace

Result<RegisterAssignment> FlatRegisterAllocator::assign(const std::vector<SetLayoutRef>& sets,
                                                         const PushConstantRange* push) const {
    RegisterAssignment out(Backend::Dx11);
    std::array<StageCounters, std::size(kShaderStages)> counters{};

    // The top constant buffer is reserved whether or not push constants exist,
    // so adding a push range never moves other bindings.
    const std::uint32_t cbLimit = pushConstantSlot();

    for (std::uint32_t s = 0; s < sets.size(); ++s) {
        out.addSet();
        for (const auto& b : sets[s]->bindings()) {
            for (ShaderStage stage : kShaderStages) {
                if (!any(b.stages & stage)) continue;

                StageCounters& n = counters[stageSlot(stage)];
                RegisterEntry e{s, b.binding, stage, b.kind, {}};

                auto take = [&](std::uint32_t& counter, std::uint32_t limit, RegisterSpace space,
                                DescriptorPart part) -> Result<void> {
                    if (counter + b.count > limit) return exhausted(space, stage, limit, b, s);
                    e.parts.push_back(AddressPart{
                        part, NativeAddress{AddressKind::FlatSlot, space, 0, counter, b.count, {}}});
                    counter += b.count;
                    return {};
                };

                // Compute u# grow from u0. Graphics u# grow down from the top so
                // a run whose bottom-up base is u lands on [N - u - count, N - u).
                auto takeUav = [&]() -> Result<void> {
                    const std::uint32_t limit = limits_.unorderedAccess;
                    if (n.unorderedAccess + b.count > limit) {
                        return exhausted(RegisterSpace::UnorderedAccess, stage, limit, b, s);
                    }
                    std::uint32_t index = n.unorderedAccess;
                    if (stage != ShaderStage::Compute) index = limit - n.unorderedAccess - b.count;
                    e.parts.push_back(AddressPart{
                        DescriptorPart::Whole,
                        NativeAddress{AddressKind::FlatSlot, RegisterSpace::UnorderedAccess, 0,
                                      index, b.count, {}}});
                    n.unorderedAccess += b.count;
                    return {};
                };

                Result<void> r;
                switch (b.kind) {
                case DescriptorKind::UniformBuffer:
                case DescriptorKind::UniformBufferDynamic:
                    r = take(n.constantBuffers, cbLimit, RegisterSpace::ConstantBuffer,
                             DescriptorPart::Whole);
                    break;
                case DescriptorKind::Sampler:
                    r = take(n.samplers, limits_.samplers, RegisterSpace::Sampler,
                             DescriptorPart::Whole);
                    break;
                case DescriptorKind::CombinedImageSampler:
                    r = take(n.textures, limits_.textures, RegisterSpace::Texture,
                             DescriptorPart::Texture);
                    if (r.ok()) {
                        r = take(n.samplers, limits_.samplers, RegisterSpace::Sampler,
                                 DescriptorPart::Sampler);
                    }
                    break;
                case DescriptorKind::SampledImage:
                case DescriptorKind::UniformTexelBuffer:
                case DescriptorKind::InputAttachment:
                    r = take(n.textures, limits_.textures, RegisterSpace::Texture,
                             DescriptorPart::Whole);
                    break;
                case DescriptorKind::StorageBuffer:
                case DescriptorKind::StorageBufferDynamic:
                case DescriptorKind::StorageImage:
                case DescriptorKind::StorageTexelBuffer:
                    if (b.readOnly) {
                        r = take(n.textures, limits_.textures, RegisterSpace::Texture,
                                 DescriptorPart::Whole);
                    } else {
                        r = takeUav();
                    }
                    break;
                }
                if (!r.ok()) return std::move(r.error());

                out.addEntry(std::move(e));
            }
        }
    }

    if (push) {
        out.setPushConstants(push->stages,
                             NativeAddress{AddressKind::FlatSlot, RegisterSpace::ConstantBuffer, 0,
                                           pushConstantSlot(), 1, {}});
    }
    return out;
}

} // namespace gfxhal

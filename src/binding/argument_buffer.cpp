#include <gfxhal/register_allocator.hpp>

#include <array>
#include <string>
#include <utility>

namespace gfxhal {

namespace {

struct StageCounters {
    std::uint32_t buffers  = 0;
    std::uint32_t textures = 0;
    std::uint32_t samplers = 0;
};

// Metal exposes vertex, fragment and kernel functions only.
constexpr ShaderStage kMetalStages = ShaderStage::Vertex | ShaderStage::Fragment |
                                     ShaderStage::Compute;

std::size_t stageSlot(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:   return 0;
    case ShaderStage::Fragment: return 1;
    default:                    return 2;
    }
}

Error exhausted(const char* what, ShaderStage stage, std::uint32_t limit, std::uint32_t set) {
    return Error{"create pipeline layout", ErrorCode::TooManyObjects, 0,
                 std::string(what) + " indices exhausted in " + toString(stage) +
                     " stage while assigning set " + std::to_string(set) + " (limit " +
                     std::to_string(limit) + ")"};
}

} // namespace

Result<RegisterAssignment> ArgumentBufferAllocator::assign(const std::vector<SetLayoutRef>& sets,
                                                           const PushConstantRange* push) const {
    RegisterAssignment out(Backend::Metal);
    std::array<StageCounters, 3> counters{};
    const std::uint32_t bufferLimit = pushConstantSlot();

    if (push && any(push->stages & ~kMetalStages)) {
        return Error{"create pipeline layout", ErrorCode::UnsupportedUsage, 0,
                     "push constants visible to a stage this backend does not have"};
    }

    for (std::uint32_t s = 0; s < sets.size(); ++s) {
        const auto& layout = *sets[s];
        if (any(layout.stages() & ~kMetalStages)) {
            return Error{"create pipeline layout", ErrorCode::UnsupportedUsage, 0,
                         "set " + std::to_string(s) +
                             " is visible to hull, domain or geometry stages, which have no "
                             "argument table on this backend"};
        }

        SetAddressing& info = out.addSet();

        if (mode_ == Mode::ArgumentBuffers) {
            for (ShaderStage stage : kShaderStages) {
                if (!any(layout.stages() & stage)) continue;
                auto& n = counters[stageSlot(stage)];
                if (n.buffers + 1 > bufferLimit) return exhausted("buffer", stage, bufferLimit, s);
                info.argumentBuffers[stage] = n.buffers;
                out.reserve(stage,
                            NativeAddress{AddressKind::FlatSlot, RegisterSpace::Buffer, 0,
                                          n.buffers, 1, {}},
                            "set " + std::to_string(s) + " argument buffer");
                ++n.buffers;
            }
            const auto argumentBuffers = info.argumentBuffers;

            // Argument ids are shared by every stage: the encoded buffer is the
            // same, only the buffer index it is bound at differs.
            std::uint32_t id = 0;
            for (const auto& b : layout.bindings()) {
                for (ShaderStage stage : kShaderStages) {
                    if (!any(b.stages & stage)) continue;
                    const std::uint32_t group = argumentBuffers.at(stage);
                    RegisterEntry e{s, b.binding, stage, b.kind, {}};
                    if (b.kind == DescriptorKind::CombinedImageSampler) {
                        e.parts.push_back({DescriptorPart::Texture,
                                           NativeAddress{AddressKind::ArgumentIndex,
                                                         RegisterSpace::Argument, group, id,
                                                         b.count, {}}});
                        e.parts.push_back({DescriptorPart::Sampler,
                                           NativeAddress{AddressKind::ArgumentIndex,
                                                         RegisterSpace::Argument, group,
                                                         id + b.count, b.count, {}}});
                    } else {
                        e.parts.push_back({DescriptorPart::Whole,
                                           NativeAddress{AddressKind::ArgumentIndex,
                                                         RegisterSpace::Argument, group, id,
                                                         b.count, {}}});
                    }
                    out.addEntry(std::move(e));
                }
                id += b.kind == DescriptorKind::CombinedImageSampler ? 2 * b.count : b.count;
            }
            continue;
        }

        for (const auto& b : layout.bindings()) {
            for (ShaderStage stage : kShaderStages) {
                if (!any(b.stages & stage)) continue;
                auto& n = counters[stageSlot(stage)];
                RegisterEntry e{s, b.binding, stage, b.kind, {}};

                auto take = [&](std::uint32_t& counter, std::uint32_t limit, RegisterSpace space,
                                DescriptorPart part, const char* what) -> Result<void> {
                    if (counter + b.count > limit) return exhausted(what, stage, limit, s);
                    e.parts.push_back(AddressPart{
                        part, NativeAddress{AddressKind::FlatSlot, space, 0, counter, b.count, {}}});
                    counter += b.count;
                    return {};
                };

                Result<void> r;
                switch (b.kind) {
                case DescriptorKind::UniformBuffer:
                case DescriptorKind::UniformBufferDynamic:
                case DescriptorKind::StorageBuffer:
                case DescriptorKind::StorageBufferDynamic:
                    r = take(n.buffers, bufferLimit, RegisterSpace::Buffer, DescriptorPart::Whole,
                             "buffer");
                    break;
                case DescriptorKind::Sampler:
                    r = take(n.samplers, limits_.samplers, RegisterSpace::MetalSampler,
                             DescriptorPart::Whole, "sampler");
                    break;
                case DescriptorKind::CombinedImageSampler:
                    r = take(n.textures, limits_.textures, RegisterSpace::MetalTexture,
                             DescriptorPart::Texture, "texture");
                    if (r.ok()) {
                        r = take(n.samplers, limits_.samplers, RegisterSpace::MetalSampler,
                                 DescriptorPart::Sampler, "sampler");
                    }
                    break;
                case DescriptorKind::SampledImage:
                case DescriptorKind::StorageImage:
                case DescriptorKind::UniformTexelBuffer:
                case DescriptorKind::StorageTexelBuffer:
                case DescriptorKind::InputAttachment:
                    r = take(n.textures, limits_.textures, RegisterSpace::MetalTexture,
                             DescriptorPart::Whole, "texture");
                    break;
                }
                if (!r.ok()) return std::move(r.error());

                out.addEntry(std::move(e));
            }
        }
    }

    if (push) {
        out.setPushConstants(push->stages,
                             NativeAddress{AddressKind::FlatSlot, RegisterSpace::Buffer, 0,
                                           pushConstantSlot(), 1, {}});
    }
    return out;
}

} // namespace gfxhal

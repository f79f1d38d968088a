#include <gfxhal/register_allocator.hpp>

#include <numeric>
#include <string>
#include <utility>

namespace gfxhal {

namespace {

RegisterSpace uniformSpace(DescriptorKind kind) {
    switch (kind) {
    case DescriptorKind::Sampler:
        return RegisterSpace::GlSampler;
    case DescriptorKind::CombinedImageSampler:
    case DescriptorKind::SampledImage:
    case DescriptorKind::UniformTexelBuffer:
    case DescriptorKind::InputAttachment:
        return RegisterSpace::GlTexture;
    case DescriptorKind::StorageImage:
    case DescriptorKind::StorageTexelBuffer:
        return RegisterSpace::GlImage;
    case DescriptorKind::UniformBuffer:
    case DescriptorKind::UniformBufferDynamic:
        return RegisterSpace::GlUniformBlock;
    case DescriptorKind::StorageBuffer:
    case DescriptorKind::StorageBufferDynamic:
        return RegisterSpace::GlStorageBlock;
    }
    return RegisterSpace::GlTexture;
}

} // namespace

Result<RegisterAssignment> FlatUniformAllocator::assign(const std::vector<SetLayoutRef>& sets,
                                                        const PushConstantRange* push) const {
    RegisterAssignment out(Backend::Gl);

    // Program-wide counters: GL has no per-stage binding tables.
    std::uint32_t textures = 0;
    std::uint32_t samplers = 0;
    std::uint32_t images   = 0;
    std::uint32_t uniforms = 0;
    std::uint32_t storage  = 0;

    for (std::uint32_t s = 0; s < sets.size(); ++s) {
        out.addSet();
        for (const auto& b : sets[s]->bindings()) {
            const RegisterSpace space = uniformSpace(b.kind);

            std::uint32_t* counter = nullptr;
            std::uint32_t  limit   = 0;
            switch (space) {
            case RegisterSpace::GlSampler:
                counter = &samplers;
                limit   = limits_.textureUnits;
                break;
            case RegisterSpace::GlImage:
                counter = &images;
                limit   = limits_.imageUnits;
                break;
            case RegisterSpace::GlUniformBlock:
                counter = &uniforms;
                limit   = pushConstantBlock();
                break;
            case RegisterSpace::GlStorageBlock:
                counter = &storage;
                limit   = limits_.storageBlocks;
                break;
            default:
                counter = &textures;
                limit   = limits_.textureUnits;
                break;
            }

            if (*counter + b.count > limit) {
                return Error{"create pipeline layout", ErrorCode::TooManyObjects, 0,
                             std::string(toString(space)) + " bindings exhausted by set " +
                                 std::to_string(s) + " binding " + std::to_string(b.binding) +
                                 " (limit " + std::to_string(limit) + ")"};
            }

            NativeAddress address{AddressKind::UniformIndices, space, 0, *counter, b.count, {}};
            address.elements.resize(b.count);
            std::iota(address.elements.begin(), address.elements.end(), *counter);
            *counter += b.count;

            for (ShaderStage stage : kShaderStages) {
                if (!any(b.stages & stage)) continue;
                RegisterEntry e{s, b.binding, stage, b.kind, {}};
                e.parts.push_back(AddressPart{DescriptorPart::Whole, address});
                out.addEntry(std::move(e));
            }
        }
    }

    // Push constants become a plain uniform block at the top binding.
    if (push) {
        out.setPushConstants(push->stages,
                             NativeAddress{AddressKind::FlatSlot, RegisterSpace::GlUniformBlock, 0,
                                           pushConstantBlock(), 1, {}});
    }
    return out;
}

} // namespace gfxhal

#include <gfxhal/register_allocator.hpp>

#include <string>
#include <utility>

namespace gfxhal {

std::vector<HeapOffsets> heapTableOffsets(const DescriptorSetLayout& layout) {
    std::vector<HeapOffsets> out;
    out.reserve(layout.bindings().size());

    HeapOffsets next;
    for (const auto& b : layout.bindings()) {
        out.push_back(next);
        if (b.kind != DescriptorKind::Sampler) {
            if (b.kind == DescriptorKind::CombinedImageSampler) next.sampler += b.count;
            next.resource += b.count;
        } else {
            next.sampler += b.count;
        }
    }
    return out;
}

Result<RegisterAssignment> HeapTableAllocator::assign(const std::vector<SetLayoutRef>& sets,
                                                      const PushConstantRange* push) const {
    RegisterAssignment out(Backend::Dx12);

    std::uint32_t rootParam = 0;
    std::uint32_t dwords    = 0;
    if (push) {
        rootParam = 1;
        dwords += (push->size + 3) / 4;
    }

    for (std::uint32_t s = 0; s < sets.size(); ++s) {
        const auto& layout  = *sets[s];
        const auto  offsets = heapTableOffsets(layout);

        std::uint32_t resources = 0;
        std::uint32_t samplers  = 0;
        for (const auto& b : layout.bindings()) {
            if (b.kind != DescriptorKind::Sampler) resources += b.count;
            if (b.kind == DescriptorKind::Sampler || b.kind == DescriptorKind::CombinedImageSampler)
                samplers += b.count;
        }

        SetAddressing& info = out.addSet();
        info.resourceDescriptors = resources;
        info.samplerDescriptors  = samplers;
        if (resources > 0) {
            info.resourceTable = rootParam++;
            ++dwords;
        }
        if (samplers > 0) {
            info.samplerTable = rootParam++;
            ++dwords;
        }

        const std::uint32_t resourceTable = info.resourceTable.value_or(0);
        const std::uint32_t samplerTable  = info.samplerTable.value_or(0);

        auto tableAddress = [](RegisterSpace space, std::uint32_t table, std::uint32_t offset,
                               std::uint32_t count) {
            return NativeAddress{AddressKind::TableOffset, space, table, offset, count, {}};
        };

        for (std::size_t i = 0; i < layout.bindings().size(); ++i) {
            const auto& b = layout.bindings()[i];
            std::vector<AddressPart> parts;
            switch (b.kind) {
            case DescriptorKind::Sampler:
                parts.push_back({DescriptorPart::Whole,
                                 tableAddress(RegisterSpace::SamplerHeap, samplerTable,
                                              offsets[i].sampler, b.count)});
                break;
            case DescriptorKind::CombinedImageSampler:
                parts.push_back({DescriptorPart::Texture,
                                 tableAddress(RegisterSpace::ResourceHeap, resourceTable,
                                              offsets[i].resource, b.count)});
                parts.push_back({DescriptorPart::Sampler,
                                 tableAddress(RegisterSpace::SamplerHeap, samplerTable,
                                              offsets[i].sampler, b.count)});
                break;
            default:
                parts.push_back({DescriptorPart::Whole,
                                 tableAddress(RegisterSpace::ResourceHeap, resourceTable,
                                              offsets[i].resource, b.count)});
                break;
            }

            // Tables are visible to every stage the binding names; the address
            // is identical in each.
            for (ShaderStage stage : kShaderStages) {
                if (!any(b.stages & stage)) continue;
                out.addEntry(RegisterEntry{s, b.binding, stage, b.kind, parts});
            }
        }
    }

    if (dwords > limits_.rootSignatureDwords) {
        return Error{"create pipeline layout", ErrorCode::TooManyObjects, 0,
                     "root signature needs " + std::to_string(dwords) + " DWORDs (limit " +
                         std::to_string(limits_.rootSignatureDwords) +
                         ") -- use fewer sets or a smaller push constant range"};
    }

    if (push) {
        out.setPushConstants(push->stages,
                             NativeAddress{AddressKind::PushConstant, RegisterSpace::RootConstants,
                                           0, 0, 1, {}});
    }
    return out;
}

} // namespace gfxhal

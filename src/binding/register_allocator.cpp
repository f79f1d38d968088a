#include <gfxhal/register_allocator.hpp>

#include <string>
#include <utility>

namespace gfxhal {

RegisterAllocator RegisterAllocator::forBackend(Backend backend) {
    switch (backend) {
    case Backend::Vulkan: return {backend, ExplicitSetAllocator{}};
    case Backend::Dx11:   return {backend, FlatRegisterAllocator{}};
    case Backend::Dx12:   return {backend, HeapTableAllocator{}};
    case Backend::Metal:
        return {backend, ArgumentBufferAllocator{ArgumentBufferAllocator::Mode::ArgumentBuffers}};
    case Backend::Gl:     return {backend, FlatUniformAllocator{}};
    }
    return {Backend::Vulkan, ExplicitSetAllocator{}};
}

Result<RegisterAssignment> RegisterAllocator::assign(
    const std::vector<SetLayoutRef>& sets,
    const std::vector<PushConstantRange>& pushConstants) const {
    for (std::size_t i = 0; i < sets.size(); ++i) {
        if (!sets[i]) {
            return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                         "set layout " + std::to_string(i) + " is null"};
        }
    }

    if (pushConstants.size() > 1) {
        return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                     "at most one push constant range is supported -- merge ranges into one "
                     "block visible to every stage that needs it"};
    }

    const PushConstantRange* push = pushConstants.empty() ? nullptr : &pushConstants.front();
    if (push) {
        if (push->size == 0 || !any(push->stages)) {
            return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                         "push constant range has zero size or no stages"};
        }
        if (push->offset % 4 != 0 || push->size % 4 != 0) {
            return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                         "push constant offset and size must be multiples of 4"};
        }
    }

    auto assignment = std::visit(
        [&](const auto& strategy) { return strategy.assign(sets, push); }, strategy_);
    if (!assignment.ok()) return assignment;

    auto aliasing = verifyNoAliasing(assignment.value());
    if (!aliasing.ok()) return std::move(aliasing.error());

    return assignment;
}

namespace {

// Reflection cannot tell a dynamic buffer from a static one.
bool compatible(DescriptorKind reflected, DescriptorKind declared) {
    auto base = [](DescriptorKind k) {
        if (k == DescriptorKind::UniformBufferDynamic) return DescriptorKind::UniformBuffer;
        if (k == DescriptorKind::StorageBufferDynamic) return DescriptorKind::StorageBuffer;
        return k;
    };
    return base(reflected) == base(declared);
}

} // namespace

Result<std::vector<ShaderRemap>> RegisterAllocator::remap(
    const RegisterAssignment& assignment, const std::vector<SetLayoutRef>& sets,
    const std::vector<ReflectedBinding>& reflected, ShaderStage stage) const {
    std::vector<ShaderRemap> out;
    out.reserve(reflected.size());

    for (const auto& r : reflected) {
        ShaderRemap m;
        m.name = r.name;

        if (r.pushConstant) {
            if (!assignment.pushConstants() || !any(assignment.pushConstantStages() & stage)) {
                return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                             std::string(toString(stage)) +
                                 " shader reads push constants the pipeline layout does not "
                                 "declare for this stage"};
            }
            m.pushConstant = true;
            m.parts.push_back({DescriptorPart::Whole, *assignment.pushConstants()});
            out.push_back(std::move(m));
            continue;
        }

        const std::string where = "'" + r.name + "' (set " + std::to_string(r.set) +
                                  " binding " + std::to_string(r.binding) + ")";

        if (r.set >= sets.size() || !sets[r.set]) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " references a set the pipeline layout does not have"};
        }
        const auto* declared = sets[r.set]->find(r.binding);
        if (!declared) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " is not declared in the set layout"};
        }
        if (!compatible(r.kind, declared->kind)) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " is a " + toString(r.kind) + " in the shader but a " +
                             toString(declared->kind) + " in the layout"};
        }
        if (r.count > declared->count) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " indexes " + std::to_string(r.count) +
                             " elements but the layout declares " +
                             std::to_string(declared->count)};
        }
        if (r.writable && !declared->writable()) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " is written by the shader but declared read-only"};
        }

        const RegisterEntry* entry = assignment.find(r.set, r.binding, stage);
        if (!entry) {
            return Error{"remap shader", ErrorCode::InvalidUsage, 0,
                         where + " is not visible to the " + std::string(toString(stage)) +
                             " stage"};
        }

        m.set     = r.set;
        m.binding = r.binding;
        m.parts   = entry->parts;
        out.push_back(std::move(m));
    }
    return out;
}

Result<void> RegisterAllocator::verifyRenderTargetSlots(const RegisterAssignment& assignment,
                                                        std::uint32_t colorCount) const {
    if (!std::holds_alternative<FlatRegisterAllocator>(strategy_)) return {};

    for (const auto& e : assignment.entries()) {
        if (e.stage == ShaderStage::Compute) continue;
        for (const auto& p : e.parts) {
            if (p.address.space != RegisterSpace::UnorderedAccess) continue;
            if (p.address.index < colorCount) {
                return Error{"create graphics pipeline", ErrorCode::InvalidUsage, 0,
                             "set " + std::to_string(e.set) + " binding " +
                                 std::to_string(e.binding) + " occupies u" +
                                 std::to_string(p.address.index) + ", which overlaps the " +
                                 std::to_string(colorCount) + " render target slot(s)"};
            }
        }
    }
    return {};
}

} // namespace gfxhal

#include <gfxhal/device.hpp>

#include "../core/device_core.hpp"

#include <string>
#include <utility>
#include <variant>

namespace gfxhal {

namespace {

struct Slot {
    std::size_t   index   = 0; // declaration-order binding index
    std::uint32_t element = 0;
};

// Walks `count` consecutive elements starting at (binding, element), rolling
// over into binding + 1, + 2 ... once an array is exhausted. Every binding
// rolled into must match the first one's kind and stages.
Result<std::vector<Slot>> walk(const DescriptorSetLayout& layout, std::uint32_t binding,
                               std::uint32_t element, std::size_t count, const char* operation) {
    auto first = layout.indexOf(binding);
    if (!first) {
        return Error{operation, ErrorCode::InvalidUsage, 0,
                     "binding " + std::to_string(binding) + " is not in the set layout"};
    }

    const auto& bindings = layout.bindings();
    const auto& origin   = bindings[*first];

    std::vector<Slot> out;
    out.reserve(count);
    std::size_t   index = *first;
    std::uint32_t e     = element;
    for (std::size_t i = 0; i < count; ++i) {
        while (e >= bindings[index].count) {
            e -= bindings[index].count;
            auto next = layout.indexOf(bindings[index].binding + 1);
            if (!next) {
                return Error{operation, ErrorCode::InvalidUsage, 0,
                             "update of binding " + std::to_string(binding) +
                                 " runs past the end of binding " +
                                 std::to_string(bindings[index].binding) +
                                 " and no consecutive binding follows"};
            }
            const auto& b = bindings[*next];
            if (b.kind != origin.kind || b.stages != origin.stages) {
                return Error{operation, ErrorCode::InvalidUsage, 0,
                             "update of binding " + std::to_string(binding) +
                                 " rolls over into binding " + std::to_string(b.binding) +
                                 ", which has a different kind or stage mask"};
            }
            index = *next;
        }
        out.push_back(Slot{index, e});
        ++e;
    }
    return out;
}

template <typename Fn>
void forEachRef(const Descriptor& d, Fn&& fn) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, BufferDescriptor> ||
                          std::is_same_v<T, TexelBufferDescriptor>) {
                fn(v.buffer);
            } else if constexpr (std::is_same_v<T, ImageDescriptor>) {
                fn(v.image);
            } else if constexpr (std::is_same_v<T, SamplerDescriptor>) {
                fn(v.sampler);
            } else if constexpr (std::is_same_v<T, CombinedImageSamplerDescriptor>) {
                fn(v.image);
                fn(v.sampler);
            }
        },
        d);
}

Result<void> checkDescriptor(const detail::DeviceCore& core, const DescriptorSetLayoutBinding& b,
                             const Descriptor& d) {
    constexpr const char* op = "write descriptor sets";
    if (std::holds_alternative<std::monostate>(d)) {
        return Error{op, ErrorCode::InvalidUsage, 0, "descriptor is empty"};
    }
    if (!accepts(b.kind, d)) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "binding " + std::to_string(b.binding) + " is a " + toString(b.kind) +
                         "; the descriptor has the wrong shape for it"};
    }

    bool stale = false;
    forEachRef(d, [&](const ResourceRef& ref) {
        if (!core.live(ref.handle)) stale = true;
    });
    if (stale) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "descriptor for binding " + std::to_string(b.binding) +
                         " references a destroyed object"};
    }

    if (const auto* buf = std::get_if<BufferDescriptor>(&d)) {
        const AdapterLimits& limits = core.adapter().limits;
        const bool uniform = b.kind == DescriptorKind::UniformBuffer ||
                             b.kind == DescriptorKind::UniformBufferDynamic;
        const std::uint64_t align = uniform ? limits.minUniformBufferOffsetAlignment
                                            : limits.minStorageBufferOffsetAlignment;
        if (align > 1 && buf->offset % align != 0) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "buffer offset " + std::to_string(buf->offset) +
                             " is not a multiple of " + std::to_string(align)};
        }
        if (buf->range == 0) {
            return Error{op, ErrorCode::InvalidUsage, 0, "buffer descriptor range is zero"};
        }
    }
    return {};
}

bool setLive(const detail::DeviceCore& core, const DescriptorSet* set) {
    return set && set->valid() && core.live(set->handle());
}

} // namespace

Result<void> Device::writeDescriptorSets(const std::vector<DescriptorWrite>& writes) {
    constexpr const char* op = "write descriptor sets";
    if (auto lost = core_->checkLost(op); !lost.ok()) return lost;

    for (const auto& w : writes) {
        if (!setLive(*core_, w.set)) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "descriptor set is null, freed or from a reset pool"};
        }
        auto& state = *w.set->state_;
        const auto& bindings = state.layout->bindings();

        auto slots = walk(*state.layout, w.binding, w.arrayElement, w.descriptors.size(), op);
        if (!slots.ok()) return std::move(slots.error());

        for (std::size_t i = 0; i < w.descriptors.size(); ++i) {
            auto r = checkDescriptor(*core_, bindings[slots.value()[i].index], w.descriptors[i]);
            if (!r.ok()) return r;
        }

        for (std::size_t i = 0; i < w.descriptors.size(); ++i) {
            const Slot& s = slots.value()[i];
            state.descriptors[s.index][s.element] = w.descriptors[i];
            core_->native().writeDescriptor(state.native, bindings[s.index].binding, s.element,
                                            w.descriptors[i]);
        }
        state.version->fetch_add(1, std::memory_order_acq_rel);
    }
    return {};
}

Result<void> Device::copyDescriptorSets(const std::vector<DescriptorCopy>& copies) {
    constexpr const char* op = "copy descriptor sets";
    if (auto lost = core_->checkLost(op); !lost.ok()) return lost;

    for (const auto& c : copies) {
        if (!setLive(*core_, c.src) || !setLive(*core_, c.dst)) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "source or destination set is null, freed or from a reset pool"};
        }
        const auto& src = *c.src->state_;
        auto&       dst = *c.dst->state_;

        auto from = walk(*src.layout, c.srcBinding, c.srcElement, c.count, op);
        if (!from.ok()) return std::move(from.error());
        auto to = walk(*dst.layout, c.dstBinding, c.dstElement, c.count, op);
        if (!to.ok()) return std::move(to.error());

        const auto& srcBindings = src.layout->bindings();
        const auto& dstBindings = dst.layout->bindings();

        std::vector<Descriptor> values;
        values.reserve(c.count);
        for (std::uint32_t i = 0; i < c.count; ++i) {
            const Slot& s = from.value()[i];
            const Slot& d = to.value()[i];
            if (srcBindings[s.index].kind != dstBindings[d.index].kind) {
                return Error{op, ErrorCode::InvalidUsage, 0,
                             "source binding " + std::to_string(srcBindings[s.index].binding) +
                                 " and destination binding " +
                                 std::to_string(dstBindings[d.index].binding) +
                                 " have different kinds"};
            }
            values.push_back(src.descriptors[s.index][s.element]);
        }

        for (std::uint32_t i = 0; i < c.count; ++i) {
            const Slot& d = to.value()[i];
            dst.descriptors[d.index][d.element] = values[i];
            if (!std::holds_alternative<std::monostate>(values[i])) {
                core_->native().writeDescriptor(dst.native, dstBindings[d.index].binding,
                                                d.element, values[i]);
            }
        }
        dst.version->fetch_add(1, std::memory_order_acq_rel);
    }
    return {};
}

} // namespace gfxhal

#include <gfxhal/descriptor_set.hpp>

#include "../core/device_core.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace gfxhal {

namespace {

bool usesHeaps(const detail::DeviceCore& core) {
    return std::holds_alternative<HeapTableAllocator>(core.allocator().strategy());
}

// Heap descriptors a set occupies: CBV/SRV/UAV and sampler.
std::pair<std::uint32_t, std::uint32_t> heapFootprint(const DescriptorSetLayout& layout) {
    std::uint32_t resources = 0;
    std::uint32_t samplers  = 0;
    for (const auto& b : layout.bindings()) {
        if (b.kind != DescriptorKind::Sampler) resources += b.count;
        if (b.kind == DescriptorKind::Sampler || b.kind == DescriptorKind::CombinedImageSampler)
            samplers += b.count;
    }
    return {resources, samplers};
}

void returnCapacity(detail::PoolState& pool, const DescriptorSetLayout& layout) {
    for (const auto& b : layout.bindings()) {
        auto& used = pool.used[b.kind];
        used = used >= b.count ? used - b.count : 0;
    }
}

} // namespace

DescriptorPool::~DescriptorPool() { release(); }

DescriptorPool& DescriptorPool::operator=(DescriptorPool&& o) noexcept {
    if (this != &o) {
        release();
        DeviceObject::operator=(std::move(o));
        state_ = std::move(o.state_);
    }
    return *this;
}

void DescriptorPool::release() {
    if (!state_) return;
    for (const auto& set : state_->live) {
        state_->core->untrack(set->handle);
        state_->core->freeHeapRuns(set->runs);
    }
    state_->live.clear();
    state_->used.clear();
    state_->alive = false;
    state_.reset();
}

std::uint32_t DescriptorPool::maxSets() const { return state_ ? state_->maxSets : 0; }

std::uint32_t DescriptorPool::liveSets() const {
    return state_ ? static_cast<std::uint32_t>(state_->live.size()) : 0;
}

Result<DescriptorSet> DescriptorPool::allocate(const SetLayoutRef& layout) {
    if (!state_) {
        return Error{"allocate descriptor set", ErrorCode::InvalidUsage, 0, "pool is empty"};
    }
    if (!layout) {
        return Error{"allocate descriptor set", ErrorCode::InvalidUsage, 0, "layout is null"};
    }
    auto& core = *state_->core;
    if (auto lost = core.checkLost("allocate descriptor set"); !lost.ok())
        return std::move(lost.error());

    if (state_->live.size() >= state_->maxSets) {
        return Error{"allocate descriptor set", ErrorCode::TooManyObjects, 0,
                     "pool already holds its maximum of " + std::to_string(state_->maxSets) +
                         " sets; reset it or create another pool"};
    }

    std::map<DescriptorKind, std::uint32_t> need;
    for (const auto& b : layout->bindings()) need[b.kind] += b.count;
    for (const auto& [kind, count] : need) {
        const std::uint32_t cap  = state_->capacity[kind];
        const std::uint32_t used = state_->used[kind];
        if (used + count > cap) {
            return Error{"allocate descriptor set", ErrorCode::OutOfHostMemory, 0,
                         std::string("pool has ") + std::to_string(cap - used) + " " +
                             toString(kind) + " descriptors left, the set needs " +
                             std::to_string(count)};
        }
    }

    HeapRuns runs;
    if (usesHeaps(core)) {
        auto [resources, samplers] = heapFootprint(*layout);
        auto heap = core.allocateHeapRuns(resources, samplers);
        if (!heap.ok()) return std::move(heap.error());
        runs = heap.value();
    }

    auto native = core.native().allocateDescriptorSet(state_->native, layout, runs);
    if (!native.ok()) {
        core.observe(native.error());
        core.freeHeapRuns(runs);
        return std::move(native.error());
    }

    auto set         = std::make_shared<detail::SetState>();
    set->layout      = layout;
    set->runs        = runs;
    set->native      = native.value();
    set->handle      = core.track(ObjectKind::DescriptorSet, set->native);
    set->descriptors.reserve(layout->bindings().size());
    for (const auto& b : layout->bindings()) set->descriptors.emplace_back(b.count);

    for (const auto& [kind, count] : need) state_->used[kind] += count;
    state_->live.push_back(set);

    DescriptorSet out;
    out.pool_  = state_;
    out.state_ = std::move(set);
    return out;
}

Result<std::vector<DescriptorSet>> DescriptorPool::allocate(
    const std::vector<SetLayoutRef>& layouts) {
    std::vector<DescriptorSet> out;
    out.reserve(layouts.size());
    for (const auto& layout : layouts) {
        auto set = allocate(layout);
        if (!set.ok()) return std::move(set.error()); // already allocated sets free on unwind
        out.push_back(std::move(set).value());
    }
    return out;
}

Result<void> DescriptorPool::reset() {
    if (!state_) return Error{"reset descriptor pool", ErrorCode::InvalidUsage, 0, "pool is empty"};
    auto& core = *state_->core;
    if (auto lost = core.checkLost("reset descriptor pool"); !lost.ok()) return lost;

    for (const auto& set : state_->live) {
        core.untrack(set->handle);
        core.freeHeapRuns(set->runs);
    }
    state_->live.clear();
    state_->used.clear();
    core.native().resetDescriptorPool(state_->native);
    return {};
}

DescriptorSet::~DescriptorSet() { destroy(); }

DescriptorSet::DescriptorSet(DescriptorSet&& o) noexcept
    : pool_(std::move(o.pool_)), state_(std::move(o.state_)) {}

DescriptorSet& DescriptorSet::operator=(DescriptorSet&& o) noexcept {
    if (this != &o) {
        destroy();
        pool_  = std::move(o.pool_);
        state_ = std::move(o.state_);
    }
    return *this;
}

void DescriptorSet::destroy() {
    if (!state_) return;

    if (pool_ && pool_->alive) {
        auto& live = pool_->live;
        auto  it   = std::find(live.begin(), live.end(), state_);
        // Not found: the pool was reset and the set is already gone.
        if (it != live.end()) {
            live.erase(it);
            returnCapacity(*pool_, *state_->layout);
            pool_->core->untrack(state_->handle);
            pool_->core->native().freeDescriptorSet(pool_->native, state_->native);
            pool_->core->freeHeapRuns(state_->runs);
        }
    }

    pool_.reset();
    state_.reset();
}

Handle DescriptorSet::handle() const { return state_ ? state_->handle : Handle{}; }

NativeHandle DescriptorSet::native() const { return state_ ? state_->native : NullHandle; }

const SetLayoutRef& DescriptorSet::layout() const {
    static const SetLayoutRef none;
    return state_ ? state_->layout : none;
}

std::uint64_t DescriptorSet::version() const { return state_ ? state_->version->load() : 0; }

const HeapRuns& DescriptorSet::heapRuns() const {
    static const HeapRuns none;
    return state_ ? state_->runs : none;
}

const Descriptor& DescriptorSet::descriptor(std::uint32_t binding, std::uint32_t element) const {
    static const Descriptor empty;
    if (!state_) return empty;
    auto index = state_->layout->indexOf(binding);
    if (!index) return empty;
    const auto& elements = state_->descriptors[*index];
    return element < elements.size() ? elements[element] : empty;
}

} // namespace gfxhal

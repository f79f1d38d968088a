#include <gfxhal/device.hpp>

#include "device_core.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace gfxhal {

Device::~Device() = default;

Device& Device::operator=(Device&& o) noexcept {
    if (this != &o) core_ = std::move(o.core_);
    return *this;
}

Backend Device::backend() const { return core_->adapter().backend; }

Validation Device::validation() const { return core_->validation(); }

const AdapterInfo& Device::adapter() const { return core_->adapter(); }

const RegisterAllocator& Device::registerAllocator() const { return core_->allocator(); }

NativeDevice& Device::native() const { return core_->native(); }

bool Device::lost() const { return core_->lost(); }

std::uint32_t Device::queueCount() const { return core_->queueCount(); }

Queue Device::queue(std::uint32_t index) const {
    Queue q;
    if (index >= core_->queueCount()) return q;
    q.core_   = core_;
    q.index_  = index;
    q.family_ = core_->queueFamily(index);
    return q;
}

std::size_t Device::pendingGarbage() const { return core_->pendingGarbage(); }

Result<std::uint32_t> Device::findMemoryType(std::uint32_t typeMask, MemoryUsage usage) const {
    return gfxhal::findMemoryType(core_->adapter().memory, typeMask, usage);
}

Result<Memory> Device::allocateMemory(std::uint32_t typeIndex, std::uint64_t size) {
    if (auto lost = core_->checkLost("allocate memory"); !lost.ok())
        return std::move(lost.error());

    const auto& types = core_->adapter().memory.types;
    if (typeIndex >= types.size()) {
        return Error{"allocate memory", ErrorCode::InvalidUsage, 0,
                     "memory type " + std::to_string(typeIndex) + " does not exist"};
    }
    if (size == 0) {
        return Error{"allocate memory", ErrorCode::InvalidUsage, 0, "allocation size is zero"};
    }

    auto native = core_->observed(core_->native().allocateMemory(typeIndex, size));
    if (!native.ok()) return std::move(native.error());

    Memory m;
    static_cast<DeviceObject&>(m).attach(core_, ObjectKind::Memory, native.value());
    m.size_       = size;
    m.typeIndex_  = typeIndex;
    m.properties_ = types[typeIndex].properties;
    return m;
}

Result<Buffer> Device::createBuffer(const BufferDesc& desc) {
    if (auto lost = core_->checkLost("create buffer"); !lost.ok()) return std::move(lost.error());

    if (desc.size == 0) {
        return Error{"create buffer", ErrorCode::InvalidUsage, 0, "buffer size is zero"};
    }
    if (!any(desc.usage)) {
        return Error{"create buffer", ErrorCode::InvalidUsage, 0, "buffer has no usage flags"};
    }

    auto native = core_->observed(core_->native().createBuffer(desc));
    if (!native.ok()) return std::move(native.error());

    Buffer b;
    static_cast<DeviceObject&>(b).attach(core_, ObjectKind::Buffer, native.value());
    b.desc_         = desc;
    b.requirements_ = core_->native().bufferRequirements(native.value());
    return b;
}

Result<Image> Device::createImage(const ImageDesc& desc) {
    if (auto lost = core_->checkLost("create image"); !lost.ok()) return std::move(lost.error());

    if (desc.extent.width == 0 || desc.extent.height == 0 || desc.extent.depth == 0 ||
        desc.mipLevels == 0 || desc.arrayLayers == 0) {
        return Error{"create image", ErrorCode::InvalidUsage, 0,
                     "extent, mip count and layer count must be non-zero"};
    }
    if (desc.samples == 0 || (desc.samples & (desc.samples - 1)) != 0 || desc.samples > 64) {
        return Error{"create image", ErrorCode::InvalidUsage, 0,
                     "sample count " + std::to_string(desc.samples) + " is not a power of two"};
    }

    const Backend       backend   = core_->adapter().backend;
    const FormatFeature available = supportedFeatures(backend, desc.format);
    if (!any(available)) {
        return Error{"create image", ErrorCode::UnsupportedFormat, 0,
                     std::string(toString(desc.format)) + " is not supported on " +
                         toString(backend)};
    }
    if (!contains(available, desc.usage)) {
        return Error{"create image", ErrorCode::UnsupportedUsage, 0,
                     std::string(toString(desc.format)) + " cannot be used that way on " +
                         toString(backend) + "; drop the storage / render-target usage or pick "
                         "another format"};
    }

    auto native = core_->observed(core_->native().createImage(desc));
    if (!native.ok()) return std::move(native.error());

    Image img;
    static_cast<DeviceObject&>(img).attach(core_, ObjectKind::Image, native.value());
    img.desc_         = desc;
    img.requirements_ = core_->native().imageRequirements(native.value());
    return img;
}

Result<Buffer> Device::createBuffer(const BufferDesc& desc, MemoryUsage usage) {
    auto buffer = createBuffer(desc);
    if (!buffer.ok()) return buffer;
    Buffer& b = buffer.value();

    auto type = findMemoryType(b.requirements_.typeMask, usage);
    if (!type.ok()) return std::move(type.error());

    auto memory = allocateMemory(type.value(), b.requirements_.size);
    if (!memory.ok()) return std::move(memory.error());

    auto bound = b.bindMemory(memory.value(), 0);
    if (!bound.ok()) return std::move(bound.error());

    b.owned_ = std::make_unique<Memory>(std::move(memory).value());
    return buffer;
}

Result<Image> Device::createImage(const ImageDesc& desc, MemoryUsage usage) {
    auto image = createImage(desc);
    if (!image.ok()) return image;
    Image& img = image.value();

    auto type = findMemoryType(img.requirements_.typeMask, usage);
    if (!type.ok()) return std::move(type.error());

    auto memory = allocateMemory(type.value(), img.requirements_.size);
    if (!memory.ok()) return std::move(memory.error());

    auto bound = img.bindMemory(memory.value(), 0);
    if (!bound.ok()) return std::move(bound.error());

    img.owned_ = std::make_unique<Memory>(std::move(memory).value());
    return image;
}

Result<Sampler> Device::createSampler(const SamplerDesc& desc) {
    if (auto lost = core_->checkLost("create sampler"); !lost.ok()) return std::move(lost.error());

    if (desc.maxAnisotropy > 1.0f && !core_->adapter().features.samplerAnisotropy) {
        return Error{"create sampler", ErrorCode::UnsupportedUsage, 0,
                     "anisotropic filtering is not supported by this adapter"};
    }
    if (desc.minLod > desc.maxLod) {
        return Error{"create sampler", ErrorCode::InvalidUsage, 0, "minLod is above maxLod"};
    }

    auto native = core_->observed(core_->native().createSampler(desc));
    if (!native.ok()) return std::move(native.error());

    Sampler s;
    static_cast<DeviceObject&>(s).attach(core_, ObjectKind::Sampler, native.value());
    s.desc_ = desc;
    return s;
}

Result<SetLayoutRef> Device::createDescriptorSetLayout(
    std::vector<DescriptorSetLayoutBinding> bindings) const {
    return DescriptorSetLayout::create(std::move(bindings));
}

bool PipelineLayout::setCompatible(std::uint32_t set, const DescriptorSetLayout& layout) const {
    if (set >= sets_.size()) return false;
    return sets_[set].get() == &layout || sets_[set]->bindings() == layout.bindings();
}

Result<PipelineLayout> Device::createPipelineLayout(std::vector<SetLayoutRef> sets,
                                                    std::vector<PushConstantRange> pushConstants) {
    if (auto lost = core_->checkLost("create pipeline layout"); !lost.ok())
        return std::move(lost.error());

    const AdapterLimits& limits = core_->adapter().limits;
    if (sets.size() > limits.maxBoundSets) {
        return Error{"create pipeline layout", ErrorCode::TooManyObjects, 0,
                     std::to_string(sets.size()) + " set layouts exceed the adapter's " +
                         std::to_string(limits.maxBoundSets) + " bound sets"};
    }
    for (const auto& range : pushConstants) {
        if (range.offset + range.size > limits.maxPushConstantsSize) {
            return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                         "push constant range ends at byte " +
                             std::to_string(range.offset + range.size) + ", limit is " +
                             std::to_string(limits.maxPushConstantsSize)};
        }
    }

    auto assignment = core_->allocator().assign(sets, pushConstants);
    if (!assignment.ok()) return std::move(assignment.error());

    std::optional<PushConstantRange> push;
    if (!pushConstants.empty()) push = pushConstants.front();

    auto native = core_->observed(
        core_->native().createPipelineLayout(sets, push, assignment.value()));
    if (!native.ok()) return std::move(native.error());

    PipelineLayout layout;
    static_cast<DeviceObject&>(layout).attach(core_, ObjectKind::PipelineLayout, native.value());
    layout.sets_       = std::move(sets);
    layout.push_       = push;
    layout.assignment_ =
        std::make_shared<const RegisterAssignment>(std::move(assignment).value());
    return layout;
}

Result<DescriptorPool> Device::createDescriptorPool(const DescriptorPoolDesc& desc) {
    if (auto lost = core_->checkLost("create descriptor pool"); !lost.ok())
        return std::move(lost.error());

    if (desc.maxSets == 0) {
        return Error{"create descriptor pool", ErrorCode::InvalidUsage, 0, "maxSets is zero"};
    }

    auto native = core_->observed(core_->native().createDescriptorPool(desc));
    if (!native.ok()) return std::move(native.error());

    auto state     = std::make_shared<detail::PoolState>();
    state->core    = core_;
    state->native  = native.value();
    state->maxSets = desc.maxSets;
    for (const auto& size : desc.sizes) state->capacity[size.kind] += size.count;

    DescriptorPool pool;
    static_cast<DeviceObject&>(pool).attach(core_, ObjectKind::DescriptorPool, native.value());
    pool.state_ = std::move(state);
    return pool;
}

Result<Fence> Device::createFence(bool signaled) {
    if (auto lost = core_->checkLost("create fence"); !lost.ok()) return std::move(lost.error());

    auto native = core_->observed(core_->native().createFence(signaled));
    if (!native.ok()) return std::move(native.error());

    Fence f;
    static_cast<DeviceObject&>(f).attach(core_, ObjectKind::Fence, native.value());
    f.state_ = std::make_shared<detail::FenceState>();
    return f;
}

Result<Semaphore> Device::createSemaphore() {
    if (auto lost = core_->checkLost("create semaphore"); !lost.ok())
        return std::move(lost.error());

    auto native = core_->observed(core_->native().createSemaphore());
    if (!native.ok()) return std::move(native.error());

    Semaphore s;
    static_cast<DeviceObject&>(s).attach(core_, ObjectKind::Semaphore, native.value());
    s.state_ = std::make_shared<detail::SemaphoreState>();
    return s;
}

Result<CommandPool> Device::createCommandPool(std::uint32_t queueFamily) {
    if (auto lost = core_->checkLost("create command pool"); !lost.ok())
        return std::move(lost.error());

    bool served = false;
    for (std::uint32_t q = 0; q < core_->queueCount(); ++q) {
        if (core_->queueFamily(q) == queueFamily) served = true;
    }
    if (!served) {
        return Error{"create command pool", ErrorCode::InvalidUsage, 0,
                     "the device has no queue of family " + std::to_string(queueFamily)};
    }

    CommandPool pool;
    pool.core_   = core_;
    pool.family_ = queueFamily;
    return pool;
}

Result<void> Device::waitForFence(const Fence& fence, std::uint64_t timeoutNs) {
    return waitForFences({&fence}, true, timeoutNs);
}

Result<void> Device::waitForFences(const std::vector<const Fence*>& fences, bool waitAll,
                                   std::uint64_t timeoutNs) {
    if (auto lost = core_->checkLost("wait for fences"); !lost.ok()) return lost;

    std::vector<NativeHandle> natives;
    natives.reserve(fences.size());
    for (const Fence* f : fences) {
        if (!f || !f->valid()) {
            return Error{"wait for fences", ErrorCode::InvalidUsage, 0, "fence is empty"};
        }
        natives.push_back(f->native());
    }
    if (natives.empty()) return {};

    auto done = core_->observed(core_->native().waitForFences(natives, waitAll, timeoutNs));
    if (!done.ok()) return std::move(done.error());
    if (!done.value()) {
        return Error{"wait for fences", ErrorCode::Timeout, 0,
                     "fences still unsignaled after " + std::to_string(timeoutNs) + " ns"};
    }

    core_->collect();
    return {};
}

Result<void> Device::waitIdle() {
    if (auto lost = core_->checkLost("wait idle"); !lost.ok()) return lost;

    for (std::uint32_t q = 0; q < core_->queueCount(); ++q) {
        auto idle = core_->native().waitQueueIdle(q);
        if (!idle.ok()) {
            core_->observe(idle.error());
            return idle;
        }
    }
    core_->collect();
    return {};
}

} // namespace gfxhal

#include "soft_device.hpp"

#include <gfxhal/format.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <utility>
#include <variant>

namespace gfxhal::soft::detail {

namespace {

std::uint64_t alignUp(std::uint64_t value, std::uint64_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

std::uint64_t mipBytes(const ImageDesc& desc, std::uint32_t mip) {
    const FormatInfo info = formatInfo(desc.format);
    const std::uint32_t w = std::max(1u, desc.extent.width >> mip);
    const std::uint32_t h = std::max(1u, desc.extent.height >> mip);
    const std::uint32_t d = std::max(1u, desc.extent.depth >> mip);
    const std::uint64_t blocksX = (w + info.blockWidth - 1) / info.blockWidth;
    const std::uint64_t blocksY = (h + info.blockWidth - 1) / info.blockWidth;
    return blocksX * blocksY * d * info.bytesPerBlock;
}

} // namespace

Descriptor descriptorPart(const Descriptor& d, DescriptorPart which) {
    const auto* combined = std::get_if<CombinedImageSamplerDescriptor>(&d);
    if (!combined || which == DescriptorPart::Whole) return d;
    if (which == DescriptorPart::Texture) return ImageDescriptor{combined->image, combined->layout};
    return SamplerDescriptor{combined->sampler};
}

Extent3D SoftImage::mipExtent(std::uint32_t mip) const {
    return Extent3D{std::max(1u, desc.extent.width >> mip), std::max(1u, desc.extent.height >> mip),
                    std::max(1u, desc.extent.depth >> mip)};
}

std::uint8_t* SoftImage::texelAddress(std::uint32_t mip, std::uint32_t layer, std::uint32_t x,
                                      std::uint32_t y, std::uint32_t z) const {
    if (!memory) return nullptr;
    const FormatInfo info = formatInfo(desc.format);

    std::uint64_t base = offset;
    for (std::uint32_t m = 0; m < mip; ++m) base += mipBytes(desc, m) * desc.arrayLayers;
    base += mipBytes(desc, mip) * layer;

    const Extent3D e       = mipExtent(mip);
    const std::uint64_t bx = (e.width + info.blockWidth - 1) / info.blockWidth;
    const std::uint64_t by = (e.height + info.blockWidth - 1) / info.blockWidth;
    base += ((z * by + y / info.blockWidth) * bx + x / info.blockWidth) * info.bytesPerBlock;
    return memory->bytes.data() + base;
}

const SoftStage* SoftPipeline::find(ShaderStage stage) const {
    for (const auto& s : stages) {
        if (s.stage == stage) return &s;
    }
    return nullptr;
}

SoftDevice::SoftDevice(AdapterInfo info, std::shared_ptr<ProgramLibrary> programs,
                       std::uint32_t queueCount)
    : info_(std::move(info)), translator_(std::move(programs)) {
    heapUsage_.assign(info_.memory.heaps.size(), 0);
    queues_.reserve(queueCount);
    for (std::uint32_t q = 0; q < queueCount; ++q) {
        queues_.push_back(std::make_unique<QueueWorker>());
    }
    for (std::uint32_t q = 0; q < queueCount; ++q) {
        queues_[q]->thread = std::thread(&SoftDevice::workerLoop, this, q);
    }
}

SoftDevice::~SoftDevice() {
    {
        std::lock_guard lock(syncMutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& q : queues_) {
        if (q->thread.joinable()) q->thread.join();
    }
}

Result<void> SoftDevice::alive(const char* operation) const {
    if (lost_.load(std::memory_order_acquire)) {
        return Error{operation, ErrorCode::DeviceLost, 0, "the soft device was lost"};
    }
    return {};
}

// Resources and memory

Result<NativeHandle> SoftDevice::createBuffer(const BufferDesc& desc) {
    if (auto r = alive("create buffer"); !r.ok()) return std::move(r.error());
    auto b  = std::make_shared<SoftBuffer>();
    b->desc = desc;
    return buffers_.insert(nextHandle(), std::move(b));
}

Result<NativeHandle> SoftDevice::createImage(const ImageDesc& desc) {
    if (auto r = alive("create image"); !r.ok()) return std::move(r.error());
    auto img  = std::make_shared<SoftImage>();
    img->desc = desc;
    for (std::uint32_t m = 0; m < desc.mipLevels; ++m) {
        img->size += mipBytes(desc, m) * desc.arrayLayers;
    }
    return images_.insert(nextHandle(), std::move(img));
}

MemoryRequirements SoftDevice::requirementsFor(std::uint64_t size,
                                               std::uint64_t alignment) const {
    MemoryRequirements req;
    req.alignment = alignment;
    req.size      = alignUp(size, alignment);
    req.typeMask  = info_.memory.types.size() >= 32
                        ? ~0u
                        : (1u << info_.memory.types.size()) - 1u;
    return req;
}

MemoryRequirements SoftDevice::bufferRequirements(NativeHandle buffer) {
    auto b = buffers_.get(buffer);
    if (!b) return {};
    std::uint64_t alignment = 16;
    if (any(b->desc.usage & (BufferUsage::Uniform | BufferUsage::UniformTexel)))
        alignment = std::max(alignment, info_.limits.minUniformBufferOffsetAlignment);
    if (any(b->desc.usage & (BufferUsage::Storage | BufferUsage::StorageTexel)))
        alignment = std::max(alignment, info_.limits.minStorageBufferOffsetAlignment);
    return requirementsFor(b->desc.size, alignment);
}

MemoryRequirements SoftDevice::imageRequirements(NativeHandle image) {
    auto img = images_.get(image);
    if (!img) return {};
    return requirementsFor(img->size, 256);
}

Result<NativeHandle> SoftDevice::allocateMemory(std::uint32_t typeIndex, std::uint64_t size) {
    if (auto r = alive("allocate memory"); !r.ok()) return std::move(r.error());
    if (typeIndex >= info_.memory.types.size()) {
        return Error{"allocate memory", ErrorCode::InvalidUsage, 0,
                     "memory type " + std::to_string(typeIndex) + " does not exist"};
    }
    const std::uint32_t heap = info_.memory.types[typeIndex].heapIndex;
    {
        std::lock_guard lock(heapMutex_);
        if (heapUsage_[heap] + size > info_.memory.heaps[heap].size) {
            const bool device = info_.memory.heaps[heap].deviceLocal;
            return Error{"allocate memory",
                         device ? ErrorCode::OutOfDeviceMemory : ErrorCode::OutOfHostMemory, 0,
                         "heap " + std::to_string(heap) + " has " +
                             std::to_string(info_.memory.heaps[heap].size - heapUsage_[heap]) +
                             " bytes left, " + std::to_string(size) + " requested"};
        }
        heapUsage_[heap] += size;
    }

    auto m       = std::make_shared<SoftMemory>();
    m->bytes.assign(size, 0);
    m->typeIndex = typeIndex;
    m->heapIndex = heap;
    return memory_.insert(nextHandle(), std::move(m));
}

Result<void> SoftDevice::bindBufferMemory(NativeHandle buffer, NativeHandle memory,
                                          std::uint64_t offset) {
    if (auto r = alive("bind buffer memory"); !r.ok()) return r;
    auto b = buffers_.get(buffer);
    auto m = memory_.get(memory);
    if (!b || !m) {
        return Error{"bind buffer memory", ErrorCode::InvalidUsage, 0, "unknown buffer or memory"};
    }
    if (offset + b->desc.size > m->bytes.size()) {
        return Error{"bind buffer memory", ErrorCode::OutOfBounds, 0,
                     "buffer does not fit in the allocation at offset " + std::to_string(offset)};
    }
    b->memory = std::move(m);
    b->offset = offset;
    return {};
}

Result<void> SoftDevice::bindImageMemory(NativeHandle image, NativeHandle memory,
                                         std::uint64_t offset) {
    if (auto r = alive("bind image memory"); !r.ok()) return r;
    auto img = images_.get(image);
    auto m   = memory_.get(memory);
    if (!img || !m) {
        return Error{"bind image memory", ErrorCode::InvalidUsage, 0, "unknown image or memory"};
    }
    if (offset + img->size > m->bytes.size()) {
        return Error{"bind image memory", ErrorCode::OutOfBounds, 0,
                     "image does not fit in the allocation at offset " + std::to_string(offset)};
    }
    img->memory = std::move(m);
    img->offset = offset;
    return {};
}

Result<void*> SoftDevice::mapMemory(NativeHandle memory, std::uint64_t offset, std::uint64_t size) {
    if (auto r = alive("map memory"); !r.ok()) return std::move(r.error());
    auto m = memory_.get(memory);
    if (!m) return Error{"map memory", ErrorCode::InvalidUsage, 0, "unknown memory"};

    const MemoryType& type = info_.memory.types[m->typeIndex];
    if (!any(type.properties & MemoryProperty::HostVisible)) {
        return Error{"map memory", ErrorCode::WrongMemoryType, 0,
                     "memory type " + std::to_string(m->typeIndex) + " is not host visible"};
    }
    const std::uint64_t end = size == WholeSize ? m->bytes.size() : offset + size;
    if (offset > m->bytes.size() || end > m->bytes.size()) {
        return Error{"map memory", ErrorCode::OutOfBounds, 0,
                     "mapped range exceeds the allocation"};
    }
    m->mapped = true;
    return static_cast<void*>(m->bytes.data() + offset);
}

void SoftDevice::unmapMemory(NativeHandle memory) {
    if (auto m = memory_.get(memory)) m->mapped = false;
}

Result<NativeHandle> SoftDevice::createSampler(const SamplerDesc& desc) {
    if (auto r = alive("create sampler"); !r.ok()) return std::move(r.error());
    auto s  = std::make_shared<SoftSampler>();
    s->desc = desc;
    return samplers_.insert(nextHandle(), std::move(s));
}

// Binding model

Result<NativeHandle> SoftDevice::createPipelineLayout(const std::vector<SetLayoutRef>& sets,
                                                      const std::optional<PushConstantRange>& push,
                                                      const RegisterAssignment& assignment) {
    if (auto r = alive("create pipeline layout"); !r.ok()) return std::move(r.error());
    auto l        = std::make_shared<SoftPipelineLayout>();
    l->sets       = sets;
    l->push       = push;
    l->assignment = assignment;
    return layouts_.insert(nextHandle(), std::move(l));
}

Result<NativeHandle> SoftDevice::createDescriptorPool(const DescriptorPoolDesc& desc) {
    if (auto r = alive("create descriptor pool"); !r.ok()) return std::move(r.error());
    auto p  = std::make_shared<SoftDescriptorPool>();
    p->desc = desc;
    return pools_.insert(nextHandle(), std::move(p));
}

Result<NativeHandle> SoftDevice::allocateDescriptorSet(NativeHandle pool, const SetLayoutRef& layout,
                                                       const HeapRuns& runs) {
    if (auto r = alive("allocate descriptor set"); !r.ok()) return std::move(r.error());
    auto p = pools_.get(pool);
    if (!p || !layout) {
        return Error{"allocate descriptor set", ErrorCode::InvalidUsage, 0,
                     "unknown pool or empty layout"};
    }
    auto s    = std::make_shared<SoftDescriptorSet>();
    s->layout = layout;
    s->runs   = runs;
    for (const auto& b : layout->bindings()) s->descriptors.emplace_back(b.count);

    const NativeHandle handle = nextHandle();
    {
        std::lock_guard lock(heapMutex_);
        p->sets.push_back(handle);
    }
    return sets_.insert(handle, std::move(s));
}

void SoftDevice::freeDescriptorSet(NativeHandle pool, NativeHandle set) {
    auto s = sets_.erase(set);
    std::lock_guard lock(heapMutex_);
    if (auto p = pools_.get(pool)) {
        p->sets.erase(std::remove(p->sets.begin(), p->sets.end(), set), p->sets.end());
    }
    if (s) {
        for (std::uint32_t i = s->runs.resources.start; i < s->runs.resources.end; ++i)
            resourceHeap_.erase(i);
        for (std::uint32_t i = s->runs.samplers.start; i < s->runs.samplers.end; ++i)
            samplerHeap_.erase(i);
    }
}

void SoftDevice::resetDescriptorPool(NativeHandle pool) {
    auto p = pools_.get(pool);
    if (!p) return;
    std::vector<NativeHandle> sets;
    {
        std::lock_guard lock(heapMutex_);
        sets = p->sets;
    }
    for (NativeHandle s : sets) freeDescriptorSet(pool, s);
}

void SoftDevice::writeDescriptor(NativeHandle set, std::uint32_t binding, std::uint32_t element,
                                 const Descriptor& descriptor) {
    auto s = sets_.get(set);
    if (!s) return;
    auto index = s->layout->indexOf(binding);
    if (!index || element >= s->descriptors[*index].size()) return;

    std::lock_guard lock(heapMutex_);
    s->descriptors[*index][element] = descriptor;

    if (info_.backend != Backend::Dx12) return;
    const auto offsets = heapTableOffsets(*s->layout);
    const DescriptorKind kind = s->layout->bindings()[*index].kind;
    if (kind != DescriptorKind::Sampler && s->runs.resources.length() > 0) {
        resourceHeap_[s->runs.resources.start + offsets[*index].resource + element] =
            descriptorPart(descriptor, DescriptorPart::Texture);
    }
    if ((kind == DescriptorKind::Sampler || kind == DescriptorKind::CombinedImageSampler) &&
        s->runs.samplers.length() > 0) {
        samplerHeap_[s->runs.samplers.start + offsets[*index].sampler + element] =
            descriptorPart(descriptor, DescriptorPart::Sampler);
    }
}

Descriptor SoftDevice::heapDescriptor(RegisterSpace space, std::uint32_t slot) const {
    std::lock_guard lock(heapMutex_);
    const auto& heap = space == RegisterSpace::SamplerHeap ? samplerHeap_ : resourceHeap_;
    auto it = heap.find(slot);
    return it == heap.end() ? Descriptor{} : it->second;
}

std::optional<SoftDescriptorSet> SoftDevice::readSet(NativeHandle set) const {
    auto s = sets_.get(set);
    if (!s) return std::nullopt;
    std::lock_guard lock(heapMutex_);
    return *s;
}

// Passes and pipelines

Result<NativeHandle> SoftDevice::createRenderPass(const RenderPassDesc& desc,
                                                  const RenderPassPlan& plan) {
    if (auto r = alive("create render pass"); !r.ok()) return std::move(r.error());
    auto rp  = std::make_shared<SoftRenderPass>();
    rp->desc = desc;
    rp->plan = plan;
    return renderPasses_.insert(nextHandle(), std::move(rp));
}

Result<NativeHandle> SoftDevice::createFramebuffer(NativeHandle renderPass,
                                                   const std::vector<ResourceRef>& attachments,
                                                   Extent2D extent, std::uint32_t layers) {
    if (auto r = alive("create framebuffer"); !r.ok()) return std::move(r.error());
    auto fb        = std::make_shared<SoftFramebuffer>();
    fb->renderPass = renderPass;
    fb->extent     = extent;
    fb->layers     = layers;
    for (const auto& a : attachments) {
        auto img = images_.get(a.native);
        if (!img) {
            return Error{"create framebuffer", ErrorCode::InvalidUsage, 0,
                         "attachment is not a soft image"};
        }
        fb->attachments.push_back(std::move(img));
    }
    return framebuffers_.insert(nextHandle(), std::move(fb));
}

Result<NativeHandle> SoftDevice::createGraphicsPipeline(const NativeGraphicsPipelineDesc& desc) {
    if (auto r = alive("create graphics pipeline"); !r.ok()) return std::move(r.error());
    auto p              = std::make_shared<SoftPipeline>();
    p->bindPoint        = PipelineBindPoint::Graphics;
    p->layout           = desc.layout;
    p->renderPass       = desc.renderPass;
    p->subpass          = desc.subpass;
    p->vertexBindings   = desc.vertexBindings;
    p->vertexAttributes = desc.vertexAttributes;
    p->depth            = desc.depth;
    p->blend            = desc.blend;
    for (const auto& s : desc.stages) {
        auto program = translator_.program(s.module);
        if (!program) {
            return Error{"create graphics pipeline", ErrorCode::InvalidUsage, 0,
                         std::string("no translated module for the ") + toString(s.stage) +
                             " stage"};
        }
        p->stages.push_back(SoftStage{s.stage, std::move(program), s.remaps});
    }
    return pipelines_.insert(nextHandle(), std::move(p));
}

Result<NativeHandle> SoftDevice::createComputePipeline(const NativeComputePipelineDesc& desc) {
    if (auto r = alive("create compute pipeline"); !r.ok()) return std::move(r.error());
    auto program = translator_.program(desc.stage.module);
    if (!program) {
        return Error{"create compute pipeline", ErrorCode::InvalidUsage, 0,
                     "no translated module for the compute stage"};
    }
    auto p       = std::make_shared<SoftPipeline>();
    p->bindPoint = PipelineBindPoint::Compute;
    p->layout    = desc.layout;
    p->stages.push_back(SoftStage{ShaderStage::Compute, std::move(program), desc.stage.remaps});
    return pipelines_.insert(nextHandle(), std::move(p));
}

// Synchronization objects

Result<NativeHandle> SoftDevice::createFence(bool signaled) {
    if (auto r = alive("create fence"); !r.ok()) return std::move(r.error());
    const NativeHandle h = nextHandle();
    std::lock_guard lock(syncMutex_);
    fences_[h] = signaled;
    return h;
}

Result<bool> SoftDevice::fenceStatus(NativeHandle fence) {
    if (auto r = alive("get fence status"); !r.ok()) return std::move(r.error());
    std::lock_guard lock(syncMutex_);
    auto it = fences_.find(fence);
    if (it == fences_.end()) {
        return Error{"get fence status", ErrorCode::InvalidUsage, 0, "unknown fence"};
    }
    return it->second;
}

Result<void> SoftDevice::resetFence(NativeHandle fence) {
    if (auto r = alive("reset fence"); !r.ok()) return r;
    std::lock_guard lock(syncMutex_);
    auto it = fences_.find(fence);
    if (it == fences_.end()) {
        return Error{"reset fence", ErrorCode::InvalidUsage, 0, "unknown fence"};
    }
    it->second = false;
    return {};
}

Result<bool> SoftDevice::waitForFences(const std::vector<NativeHandle>& fences, bool waitAll,
                                       std::uint64_t timeoutNs) {
    auto done = [&] {
        std::size_t count = 0;
        for (NativeHandle f : fences) {
            auto it = fences_.find(f);
            if (it != fences_.end() && it->second) ++count;
        }
        return waitAll ? count == fences.size() : count > 0;
    };
    auto lostOrDone = [&] { return lost_.load(std::memory_order_acquire) || done(); };

    std::unique_lock lock(syncMutex_);
    if (timeoutNs == ~std::uint64_t{0}) {
        cv_.wait(lock, lostOrDone);
    } else if (timeoutNs > 0) {
        cv_.wait_for(lock, std::chrono::nanoseconds(timeoutNs), lostOrDone);
    }
    if (lost_.load(std::memory_order_acquire)) {
        return Error{"wait for fences", ErrorCode::DeviceLost, 0, "the soft device was lost"};
    }
    return done();
}

Result<NativeHandle> SoftDevice::createSemaphore() {
    if (auto r = alive("create semaphore"); !r.ok()) return std::move(r.error());
    const NativeHandle h = nextHandle();
    std::lock_guard lock(syncMutex_);
    semaphores_[h] = false;
    return h;
}

void SoftDevice::destroy(ObjectKind kind, NativeHandle handle) {
    switch (kind) {
    case ObjectKind::Buffer:         buffers_.erase(handle); break;
    case ObjectKind::Image:          images_.erase(handle); break;
    case ObjectKind::Sampler:        samplers_.erase(handle); break;
    case ObjectKind::PipelineLayout: layouts_.erase(handle); break;
    case ObjectKind::RenderPass:     renderPasses_.erase(handle); break;
    case ObjectKind::Framebuffer:    framebuffers_.erase(handle); break;
    case ObjectKind::Pipeline:       pipelines_.erase(handle); break;
    case ObjectKind::CommandPool:    break;
    case ObjectKind::Memory:
        if (auto m = memory_.erase(handle)) {
            std::lock_guard lock(heapMutex_);
            heapUsage_[m->heapIndex] -= m->bytes.size();
        }
        break;
    case ObjectKind::DescriptorPool:
        resetDescriptorPool(handle);
        pools_.erase(handle);
        break;
    case ObjectKind::DescriptorSet:
        freeDescriptorSet(NullHandle, handle);
        break;
    case ObjectKind::Fence: {
        std::lock_guard lock(syncMutex_);
        fences_.erase(handle);
        break;
    }
    case ObjectKind::Semaphore: {
        std::lock_guard lock(syncMutex_);
        semaphores_.erase(handle);
        break;
    }
    }
}

// Hooks

void SoftDevice::loseDevice() {
    {
        std::lock_guard lock(syncMutex_);
        lost_.store(true, std::memory_order_release);
    }
    std::fprintf(stderr, "[gfxhal] soft: device lost\n");
    cv_.notify_all();
}

NativeHandle SoftDevice::createSurface(std::uint32_t imageCount) {
    const NativeHandle h = nextHandle();
    std::lock_guard lock(syncMutex_);
    surfaces_[h] = SoftSurface{SurfaceState::Ok, imageCount, 0};
    return h;
}

void SoftDevice::setSurfaceState(NativeHandle surface, SurfaceState state) {
    std::lock_guard lock(syncMutex_);
    auto it = surfaces_.find(surface);
    if (it != surfaces_.end()) it->second.state = state;
}

std::uint64_t SoftDevice::presentCount(NativeHandle surface) const {
    std::lock_guard lock(syncMutex_);
    auto it = surfaces_.find(surface);
    return it == surfaces_.end() ? 0 : it->second.presents;
}

ImageLayout SoftDevice::imageLayout(NativeHandle image) const {
    auto img = images_.get(image);
    if (!img) return ImageLayout::Undefined;
    std::lock_guard lock(execMutex_);
    return img->layout;
}

std::size_t SoftDevice::liveObjects() const {
    std::size_t n = memory_.size() + buffers_.size() + images_.size() + samplers_.size() +
                    layouts_.size() + pools_.size() + sets_.size() + renderPasses_.size() +
                    framebuffers_.size() + pipelines_.size();
    std::lock_guard lock(syncMutex_);
    return n + fences_.size() + semaphores_.size();
}

void SoftDevice::layoutError(const char* what, NativeHandle image, ImageLayout expected,
                             ImageLayout found) {
    layoutErrors_.fetch_add(1, std::memory_order_relaxed);
    std::fprintf(stderr, "[gfxhal] soft: %s: image %llu is %s, expected %s\n", what,
                 static_cast<unsigned long long>(image), toString(found), toString(expected));
}

void SoftDevice::bindingError(const std::string& message) {
    bindingErrors_.fetch_add(1, std::memory_order_relaxed);
    std::fprintf(stderr, "[gfxhal] soft: %s\n", message.c_str());
}

} // namespace gfxhal::soft::detail

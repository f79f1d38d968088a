#include "device.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace gfxhal::vulkan::detail {

namespace {

// For each native dynamic-offset slot (binding-number order, then element),
// the position of that offset in declaration order.
std::vector<std::uint32_t> dynamicOrderOf(const DescriptorSetLayout& layout) {
    struct Dynamic {
        std::uint32_t binding;
        std::uint32_t base;
        std::uint32_t count;
    };
    std::vector<Dynamic> dynamics;
    std::uint32_t next = 0;
    for (const auto& b : layout.bindings()) {
        if (!isDynamicKind(b.kind)) continue;
        dynamics.push_back({b.binding, next, b.count});
        next += b.count;
    }
    std::sort(dynamics.begin(), dynamics.end(),
              [](const Dynamic& a, const Dynamic& b) { return a.binding < b.binding; });

    std::vector<std::uint32_t> order;
    order.reserve(next);
    for (const auto& d : dynamics) {
        for (std::uint32_t e = 0; e < d.count; ++e) order.push_back(d.base + e);
    }
    return order;
}

VkDeviceSize rangeOf(std::uint64_t range) {
    return range == WholeSize ? VK_WHOLE_SIZE : range;
}

} // namespace

Result<VkDescriptorSetLayout> VulkanDevice::setLayoutFor(const SetLayoutRef& layout) {
    std::lock_guard lock(setLayoutMutex_);
    if (auto it = setLayouts_.find(layout); it != setLayouts_.end()) return it->second;

    std::vector<VkDescriptorSetLayoutBinding> bindings;
    bindings.reserve(layout->bindings().size());
    for (const auto& b : layout->bindings()) {
        VkDescriptorSetLayoutBinding vb{};
        vb.binding         = b.binding;
        vb.descriptorType  = toVk(b.kind);
        vb.descriptorCount = b.count;
        vb.stageFlags      = b.kind == DescriptorKind::InputAttachment
                                 ? VK_SHADER_STAGE_FRAGMENT_BIT
                                 : toVkStages(b.stages);
        bindings.push_back(vb);
    }

    VkDescriptorSetLayoutCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    ci.bindingCount = static_cast<std::uint32_t>(bindings.size());
    ci.pBindings    = bindings.data();

    VkDescriptorSetLayout native = VK_NULL_HANDLE;
    VkResult vr = vkCreateDescriptorSetLayout(device_, &ci, nullptr, &native);
    if (vr != VK_SUCCESS) {
        return fail("create descriptor set layout", vr, "vkCreateDescriptorSetLayout failed");
    }
    setLayouts_.emplace(layout, native);
    return native;
}

// Explicit sets address (set, binding) directly, so the assignment adds
// nothing the native layout needs.
Result<NativeHandle> VulkanDevice::createPipelineLayout(const std::vector<SetLayoutRef>& sets,
                                                        const std::optional<PushConstantRange>& push,
                                                        const RegisterAssignment& /*assignment*/) {
    constexpr const char* op = "create pipeline layout";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    auto record  = std::make_shared<LayoutRecord>();
    record->sets = sets;

    std::vector<VkDescriptorSetLayout> natives;
    natives.reserve(sets.size());
    for (const auto& s : sets) {
        auto native = setLayoutFor(s);
        if (!native.ok()) return std::move(native.error());
        natives.push_back(native.value());
        record->dynamicOrder.push_back(dynamicOrderOf(*s));
    }

    VkPushConstantRange range{};
    if (push) {
        range.stageFlags = toVkStages(push->stages);
        range.offset     = push->offset;
        range.size       = push->size;
    }

    VkPipelineLayoutCreateInfo ci{};
    ci.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    ci.setLayoutCount         = static_cast<std::uint32_t>(natives.size());
    ci.pSetLayouts            = natives.data();
    ci.pushConstantRangeCount = push ? 1u : 0u;
    ci.pPushConstantRanges    = push ? &range : nullptr;

    VkResult vr = vkCreatePipelineLayout(device_, &ci, nullptr, &record->layout);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreatePipelineLayout failed");
    return layouts_.insert(std::move(record));
}

Result<NativeHandle> VulkanDevice::createDescriptorPool(const DescriptorPoolDesc& desc) {
    constexpr const char* op = "create descriptor pool";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    std::vector<VkDescriptorPoolSize> sizes;
    for (const auto& s : desc.sizes) {
        if (s.count == 0) continue;
        sizes.push_back({toVk(s.kind), s.count});
    }

    VkDescriptorPoolCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    ci.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    ci.maxSets       = desc.maxSets;
    ci.poolSizeCount = static_cast<std::uint32_t>(sizes.size());
    ci.pPoolSizes    = sizes.data();

    auto record = std::make_shared<PoolRecord>();
    VkResult vr = vkCreateDescriptorPool(device_, &ci, nullptr, &record->pool);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateDescriptorPool failed");
    return pools_.insert(std::move(record));
}

Result<NativeHandle> VulkanDevice::allocateDescriptorSet(NativeHandle pool,
                                                         const SetLayoutRef& layout,
                                                         const HeapRuns& /*runs*/) {
    constexpr const char* op = "allocate descriptor set";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    auto p = pools_.get(pool);
    if (!p || !layout) return Error{op, ErrorCode::InvalidUsage, 0, "unknown pool or empty layout"};

    auto native = setLayoutFor(layout);
    if (!native.ok()) return std::move(native.error());
    VkDescriptorSetLayout vkLayout = native.value();

    auto record    = std::make_shared<SetRecord>();
    record->pool   = pool;
    record->layout = layout;

    VkDescriptorSetAllocateInfo ai{};
    ai.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    ai.descriptorPool     = p->pool;
    ai.descriptorSetCount = 1;
    ai.pSetLayouts        = &vkLayout;

    std::lock_guard lock(p->mutex);
    VkResult vr = vkAllocateDescriptorSets(device_, &ai, &record->set);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkAllocateDescriptorSets failed");

    const NativeHandle handle = sets_.insert(std::move(record));
    p->sets.push_back(handle);
    return handle;
}

// The pool argument may be NullHandle; the record knows its pool.
void VulkanDevice::freeDescriptorSet(NativeHandle /*pool*/, NativeHandle set) {
    auto s = sets_.erase(set);
    if (!s) return;
    if (auto p = pools_.get(s->pool)) {
        std::lock_guard lock(p->mutex);
        p->sets.erase(std::remove(p->sets.begin(), p->sets.end(), set), p->sets.end());
    }
    releaseSet(*s);
}

// Frees the native set and its texel views once submitted work is done. A
// pool reset or destroy in between already returned the set to the pool.
void VulkanDevice::releaseSet(const SetRecord& record) {
    auto pool = pools_.get(record.pool);
    std::uint64_t epoch = 0;
    if (pool) {
        std::lock_guard lock(pool->mutex);
        epoch = pool->epoch;
    }

    VkDevice        device = device_;
    VkDescriptorSet set    = record.set;
    std::vector<VkBufferView> views;
    for (const auto& [key, view] : record.views) views.push_back(view);

    retire([device, pool, epoch, set, views] {
        if (pool) {
            std::lock_guard lock(pool->mutex);
            if (pool->epoch == epoch) vkFreeDescriptorSets(device, pool->pool, 1, &set);
        }
        for (VkBufferView v : views) vkDestroyBufferView(device, v, nullptr);
    });
}

void VulkanDevice::resetDescriptorPool(NativeHandle pool) {
    auto p = pools_.get(pool);
    if (!p) return;

    std::vector<VkBufferView> views;
    {
        std::lock_guard lock(p->mutex);
        for (NativeHandle s : p->sets) {
            if (auto record = sets_.erase(s)) {
                for (const auto& [key, view] : record->views) views.push_back(view);
            }
        }
        p->sets.clear();
        ++p->epoch;
        VkResult vr = vkResetDescriptorPool(device_, p->pool, 0);
        if (vr != VK_SUCCESS) {
            std::fprintf(stderr, "[gfxhal] vulkan: vkResetDescriptorPool failed (%s)\n",
                         toString(vr));
        }
    }

    if (views.empty()) return;
    VkDevice device = device_;
    retire([device, views] {
        for (VkBufferView v : views) vkDestroyBufferView(device, v, nullptr);
    });
}

// Writes are serialized by the caller per set.
void VulkanDevice::writeDescriptor(NativeHandle set, std::uint32_t binding, std::uint32_t element,
                                   const Descriptor& descriptor) {
    auto s = sets_.get(set);
    if (!s) return;
    const DescriptorSetLayoutBinding* b = s->layout->find(binding);
    if (!b || element >= b->count) return;

    VkDescriptorBufferInfo bufferInfo{};
    VkDescriptorImageInfo  imageInfo{};
    VkBufferView           texelView = VK_NULL_HANDLE;

    VkWriteDescriptorSet w{};
    w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    w.dstSet          = s->set;
    w.dstBinding      = binding;
    w.dstArrayElement = element;
    w.descriptorCount = 1;
    w.descriptorType  = toVk(b->kind);

    bool ready = std::visit(
        [&](const auto& d) -> bool {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, BufferDescriptor>) {
                auto buf = buffers_.get(d.buffer.native);
                if (!buf) return false;
                bufferInfo   = {buf->buffer, d.offset, rangeOf(d.range)};
                w.pBufferInfo = &bufferInfo;
                return true;
            } else if constexpr (std::is_same_v<T, ImageDescriptor>) {
                auto img = images_.get(d.image.native);
                if (!img) return false;
                imageInfo    = {VK_NULL_HANDLE, img->view, toVk(d.layout)};
                w.pImageInfo = &imageInfo;
                return true;
            } else if constexpr (std::is_same_v<T, SamplerDescriptor>) {
                imageInfo.sampler = fromNative<VkSampler>(d.sampler.native);
                w.pImageInfo      = &imageInfo;
                return true;
            } else if constexpr (std::is_same_v<T, CombinedImageSamplerDescriptor>) {
                auto img = images_.get(d.image.native);
                if (!img) return false;
                imageInfo    = {fromNative<VkSampler>(d.sampler.native), img->view, toVk(d.layout)};
                w.pImageInfo = &imageInfo;
                return true;
            } else {
                auto buf = buffers_.get(d.buffer.native);
                if (!buf) return false;
                VkBufferViewCreateInfo ci{};
                ci.sType  = VK_STRUCTURE_TYPE_BUFFER_VIEW_CREATE_INFO;
                ci.buffer = buf->buffer;
                ci.format = toVk(d.format);
                ci.offset = d.offset;
                ci.range  = rangeOf(d.range);
                VkResult vr = vkCreateBufferView(device_, &ci, nullptr, &texelView);
                if (vr != VK_SUCCESS) {
                    std::fprintf(stderr, "[gfxhal] vulkan: vkCreateBufferView failed (%s)\n",
                                 toString(vr));
                    return false;
                }
                w.pTexelBufferView = &texelView;
                return true;
            }
        },
        descriptor);
    if (!ready) return;

    vkUpdateDescriptorSets(device_, 1, &w, 0, nullptr);

    if (texelView == VK_NULL_HANDLE) return;
    auto& slot = s->views[{binding, element}];
    if (slot != VK_NULL_HANDLE) {
        // Earlier submissions may still read through the old view.
        VkDevice     device = device_;
        VkBufferView old    = slot;
        retire([device, old] { vkDestroyBufferView(device, old, nullptr); });
    }
    slot = texelView;
}

} // namespace gfxhal::vulkan::detail

#include "device.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <string>
#include <utility>

namespace gfxhal::vulkan::detail {

VulkanDevice::VulkanDevice(std::shared_ptr<InstanceState> instance, VkPhysicalDevice gpu,
                           AdapterInfo info)
    : instance_(std::move(instance)), gpu_(gpu), info_(std::move(info)), translator_(*this) {}

Result<std::unique_ptr<VulkanDevice>> VulkanDevice::create(
    std::shared_ptr<InstanceState> instance, VkPhysicalDevice gpu, AdapterInfo info,
    const std::vector<QueueRequest>& queues, bool swapchain) {
    constexpr const char* op = "create device";

    std::map<std::uint32_t, std::uint32_t> perFamily;
    for (const auto& q : queues) {
        if (q.family >= info.queueFamilies.size()) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "queue family " + std::to_string(q.family) + " does not exist"};
        }
        perFamily[q.family] += q.count;
        if (perFamily[q.family] > info.queueFamilies[q.family].count) {
            return Error{op, ErrorCode::InvalidUsage, 0,
                         "queue family " + std::to_string(q.family) + " has only " +
                             std::to_string(info.queueFamilies[q.family].count) + " queues"};
        }
    }
    if (perFamily.empty()) {
        return Error{op, ErrorCode::InvalidUsage, 0, "a device needs at least one queue"};
    }

    std::uint32_t maxCount = 0;
    for (const auto& [family, count] : perFamily) maxCount = std::max(maxCount, count);
    std::vector<float> priorities(maxCount, 1.0f);

    std::vector<VkDeviceQueueCreateInfo> queueCIs;
    for (const auto& [family, count] : perFamily) {
        VkDeviceQueueCreateInfo qci{};
        qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qci.queueFamilyIndex = family;
        qci.queueCount       = count;
        qci.pQueuePriorities = priorities.data();
        queueCIs.push_back(qci);
    }

    VkPhysicalDeviceVulkan13Features f13{};
    f13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    f13.synchronization2 = VK_TRUE;

    VkPhysicalDeviceVulkan12Features f12{};
    f12.sType             = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    f12.pNext             = &f13;
    f12.timelineSemaphore = VK_TRUE;

    VkPhysicalDeviceFeatures2 features{};
    features.sType                      = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext                      = &f12;
    features.features.samplerAnisotropy = info.features.samplerAnisotropy ? VK_TRUE : VK_FALSE;

    VkPhysicalDeviceFeatures supported{};
    vkGetPhysicalDeviceFeatures(gpu, &supported);
    features.features.fillModeNonSolid = supported.fillModeNonSolid;

    std::vector<const char*> extensions;
    if (swapchain) extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &features;
    ci.queueCreateInfoCount    = static_cast<std::uint32_t>(queueCIs.size());
    ci.pQueueCreateInfos       = queueCIs.data();
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();

    std::unique_ptr<VulkanDevice> d(new VulkanDevice(std::move(instance), gpu, std::move(info)));
    d->swapchain_ = swapchain;
    d->wireframe_ = supported.fillModeNonSolid == VK_TRUE;

    VkResult vr = vkCreateDevice(gpu, &ci, nullptr, &d->device_);
    if (vr != VK_SUCCESS) {
        d->device_ = VK_NULL_HANDLE;
        return vkError(op, vr, "vkCreateDevice failed");
    }

    if (auto r = d->createAllocator(); !r.ok()) return std::move(r.error());

    // Flattened in request order; each family hands out its queues in turn.
    std::map<std::uint32_t, std::uint32_t> nextInFamily;
    for (const auto& request : queues) {
        for (std::uint32_t i = 0; i < request.count; ++i) {
            auto q    = std::make_unique<QueueState>();
            q->family = request.family;
            vkGetDeviceQueue(d->device_, request.family, nextInFamily[request.family]++, &q->queue);

            VkCommandPoolCreateInfo poolCI{};
            poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            poolCI.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
            poolCI.queueFamilyIndex = request.family;
            vr = vkCreateCommandPool(d->device_, &poolCI, nullptr, &q->pool);
            if (vr != VK_SUCCESS) return vkError(op, vr, "vkCreateCommandPool failed");

            // One timeline per queue; its value is the last completed serial.
            VkSemaphoreTypeCreateInfo timelineCI{};
            timelineCI.sType         = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
            timelineCI.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
            timelineCI.initialValue  = 0;

            VkSemaphoreCreateInfo semCI{};
            semCI.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
            semCI.pNext = &timelineCI;
            vr = vkCreateSemaphore(d->device_, &semCI, nullptr, &q->timeline);
            if (vr != VK_SUCCESS) {
                d->queues_.push_back(std::move(q));
                return vkError(op, vr, "vkCreateSemaphore failed for the queue timeline");
            }
            d->queues_.push_back(std::move(q));
        }
    }

    return d;
}

VulkanDevice::~VulkanDevice() {
    if (device_ == VK_NULL_HANDLE) return;

    vkDeviceWaitIdle(device_);

    for (auto& q : queues_) {
        recycle(*q, ~std::uint64_t{0});
        if (q->pool != VK_NULL_HANDLE) vkDestroyCommandPool(device_, q->pool, nullptr);
        if (q->timeline != VK_NULL_HANDLE) vkDestroySemaphore(device_, q->timeline, nullptr);
    }
    collectRetired(true);

    for (VkEvent e : freeEvents_) vkDestroyEvent(device_, e, nullptr);

    // Everything below should already be gone through the garbage collector;
    // leftovers are released so the device can be destroyed cleanly.
    for (auto& s : sets_.drain()) {
        for (const auto& [key, view] : s->views) vkDestroyBufferView(device_, view, nullptr);
    }
    for (auto& p : pools_.drain()) vkDestroyDescriptorPool(device_, p->pool, nullptr);
    for (auto& l : layouts_.drain()) vkDestroyPipelineLayout(device_, l->layout, nullptr);
    for (auto& p : passes_.drain()) vkDestroyRenderPass(device_, p->pass, nullptr);
    for (auto& b : buffers_.drain()) vkDestroyBuffer(device_, b->buffer, nullptr);
    for (auto& i : images_.drain()) {
        if (i->view != VK_NULL_HANDLE) vkDestroyImageView(device_, i->view, nullptr);
        vkDestroyImage(device_, i->image, nullptr);
    }
    for (auto& m : memory_.drain()) {
        if (m->mapped) vmaUnmapMemory(allocator_, m->allocation);
        vmaFreeMemory(allocator_, m->allocation);
    }
    for (const auto& [ref, layout] : setLayouts_) {
        vkDestroyDescriptorSetLayout(device_, layout, nullptr);
    }

    if (allocator_ != VK_NULL_HANDLE) vmaDestroyAllocator(allocator_);
    vkDestroyDevice(device_, nullptr);
}

Error VulkanDevice::fail(const char* operation, VkResult vr, const std::string& message) {
    if (vr == VK_ERROR_DEVICE_LOST && !lost_.exchange(true)) {
        std::fprintf(stderr, "[gfxhal] vulkan: device lost during %s\n", operation);
    }
    return vkError(operation, vr, message);
}

Result<void> VulkanDevice::alive(const char* operation) const {
    if (lost_.load(std::memory_order_acquire)) {
        return Error{operation, ErrorCode::DeviceLost, static_cast<std::int32_t>(VK_ERROR_DEVICE_LOST),
                     "the Vulkan device was lost"};
    }
    return {};
}

// Resources

Result<NativeHandle> VulkanDevice::createBuffer(const BufferDesc& desc) {
    constexpr const char* op = "create buffer";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    VkBufferCreateInfo ci{};
    ci.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    ci.size        = desc.size;
    ci.usage       = toVk(desc.usage);
    ci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    auto record  = std::make_shared<BufferRecord>();
    record->desc = desc;
    VkResult vr  = vkCreateBuffer(device_, &ci, nullptr, &record->buffer);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateBuffer failed");
    return buffers_.insert(std::move(record));
}

Result<NativeHandle> VulkanDevice::createImage(const ImageDesc& desc) {
    constexpr const char* op = "create image";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    const VkImageType type  = desc.extent.depth > 1 ? VK_IMAGE_TYPE_3D : VK_IMAGE_TYPE_2D;
    const VkFormat    format = toVk(desc.format);
    const VkImageUsageFlags usage = toVkImageUsage(desc.usage);

    VkImageFormatProperties props{};
    VkResult vr = vkGetPhysicalDeviceImageFormatProperties(gpu_, format, type,
                                                           VK_IMAGE_TILING_OPTIMAL, usage, 0,
                                                           &props);
    if (vr == VK_ERROR_FORMAT_NOT_SUPPORTED) {
        return Error{op, ErrorCode::UnsupportedFormat, static_cast<std::int32_t>(vr),
                     std::string(gfxhal::toString(desc.format)) +
                         " images with the requested usage are not supported by " + info_.name};
    }
    if (vr != VK_SUCCESS) return fail(op, vr, "vkGetPhysicalDeviceImageFormatProperties failed");

    VkImageCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    ci.imageType     = type;
    ci.format        = format;
    ci.extent        = {desc.extent.width, desc.extent.height, desc.extent.depth};
    ci.mipLevels     = desc.mipLevels;
    ci.arrayLayers   = desc.arrayLayers;
    ci.samples       = toVkSamples(desc.samples);
    ci.tiling        = VK_IMAGE_TILING_OPTIMAL;
    ci.usage         = usage;
    ci.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    auto record     = std::make_shared<ImageRecord>();
    record->desc    = desc;
    record->aspects = aspectsOf(desc.format);
    vr = vkCreateImage(device_, &ci, nullptr, &record->image);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateImage failed");
    return images_.insert(std::move(record));
}

MemoryRequirements VulkanDevice::bufferRequirements(NativeHandle buffer) {
    auto b = buffers_.get(buffer);
    if (!b) return {};
    VkMemoryRequirements req;
    vkGetBufferMemoryRequirements(device_, b->buffer, &req);
    return MemoryRequirements{req.size, req.alignment, req.memoryTypeBits};
}

MemoryRequirements VulkanDevice::imageRequirements(NativeHandle image) {
    auto i = images_.get(image);
    if (!i) return {};
    VkMemoryRequirements req;
    vkGetImageMemoryRequirements(device_, i->image, &req);
    return MemoryRequirements{req.size, req.alignment, req.memoryTypeBits};
}

Result<NativeHandle> VulkanDevice::createSampler(const SamplerDesc& desc) {
    constexpr const char* op = "create sampler";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    VkSamplerCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    ci.magFilter    = toVk(desc.magFilter);
    ci.minFilter    = toVk(desc.minFilter);
    ci.mipmapMode   = desc.mipFilter == Filter::Nearest ? VK_SAMPLER_MIPMAP_MODE_NEAREST
                                                        : VK_SAMPLER_MIPMAP_MODE_LINEAR;
    ci.addressModeU = toVk(desc.addressU);
    ci.addressModeV = toVk(desc.addressV);
    ci.addressModeW = toVk(desc.addressW);
    ci.minLod       = desc.minLod;
    ci.maxLod       = desc.maxLod;
    ci.borderColor  = VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;
    if (desc.maxAnisotropy > 1.0f && info_.features.samplerAnisotropy) {
        ci.anisotropyEnable = VK_TRUE;
        ci.maxAnisotropy    = desc.maxAnisotropy;
    }
    if (desc.compare) {
        ci.compareEnable = VK_TRUE;
        ci.compareOp     = toVk(*desc.compare);
    }

    VkSampler sampler = VK_NULL_HANDLE;
    VkResult  vr      = vkCreateSampler(device_, &ci, nullptr, &sampler);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateSampler failed");
    return toNative(sampler);
}

// Synchronization

Result<NativeHandle> VulkanDevice::createFence(bool signaled) {
    constexpr const char* op = "create fence";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    VkFenceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    ci.flags = signaled ? VK_FENCE_CREATE_SIGNALED_BIT : 0;

    VkFence  fence = VK_NULL_HANDLE;
    VkResult vr    = vkCreateFence(device_, &ci, nullptr, &fence);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateFence failed");
    return toNative(fence);
}

Result<bool> VulkanDevice::fenceStatus(NativeHandle fence) {
    VkResult vr = vkGetFenceStatus(device_, fromNative<VkFence>(fence));
    if (vr == VK_SUCCESS) return true;
    if (vr == VK_NOT_READY) return false;
    return fail("fence status", vr, "vkGetFenceStatus failed");
}

Result<void> VulkanDevice::resetFence(NativeHandle fence) {
    VkFence  f  = fromNative<VkFence>(fence);
    VkResult vr = vkResetFences(device_, 1, &f);
    if (vr != VK_SUCCESS) return fail("reset fence", vr, "vkResetFences failed");
    return {};
}

Result<bool> VulkanDevice::waitForFences(const std::vector<NativeHandle>& fences, bool waitAll,
                                         std::uint64_t timeoutNs) {
    constexpr const char* op = "wait for fences";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    if (fences.empty()) return true;

    std::vector<VkFence> vk;
    vk.reserve(fences.size());
    for (NativeHandle f : fences) vk.push_back(fromNative<VkFence>(f));

    VkResult vr = vkWaitForFences(device_, static_cast<std::uint32_t>(vk.size()), vk.data(),
                                  waitAll ? VK_TRUE : VK_FALSE, timeoutNs);
    if (vr == VK_SUCCESS) return true;
    if (vr == VK_TIMEOUT) return false;
    return fail(op, vr, "vkWaitForFences failed");
}

Result<NativeHandle> VulkanDevice::createSemaphore() {
    constexpr const char* op = "create semaphore";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());

    // Binary: presentation cannot wait on timeline semaphores.
    VkSemaphoreCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkSemaphore semaphore = VK_NULL_HANDLE;
    VkResult    vr        = vkCreateSemaphore(device_, &ci, nullptr, &semaphore);
    if (vr != VK_SUCCESS) return fail(op, vr, "vkCreateSemaphore failed");
    return toNative(semaphore);
}

Result<VkEvent> VulkanDevice::acquireEvent() {
    {
        std::lock_guard lock(eventMutex_);
        if (!freeEvents_.empty()) {
            VkEvent e = freeEvents_.back();
            freeEvents_.pop_back();
            return e;
        }
    }

    VkEventCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_EVENT_CREATE_INFO;
    // Device-only: set, waited and reset inside command buffers.
    ci.flags = VK_EVENT_CREATE_DEVICE_ONLY_BIT;

    VkEvent  event = VK_NULL_HANDLE;
    VkResult vr    = vkCreateEvent(device_, &ci, nullptr, &event);
    if (vr != VK_SUCCESS) return fail("create split barrier event", vr, "vkCreateEvent failed");
    return event;
}

// Deferred release

void VulkanDevice::retire(std::function<void()> release) {
    Retired r;
    r.serials.reserve(queues_.size());
    for (const auto& q : queues_) r.serials.push_back(q->submitted.load(std::memory_order_acquire));
    r.release = std::move(release);

    std::lock_guard lock(retireMutex_);
    retired_.push_back(std::move(r));
}

void VulkanDevice::collectRetired(bool all) {
    std::lock_guard lock(retireMutex_);
    while (!retired_.empty()) {
        const Retired& front = retired_.front();
        if (!all) {
            bool done = true;
            for (std::uint32_t i = 0; i < queues_.size() && done; ++i) {
                done = front.serials[i] == 0 || completedSerial(i) >= front.serials[i];
            }
            if (!done) break;
        }
        // In order, under the lock: a pool's destruction must follow the
        // frees of its sets.
        front.release();
        retired_.pop_front();
    }
}

void VulkanDevice::destroy(ObjectKind kind, NativeHandle handle) {
    switch (kind) {
    case ObjectKind::Buffer:
        if (auto b = buffers_.erase(handle)) vkDestroyBuffer(device_, b->buffer, nullptr);
        break;
    case ObjectKind::Image:
        if (auto i = images_.erase(handle)) {
            if (i->view != VK_NULL_HANDLE) vkDestroyImageView(device_, i->view, nullptr);
            vkDestroyImage(device_, i->image, nullptr);
        }
        break;
    case ObjectKind::Memory:
        if (auto m = memory_.erase(handle)) {
            if (m->mapped) vmaUnmapMemory(allocator_, m->allocation);
            vmaFreeMemory(allocator_, m->allocation);
        }
        break;
    case ObjectKind::Sampler:
        vkDestroySampler(device_, fromNative<VkSampler>(handle), nullptr);
        break;
    case ObjectKind::PipelineLayout:
        if (auto l = layouts_.erase(handle)) vkDestroyPipelineLayout(device_, l->layout, nullptr);
        break;
    case ObjectKind::DescriptorPool:
        if (auto p = pools_.erase(handle)) {
            for (NativeHandle s : p->sets) {
                if (auto set = sets_.erase(s)) releaseSet(*set);
            }
            VkDevice device = device_;
            retire([device, p] { vkDestroyDescriptorPool(device, p->pool, nullptr); });
        }
        break;
    case ObjectKind::DescriptorSet:
        freeDescriptorSet(NullHandle, handle);
        break;
    case ObjectKind::RenderPass:
        if (auto p = passes_.erase(handle)) vkDestroyRenderPass(device_, p->pass, nullptr);
        break;
    case ObjectKind::Framebuffer:
        vkDestroyFramebuffer(device_, fromNative<VkFramebuffer>(handle), nullptr);
        break;
    case ObjectKind::Pipeline:
        vkDestroyPipeline(device_, fromNative<VkPipeline>(handle), nullptr);
        break;
    case ObjectKind::Fence:
        vkDestroyFence(device_, fromNative<VkFence>(handle), nullptr);
        break;
    case ObjectKind::Semaphore:
        vkDestroySemaphore(device_, fromNative<VkSemaphore>(handle), nullptr);
        break;
    case ObjectKind::CommandPool:
        // Streams are recorded into per-queue pools at submit.
        break;
    }
}

} // namespace gfxhal::vulkan::detail

#include "device.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>
#include <string>

namespace gfxhal::vulkan::detail {

namespace {

// Descriptor views always span the whole image.
VkImageViewType viewTypeOf(const ImageDesc& desc) {
    if (desc.extent.depth > 1) return VK_IMAGE_VIEW_TYPE_3D;
    return desc.arrayLayers > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
}

} // namespace

Result<void> VulkanDevice::createAllocator() {
    VmaAllocatorCreateInfo ci{};
    ci.instance         = instance_->instance;
    ci.physicalDevice   = gpu_;
    ci.device           = device_;
    ci.vulkanApiVersion = VK_API_VERSION_1_3;

    VkResult vr = vmaCreateAllocator(&ci, &allocator_);
    if (vr != VK_SUCCESS) {
        allocator_ = VK_NULL_HANDLE;
        return vkError("create allocator", vr, "vmaCreateAllocator failed");
    }
    return {};
}

// The core sub-allocates resources out of these blocks itself, so each
// request is one VMA allocation pinned to the chosen memory type.
Result<NativeHandle> VulkanDevice::allocateMemory(std::uint32_t typeIndex, std::uint64_t size) {
    constexpr const char* op = "allocate memory";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    if (typeIndex >= info_.memory.types.size()) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "memory type " + std::to_string(typeIndex) + " does not exist"};
    }

    VkMemoryRequirements req{};
    req.size           = size;
    req.alignment      = 1;
    req.memoryTypeBits = 1u << typeIndex;

    VmaAllocationCreateInfo aci{};
    aci.flags          = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
    aci.memoryTypeBits = 1u << typeIndex;

    auto record         = std::make_shared<MemoryRecord>();
    record->typeIndex   = typeIndex;
    record->hostVisible = any(info_.memory.types[typeIndex].properties & MemoryProperty::HostVisible);

    VkResult vr = vmaAllocateMemory(allocator_, &req, &aci, &record->allocation, &record->info);
    if (vr != VK_SUCCESS) {
        return fail(op, vr, "vmaAllocateMemory failed for " + std::to_string(size) +
                                " bytes of memory type " + std::to_string(typeIndex));
    }
    return memory_.insert(std::move(record));
}

Result<void> VulkanDevice::bindBufferMemory(NativeHandle buffer, NativeHandle memory,
                                            std::uint64_t offset) {
    constexpr const char* op = "bind buffer memory";
    auto b = buffers_.get(buffer);
    auto m = memory_.get(memory);
    if (!b || !m) return Error{op, ErrorCode::InvalidUsage, 0, "unknown buffer or memory"};

    VkResult vr = vmaBindBufferMemory2(allocator_, m->allocation, offset, b->buffer, nullptr);
    if (vr != VK_SUCCESS) return fail(op, vr, "vmaBindBufferMemory2 failed");
    return {};
}

Result<void> VulkanDevice::bindImageMemory(NativeHandle image, NativeHandle memory,
                                           std::uint64_t offset) {
    constexpr const char* op = "bind image memory";
    auto i = images_.get(image);
    auto m = memory_.get(memory);
    if (!i || !m) return Error{op, ErrorCode::InvalidUsage, 0, "unknown image or memory"};

    VkResult vr = vmaBindImageMemory2(allocator_, m->allocation, offset, i->image, nullptr);
    if (vr != VK_SUCCESS) return fail(op, vr, "vmaBindImageMemory2 failed");

    // Views need bound memory.
    VkImageViewCreateInfo vci{};
    vci.sType            = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    vci.image            = i->image;
    vci.viewType         = viewTypeOf(i->desc);
    vci.format           = toVk(i->desc.format);
    vci.subresourceRange = {i->aspects, 0, VK_REMAINING_MIP_LEVELS, 0, VK_REMAINING_ARRAY_LAYERS};

    vr = vkCreateImageView(device_, &vci, nullptr, &i->view);
    if (vr != VK_SUCCESS) {
        i->view = VK_NULL_HANDLE;
        return fail(op, vr, "vkCreateImageView failed");
    }
    return {};
}

Result<void*> VulkanDevice::mapMemory(NativeHandle memory, std::uint64_t offset,
                                      std::uint64_t size) {
    constexpr const char* op = "map memory";
    if (auto r = alive(op); !r.ok()) return std::move(r.error());
    auto m = memory_.get(memory);
    if (!m) return Error{op, ErrorCode::InvalidUsage, 0, "unknown memory"};
    if (!m->hostVisible) {
        return Error{op, ErrorCode::WrongMemoryType, 0,
                     "memory type " + std::to_string(m->typeIndex) + " is not host visible"};
    }
    if (size != WholeSize && offset + size > m->info.size) {
        return Error{op, ErrorCode::OutOfBounds, 0,
                     "range ends at " + std::to_string(offset + size) + " past the " +
                         std::to_string(m->info.size) + "-byte block"};
    }

    void* base = nullptr;
    VkResult vr = vmaMapMemory(allocator_, m->allocation, &base);
    if (vr != VK_SUCCESS) return fail(op, vr, "vmaMapMemory failed");
    m->mapped = true;
    return static_cast<void*>(static_cast<std::uint8_t*>(base) + offset);
}

void VulkanDevice::unmapMemory(NativeHandle memory) {
    auto m = memory_.get(memory);
    if (!m || !m->mapped) return;
    vmaUnmapMemory(allocator_, m->allocation);
    m->mapped = false;
}

} // namespace gfxhal::vulkan::detail

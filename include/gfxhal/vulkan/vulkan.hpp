#pragma once

#include <gfxhal/error.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/result.hpp>

#include <vulkan/vulkan.h>

#include <memory>
#include <string>
#include <vector>

// Explicit-descriptor shim on Vulkan 1.3. Devices enable synchronization2 and
// timeline semaphores; memory comes from VMA and shader bindings from
// SPIRV-Reflect. Surfaces and swapchains stay with the windowing code: a
// PresentTarget names a VkSwapchainKHR through toHandle().

namespace gfxhal::vulkan {

struct InstanceConfig {
    std::string              appName          = "gfxhal_app";
    bool                     validationLayers = false; // skipped when the layer is absent
    std::vector<const char*> extensions;               // e.g. the window system's surface list
};

[[nodiscard]] Result<std::shared_ptr<NativeInstance>> createInstance(
    const InstanceConfig& config = {});

// Raw objects behind a device, for interop with swapchain code.
struct DeviceObjects {
    VkInstance       instance       = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice         device         = VK_NULL_HANDLE;
};

// Empty when the device does not belong to this shim.
[[nodiscard]] DeviceObjects deviceObjects(NativeDevice& device);

[[nodiscard]] NativeHandle toHandle(VkSwapchainKHR swapchain);

} // namespace gfxhal::vulkan

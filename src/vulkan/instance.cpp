#include <gfxhal/vulkan/vulkan.hpp>

#include "device.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace gfxhal::vulkan {

namespace detail {

namespace {

VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/)
{
    const char* level = "info";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        level = "error";
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        level = "warning";

    std::fprintf(stderr, "[gfxhal] vulkan %s: %s\n", level, data->pMessage);
    return VK_FALSE;
}

bool layerAvailable(const char* name) {
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> available(count);
    vkEnumerateInstanceLayerProperties(&count, available.data());
    for (auto& layer : available) {
        if (std::strcmp(layer.layerName, name) == 0) return true;
    }
    return false;
}

bool deviceExtensionAvailable(VkPhysicalDevice gpu, const char* name) {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, available.data());
    for (auto& ext : available) {
        if (std::strcmp(ext.extensionName, name) == 0) return true;
    }
    return false;
}

AdapterType adapterType(VkPhysicalDeviceType type) {
    switch (type) {
    case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:   return AdapterType::Discrete;
    case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return AdapterType::Integrated;
    case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:    return AdapterType::Virtual;
    case VK_PHYSICAL_DEVICE_TYPE_CPU:            return AdapterType::Cpu;
    default:                                     return AdapterType::Other;
    }
}

// Adapters need 1.3 with synchronization2 and timeline semaphores.
bool suitable(VkPhysicalDevice gpu, const VkPhysicalDeviceProperties& props) {
    if (props.apiVersion < VK_API_VERSION_1_3) return false;

    VkPhysicalDeviceVulkan13Features f13{};
    f13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceVulkan12Features f12{};
    f12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    f12.pNext = &f13;
    VkPhysicalDeviceFeatures2 features{};
    features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext = &f12;
    vkGetPhysicalDeviceFeatures2(gpu, &features);

    return f13.synchronization2 == VK_TRUE && f12.timelineSemaphore == VK_TRUE;
}

AdapterInfo describe(VkPhysicalDevice gpu, const VkPhysicalDeviceProperties& props) {
    AdapterInfo info;
    info.name    = props.deviceName;
    info.type    = adapterType(props.deviceType);
    info.backend = Backend::Vulkan;

    VkPhysicalDeviceMemoryProperties mem;
    vkGetPhysicalDeviceMemoryProperties(gpu, &mem);
    for (std::uint32_t i = 0; i < mem.memoryHeapCount; ++i) {
        info.memory.heaps.push_back(
            MemoryHeap{mem.memoryHeaps[i].size,
                       (mem.memoryHeaps[i].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT) != 0});
    }
    for (std::uint32_t i = 0; i < mem.memoryTypeCount; ++i) {
        const VkMemoryPropertyFlags f = mem.memoryTypes[i].propertyFlags;
        MemoryProperty p = MemoryProperty::None;
        if (f & VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT)  p |= MemoryProperty::DeviceLocal;
        if (f & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT)  p |= MemoryProperty::HostVisible;
        if (f & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) p |= MemoryProperty::HostCoherent;
        if (f & VK_MEMORY_PROPERTY_HOST_CACHED_BIT)   p |= MemoryProperty::HostCached;
        info.memory.types.push_back(MemoryType{p, mem.memoryTypes[i].heapIndex});
    }

    std::uint32_t familyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, nullptr);
    std::vector<VkQueueFamilyProperties> families(familyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, families.data());
    for (const auto& f : families) {
        QueueCapability caps = QueueCapability::None;
        // Graphics families present on every platform we target; the
        // swapchain code still checks the surface.
        if (f.queueFlags & VK_QUEUE_GRAPHICS_BIT)
            caps |= QueueCapability::Graphics | QueueCapability::Present;
        if (f.queueFlags & VK_QUEUE_COMPUTE_BIT)  caps |= QueueCapability::Compute;
        if (f.queueFlags & (VK_QUEUE_TRANSFER_BIT | VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT))
            caps |= QueueCapability::Transfer;
        info.queueFamilies.push_back(QueueFamily{caps, f.queueCount});
    }

    VkPhysicalDeviceFeatures core;
    vkGetPhysicalDeviceFeatures(gpu, &core);

    info.features.splitBarriers           = true;
    info.features.stageGranularWaits      = true;
    info.features.implicitPassTransitions = true;
    info.features.samplerAnisotropy       = core.samplerAnisotropy == VK_TRUE;

    const VkPhysicalDeviceLimits& l = props.limits;
    info.limits.minUniformBufferOffsetAlignment = l.minUniformBufferOffsetAlignment;
    info.limits.minStorageBufferOffsetAlignment = l.minStorageBufferOffsetAlignment;
    info.limits.nonCoherentAtomSize             = l.nonCoherentAtomSize;
    info.limits.maxColorAttachments             = l.maxColorAttachments;
    info.limits.maxBoundSets                    = l.maxBoundDescriptorSets;
    info.limits.maxPushConstantsSize            = l.maxPushConstantsSize;
    return info;
}

class VulkanInstance final : public NativeInstance {
public:
    explicit VulkanInstance(std::shared_ptr<InstanceState> state) : state_(std::move(state)) {
        std::uint32_t count = 0;
        vkEnumeratePhysicalDevices(state_->instance, &count, nullptr);
        std::vector<VkPhysicalDevice> gpus(count);
        vkEnumeratePhysicalDevices(state_->instance, &count, gpus.data());

        for (VkPhysicalDevice gpu : gpus) {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(gpu, &props);
            if (!suitable(gpu, props)) {
                std::fprintf(stderr, "[gfxhal] vulkan: skipping '%s', it lacks Vulkan 1.3 "
                                     "synchronization2 or timeline semaphores\n",
                             props.deviceName);
                continue;
            }
            gpus_.push_back(gpu);
            infos_.push_back(describe(gpu, props));
            swapchain_.push_back(deviceExtensionAvailable(gpu, VK_KHR_SWAPCHAIN_EXTENSION_NAME));
        }
    }

    [[nodiscard]] Backend backend() const override { return Backend::Vulkan; }

    [[nodiscard]] std::vector<AdapterInfo> enumerateAdapters() override { return infos_; }

    [[nodiscard]] Result<std::unique_ptr<NativeDevice>> createDevice(
        std::uint32_t adapter, const std::vector<QueueRequest>& queues) override {
        if (adapter >= gpus_.size()) {
            return Error{"create device", ErrorCode::InvalidUsage, 0,
                         "adapter " + std::to_string(adapter) + " does not exist"};
        }
        auto device = VulkanDevice::create(state_, gpus_[adapter], infos_[adapter], queues,
                                           swapchain_[adapter]);
        if (!device.ok()) return std::move(device.error());
        return std::unique_ptr<NativeDevice>(std::move(device).value());
    }

private:
    std::shared_ptr<InstanceState> state_;
    std::vector<VkPhysicalDevice>  gpus_;
    std::vector<AdapterInfo>       infos_;
    std::vector<bool>              swapchain_;
};

} // namespace

InstanceState::~InstanceState() {
    if (messenger != VK_NULL_HANDLE) {
        auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));
        if (func) func(instance, messenger, nullptr);
    }
    if (instance != VK_NULL_HANDLE) {
        vkDestroyInstance(instance, nullptr);
    }
}

} // namespace detail

Result<std::shared_ptr<NativeInstance>> createInstance(const InstanceConfig& config) {
    std::vector<const char*> extensions = config.extensions;

    bool wantValidation = config.validationLayers;
    const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";
    // Degrade gracefully when the validation layer is absent (release driver, CI).
    if (wantValidation && !detail::layerAvailable(kValidationLayer)) {
        std::fprintf(stderr, "[gfxhal] vulkan: validation layer not installed, continuing "
                             "without it\n");
        wantValidation = false;
    }

    std::vector<const char*> layers;
    if (wantValidation) {
        layers.push_back(kValidationLayer);
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = config.appName.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "gfxhal";
    appInfo.apiVersion         = VK_API_VERSION_1_3;

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();

    // Chained so validation also covers vkCreateInstance/vkDestroyInstance.
    VkDebugUtilsMessengerCreateInfoEXT debugCI{};
    if (wantValidation) {
        debugCI.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        debugCI.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        debugCI.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
        debugCI.pfnUserCallback = detail::debugCallback;
        ci.pNext = &debugCI;
    }

    auto state = std::make_shared<detail::InstanceState>();
    VkResult vr = vkCreateInstance(&ci, nullptr, &state->instance);
    if (vr != VK_SUCCESS) {
        std::string msg = "vkCreateInstance failed";
        if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
            msg += "; the driver does not support Vulkan 1.3, try updating it";
        }
        return detail::vkError("create instance", vr, msg);
    }

    if (wantValidation) {
        auto createFunc = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(state->instance, "vkCreateDebugUtilsMessengerEXT"));
        if (createFunc) {
            vr = createFunc(state->instance, &debugCI, nullptr, &state->messenger);
            if (vr != VK_SUCCESS) {
                std::fprintf(stderr, "[gfxhal] vulkan: debug messenger unavailable (%s)\n",
                             detail::toString(vr));
            }
        }
    }

    return std::shared_ptr<NativeInstance>(
        std::make_shared<detail::VulkanInstance>(std::move(state)));
}

DeviceObjects deviceObjects(NativeDevice& device) {
    auto* vk = dynamic_cast<detail::VulkanDevice*>(&device);
    if (!vk) return {};
    return DeviceObjects{vk->vkInstance(), vk->vkPhysicalDevice(), vk->vkDevice()};
}

NativeHandle toHandle(VkSwapchainKHR swapchain) { return detail::toNative(swapchain); }

} // namespace gfxhal::vulkan

#pragma once

#include <gfxhal/native.hpp>
#include <gfxhal/vulkan/vulkan.hpp>

#include "convert.hpp"

#include <vk_mem_alloc.h>
#include <vulkan/vulkan.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gfxhal::vulkan::detail {

// Owns the VkInstance and its debug messenger. Shared by every device
// created from it.
struct InstanceState {
    VkInstance               instance  = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;

    InstanceState() = default;
    ~InstanceState();
    InstanceState(const InstanceState&) = delete;
    InstanceState& operator=(const InstanceState&) = delete;
};

struct BufferRecord {
    VkBuffer   buffer = VK_NULL_HANDLE;
    BufferDesc desc;
};

struct ImageRecord {
    VkImage            image   = VK_NULL_HANDLE;
    VkImageView        view    = VK_NULL_HANDLE; // whole image, created at bind
    ImageDesc          desc;
    VkImageAspectFlags aspects = VK_IMAGE_ASPECT_COLOR_BIT;
};

struct MemoryRecord {
    VmaAllocation     allocation  = VK_NULL_HANDLE;
    VmaAllocationInfo info{};
    std::uint32_t     typeIndex   = 0;
    bool              hostVisible = false;
    bool              mapped      = false;
};

struct LayoutRecord {
    VkPipelineLayout          layout = VK_NULL_HANDLE;
    std::vector<SetLayoutRef> sets;
    // Per set: for each native dynamic offset slot (binding-number order),
    // the index of the offset in declaration order.
    std::vector<std::vector<std::uint32_t>> dynamicOrder;
};

struct PoolRecord {
    VkDescriptorPool          pool = VK_NULL_HANDLE;
    std::vector<NativeHandle> sets;
    std::uint64_t             epoch = 0; // bumped by reset; stale deferred frees are skipped
    std::mutex                mutex;     // allocate, free and reset touch the pool
};

struct SetRecord {
    VkDescriptorSet set  = VK_NULL_HANDLE;
    NativeHandle    pool = NullHandle;
    SetLayoutRef    layout;
    std::map<std::pair<std::uint32_t, std::uint32_t>, VkBufferView> views; // (binding, element)
};

struct PassRecord {
    VkRenderPass   pass = VK_NULL_HANDLE;
    RenderPassDesc desc;
};

// Host-side record table. Records are handed out by shared_ptr so a
// concurrent destroy cannot free one under a reader.
template <typename T>
class Registry {
public:
    NativeHandle insert(std::shared_ptr<T> record) {
        std::lock_guard lock(mutex_);
        const NativeHandle handle = next_++;
        records_.emplace(handle, std::move(record));
        return handle;
    }

    [[nodiscard]] std::shared_ptr<T> get(NativeHandle handle) const {
        std::lock_guard lock(mutex_);
        auto it = records_.find(handle);
        return it == records_.end() ? nullptr : it->second;
    }

    std::shared_ptr<T> erase(NativeHandle handle) {
        std::lock_guard lock(mutex_);
        auto it = records_.find(handle);
        if (it == records_.end()) return nullptr;
        auto record = std::move(it->second);
        records_.erase(it);
        return record;
    }

    [[nodiscard]] std::vector<std::shared_ptr<T>> drain() {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<T>> out;
        out.reserve(records_.size());
        for (auto& [handle, record] : records_) out.push_back(std::move(record));
        records_.clear();
        return out;
    }

private:
    mutable std::mutex                                 mutex_;
    std::unordered_map<NativeHandle, std::shared_ptr<T>> records_;
    NativeHandle                                       next_ = 1;
};

// Command buffers and events of one submission, recycled once the queue's
// timeline passes its serial.
struct InFlight {
    std::uint64_t                serial = 0;
    std::vector<VkCommandBuffer> commandBuffers;
    std::vector<VkEvent>         events;
};

struct QueueState {
    VkQueue              queue    = VK_NULL_HANDLE;
    std::uint32_t        family   = 0;
    VkCommandPool        pool     = VK_NULL_HANDLE;
    VkSemaphore          timeline = VK_NULL_HANDLE; // value = last completed serial
    std::deque<InFlight> inFlight;
    std::mutex           mutex; // vkQueue* calls and the pool are externally synchronized

    std::atomic<std::uint64_t> submitted{0};
};

class VulkanDevice;

class SpirvTranslator final : public ShaderTranslator {
public:
    explicit SpirvTranslator(VulkanDevice& device) : device_(device) {}

    [[nodiscard]] Result<TranslatedShader> translate(const ShaderSource& source,
                                                     const RegisterAssignment& assignment) override;
    void release(NativeHandle module) override;

private:
    VulkanDevice& device_;
};

// Thread safety: internally synchronized. Record tables, the set-layout
// cache, each queue and the deferred-release list have their own locks.
class VulkanDevice final : public NativeDevice {
public:
    [[nodiscard]] static Result<std::unique_ptr<VulkanDevice>> create(
        std::shared_ptr<InstanceState> instance, VkPhysicalDevice gpu, AdapterInfo info,
        const std::vector<QueueRequest>& queues, bool swapchain);

    ~VulkanDevice() override;
    VulkanDevice(const VulkanDevice&) = delete;
    VulkanDevice& operator=(const VulkanDevice&) = delete;

    [[nodiscard]] Backend            backend() const override { return Backend::Vulkan; }
    [[nodiscard]] const AdapterInfo& adapter() const override { return info_; }
    [[nodiscard]] std::uint32_t      queueCount() const override {
        return static_cast<std::uint32_t>(queues_.size());
    }
    [[nodiscard]] ShaderTranslator& translator() override { return translator_; }

    [[nodiscard]] Result<NativeHandle> createBuffer(const BufferDesc& desc) override;
    [[nodiscard]] Result<NativeHandle> createImage(const ImageDesc& desc) override;
    [[nodiscard]] MemoryRequirements   bufferRequirements(NativeHandle buffer) override;
    [[nodiscard]] MemoryRequirements   imageRequirements(NativeHandle image) override;
    [[nodiscard]] Result<NativeHandle> allocateMemory(std::uint32_t typeIndex,
                                                      std::uint64_t size) override;
    [[nodiscard]] Result<void> bindBufferMemory(NativeHandle buffer, NativeHandle memory,
                                                std::uint64_t offset) override;
    [[nodiscard]] Result<void> bindImageMemory(NativeHandle image, NativeHandle memory,
                                               std::uint64_t offset) override;
    [[nodiscard]] Result<void*> mapMemory(NativeHandle memory, std::uint64_t offset,
                                          std::uint64_t size) override;
    void unmapMemory(NativeHandle memory) override;
    [[nodiscard]] Result<NativeHandle> createSampler(const SamplerDesc& desc) override;

    [[nodiscard]] Result<NativeHandle> createPipelineLayout(
        const std::vector<SetLayoutRef>& sets, const std::optional<PushConstantRange>& push,
        const RegisterAssignment& assignment) override;
    [[nodiscard]] Result<NativeHandle> createDescriptorPool(const DescriptorPoolDesc& desc) override;
    [[nodiscard]] Result<NativeHandle> allocateDescriptorSet(NativeHandle pool,
                                                             const SetLayoutRef& layout,
                                                             const HeapRuns& runs) override;
    void freeDescriptorSet(NativeHandle pool, NativeHandle set) override;
    void resetDescriptorPool(NativeHandle pool) override;
    void writeDescriptor(NativeHandle set, std::uint32_t binding, std::uint32_t element,
                         const Descriptor& descriptor) override;

    [[nodiscard]] Result<NativeHandle> createRenderPass(const RenderPassDesc& desc,
                                                        const RenderPassPlan& plan) override;
    [[nodiscard]] Result<NativeHandle> createFramebuffer(NativeHandle renderPass,
                                                         const std::vector<ResourceRef>& attachments,
                                                         Extent2D extent,
                                                         std::uint32_t layers) override;
    [[nodiscard]] Result<NativeHandle> createGraphicsPipeline(
        const NativeGraphicsPipelineDesc& desc) override;
    [[nodiscard]] Result<NativeHandle> createComputePipeline(
        const NativeComputePipelineDesc& desc) override;

    [[nodiscard]] Result<NativeHandle> createFence(bool signaled) override;
    [[nodiscard]] Result<bool>         fenceStatus(NativeHandle fence) override;
    [[nodiscard]] Result<void>         resetFence(NativeHandle fence) override;
    [[nodiscard]] Result<bool> waitForFences(const std::vector<NativeHandle>& fences, bool waitAll,
                                             std::uint64_t timeoutNs) override;
    [[nodiscard]] Result<NativeHandle> createSemaphore() override;

    [[nodiscard]] Result<void>  submit(std::uint32_t queue, NativeSubmission submission) override;
    [[nodiscard]] std::uint64_t completedSerial(std::uint32_t queue) override;
    [[nodiscard]] Result<void>  waitQueueIdle(std::uint32_t queue) override;
    [[nodiscard]] Result<void>  present(std::uint32_t queue, const PresentTarget& target,
                                        const std::vector<NativeHandle>& waits) override;

    void destroy(ObjectKind kind, NativeHandle handle) override;

    // Used by the stream recorder and the translator.
    [[nodiscard]] VkDevice         vkDevice() const { return device_; }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return gpu_; }
    [[nodiscard]] VkInstance       vkInstance() const { return instance_->instance; }

    [[nodiscard]] std::shared_ptr<BufferRecord> buffer(NativeHandle h) const { return buffers_.get(h); }
    [[nodiscard]] std::shared_ptr<ImageRecord>  image(NativeHandle h) const { return images_.get(h); }
    [[nodiscard]] std::shared_ptr<LayoutRecord> layout(NativeHandle h) const { return layouts_.get(h); }
    [[nodiscard]] std::shared_ptr<SetRecord>    set(NativeHandle h) const { return sets_.get(h); }
    [[nodiscard]] std::shared_ptr<PassRecord>   renderPass(NativeHandle h) const {
        return passes_.get(h);
    }

    [[nodiscard]] Result<VkEvent> acquireEvent();

    // Classifies a failed call; VK_ERROR_DEVICE_LOST also marks the device.
    [[nodiscard]] Error fail(const char* operation, VkResult vr, const std::string& message);

private:
    VulkanDevice(std::shared_ptr<InstanceState> instance, VkPhysicalDevice gpu, AdapterInfo info);

    [[nodiscard]] Result<void> alive(const char* operation) const;
    [[nodiscard]] Result<VkDescriptorSetLayout> setLayoutFor(const SetLayoutRef& layout);
    [[nodiscard]] Result<void> createAllocator();

    // Runs release once every queue has finished what was submitted so far.
    void retire(std::function<void()> release);
    void collectRetired(bool all);
    void recycle(QueueState& queue, std::uint64_t completed);
    void releaseBatch(QueueState& queue, InFlight& batch);
    void releaseSet(const SetRecord& record);

    std::shared_ptr<InstanceState> instance_;
    VkPhysicalDevice               gpu_       = VK_NULL_HANDLE;
    VkDevice                       device_    = VK_NULL_HANDLE;
    VmaAllocator                   allocator_ = VK_NULL_HANDLE;
    AdapterInfo                    info_;
    SpirvTranslator                translator_;
    bool                           swapchain_ = false;
    bool                           wireframe_ = false; // fillModeNonSolid enabled

    Registry<BufferRecord> buffers_;
    Registry<ImageRecord>  images_;
    Registry<MemoryRecord> memory_;
    Registry<LayoutRecord> layouts_;
    Registry<PoolRecord>   pools_;
    Registry<SetRecord>    sets_;
    Registry<PassRecord>   passes_;

    std::mutex                                     setLayoutMutex_;
    std::map<SetLayoutRef, VkDescriptorSetLayout>  setLayouts_;

    std::vector<std::unique_ptr<QueueState>> queues_;

    std::mutex           eventMutex_;
    std::vector<VkEvent> freeEvents_;

    struct Retired {
        std::vector<std::uint64_t> serials; // per queue, at retirement
        std::function<void()>      release;
    };
    std::mutex          retireMutex_;
    std::deque<Retired> retired_;

    std::atomic<bool> lost_{false};

    friend class StreamRecorder;
};

} // namespace gfxhal::vulkan::detail

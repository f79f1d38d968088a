#pragma once

#include <gfxhal/command.hpp>
#include <gfxhal/descriptor.hpp>
#include <gfxhal/descriptor_set.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/memory.hpp>
#include <gfxhal/native.hpp>
#include <gfxhal/pipeline.hpp>
#include <gfxhal/pipeline_layout.hpp>
#include <gfxhal/queue.hpp>
#include <gfxhal/register_allocator.hpp>
#include <gfxhal/render_pass.hpp>
#include <gfxhal/resource.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/sync.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gfxhal {

// FailFast raises every recording or usage error through throwError the
// moment it happens. Report logs it to stderr and returns it.
enum class Validation : std::uint8_t {
    FailFast,
    Report,
};

#ifdef NDEBUG
inline constexpr Validation DefaultValidation = Validation::Report;
#else
inline constexpr Validation DefaultValidation = Validation::FailFast;
#endif

[[nodiscard]] const char* toString(Validation validation);

namespace detail {
class DeviceCore;
struct InstanceState;
} // namespace detail

class Adapter;

// Owns the native instance. Adapters and devices share it, so it lives as
// long as any of them.
//
// Thread safety: immutable after construction.
class Instance {
public:
    [[nodiscard]] Backend            backend()    const;
    [[nodiscard]] Validation         validation() const;
    [[nodiscard]] const std::string& appName()    const;

    [[nodiscard]] std::vector<Adapter> adapters() const;

    // First adapter of the preferred type, else the first adapter.
    [[nodiscard]] Result<Adapter> pickAdapter(AdapterType prefer = AdapterType::Discrete) const;

private:
    friend class InstanceBuilder;

    std::shared_ptr<detail::InstanceState> state_;
};

class InstanceBuilder {
public:
    explicit InstanceBuilder(std::shared_ptr<NativeInstance> native);

    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& validation(Validation v);

    [[nodiscard]] Result<Instance> build();

private:
    std::shared_ptr<NativeInstance> native_;
    std::string                     appName_    = "gfxhal_app";
    Validation                      validation_ = DefaultValidation;
};

// Thread safety: immutable value.
class Adapter {
public:
    [[nodiscard]] const AdapterInfo& info()  const;
    [[nodiscard]] std::uint32_t      index() const { return index_; }

    // First family that has every requested capability.
    [[nodiscard]] std::optional<std::uint32_t> findQueueFamily(QueueCapability caps) const;

private:
    friend class Instance;
    friend class DeviceBuilder;

    std::shared_ptr<detail::InstanceState> instance_;
    std::uint32_t                          index_ = 0;
};

// Thread safety: object creation, descriptor writes to distinct sets and
// queue submission are internally synchronized.
class Device {
public:
    Device() = default;
    ~Device();
    Device(Device&&) noexcept = default;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] bool                     valid()      const { return core_ != nullptr; }
    [[nodiscard]] Backend                  backend()    const;
    [[nodiscard]] Validation               validation() const;
    [[nodiscard]] const AdapterInfo&       adapter()    const;
    [[nodiscard]] const RegisterAllocator& registerAllocator() const;
    [[nodiscard]] NativeDevice&            native()     const;

    // Sticky: once any operation saw DeviceLost, every later one fails with it.
    [[nodiscard]] bool lost() const;

    [[nodiscard]] std::uint32_t queueCount() const;
    [[nodiscard]] Queue         queue(std::uint32_t index) const;

    // Memory and resources.
    [[nodiscard]] Result<std::uint32_t> findMemoryType(std::uint32_t typeMask,
                                                       MemoryUsage usage) const;
    [[nodiscard]] Result<Memory> allocateMemory(std::uint32_t typeIndex, std::uint64_t size);
    [[nodiscard]] Result<Buffer> createBuffer(const BufferDesc& desc);
    [[nodiscard]] Result<Image>  createImage(const ImageDesc& desc);

    // Create, allocate a dedicated block for usage, bind.
    [[nodiscard]] Result<Buffer> createBuffer(const BufferDesc& desc, MemoryUsage usage);
    [[nodiscard]] Result<Image>  createImage(const ImageDesc& desc, MemoryUsage usage);

    [[nodiscard]] Result<Sampler> createSampler(const SamplerDesc& desc);

    // Binding model.
    [[nodiscard]] Result<SetLayoutRef> createDescriptorSetLayout(
        std::vector<DescriptorSetLayoutBinding> bindings) const;
    [[nodiscard]] Result<PipelineLayout> createPipelineLayout(
        std::vector<SetLayoutRef> sets, std::vector<PushConstantRange> pushConstants = {});
    [[nodiscard]] Result<DescriptorPool> createDescriptorPool(const DescriptorPoolDesc& desc);
    [[nodiscard]] Result<void> writeDescriptorSets(const std::vector<DescriptorWrite>& writes);
    [[nodiscard]] Result<void> copyDescriptorSets(const std::vector<DescriptorCopy>& copies);

    // Passes and pipelines.
    [[nodiscard]] Result<RenderPass>  createRenderPass(const RenderPassDesc& desc);
    [[nodiscard]] Result<Framebuffer> createFramebuffer(const RenderPass& renderPass,
                                                        const std::vector<const Image*>& attachments,
                                                        Extent2D extent, std::uint32_t layers = 1);
    [[nodiscard]] Result<Pipeline> createGraphicsPipeline(const GraphicsPipelineDesc& desc);
    [[nodiscard]] Result<Pipeline> createComputePipeline(const ComputePipelineDesc& desc);

    // Synchronization and recording.
    [[nodiscard]] Result<Fence>       createFence(bool signaled = false);
    [[nodiscard]] Result<Semaphore>   createSemaphore();
    [[nodiscard]] Result<CommandPool> createCommandPool(std::uint32_t queueFamily);

    [[nodiscard]] Result<void> waitForFence(const Fence& fence,
                                            std::uint64_t timeoutNs = WaitForever);
    [[nodiscard]] Result<void> waitForFences(const std::vector<const Fence*>& fences, bool waitAll,
                                             std::uint64_t timeoutNs = WaitForever);

    // Drains every queue and collects garbage.
    [[nodiscard]] Result<void> waitIdle();

    // Native objects retired but not yet freed.
    [[nodiscard]] std::size_t pendingGarbage() const;

private:
    friend class DeviceBuilder;

    std::shared_ptr<detail::DeviceCore> core_;
};

class DeviceBuilder {
public:
    explicit DeviceBuilder(const Adapter& adapter);

    // Default: one queue of the first graphics-capable family.
    DeviceBuilder& queues(std::uint32_t family, std::uint32_t count = 1);
    DeviceBuilder& validation(Validation v);

    // Overrides the backend's default binding strategy or its limits.
    DeviceBuilder& registerAllocator(RegisterAllocator allocator);

    [[nodiscard]] Result<Device> build();

private:
    Adapter                          adapter_;
    std::vector<QueueRequest>        queues_;
    std::optional<Validation>        validation_;
    std::optional<RegisterAllocator> allocator_;
};

} // namespace gfxhal

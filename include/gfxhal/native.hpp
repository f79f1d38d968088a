#pragma once

#include <gfxhal/commands.hpp>
#include <gfxhal/descriptor.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/memory.hpp>
#include <gfxhal/pass_planner.hpp>
#include <gfxhal/pipeline_desc.hpp>
#include <gfxhal/range_allocator.hpp>
#include <gfxhal/register_allocator.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// The contract a native API shim implements. Everything above this header is
// backend-neutral; everything below it talks to one driver (or to host
// memory, for the soft shim).

namespace gfxhal {

enum class AdapterType : std::uint8_t {
    Discrete,
    Integrated,
    Virtual,
    Cpu,
    Other,
};

[[nodiscard]] const char* toString(AdapterType type);

enum class QueueCapability : std::uint8_t {
    None     = 0,
    Graphics = 1u << 0,
    Compute  = 1u << 1,
    Transfer = 1u << 2,
    Present  = 1u << 3,
};
GFXHAL_FLAGS(QueueCapability)

struct QueueFamily {
    QueueCapability capabilities = QueueCapability::None;
    std::uint32_t   count        = 1;
};

struct AdapterFeatures {
    bool splitBarriers           = false; // begin/end barrier halves
    bool stageGranularWaits      = true;  // semaphore waits block only named stages
    bool implicitPassTransitions = false; // render pass performs layout transitions itself
    bool samplerAnisotropy       = false;
};

struct AdapterLimits {
    std::uint64_t minUniformBufferOffsetAlignment = 256;
    std::uint64_t minStorageBufferOffsetAlignment = 16;
    std::uint64_t nonCoherentAtomSize             = 64;
    std::uint32_t maxColorAttachments             = 8;
    std::uint32_t maxBoundSets                    = 8;
    std::uint32_t maxPushConstantsSize            = 128;
    std::uint32_t resourceHeapSize                = 1'000'000;
    std::uint32_t samplerHeapSize                 = 2048;
};

struct AdapterInfo {
    std::string              name;
    AdapterType              type    = AdapterType::Other;
    Backend                  backend = Backend::Vulkan;
    MemoryProperties         memory;
    std::vector<QueueFamily> queueFamilies;
    AdapterFeatures          features;
    AdapterLimits            limits;
};

struct QueueRequest {
    std::uint32_t family = 0;
    std::uint32_t count  = 1;
};

struct DescriptorPoolSize {
    DescriptorKind kind  = DescriptorKind::UniformBuffer;
    std::uint32_t  count = 0;
};

struct DescriptorPoolDesc {
    std::uint32_t                   maxSets = 0;
    std::vector<DescriptorPoolSize> sizes;
};

// Shader-visible heap runs owned by one descriptor set (heap/table model).
// Empty ranges on every other model.
struct HeapRuns {
    Range<std::uint32_t> resources;
    Range<std::uint32_t> samplers;
};

// Output of a shader translator: a native shader object and the resources
// the shader references.
struct TranslatedShader {
    NativeHandle                  module = NullHandle;
    std::vector<ReflectedBinding> reflected;
};

// Turns backend-neutral shader input into a native shader object.
class ShaderTranslator {
public:
    virtual ~ShaderTranslator() = default;

    [[nodiscard]] virtual Result<TranslatedShader> translate(
        const ShaderSource& source, const RegisterAssignment& assignment) = 0;

    // Frees a module once the pipelines built from it exist.
    virtual void release(NativeHandle module) = 0;
};

struct NativeShaderStage {
    ShaderStage              stage  = ShaderStage::None;
    NativeHandle             module = NullHandle;
    std::string              entryPoint;
    std::vector<ShaderRemap> remaps;
};

struct NativeGraphicsPipelineDesc {
    NativeHandle                   layout     = NullHandle;
    NativeHandle                   renderPass = NullHandle;
    std::uint32_t                  subpass    = 0;
    std::vector<NativeShaderStage> stages;
    std::vector<VertexBinding>     vertexBindings;
    std::vector<VertexAttribute>   vertexAttributes;
    RasterState                    raster;
    DepthState                     depth;
    std::vector<BlendState>        blend; // one per color attachment
    std::uint32_t                  samples = 1;
};

struct NativeComputePipelineDesc {
    NativeHandle      layout = NullHandle;
    NativeShaderStage stage;
};

struct NativeWait {
    NativeHandle  semaphore = NullHandle;
    PipelineStage stages    = PipelineStage::TopOfPipe;
};

// One queue submission. Serials increase by one per submission on a queue;
// completedSerial() reports the last one that finished executing.
struct NativeSubmission {
    std::vector<std::shared_ptr<const CommandStream>> commandBuffers;
    std::vector<NativeWait>                           waits;
    std::vector<NativeHandle>                         signals;
    NativeHandle                                      fence  = NullHandle;
    std::uint64_t                                     serial = 0;
};

struct PresentTarget {
    NativeHandle  surface    = NullHandle;
    std::uint32_t imageIndex = 0;
};

// One logical device of a native API. Every call may fail with DeviceLost
// once the device is gone.
//
// Thread safety: implementations are internally synchronized.
class NativeDevice {
public:
    virtual ~NativeDevice() = default;

    [[nodiscard]] virtual Backend            backend() const = 0;
    [[nodiscard]] virtual const AdapterInfo& adapter() const = 0;
    [[nodiscard]] virtual std::uint32_t      queueCount() const = 0;
    [[nodiscard]] virtual ShaderTranslator&  translator() = 0;

    // Resources and memory.
    [[nodiscard]] virtual Result<NativeHandle> createBuffer(const BufferDesc& desc) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createImage(const ImageDesc& desc) = 0;
    [[nodiscard]] virtual MemoryRequirements   bufferRequirements(NativeHandle buffer) = 0;
    [[nodiscard]] virtual MemoryRequirements   imageRequirements(NativeHandle image) = 0;
    [[nodiscard]] virtual Result<NativeHandle> allocateMemory(std::uint32_t typeIndex,
                                                              std::uint64_t size) = 0;
    [[nodiscard]] virtual Result<void> bindBufferMemory(NativeHandle buffer, NativeHandle memory,
                                                        std::uint64_t offset) = 0;
    [[nodiscard]] virtual Result<void> bindImageMemory(NativeHandle image, NativeHandle memory,
                                                       std::uint64_t offset) = 0;
    [[nodiscard]] virtual Result<void*> mapMemory(NativeHandle memory, std::uint64_t offset,
                                                  std::uint64_t size) = 0;
    virtual void unmapMemory(NativeHandle memory) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createSampler(const SamplerDesc& desc) = 0;

    // Binding model.
    [[nodiscard]] virtual Result<NativeHandle> createPipelineLayout(
        const std::vector<SetLayoutRef>& sets, const std::optional<PushConstantRange>& push,
        const RegisterAssignment& assignment) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createDescriptorPool(
        const DescriptorPoolDesc& desc) = 0;
    [[nodiscard]] virtual Result<NativeHandle> allocateDescriptorSet(NativeHandle pool,
                                                                     const SetLayoutRef& layout,
                                                                     const HeapRuns& runs) = 0;
    virtual void freeDescriptorSet(NativeHandle pool, NativeHandle set) = 0;
    virtual void resetDescriptorPool(NativeHandle pool) = 0;
    virtual void writeDescriptor(NativeHandle set, std::uint32_t binding, std::uint32_t element,
                                 const Descriptor& descriptor) = 0;

    // Passes and pipelines.
    [[nodiscard]] virtual Result<NativeHandle> createRenderPass(const RenderPassDesc& desc,
                                                                const RenderPassPlan& plan) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createFramebuffer(
        NativeHandle renderPass, const std::vector<ResourceRef>& attachments, Extent2D extent,
        std::uint32_t layers) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createGraphicsPipeline(
        const NativeGraphicsPipelineDesc& desc) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createComputePipeline(
        const NativeComputePipelineDesc& desc) = 0;

    // Synchronization.
    [[nodiscard]] virtual Result<NativeHandle> createFence(bool signaled) = 0;
    [[nodiscard]] virtual Result<bool>         fenceStatus(NativeHandle fence) = 0;
    [[nodiscard]] virtual Result<void>         resetFence(NativeHandle fence) = 0;
    // true: condition met, false: timed out.
    [[nodiscard]] virtual Result<bool> waitForFences(const std::vector<NativeHandle>& fences,
                                                     bool waitAll, std::uint64_t timeoutNs) = 0;
    [[nodiscard]] virtual Result<NativeHandle> createSemaphore() = 0;

    // Queues.
    [[nodiscard]] virtual Result<void> submit(std::uint32_t queue, NativeSubmission submission) = 0;
    [[nodiscard]] virtual std::uint64_t completedSerial(std::uint32_t queue) = 0;
    [[nodiscard]] virtual Result<void>  waitQueueIdle(std::uint32_t queue) = 0;
    [[nodiscard]] virtual Result<void>  present(std::uint32_t queue, const PresentTarget& target,
                                                const std::vector<NativeHandle>& waits) = 0;

    virtual void destroy(ObjectKind kind, NativeHandle handle) = 0;
};

class NativeInstance {
public:
    virtual ~NativeInstance() = default;

    [[nodiscard]] virtual Backend                  backend() const = 0;
    [[nodiscard]] virtual std::vector<AdapterInfo> enumerateAdapters() = 0;
    [[nodiscard]] virtual Result<std::unique_ptr<NativeDevice>> createDevice(
        std::uint32_t adapter, const std::vector<QueueRequest>& queues) = 0;
};

} // namespace gfxhal

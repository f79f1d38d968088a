#pragma once

#include <gfxhal/native.hpp>
#include <gfxhal/soft/soft.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace gfxhal::soft::detail {

struct SoftMemory {
    std::vector<std::uint8_t> bytes;
    std::uint32_t             typeIndex = 0;
    std::uint32_t             heapIndex = 0;
    bool                      mapped    = false;
};

struct SoftBuffer {
    BufferDesc                  desc;
    std::shared_ptr<SoftMemory> memory;
    std::uint64_t               offset = 0;

    // Empty until memory is bound.
    [[nodiscard]] std::span<std::uint8_t> bytes() const {
        if (!memory) return {};
        return {memory->bytes.data() + offset, desc.size};
    }
};

struct SoftImage {
    ImageDesc                   desc;
    std::uint64_t               size = 0; // linear bytes over every mip and layer
    std::shared_ptr<SoftMemory> memory;
    std::uint64_t               offset = 0;
    ImageLayout                 layout = ImageLayout::Undefined; // executor thread only

    [[nodiscard]] std::uint8_t* texelAddress(std::uint32_t mip, std::uint32_t layer,
                                             std::uint32_t x, std::uint32_t y,
                                             std::uint32_t z = 0) const;
    [[nodiscard]] Extent3D mipExtent(std::uint32_t mip) const;
};

struct SoftSampler {
    SamplerDesc desc;
};

struct SoftPipelineLayout {
    std::vector<SetLayoutRef>        sets;
    std::optional<PushConstantRange> push;
    RegisterAssignment               assignment;
};

struct SoftDescriptorPool {
    DescriptorPoolDesc        desc;
    std::vector<NativeHandle> sets;
};

struct SoftDescriptorSet {
    SetLayoutRef                         layout;
    std::vector<std::vector<Descriptor>> descriptors; // [binding index][element]
    HeapRuns                             runs;
};

struct SoftRenderPass {
    RenderPassDesc desc;
    RenderPassPlan plan;
};

struct SoftFramebuffer {
    NativeHandle                            renderPass = NullHandle;
    std::vector<std::shared_ptr<SoftImage>> attachments;
    Extent2D                                extent;
    std::uint32_t                           layers = 1;
};

struct SoftStage {
    ShaderStage                    stage = ShaderStage::None;
    std::shared_ptr<const Program> program;
    std::vector<ShaderRemap>       remaps;
};

struct SoftPipeline {
    PipelineBindPoint            bindPoint = PipelineBindPoint::Graphics;
    NativeHandle                 layout    = NullHandle;
    NativeHandle                 renderPass = NullHandle;
    std::uint32_t                subpass   = 0;
    std::vector<SoftStage>       stages;
    std::vector<VertexBinding>   vertexBindings;
    std::vector<VertexAttribute> vertexAttributes;
    DepthState                   depth;
    std::vector<BlendState>      blend;

    [[nodiscard]] const SoftStage* find(ShaderStage stage) const;
};

struct SoftSurface {
    SurfaceState  state      = SurfaceState::Ok;
    std::uint32_t imageCount = 2;
    std::uint64_t presents   = 0;
};

// Handle -> object map with its own lock. Handles come from one counter per
// device so no two tables hand out the same value.
template <typename T>
class ObjectTable {
public:
    NativeHandle insert(NativeHandle handle, std::shared_ptr<T> object) {
        std::lock_guard lock(mutex_);
        objects_.emplace(handle, std::move(object));
        return handle;
    }

    [[nodiscard]] std::shared_ptr<T> get(NativeHandle handle) const {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(handle);
        return it == objects_.end() ? nullptr : it->second;
    }

    std::shared_ptr<T> erase(NativeHandle handle) {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(handle);
        if (it == objects_.end()) return nullptr;
        auto object = std::move(it->second);
        objects_.erase(it);
        return object;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }

private:
    mutable std::mutex                                   mutex_;
    std::unordered_map<NativeHandle, std::shared_ptr<T>> objects_;
};

class SoftDevice;

// Program-name translator. Reflection is whatever the program declared.
class SoftTranslator final : public ShaderTranslator {
public:
    explicit SoftTranslator(std::shared_ptr<ProgramLibrary> programs)
        : programs_(std::move(programs)) {}

    [[nodiscard]] Result<TranslatedShader> translate(const ShaderSource& source,
                                                     const RegisterAssignment& assignment) override;
    void release(NativeHandle module) override;

    [[nodiscard]] std::shared_ptr<const Program> program(NativeHandle module) const;
    [[nodiscard]] std::size_t                    moduleCount() const;

private:
    std::shared_ptr<ProgramLibrary> programs_;

    mutable std::mutex                                               mutex_;
    std::unordered_map<NativeHandle, std::shared_ptr<const Program>> modules_;
    NativeHandle                                                     next_ = 1;
};

struct Job {
    NativeSubmission submission;
    bool             present = false;
};

struct QueueWorker {
    std::thread     thread;
    std::deque<Job> jobs;
    bool            held = false;
    bool            busy = false;
    std::atomic<std::uint64_t> completed{0};
};

class SoftDevice final : public NativeDevice, public DeviceHooks {
public:
    SoftDevice(AdapterInfo info, std::shared_ptr<ProgramLibrary> programs,
               std::uint32_t queueCount);
    ~SoftDevice() override;

    SoftDevice(const SoftDevice&) = delete;
    SoftDevice& operator=(const SoftDevice&) = delete;

    [[nodiscard]] Backend            backend() const override { return info_.backend; }
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

    // DeviceHooks
    void holdQueue(std::uint32_t queue, bool held) override;
    void loseDevice() override;
    [[nodiscard]] NativeHandle  createSurface(std::uint32_t imageCount) override;
    void                        setSurfaceState(NativeHandle surface, SurfaceState state) override;
    [[nodiscard]] std::uint64_t presentCount(NativeHandle surface) const override;
    [[nodiscard]] ImageLayout   imageLayout(NativeHandle image) const override;
    [[nodiscard]] std::uint64_t layoutErrors() const override { return layoutErrors_.load(); }
    [[nodiscard]] std::uint64_t bindingErrors() const override { return bindingErrors_.load(); }
    [[nodiscard]] std::size_t   liveObjects() const override;

    // Executor access.
    [[nodiscard]] std::shared_ptr<SoftBuffer>   buffer(NativeHandle h) const { return buffers_.get(h); }
    [[nodiscard]] std::shared_ptr<SoftImage>    image(NativeHandle h) const { return images_.get(h); }
    [[nodiscard]] std::shared_ptr<SoftSampler>  sampler(NativeHandle h) const { return samplers_.get(h); }
    [[nodiscard]] std::shared_ptr<SoftPipelineLayout> pipelineLayout(NativeHandle h) const {
        return layouts_.get(h);
    }
    [[nodiscard]] std::shared_ptr<SoftDescriptorSet> descriptorSet(NativeHandle h) const {
        return sets_.get(h);
    }
    [[nodiscard]] std::shared_ptr<SoftRenderPass>  renderPass(NativeHandle h) const {
        return renderPasses_.get(h);
    }
    [[nodiscard]] std::shared_ptr<SoftFramebuffer> framebuffer(NativeHandle h) const {
        return framebuffers_.get(h);
    }
    [[nodiscard]] std::shared_ptr<SoftPipeline> pipeline(NativeHandle h) const {
        return pipelines_.get(h);
    }

    // Copy of a set's contents, taken under the write lock.
    [[nodiscard]] std::optional<SoftDescriptorSet> readSet(NativeHandle set) const;

    // Heap/table model: the shader-visible descriptor heaps.
    [[nodiscard]] Descriptor heapDescriptor(RegisterSpace space, std::uint32_t slot) const;

    void layoutError(const char* what, NativeHandle image, ImageLayout expected,
                     ImageLayout found);
    void bindingError(const std::string& message);

private:
    [[nodiscard]] Result<void> alive(const char* operation) const;
    [[nodiscard]] NativeHandle nextHandle() { return next_.fetch_add(1); }
    [[nodiscard]] MemoryRequirements requirementsFor(std::uint64_t size,
                                                     std::uint64_t alignment) const;

    void workerLoop(std::uint32_t queue);
    void execute(const Job& job);
    [[nodiscard]] bool signaled(const std::vector<NativeWait>& waits) const;

    AdapterInfo    info_;
    SoftTranslator translator_;

    std::atomic<NativeHandle> next_{1};

    ObjectTable<SoftMemory>         memory_;
    ObjectTable<SoftBuffer>         buffers_;
    ObjectTable<SoftImage>          images_;
    ObjectTable<SoftSampler>        samplers_;
    ObjectTable<SoftPipelineLayout> layouts_;
    ObjectTable<SoftDescriptorPool> pools_;
    ObjectTable<SoftDescriptorSet>  sets_;
    ObjectTable<SoftRenderPass>     renderPasses_;
    ObjectTable<SoftFramebuffer>    framebuffers_;
    ObjectTable<SoftPipeline>       pipelines_;

    mutable std::mutex                 heapMutex_;
    std::vector<std::uint64_t>         heapUsage_; // bytes allocated per memory heap
    std::map<std::uint32_t, Descriptor> resourceHeap_;
    std::map<std::uint32_t, Descriptor> samplerHeap_;

    // Fences, semaphores, surfaces and the queue workers.
    mutable std::mutex                             syncMutex_;
    std::condition_variable                        cv_;
    std::unordered_map<NativeHandle, bool>         fences_;
    std::unordered_map<NativeHandle, bool>         semaphores_;
    std::unordered_map<NativeHandle, SoftSurface>  surfaces_;
    std::vector<std::unique_ptr<QueueWorker>>      queues_;
    bool                                           stopping_ = false;
    std::atomic<bool>                              lost_{false};

    // Queues run concurrently but replay one stream at a time, so executor
    // state on images (layouts, contents) has a single writer.
    mutable std::mutex execMutex_;

    std::atomic<std::uint64_t> layoutErrors_{0};
    std::atomic<std::uint64_t> bindingErrors_{0};
};

// Per-invocation view of executor state.
struct InvocationContext {
    SoftDevice*                     device = nullptr;
    ShaderStage                     stage  = ShaderStage::None;
    const std::vector<ShaderRemap>* remaps = nullptr;

    // (stage, space, group, slot, element) -> descriptor, for the bind point.
    using RegisterKey = std::tuple<ShaderStage, RegisterSpace, std::uint32_t, std::uint32_t,
                                   std::uint32_t>;
    const std::map<RegisterKey, Descriptor>* registers = nullptr;
    const std::vector<std::uint8_t>*         push      = nullptr;
    std::set<NativeHandle>*                  checkedImages = nullptr; // layout checked once per draw

    // Vertex stage.
    std::uint32_t                                      vertexIndex   = 0;
    std::uint32_t                                      instanceIndex = 0;
    std::map<std::uint32_t, std::span<const std::uint8_t>> attributes;

    // Compute stage.
    std::array<std::uint32_t, 3> workgroup{0, 0, 0};

    // Fragment stage.
    std::array<std::uint32_t, 2>              pixel{0, 0};
    std::vector<std::optional<Color>>         colors;
    std::optional<float>                      depth;
    bool                                      discarded = false;

    [[nodiscard]] static RegisterKey keyOf(ShaderStage stage, const NativeAddress& address,
                                           std::uint32_t element);

    // The descriptor a name resolves to for one part, or null.
    [[nodiscard]] const Descriptor* resolve(std::string_view name, DescriptorPart part,
                                            std::uint32_t element) const;

    [[nodiscard]] Invocation invocation() { return Invocation(*this); }
};

// The half of a descriptor a split register or heap slot holds.
[[nodiscard]] Descriptor descriptorPart(const Descriptor& descriptor, DescriptorPart part);

// Texel conversion for the formats the executor renders and samples.
[[nodiscard]] Color decodeTexel(Format format, const std::uint8_t* texel);
void                encodeTexel(Format format, const Color& color, std::uint8_t* texel);

} // namespace gfxhal::soft::detail

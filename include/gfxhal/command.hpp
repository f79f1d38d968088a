#pragma once

#include <gfxhal/barrier.hpp>
#include <gfxhal/commands.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/result.hpp>
#include <gfxhal/types.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace gfxhal {

class Buffer;
class DescriptorSet;
class Framebuffer;
class Image;
class Pipeline;
class PipelineLayout;
class RenderPass;

namespace detail {
class DeviceCore;
struct RecorderState;
} // namespace detail

enum class CommandBufferLevel : std::uint8_t {
    Primary,
    Secondary,
};

enum class CommandBufferUsage : std::uint8_t {
    None               = 0,
    OneTimeSubmit      = 1u << 0,
    RenderPassContinue = 1u << 1,
    SimultaneousUse    = 1u << 2,
};
GFXHAL_FLAGS(CommandBufferUsage)

enum class CommandBufferState : std::uint8_t {
    Initial,
    Recording,
    RenderPass,
    Executable,
    Pending,
    Invalid,
};

[[nodiscard]] const char* toString(CommandBufferState state);

// Render pass and subpass a RenderPassContinue secondary executes inside.
struct CommandBufferInheritance {
    const RenderPass*  renderPass  = nullptr;
    std::uint32_t      subpass     = 0;
    const Framebuffer* framebuffer = nullptr; // optional
};

// Records a portable command stream and enforces the recording state machine:
//
//   Initial --begin--> Recording --beginRenderPass--> RenderPass(0)
//   RenderPass(n) --nextSubpass--> RenderPass(n+1)
//   RenderPass(last) --endRenderPass--> Recording --finish--> Executable
//   Executable --submit--> Pending --complete--> Initial (Invalid when
//   recorded with OneTimeSubmit)
//
// An illegal call returns InvalidUsage without changing the state and
// poisons the buffer: finish() fails until reset(). With fail-fast
// validation the error is thrown immediately instead.
//
// Thread safety: thread-confined, like the pool it came from.
class CommandBuffer {
public:
    CommandBuffer() = default;
    ~CommandBuffer();
    CommandBuffer(CommandBuffer&&) noexcept;
    CommandBuffer& operator=(CommandBuffer&&) noexcept;
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

    [[nodiscard]] bool               valid()    const { return state_ != nullptr; }
    [[nodiscard]] CommandBufferLevel level()    const;
    [[nodiscard]] CommandBufferUsage usage()    const;
    [[nodiscard]] CommandBufferState state()    const;
    [[nodiscard]] bool               poisoned() const;
    [[nodiscard]] std::uint32_t      subpass()  const;
    [[nodiscard]] std::size_t        commandCount() const;

    // Finished command stream; null unless Executable or Pending.
    [[nodiscard]] std::shared_ptr<const CommandStream> stream() const;

    [[nodiscard]] Result<void> begin(CommandBufferUsage usage = CommandBufferUsage::None,
                                     const CommandBufferInheritance* inheritance = nullptr);
    [[nodiscard]] Result<void> finish();
    [[nodiscard]] Result<void> reset();

    // Render passes.
    [[nodiscard]] Result<void> beginRenderPass(const RenderPass& renderPass,
                                               const Framebuffer& framebuffer, Rect2D area,
                                               std::vector<ClearValue> clears,
                                               SubpassContents contents = SubpassContents::Inline);
    [[nodiscard]] Result<void> nextSubpass(SubpassContents contents = SubpassContents::Inline);
    [[nodiscard]] Result<void> endRenderPass();

    // State.
    [[nodiscard]] Result<void> bindPipeline(const Pipeline& pipeline);
    [[nodiscard]] Result<void> bindDescriptorSets(PipelineBindPoint bindPoint,
                                                  const PipelineLayout& layout,
                                                  std::uint32_t firstSet,
                                                  const std::vector<const DescriptorSet*>& sets,
                                                  std::vector<std::uint32_t> dynamicOffsets = {});
    [[nodiscard]] Result<void> pushConstants(const PipelineLayout& layout, ShaderStage stages,
                                             std::uint32_t offset, const void* data,
                                             std::uint32_t size);
    [[nodiscard]] Result<void> bindVertexBuffers(std::uint32_t firstBinding,
                                                 const std::vector<const Buffer*>& buffers,
                                                 std::vector<std::uint64_t> offsets = {});
    [[nodiscard]] Result<void> bindIndexBuffer(const Buffer& buffer, std::uint64_t offset,
                                               IndexType type);
    [[nodiscard]] Result<void> setViewport(const Viewport& viewport);
    [[nodiscard]] Result<void> setScissor(const Rect2D& scissor);

    // Work.
    [[nodiscard]] Result<void> draw(std::uint32_t vertexCount, std::uint32_t instanceCount = 1,
                                    std::uint32_t firstVertex = 0,
                                    std::uint32_t firstInstance = 0);
    [[nodiscard]] Result<void> drawIndexed(std::uint32_t indexCount,
                                           std::uint32_t instanceCount = 1,
                                           std::uint32_t firstIndex = 0,
                                           std::int32_t vertexOffset = 0,
                                           std::uint32_t firstInstance = 0);
    [[nodiscard]] Result<void> drawIndirect(const Buffer& buffer, std::uint64_t offset,
                                            std::uint32_t drawCount, std::uint32_t stride = 16);
    [[nodiscard]] Result<void> dispatch(std::uint32_t x, std::uint32_t y = 1,
                                        std::uint32_t z = 1);
    [[nodiscard]] Result<void> dispatchIndirect(const Buffer& buffer, std::uint64_t offset);

    // Transfers.
    [[nodiscard]] Result<void> copyBuffer(const Buffer& src, const Buffer& dst,
                                          std::vector<BufferCopy> regions);
    [[nodiscard]] Result<void> copyBufferToImage(const Buffer& src, const Image& dst,
                                                 ImageLayout dstLayout,
                                                 std::vector<BufferImageCopy> regions);
    [[nodiscard]] Result<void> copyImageToBuffer(const Image& src, ImageLayout srcLayout,
                                                 const Buffer& dst,
                                                 std::vector<BufferImageCopy> regions);
    [[nodiscard]] Result<void> fillBuffer(const Buffer& buffer, std::uint64_t offset,
                                          std::uint64_t size, std::uint32_t value);
    [[nodiscard]] Result<void> updateBuffer(const Buffer& buffer, std::uint64_t offset,
                                            const void* data, std::uint64_t size);

    // Synchronization. Barriers are recorded outside render passes only; the
    // render pass's own transitions come from its barrier plan.
    [[nodiscard]] Result<void> pipelineBarrier(BarrierSet barriers);
    [[nodiscard]] Result<void> beginSplitBarrier(std::uint32_t id, BarrierSet barriers);
    [[nodiscard]] Result<void> endSplitBarrier(std::uint32_t id);

    [[nodiscard]] Result<void> executeCommands(const std::vector<const CommandBuffer*>& secondaries);

private:
    friend class CommandPool;
    friend class Queue;

    explicit CommandBuffer(std::shared_ptr<detail::RecorderState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::RecorderState> state_;
};

// Thread safety: thread-confined. Pools on different threads may record
// concurrently; their buffers can be submitted together.
class CommandPool {
public:
    CommandPool() = default;
    ~CommandPool();
    CommandPool(CommandPool&&) noexcept = default;
    CommandPool& operator=(CommandPool&&) noexcept = default;
    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

    [[nodiscard]] bool          valid()       const { return core_ != nullptr; }
    [[nodiscard]] std::uint32_t queueFamily() const { return family_; }

    [[nodiscard]] Result<CommandBuffer> allocate(
        CommandBufferLevel level = CommandBufferLevel::Primary);

    // Returns every buffer of the pool, Invalid ones included, to Initial.
    // A pending buffer is InvalidUsage.
    [[nodiscard]] Result<void> reset();

private:
    friend class Device;

    std::shared_ptr<detail::DeviceCore>               core_;
    std::uint32_t                                     family_ = 0;
    std::vector<std::weak_ptr<detail::RecorderState>> buffers_;
};

} // namespace gfxhal

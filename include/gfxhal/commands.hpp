#pragma once

#include <gfxhal/barrier.hpp>
#include <gfxhal/handle.hpp>
#include <gfxhal/pipeline_desc.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/types.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace gfxhal {

enum class SubpassContents : std::uint8_t {
    Inline,
    SecondaryBuffers,
};

struct ClearValue {
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 0.0f};
    float                depth   = 1.0f;
    std::uint32_t        stencil = 0;

    [[nodiscard]] static ClearValue rgba(float r, float g, float b, float a) {
        ClearValue v;
        v.color = {r, g, b, a};
        return v;
    }
    [[nodiscard]] static ClearValue depthStencil(float d, std::uint32_t s = 0) {
        ClearValue v;
        v.depth   = d;
        v.stencil = s;
        return v;
    }
};

struct CommandStream;

// Recorded operations. Resources are captured as native handles at record
// time; the owning wrappers' arena handles are listed once per stream.
namespace op {

struct BindPipeline {
    PipelineBindPoint bindPoint = PipelineBindPoint::Graphics;
    NativeHandle      pipeline  = NullHandle;
    NativeHandle      layout    = NullHandle;
};

struct BindDescriptorSets {
    PipelineBindPoint          bindPoint = PipelineBindPoint::Graphics;
    NativeHandle               layout    = NullHandle;
    std::uint32_t              firstSet  = 0;
    std::vector<NativeHandle>  sets;
    std::vector<std::uint32_t> dynamicOffsets;
};

struct PushConstants {
    NativeHandle              layout = NullHandle;
    ShaderStage               stages = ShaderStage::None;
    std::uint32_t             offset = 0;
    std::vector<std::uint8_t> data;
};

struct BindVertexBuffers {
    std::uint32_t              firstBinding = 0;
    std::vector<ResourceRef>   buffers;
    std::vector<std::uint64_t> offsets;
};

struct BindIndexBuffer {
    ResourceRef   buffer;
    std::uint64_t offset = 0;
    IndexType     type   = IndexType::Uint32;
};

struct SetViewport {
    Viewport viewport;
};

struct SetScissor {
    Rect2D scissor;
};

struct Draw {
    std::uint32_t vertexCount   = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstVertex   = 0;
    std::uint32_t firstInstance = 0;
};

struct DrawIndexed {
    std::uint32_t indexCount    = 0;
    std::uint32_t instanceCount = 1;
    std::uint32_t firstIndex    = 0;
    std::int32_t  vertexOffset  = 0;
    std::uint32_t firstInstance = 0;
};

struct DrawIndirect {
    ResourceRef   buffer;
    std::uint64_t offset    = 0;
    std::uint32_t drawCount = 1;
    std::uint32_t stride    = 16;
};

struct Dispatch {
    std::uint32_t x = 1;
    std::uint32_t y = 1;
    std::uint32_t z = 1;
};

struct DispatchIndirect {
    ResourceRef   buffer;
    std::uint64_t offset = 0;
};

struct CopyBuffer {
    ResourceRef             src;
    ResourceRef             dst;
    std::vector<BufferCopy> regions;
};

struct CopyBufferToImage {
    ResourceRef                  src;
    ResourceRef                  dst;
    ImageLayout                  dstLayout = ImageLayout::TransferDst;
    std::vector<BufferImageCopy> regions;
};

struct CopyImageToBuffer {
    ResourceRef                  src;
    ImageLayout                  srcLayout = ImageLayout::TransferSrc;
    ResourceRef                  dst;
    std::vector<BufferImageCopy> regions;
};

struct FillBuffer {
    ResourceRef   buffer;
    std::uint64_t offset = 0;
    std::uint64_t size   = WholeSize;
    std::uint32_t value  = 0;
};

struct UpdateBuffer {
    ResourceRef               buffer;
    std::uint64_t             offset = 0;
    std::vector<std::uint8_t> data;
};

struct PipelineBarrier {
    BarrierSet barriers;
};

struct SplitBarrierBegin {
    std::uint32_t id = 0;
    BarrierSet    barriers;
};

struct SplitBarrierEnd {
    std::uint32_t id = 0;
    BarrierSet    barriers;
};

struct BeginRenderPass {
    NativeHandle            renderPass  = NullHandle;
    NativeHandle            framebuffer = NullHandle;
    Rect2D                  area;
    std::vector<ClearValue> clears;
    SubpassContents         contents = SubpassContents::Inline;
};

struct NextSubpass {
    SubpassContents contents = SubpassContents::Inline;
};

struct EndRenderPass {};

struct ExecuteCommands {
    std::vector<std::shared_ptr<const CommandStream>> secondaries;
};

} // namespace op

using Command = std::variant<op::BindPipeline, op::BindDescriptorSets, op::PushConstants,
                             op::BindVertexBuffers, op::BindIndexBuffer, op::SetViewport,
                             op::SetScissor, op::Draw, op::DrawIndexed, op::DrawIndirect,
                             op::Dispatch, op::DispatchIndirect, op::CopyBuffer,
                             op::CopyBufferToImage, op::CopyImageToBuffer, op::FillBuffer,
                             op::UpdateBuffer, op::PipelineBarrier, op::SplitBarrierBegin,
                             op::SplitBarrierEnd, op::BeginRenderPass, op::NextSubpass,
                             op::EndRenderPass, op::ExecuteCommands>;

// A descriptor set bound by a stream, with the write version observed when
// the stream was finished. Submission rejects the stream if the set was
// written since.
struct DescriptorSetUse {
    Handle                                           handle;
    std::shared_ptr<const std::atomic<std::uint64_t>> version;
    std::uint64_t                                    finishedVersion = 0;
};

// Immutable once its command buffer is finished.
struct CommandStream {
    std::vector<Command>          commands;
    std::vector<Handle>           resources;      // every arena object referenced
    std::vector<DescriptorSetUse> descriptorSets;
};

} // namespace gfxhal

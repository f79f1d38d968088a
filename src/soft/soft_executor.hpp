#pragma once

#include "soft_device.hpp"

#include <gfxhal/commands.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace gfxhal::soft::detail {

// Replays command streams against host memory. One executor per submission;
// the device serializes executors, so image state has one writer at a time.
class Executor {
public:
    explicit Executor(SoftDevice& device);

    void run(const CommandStream& stream);

private:
    struct BindState {
        std::shared_ptr<SoftPipeline>                          pipeline;
        std::map<InvocationContext::RegisterKey, Descriptor>   registers;
        std::map<std::uint32_t, std::uint32_t>                 tables; // root table -> heap base
        std::vector<std::uint8_t>                              push;
    };

    struct VertexBuffer {
        std::shared_ptr<SoftBuffer> buffer;
        std::uint64_t               offset = 0;
    };

    struct IndexBuffer {
        std::shared_ptr<SoftBuffer> buffer;
        std::uint64_t               offset = 0;
        IndexType                   type   = IndexType::Uint32;
    };

    struct PassState {
        std::shared_ptr<SoftRenderPass>  renderPass;
        std::shared_ptr<SoftFramebuffer> framebuffer;
        Rect2D                           area;
        std::uint32_t                    subpass = 0;
        bool                             checked = false; // subpass layouts verified
    };

    void exec(const op::BindPipeline& c);
    void exec(const op::BindDescriptorSets& c);
    void exec(const op::PushConstants& c);
    void exec(const op::BindVertexBuffers& c);
    void exec(const op::BindIndexBuffer& c);
    void exec(const op::SetViewport& c);
    void exec(const op::SetScissor& c);
    void exec(const op::Draw& c);
    void exec(const op::DrawIndexed& c);
    void exec(const op::DrawIndirect& c);
    void exec(const op::Dispatch& c);
    void exec(const op::DispatchIndirect& c);
    void exec(const op::CopyBuffer& c);
    void exec(const op::CopyBufferToImage& c);
    void exec(const op::CopyImageToBuffer& c);
    void exec(const op::FillBuffer& c);
    void exec(const op::UpdateBuffer& c);
    void exec(const op::PipelineBarrier& c);
    void exec(const op::SplitBarrierBegin& c);
    void exec(const op::SplitBarrierEnd& c);
    void exec(const op::BeginRenderPass& c);
    void exec(const op::NextSubpass& c);
    void exec(const op::EndRenderPass& c);
    void exec(const op::ExecuteCommands& c);

    void apply(const BarrierSet& barriers, const char* what);
    void transition(const ResourceRef& image, ImageLayout from, ImageLayout to, const char* what);
    void expectLayout(const ResourceRef& image, ImageLayout expected, const char* what);

    void clearAttachments(const op::BeginRenderPass& c);
    void checkSubpass();
    void resolveSubpass();
    void enterSubpassImplicit();

    // Vertex invocations for the given indices, then one fragment pass over
    // the covered pixels.
    void drawVertices(const std::vector<std::uint32_t>& vertices, std::uint32_t instanceCount,
                      std::uint32_t firstInstance);
    void shadeFragments();

    [[nodiscard]] bool implicitTransitions() const;
    [[nodiscard]] InvocationContext context(BindState& bind, const SoftStage& stage);

    SoftDevice& device_;

    BindState                           graphics_;
    BindState                           compute_;
    std::map<std::uint32_t, VertexBuffer> vertexBuffers_;
    std::optional<IndexBuffer>          indexBuffer_;
    std::optional<Viewport>             viewport_;
    std::optional<Rect2D>               scissor_;
    std::optional<PassState>            pass_;
    std::map<std::uint32_t, BarrierSet> openSplits_;
    std::set<NativeHandle>              checkedImages_; // shader reads verified this draw
};

} // namespace gfxhal::soft::detail

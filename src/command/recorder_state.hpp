#pragma once

#include <gfxhal/command.hpp>
#include <gfxhal/commands.hpp>
#include <gfxhal/handle.hpp>
#include <gfxhal/pass_planner.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace gfxhal::detail {

class DeviceCore;

// The render pass a buffer records into: begun by this (primary) buffer or
// inherited by a RenderPassContinue secondary.
struct PassContext {
    Handle                                renderPass;
    std::shared_ptr<const RenderPassDesc> desc;
    std::shared_ptr<const RenderPassPlan> plan;
    std::vector<ResourceRef>              attachments; // empty when no framebuffer is known
    std::uint32_t                         subpass  = 0;
    SubpassContents                       contents = SubpassContents::Inline;
};

struct BoundSet {
    Handle                                            handle;
    std::shared_ptr<const std::atomic<std::uint64_t>> version;
};

struct PendingSubmission {
    std::uint32_t queue  = 0;
    std::uint64_t serial = 0;
};

struct RecorderState;

// A secondary recorded into a primary by executeCommands, with the stream it
// held at that point. Submitting the primary makes the secondary Pending too.
struct ExecutedSecondary {
    std::shared_ptr<RecorderState>       state;
    std::shared_ptr<const CommandStream> stream;
};

// Shared between a CommandBuffer and its pool so the pool can reset buffers
// it handed out.
struct RecorderState {
    std::shared_ptr<DeviceCore> core;
    CommandBufferLevel          level  = CommandBufferLevel::Primary;
    std::uint32_t               family = 0;

    CommandBufferUsage usage    = CommandBufferUsage::None;
    CommandBufferState state    = CommandBufferState::Initial;
    bool               poisoned = false;

    std::shared_ptr<CommandStream> stream;
    std::optional<PassContext>     pass;      // begun with beginRenderPass
    std::optional<PassContext>     inherited; // RenderPassContinue secondaries

    bool          graphicsBound = false;
    Handle        pipelineRenderPass;
    std::uint32_t pipelineSubpass = 0;
    bool          computeBound    = false;

    std::map<std::uint32_t, BarrierSet> openSplits;
    std::vector<BoundSet>               boundSets;
    std::vector<PendingSubmission>      pending;
    std::vector<ExecutedSecondary>      executed;

    // Moves a Pending buffer on once every submission of it has completed.
    void refresh();

    void markPending(PendingSubmission submission);

    // Back to Initial, dropping everything recorded.
    void clear();

    void use(Handle handle);
};

} // namespace gfxhal::detail

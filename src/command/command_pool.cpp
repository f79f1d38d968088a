#include <gfxhal/command.hpp>

#include "../core/device_core.hpp"
#include "recorder_state.hpp"

#include <algorithm>

namespace gfxhal {

CommandPool::~CommandPool() = default;

Result<CommandBuffer> CommandPool::allocate(CommandBufferLevel level) {
    if (!core_) {
        return Error{"allocate command buffer", ErrorCode::InvalidUsage, 0,
                     "command pool is empty"};
    }
    if (auto lost = core_->checkLost("allocate command buffer"); !lost.ok())
        return std::move(lost.error());

    buffers_.erase(std::remove_if(buffers_.begin(), buffers_.end(),
                                  [](const auto& weak) { return weak.expired(); }),
                   buffers_.end());

    auto state    = std::make_shared<detail::RecorderState>();
    state->core   = core_;
    state->level  = level;
    state->family = family_;
    buffers_.push_back(state);
    return CommandBuffer(std::move(state));
}

Result<void> CommandPool::reset() {
    if (!core_) {
        return Error{"reset command pool", ErrorCode::InvalidUsage, 0, "command pool is empty"};
    }

    std::vector<std::shared_ptr<detail::RecorderState>> live;
    for (const auto& weak : buffers_) {
        if (auto state = weak.lock()) live.push_back(std::move(state));
    }
    for (const auto& state : live) {
        state->refresh();
        if (state->state == CommandBufferState::Pending) {
            return core_->report(Error{"reset command pool", ErrorCode::InvalidUsage, 0,
                                       "a command buffer of this pool is still pending"});
        }
    }
    for (const auto& state : live) state->clear();

    buffers_.clear();
    for (const auto& state : live) buffers_.push_back(state);
    return {};
}

} // namespace gfxhal

#include <gfxhal/sync.hpp>

#include "../core/device_core.hpp"

#include <mutex>
#include <string>

namespace gfxhal {

Result<bool> Fence::signaled() const {
    if (!core_) return Error{"fence status", ErrorCode::InvalidUsage, 0, "fence is empty"};
    if (auto lost = core_->checkLost("fence status"); !lost.ok()) return std::move(lost.error());
    return core_->observed(core_->native().fenceStatus(native_));
}

Result<void> Fence::reset() {
    if (!core_) return Error{"reset fence", ErrorCode::InvalidUsage, 0, "fence is empty"};
    if (auto lost = core_->checkLost("reset fence"); !lost.ok()) return lost;

    std::lock_guard lock(core_->submitMutex());
    if (state_->armed && core_->completedSerial(state_->queue) < state_->serial) {
        return core_->report(Error{"reset fence", ErrorCode::InvalidUsage, 0,
                                   "submission " + std::to_string(state_->serial) + " on queue " +
                                       std::to_string(state_->queue) +
                                       " has not finished; wait for the fence first"});
    }
    auto r = core_->native().resetFence(native_);
    if (!r.ok()) {
        core_->observe(r.error());
        return r;
    }
    state_->armed = false;
    return {};
}

Result<void> Fence::wait(std::uint64_t timeoutNs) const {
    if (!core_) return Error{"wait for fence", ErrorCode::InvalidUsage, 0, "fence is empty"};
    if (auto lost = core_->checkLost("wait for fence"); !lost.ok()) return lost;

    auto done = core_->observed(core_->native().waitForFences({native_}, true, timeoutNs));
    if (!done.ok()) return std::move(done.error());
    if (!done.value()) {
        return Error{"wait for fence", ErrorCode::Timeout, 0,
                     "fence still unsignaled after " + std::to_string(timeoutNs) + " ns"};
    }
    return {};
}

bool Semaphore::signalPending() const {
    if (!core_) return false;
    std::lock_guard lock(core_->submitMutex());
    return state_->signalPending;
}

} // namespace gfxhal

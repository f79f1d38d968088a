#include <gfxhal/command.hpp>
#include <gfxhal/queue.hpp>
#include <gfxhal/sync.hpp>

#include "../command/recorder_state.hpp"
#include "../core/device_core.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

namespace gfxhal {

namespace {

constexpr const char* kSubmit = "queue submit";

bool contains(const std::vector<const Semaphore*>& list, const Semaphore* s) {
    return std::find(list.begin(), list.end(), s) != list.end();
}

} // namespace

Result<void> Queue::submit(const SubmitInfo& info) {
    if (!core_) return Error{kSubmit, ErrorCode::InvalidUsage, 0, "queue is empty"};
    if (auto lost = core_->checkLost(kSubmit); !lost.ok()) return lost;

    const bool stageWaits = core_->adapter().features.stageGranularWaits;
    {
        std::lock_guard lock(core_->submitMutex());

        NativeSubmission submission;
        std::vector<const detail::RecorderState*> claimed;

        for (std::size_t i = 0; i < info.commandBuffers.size(); ++i) {
            const CommandBuffer* cb = info.commandBuffers[i];
            const std::string which = "command buffer " + std::to_string(i);
            if (!cb || !cb->state_) {
                return core_->report(
                    Error{kSubmit, ErrorCode::InvalidUsage, 0, which + " is null or empty"});
            }
            detail::RecorderState& s = *cb->state_;
            s.refresh();

            if (s.core != core_) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           which + " was allocated on another device"});
            }
            if (s.level != CommandBufferLevel::Primary) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           which + " is a secondary buffer"});
            }
            if (s.family != family_) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           which + " was allocated for queue family " +
                                               std::to_string(s.family) + ", not " +
                                               std::to_string(family_)});
            }
            const bool resubmit = s.state == CommandBufferState::Pending &&
                                  any(s.usage & CommandBufferUsage::SimultaneousUse);
            if ((s.state != CommandBufferState::Executable && !resubmit) || s.poisoned) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           which + " is " + toString(s.state) +
                                               (s.poisoned ? " and poisoned" : "") +
                                               "; only finished buffers can be submitted"});
            }
            for (std::size_t j = 0; j < i; ++j) {
                if (info.commandBuffers[j] == cb &&
                    !any(s.usage & CommandBufferUsage::SimultaneousUse)) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " is listed twice"});
                }
            }
            for (Handle h : s.stream->resources) {
                if (!core_->live(h)) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " references an object destroyed after "
                                                       "it was recorded"});
                }
            }
            for (const auto& use : s.stream->descriptorSets) {
                if (!core_->live(use.handle)) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " binds a descriptor set that was freed"});
                }
                if (use.version->load(std::memory_order_acquire) != use.finishedVersion) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " binds a descriptor set written after "
                                                       "the buffer was finished"});
                }
            }
            for (const auto& executed : s.executed) {
                detail::RecorderState& sec = *executed.state;
                sec.refresh();
                const bool simultaneous = any(sec.usage & CommandBufferUsage::SimultaneousUse);
                const bool usable =
                    sec.stream == executed.stream &&
                    (sec.state == CommandBufferState::Executable ||
                     (sec.state == CommandBufferState::Pending && simultaneous));
                if (!usable) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " executes a secondary buffer that was "
                                                       "reset, re-recorded or is still pending"});
                }
                const bool twice =
                    std::find(claimed.begin(), claimed.end(), &sec) != claimed.end();
                if (twice && !simultaneous) {
                    return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                               which + " executes a secondary buffer another "
                                                       "buffer of this submission also executes"});
                }
                claimed.push_back(&sec);
            }
            submission.commandBuffers.push_back(s.stream);
        }

        std::vector<const Semaphore*> waited;
        for (const auto& wait : info.waits) {
            const Semaphore* sem = wait.semaphore;
            if (!sem || !sem->valid() || !core_->live(sem->handle())) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "wait semaphore is null or destroyed"});
            }
            if (!sem->state_->signalPending || contains(waited, sem)) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "waiting on a semaphore with no pending signal"});
            }
            waited.push_back(sem);
            submission.waits.push_back(
                NativeWait{sem->native(), stageWaits ? wait.stages : PipelineStage::TopOfPipe});
        }

        std::vector<const Semaphore*> signaled;
        for (const Semaphore* sem : info.signals) {
            if (!sem || !sem->valid() || !core_->live(sem->handle())) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "signal semaphore is null or destroyed"});
            }
            const bool stillPending = sem->state_->signalPending && !contains(waited, sem);
            if (stillPending || contains(signaled, sem)) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "signaling a semaphore that is already signaled"});
            }
            signaled.push_back(sem);
            submission.signals.push_back(sem->native());
        }

        if (Fence* fence = info.fence) {
            if (!fence->valid() || !core_->live(fence->handle())) {
                return core_->report(
                    Error{kSubmit, ErrorCode::InvalidUsage, 0, "fence is empty or destroyed"});
            }
            if (fence->state_->armed) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "fence was already submitted; reset it first"});
            }
            auto status = core_->observed(core_->native().fenceStatus(fence->native()));
            if (!status.ok()) return std::move(status.error());
            if (status.value()) {
                return core_->report(Error{kSubmit, ErrorCode::InvalidUsage, 0,
                                           "fence is signaled; reset it before reuse"});
            }
            submission.fence = fence->native();
        }

        const std::uint64_t serial = core_->submittedSerial(index_) + 1;
        submission.serial = serial;

        auto r = core_->observed(core_->native().submit(index_, std::move(submission)));
        if (!r.ok()) return r;
        core_->setSubmittedSerial(index_, serial);

        for (const Semaphore* sem : waited) sem->state_->signalPending = false;
        for (const Semaphore* sem : signaled) sem->state_->signalPending = true;
        if (info.fence) {
            info.fence->state_->armed  = true;
            info.fence->state_->queue  = index_;
            info.fence->state_->serial = serial;
        }
        const detail::PendingSubmission pending{index_, serial};
        for (CommandBuffer* cb : info.commandBuffers) {
            cb->state_->markPending(pending);
            for (const auto& executed : cb->state_->executed) executed.state->markPending(pending);
        }
    }

    core_->collect();
    return {};
}

Result<void> Queue::present(const PresentTarget& target,
                            const std::vector<const Semaphore*>& waits) {
    constexpr const char* op = "queue present";
    if (!core_) return Error{op, ErrorCode::InvalidUsage, 0, "queue is empty"};
    if (auto lost = core_->checkLost(op); !lost.ok()) return lost;

    std::lock_guard lock(core_->submitMutex());

    std::vector<NativeHandle> natives;
    for (std::size_t i = 0; i < waits.size(); ++i) {
        const Semaphore* sem = waits[i];
        if (!sem || !sem->valid() || !core_->live(sem->handle())) {
            return core_->report(Error{op, ErrorCode::InvalidUsage, 0,
                                       "wait semaphore is null or destroyed"});
        }
        bool repeated = false;
        for (std::size_t j = 0; j < i; ++j) repeated = repeated || waits[j] == sem;
        if (!sem->state_->signalPending || repeated) {
            return core_->report(Error{op, ErrorCode::InvalidUsage, 0,
                                       "waiting on a semaphore with no pending signal"});
        }
        natives.push_back(sem->native());
    }

    auto r = core_->observed(core_->native().present(index_, target, natives));
    // The presentation engine consumes the waits even when the surface is stale.
    if (r.ok() || categoryOf(r.error().code) == ErrorCategory::Present) {
        for (const Semaphore* sem : waits) sem->state_->signalPending = false;
    }
    return r;
}

Result<void> Queue::waitIdle() {
    constexpr const char* op = "queue wait idle";
    if (!core_) return Error{op, ErrorCode::InvalidUsage, 0, "queue is empty"};
    if (auto lost = core_->checkLost(op); !lost.ok()) return lost;

    auto r = core_->observed(core_->native().waitQueueIdle(index_));
    if (!r.ok()) return r;
    core_->collect();
    return {};
}

std::uint64_t Queue::submittedSerial() const {
    return core_ ? core_->submittedSerial(index_) : 0;
}

std::uint64_t Queue::completedSerial() const {
    return core_ ? core_->completedSerial(index_) : 0;
}

} // namespace gfxhal

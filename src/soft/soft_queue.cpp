#include "soft_device.hpp"
#include "soft_executor.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace gfxhal::soft::detail {

bool SoftDevice::signaled(const std::vector<NativeWait>& waits) const {
    for (const auto& w : waits) {
        auto it = semaphores_.find(w.semaphore);
        if (it == semaphores_.end() || !it->second) return false;
    }
    return true;
}

// One thread per queue. A job waits for its semaphores, replays its streams
// under the execution lock, then signals.
void SoftDevice::workerLoop(std::uint32_t queue) {
    QueueWorker& worker = *queues_[queue];
    while (true) {
        Job job;
        {
            std::unique_lock lock(syncMutex_);
            cv_.wait(lock, [&] {
                return stopping_ ||
                       (!lost_.load(std::memory_order_acquire) && !worker.held &&
                        !worker.jobs.empty() && signaled(worker.jobs.front().submission.waits));
            });
            if (stopping_) return;

            job = std::move(worker.jobs.front());
            worker.jobs.pop_front();
            worker.busy = true;
            for (const auto& w : job.submission.waits) semaphores_[w.semaphore] = false;
        }

        if (!job.present) execute(job);

        {
            std::lock_guard lock(syncMutex_);
            for (NativeHandle s : job.submission.signals) semaphores_[s] = true;
            if (job.submission.fence != NullHandle) fences_[job.submission.fence] = true;
            if (job.submission.serial != 0) {
                worker.completed.store(job.submission.serial, std::memory_order_release);
            }
            worker.busy = false;
        }
        cv_.notify_all();
    }
}

void SoftDevice::execute(const Job& job) {
    std::lock_guard lock(execMutex_);
    Executor executor(*this);
    for (const auto& stream : job.submission.commandBuffers) executor.run(*stream);
}

Result<void> SoftDevice::submit(std::uint32_t queue, NativeSubmission submission) {
    if (auto r = alive("queue submit"); !r.ok()) return r;
    if (queue >= queues_.size()) {
        return Error{"queue submit", ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }
    {
        std::lock_guard lock(syncMutex_);
        queues_[queue]->jobs.push_back(Job{std::move(submission), false});
    }
    cv_.notify_all();
    return {};
}

std::uint64_t SoftDevice::completedSerial(std::uint32_t queue) {
    if (queue >= queues_.size()) return 0;
    return queues_[queue]->completed.load(std::memory_order_acquire);
}

Result<void> SoftDevice::waitQueueIdle(std::uint32_t queue) {
    if (queue >= queues_.size()) {
        return Error{"queue wait idle", ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }
    QueueWorker& worker = *queues_[queue];
    std::unique_lock lock(syncMutex_);
    cv_.wait(lock, [&] {
        return lost_.load(std::memory_order_acquire) || (worker.jobs.empty() && !worker.busy);
    });
    if (lost_.load(std::memory_order_acquire)) {
        return Error{"queue wait idle", ErrorCode::DeviceLost, 0, "the soft device was lost"};
    }
    return {};
}

Result<void> SoftDevice::present(std::uint32_t queue, const PresentTarget& target,
                                 const std::vector<NativeHandle>& waits) {
    if (auto r = alive("queue present"); !r.ok()) return r;
    if (queue >= queues_.size()) {
        return Error{"queue present", ErrorCode::InvalidUsage, 0,
                     "queue " + std::to_string(queue) + " does not exist"};
    }

    SurfaceState state = SurfaceState::Ok;
    {
        std::lock_guard lock(syncMutex_);
        auto it = surfaces_.find(target.surface);
        if (it == surfaces_.end()) {
            return Error{"queue present", ErrorCode::InvalidUsage, 0, "unknown surface"};
        }
        if (target.imageIndex >= it->second.imageCount) {
            return Error{"queue present", ErrorCode::InvalidUsage, 0,
                         "image index " + std::to_string(target.imageIndex) +
                             " is out of range for a " + std::to_string(it->second.imageCount) +
                             "-image surface"};
        }
        state = it->second.state;

        // The presentation engine consumes the waits whatever the outcome.
        Job job;
        job.present = true;
        for (NativeHandle s : waits) job.submission.waits.push_back(NativeWait{s});
        queues_[queue]->jobs.push_back(std::move(job));

        if (state == SurfaceState::Ok) ++it->second.presents;
    }
    cv_.notify_all();

    switch (state) {
    case SurfaceState::Ok:
        return {};
    case SurfaceState::OutOfDate:
        return Error{"queue present", ErrorCode::OutOfDate, 0,
                     "surface is out of date; recreate the swapchain"};
    case SurfaceState::Lost:
        return Error{"queue present", ErrorCode::SurfaceLost, 0, "surface was lost"};
    }
    return {};
}

void SoftDevice::holdQueue(std::uint32_t queue, bool held) {
    if (queue >= queues_.size()) return;
    {
        std::lock_guard lock(syncMutex_);
        queues_[queue]->held = held;
    }
    cv_.notify_all();
}

} // namespace gfxhal::soft::detail

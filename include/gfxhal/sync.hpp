#pragma once

#include <gfxhal/device_object.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/result.hpp>

#include <cstdint>
#include <limits>
#include <memory>

namespace gfxhal {

inline constexpr std::uint64_t WaitForever = std::numeric_limits<std::uint64_t>::max();

namespace detail {

// Host-side bookkeeping used to reject illegal submissions before they
// reach the native queue. Guarded by the device's submit mutex.
struct FenceState {
    bool          armed  = false; // handed to a submission since the last reset
    std::uint32_t queue  = 0;     // where it was armed
    std::uint64_t serial = 0;
};

struct SemaphoreState {
    bool signalPending = false; // a submitted signal no wait has consumed yet
};

} // namespace detail

// Host-visible completion signal for one submission. Reset before reuse;
// resetting while that submission is still executing is InvalidUsage.
//
// Thread safety: thread-confined.
class Fence : public DeviceObject {
public:
    Fence() = default;

    [[nodiscard]] Result<bool> signaled() const;
    [[nodiscard]] Result<void> reset();

    // Timeout when the fence stays unsignaled for timeoutNs, DeviceLost when
    // the device is gone.
    [[nodiscard]] Result<void> wait(std::uint64_t timeoutNs = WaitForever) const;

private:
    friend class Device;
    friend class Queue;

    std::shared_ptr<detail::FenceState> state_;
};

// Binary, device-only signal between submissions.
//
// Thread safety: thread-confined.
class Semaphore : public DeviceObject {
public:
    Semaphore() = default;

    [[nodiscard]] bool signalPending() const;

private:
    friend class Device;
    friend class Queue;

    std::shared_ptr<detail::SemaphoreState> state_;
};

} // namespace gfxhal

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace gfxhal {

// Every failure the HAL can report. Grouped by the category returned from
// categoryOf(); the category decides whether the caller can recover.
enum class ErrorCode : std::uint8_t {
    // CreationError
    OutOfMemory,
    UnsupportedFormat,
    UnsupportedUsage,
    // AllocationError
    OutOfDeviceMemory,
    OutOfHostMemory,
    TooManyObjects,
    // BindError
    WrongMemoryType,
    OutOfBounds,
    // InvalidUsage: illegal recording state, register collision, stale handle
    InvalidUsage,
    // WaitError
    Timeout,
    DeviceLost,
    // PresentError
    OutOfDate,
    SurfaceLost,
    // Native call failed with a result code that maps to nothing above.
    Native,
};

enum class ErrorCategory : std::uint8_t {
    Creation,
    Allocation,
    Bind,
    InvalidUsage,
    Wait,
    Present,
    Native,
};

[[nodiscard]] ErrorCategory categoryOf(ErrorCode code);
[[nodiscard]] const char* toString(ErrorCode code);

// Timeout, out-of-memory and bind failures can be retried with different
// parameters. InvalidUsage is a programming error, DeviceLost is fatal for
// the whole device.
[[nodiscard]] bool isRecoverable(ErrorCode code);

// Thin error type that carries what we tried, what the HAL classified it as,
// the raw native result (0 when the error did not come from a driver), and a
// human message.
struct Error {
    std::string operation;          // e.g. "create pipeline layout"
    ErrorCode code = ErrorCode::InvalidUsage;
    std::int32_t nativeResult = 0;  // VkResult / HRESULT, 0 when not native
    std::string message;            // human-readable explanation + suggestion

    [[nodiscard]] ErrorCategory category() const { return categoryOf(code); }

    // Format as a single readable string.
    [[nodiscard]] std::string format() const;
};

// Error unwrap hook used by Result<T>::orThrow() and fail-fast validation.
// When GFXHAL_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When GFXHAL_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace gfxhal

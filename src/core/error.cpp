#include <gfxhal/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace gfxhal {

#ifndef GFXHAL_ENABLE_EXCEPTIONS
#define GFXHAL_ENABLE_EXCEPTIONS 1
#endif

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
    case ErrorCode::OutOfMemory:
    case ErrorCode::UnsupportedFormat:
    case ErrorCode::UnsupportedUsage:
        return ErrorCategory::Creation;
    case ErrorCode::OutOfDeviceMemory:
    case ErrorCode::OutOfHostMemory:
    case ErrorCode::TooManyObjects:
        return ErrorCategory::Allocation;
    case ErrorCode::WrongMemoryType:
    case ErrorCode::OutOfBounds:
        return ErrorCategory::Bind;
    case ErrorCode::InvalidUsage:
        return ErrorCategory::InvalidUsage;
    case ErrorCode::Timeout:
    case ErrorCode::DeviceLost:
        return ErrorCategory::Wait;
    case ErrorCode::OutOfDate:
    case ErrorCode::SurfaceLost:
        return ErrorCategory::Present;
    case ErrorCode::Native:
        return ErrorCategory::Native;
    }
    return ErrorCategory::Native;
}

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::OutOfMemory:       return "out of memory";
    case ErrorCode::UnsupportedFormat: return "unsupported format";
    case ErrorCode::UnsupportedUsage:  return "unsupported usage";
    case ErrorCode::OutOfDeviceMemory: return "out of device memory";
    case ErrorCode::OutOfHostMemory:   return "out of host memory";
    case ErrorCode::TooManyObjects:    return "too many objects";
    case ErrorCode::WrongMemoryType:   return "wrong memory type";
    case ErrorCode::OutOfBounds:       return "out of bounds";
    case ErrorCode::InvalidUsage:      return "invalid usage";
    case ErrorCode::Timeout:           return "timeout";
    case ErrorCode::DeviceLost:        return "device lost";
    case ErrorCode::OutOfDate:         return "out of date";
    case ErrorCode::SurfaceLost:       return "surface lost";
    case ErrorCode::Native:            return "native error";
    }
    return "unknown error";
}

bool isRecoverable(ErrorCode code) {
    switch (categoryOf(code)) {
    case ErrorCategory::Creation:
    case ErrorCategory::Allocation:
    case ErrorCategory::Bind:
        return true;
    case ErrorCategory::Wait:
        return code == ErrorCode::Timeout;
    case ErrorCategory::Present:
        return code == ErrorCode::OutOfDate;
    case ErrorCategory::InvalidUsage:
    case ErrorCategory::Native:
        return false;
    }
    return false;
}

std::string Error::format() const {
    std::string out = "gfxhal: " + operation + " failed [" + toString(code) + "]";

    if (nativeResult != 0) {
        out += " (native result " + std::to_string(nativeResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if GFXHAL_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace gfxhal

#include <gfxhal/error.hpp>

#include <cassert>
#include <cstdio>
#include <string>

int main() {
    using gfxhal::ErrorCategory;
    using gfxhal::ErrorCode;

    // Native error with message
    {
        gfxhal::Error e{"create device", ErrorCode::Native, -3, "adapter only supports 1.2"};
        std::string s = e.format();
        assert(s.find("create device") != std::string::npos);
        assert(s.find("native result -3") != std::string::npos);
        assert(s.find("adapter only supports 1.2") != std::string::npos);
    }

    // HAL error (nativeResult == 0)
    {
        gfxhal::Error e{"bind memory", ErrorCode::WrongMemoryType, 0, "not host visible"};
        std::string s = e.format();
        assert(s.find("bind memory") != std::string::npos);
        assert(s.find("wrong memory type") != std::string::npos);
        assert(s.find("native result") == std::string::npos);
        assert(s.find("not host visible") != std::string::npos);
    }

    // No message
    {
        gfxhal::Error e{"create instance", ErrorCode::Native, -1, ""};
        std::string s = e.format();
        assert(s.find("create instance") != std::string::npos);
        assert(s.find("native result -1") != std::string::npos);
    }

    // Categories
    {
        assert(gfxhal::categoryOf(ErrorCode::UnsupportedFormat) == ErrorCategory::Creation);
        assert(gfxhal::categoryOf(ErrorCode::OutOfMemory) == ErrorCategory::Creation);
        assert(gfxhal::categoryOf(ErrorCode::TooManyObjects) == ErrorCategory::Allocation);
        assert(gfxhal::categoryOf(ErrorCode::OutOfDeviceMemory) == ErrorCategory::Allocation);
        assert(gfxhal::categoryOf(ErrorCode::OutOfBounds) == ErrorCategory::Bind);
        assert(gfxhal::categoryOf(ErrorCode::InvalidUsage) == ErrorCategory::InvalidUsage);
        assert(gfxhal::categoryOf(ErrorCode::Timeout) == ErrorCategory::Wait);
        assert(gfxhal::categoryOf(ErrorCode::DeviceLost) == ErrorCategory::Wait);
        assert(gfxhal::categoryOf(ErrorCode::OutOfDate) == ErrorCategory::Present);
        assert(gfxhal::categoryOf(ErrorCode::Native) == ErrorCategory::Native);

        gfxhal::Error e{"present", ErrorCode::SurfaceLost, 0, ""};
        assert(e.category() == ErrorCategory::Present);
    }

    // Recoverability
    {
        assert(gfxhal::isRecoverable(ErrorCode::Timeout));
        assert(gfxhal::isRecoverable(ErrorCode::OutOfDeviceMemory));
        assert(gfxhal::isRecoverable(ErrorCode::WrongMemoryType));
        assert(gfxhal::isRecoverable(ErrorCode::OutOfDate));
        assert(!gfxhal::isRecoverable(ErrorCode::DeviceLost));
        assert(!gfxhal::isRecoverable(ErrorCode::SurfaceLost));
        assert(!gfxhal::isRecoverable(ErrorCode::InvalidUsage));
    }

    std::printf("error tests passed\n");
    return 0;
}

#include <gfxhal/result.hpp>

#include <cassert>
#ifndef GFXHAL_ENABLE_EXCEPTIONS
#define GFXHAL_ENABLE_EXCEPTIONS 1
#endif
#if GFXHAL_ENABLE_EXCEPTIONS
#include <stdexcept>
#endif
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using gfxhal::Error;
using gfxhal::ErrorCategory;
using gfxhal::ErrorCode;
using gfxhal::Result;

namespace {

Result<std::uint32_t> findSlot(std::uint32_t used, std::uint32_t limit) {
    if (used >= limit) {
        return Error{"assign register", ErrorCode::TooManyObjects, 0,
                     std::to_string(limit) + " slots already taken"};
    }
    return used;
}

Result<std::vector<std::uint32_t>> assignRun(std::uint32_t base, std::uint32_t count,
                                             std::uint32_t limit) {
    std::vector<std::uint32_t> run;
    for (std::uint32_t i = 0; i < count; ++i) {
        auto slot = findSlot(base + i, limit);
        if (!slot.ok()) return std::move(slot.error());
        run.push_back(slot.value());
    }
    return run;
}

Result<void> bindAt(std::uint64_t offset, std::uint64_t alignment) {
    if (offset % alignment != 0) {
        return Error{"bind buffer memory", ErrorCode::OutOfBounds, 0, "offset is misaligned"};
    }
    return {};
}

} // namespace

int main() {
    // Value
    {
        Result<std::uint32_t> r = findSlot(3, 8);
        assert(r.ok());
        assert(r);
        assert(r.value() == 3);
        assert(!r.failedWith(ErrorCode::TooManyObjects));
    }

    // Error carries operation, code and native result
    {
        Result<int> r = Error{"submit", ErrorCode::DeviceLost, -4, "device removed"};
        assert(!r.ok());
        assert(!r);
        assert(r.failedWith(ErrorCode::DeviceLost));
        assert(!r.failedWith(ErrorCode::Timeout));
        assert(r.error().operation == "submit");
        assert(r.error().nativeResult == -4);
        assert(r.error().category() == ErrorCategory::Wait);
    }

    // Errors propagate unchanged through a differently typed Result
    {
        auto fits = assignRun(4, 4, 8);
        assert(fits.ok() && fits.value().size() == 4);
        assert(fits.value().front() == 4 && fits.value().back() == 7);

        auto overflow = assignRun(6, 4, 8);
        assert(overflow.failedWith(ErrorCode::TooManyObjects));
        assert(overflow.error().operation == "assign register");
        assert(overflow.error().category() == ErrorCategory::Allocation);
    }

    // Move-only values
    {
        Result<std::unique_ptr<int>> r = std::make_unique<int>(5);
        assert(r.ok());
        std::unique_ptr<int> owned = std::move(r).value();
        assert(owned && *owned == 5);
    }

    // Result<void>
    {
        Result<void> ok = bindAt(512, 256);
        assert(ok.ok());
        assert(!ok.failedWith(ErrorCode::OutOfBounds));

        Result<void> bad = bindAt(100, 256);
        assert(!bad);
        assert(bad.failedWith(ErrorCode::OutOfBounds));
        assert(bad.error().category() == ErrorCategory::Bind);

        Error taken = bad.error();
        assert(taken.message == "offset is misaligned");
    }

    // orThrow unwraps success
    {
        std::uint32_t slot = findSlot(0, 1).orThrow();
        assert(slot == 0);
        bindAt(0, 16).orThrow();
    }

#if GFXHAL_ENABLE_EXCEPTIONS
    // orThrow raises the formatted error
    {
        bool caught = false;
        try {
            (void)findSlot(16, 16).orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            std::string msg = e.what();
            assert(msg.find("assign register") != std::string::npos);
            assert(msg.find("16 slots already taken") != std::string::npos);
        }
        assert(caught);

        caught = false;
        try {
            bindAt(3, 4).orThrow();
        } catch (const std::runtime_error& e) {
            caught = true;
            assert(std::string(e.what()).find("misaligned") != std::string::npos);
        }
        assert(caught);
    }
#endif

    return 0;
}

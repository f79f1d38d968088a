#pragma once

#include <gfxhal/types.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace gfxhal {

// Deferred destruction keyed on queue serials. An object retired while queue
// q has submitted serial S is freed once q's completed serial reaches S, for
// every queue.
//
// Thread safety: internally synchronized. Owners may be dropped on any thread.
class GarbageCollector {
public:
    using Deleter = std::function<void(ObjectKind, NativeHandle)>;

    explicit GarbageCollector(Deleter deleter) : deleter_(std::move(deleter)) {}

    // submittedSerials[q] is the last serial handed to queue q.
    void retire(ObjectKind kind, NativeHandle handle, std::vector<std::uint64_t> submittedSerials);

    // Frees everything whose snapshot is covered. Returns the number freed.
    std::size_t collect(const std::vector<std::uint64_t>& completedSerials);

    // Frees everything unconditionally. Only valid after the device drained.
    std::size_t drain();

    [[nodiscard]] std::size_t pending() const;

private:
    struct Retired {
        ObjectKind                 kind;
        NativeHandle               handle;
        std::vector<std::uint64_t> serials;
    };

    Deleter              deleter_;
    mutable std::mutex   mutex_;
    std::vector<Retired> retired_;
};

} // namespace gfxhal

#include <gfxhal/garbage.hpp>

#include <utility>

namespace gfxhal {

void GarbageCollector::retire(ObjectKind kind, NativeHandle handle,
                              std::vector<std::uint64_t> submittedSerials) {
    if (handle == NullHandle) return;
    std::lock_guard lock(mutex_);
    retired_.push_back(Retired{kind, handle, std::move(submittedSerials)});
}

std::size_t GarbageCollector::collect(const std::vector<std::uint64_t>& completedSerials) {
    std::vector<Retired> ready;
    {
        std::lock_guard lock(mutex_);
        auto covered = [&](const Retired& r) {
            for (std::size_t q = 0; q < r.serials.size(); ++q) {
                const std::uint64_t done = q < completedSerials.size() ? completedSerials[q] : 0;
                if (done < r.serials[q]) return false;
            }
            return true;
        };

        std::vector<Retired> keep;
        for (auto& r : retired_) {
            if (covered(r)) {
                ready.push_back(std::move(r));
            } else {
                keep.push_back(std::move(r));
            }
        }
        retired_ = std::move(keep);
    }

    // Deleters call into the native device; never under our lock.
    for (const auto& r : ready) deleter_(r.kind, r.handle);
    return ready.size();
}

std::size_t GarbageCollector::drain() {
    std::vector<Retired> all;
    {
        std::lock_guard lock(mutex_);
        all.swap(retired_);
    }
    for (const auto& r : all) deleter_(r.kind, r.handle);
    return all.size();
}

std::size_t GarbageCollector::pending() const {
    std::lock_guard lock(mutex_);
    return retired_.size();
}

} // namespace gfxhal

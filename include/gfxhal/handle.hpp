#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace gfxhal {

// Index + generation into an Arena. Generation 0 is never issued, so a
// default-constructed Handle is always stale.
struct Handle {
    std::uint32_t index      = 0;
    std::uint32_t generation = 0;

    [[nodiscard]] bool valid() const { return generation != 0; }
    [[nodiscard]] bool operator==(const Handle&) const = default;
};

// Slot arena with generation counting. Removing an entry bumps the slot's
// generation so every outstanding Handle to it reads as stale.
//
// Thread safety: thread-confined. The device wraps its arena in a mutex.
template <typename T>
class Arena {
public:
    [[nodiscard]] Handle insert(T value) {
        std::uint32_t index = 0;
        if (!freeList_.empty()) {
            index = freeList_.back();
            freeList_.pop_back();
        } else {
            index = static_cast<std::uint32_t>(slots_.size());
            slots_.push_back(Slot{});
        }
        Slot& slot = slots_[index];
        slot.value = std::move(value);
        ++slot.generation;
        if (slot.generation == 0) ++slot.generation; // wrapped
        slot.live = true;
        ++live_;
        return Handle{index, slot.generation};
    }

    [[nodiscard]] T* get(Handle h) {
        if (!contains(h)) return nullptr;
        return &*slots_[h.index].value;
    }

    [[nodiscard]] const T* get(Handle h) const {
        if (!contains(h)) return nullptr;
        return &*slots_[h.index].value;
    }

    [[nodiscard]] bool contains(Handle h) const {
        return h.valid() && h.index < slots_.size() && slots_[h.index].live &&
               slots_[h.index].generation == h.generation;
    }

    // Returns the removed value, or nullopt for a stale handle.
    std::optional<T> remove(Handle h) {
        if (!contains(h)) return std::nullopt;
        Slot& slot = slots_[h.index];
        std::optional<T> out = std::move(slot.value);
        slot.value.reset();
        slot.live = false;
        freeList_.push_back(h.index);
        --live_;
        return out;
    }

    [[nodiscard]] std::size_t size() const { return live_; }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (std::uint32_t i = 0; i < slots_.size(); ++i) {
            if (slots_[i].live) fn(Handle{i, slots_[i].generation}, *slots_[i].value);
        }
    }

private:
    struct Slot {
        std::optional<T> value;
        std::uint32_t    generation = 0;
        bool             live       = false;
    };

    std::vector<Slot>          slots_;
    std::vector<std::uint32_t> freeList_;
    std::size_t                live_ = 0;
};

} // namespace gfxhal

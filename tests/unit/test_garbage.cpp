#include <gfxhal/garbage.hpp>

#include <cassert>
#include <cstdio>
#include <vector>

using gfxhal::ObjectKind;

int main() {
    std::vector<gfxhal::NativeHandle> freed;
    auto deleter = [&](ObjectKind, gfxhal::NativeHandle h) { freed.push_back(h); };

    // Freed once the single queue reaches the snapshot
    {
        freed.clear();
        gfxhal::GarbageCollector gc(deleter);
        gc.retire(ObjectKind::Buffer, 11, {5});
        assert(gc.pending() == 1);

        assert(gc.collect({4}) == 0);
        assert(freed.empty());
        assert(gc.collect({5}) == 1);
        assert(freed.size() == 1 && freed[0] == 11);
        assert(gc.pending() == 0);
        std::printf("  single queue: ok\n");
    }

    // Every queue must have caught up
    {
        freed.clear();
        gfxhal::GarbageCollector gc(deleter);
        gc.retire(ObjectKind::Image, 21, {3, 7});
        assert(gc.collect({10, 6}) == 0);
        assert(gc.collect({3, 7}) == 1);
        assert(freed.size() == 1 && freed[0] == 21);
        std::printf("  multi queue: ok\n");
    }

    // Retired while nothing was submitted: freed on the next collect
    {
        freed.clear();
        gfxhal::GarbageCollector gc(deleter);
        gc.retire(ObjectKind::Sampler, 31, {0, 0});
        assert(gc.collect({0, 0}) == 1);
    }

    // Only covered entries are freed; order of the rest is kept
    {
        freed.clear();
        gfxhal::GarbageCollector gc(deleter);
        gc.retire(ObjectKind::Buffer, 1, {1});
        gc.retire(ObjectKind::Buffer, 2, {9});
        gc.retire(ObjectKind::Buffer, 3, {2});
        assert(gc.collect({2}) == 2);
        assert(freed.size() == 2 && freed[0] == 1 && freed[1] == 3);
        assert(gc.pending() == 1);
        assert(gc.drain() == 1);
        assert(freed.back() == 2);
        assert(gc.pending() == 0);
        std::printf("  partial collect + drain: ok\n");
    }

    // Null handles are ignored
    {
        freed.clear();
        gfxhal::GarbageCollector gc(deleter);
        gc.retire(ObjectKind::Fence, gfxhal::NullHandle, {1});
        assert(gc.pending() == 0);
    }

    std::printf("garbage collector tests passed\n");
    return 0;
}

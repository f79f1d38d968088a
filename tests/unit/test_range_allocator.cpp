#include <gfxhal/range_allocator.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>

using Allocator = gfxhal::RangeAllocator<std::uint32_t>;
using Range = gfxhal::Range<std::uint32_t>;

int main() {
    // Sequential allocation and exhaustion
    {
        Allocator heap({0, 16});
        auto a = heap.allocate(8);
        auto b = heap.allocate(8);
        assert(a && *a == (Range{0, 8}));
        assert(b && *b == (Range{8, 16}));
        assert(!heap.allocate(1));
        assert(heap.freeSpace() == 0);
        assert(!heap.allocate(0));
        std::printf("  sequential: ok\n");
    }

    // Best fit picks the smallest hole that fits
    {
        Allocator heap({0, 100});
        auto a = heap.allocate(10); // 0-10
        auto b = heap.allocate(30); // 10-40
        auto c = heap.allocate(5);  // 40-45
        auto d = heap.allocate(20); // 45-65
        assert(a && b && c && d);
        assert(heap.free(*b));      // hole of 30
        assert(heap.free(*d));      // hole 45-100 (55)

        auto e = heap.allocate(25);
        assert(e && e->start == 10);
        std::printf("  best fit: ok\n");
    }

    // Exact fit wins over earlier larger holes
    {
        Allocator heap({0, 64});
        auto a = heap.allocate(16);
        auto b = heap.allocate(4);
        auto c = heap.allocate(16);
        (void)c;
        assert(heap.free(*a)); // 0-16
        assert(heap.free(*b)); // merges to 0-20
        auto exact = heap.allocate(28); // tail 36-64 is exactly 28
        assert(exact && exact->start == 36);
    }

    // Frees merge with both neighbours
    {
        Allocator heap({0, 30});
        auto a = heap.allocate(10);
        auto b = heap.allocate(10);
        auto c = heap.allocate(10);
        assert(heap.free(*a));
        assert(heap.free(*c));
        assert(heap.freeRanges().size() == 2);
        assert(heap.free(*b));
        assert(heap.freeRanges().size() == 1);
        assert(heap.empty());
        std::printf("  merge: ok\n");
    }

    // Invalid frees change nothing
    {
        Allocator heap({0, 10});
        auto a = heap.allocate(4);
        assert(a);
        assert(!heap.free(Range{4, 6}));   // already free
        assert(!heap.free(Range{8, 12}));  // outside
        assert(!heap.free(Range{3, 3}));   // empty
        assert(heap.freeSpace() == 6);
        assert(heap.free(*a));
        assert(!heap.free(*a));            // double free
        assert(heap.empty());
        std::printf("  invalid frees: ok\n");
    }

    // Reset
    {
        Allocator heap({5, 25});
        (void)heap.allocate(7);
        (void)heap.allocate(3);
        heap.reset();
        assert(heap.empty());
        assert(heap.freeSpace() == 20);
        auto a = heap.allocate(20);
        assert(a && *a == (Range{5, 25}));
    }

    std::printf("range allocator tests passed\n");
    return 0;
}

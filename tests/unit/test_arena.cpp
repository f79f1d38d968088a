#include <gfxhal/handle.hpp>

#include <cassert>
#include <cstdio>
#include <string>

int main() {
    // Default handle is stale
    {
        gfxhal::Arena<int> arena;
        gfxhal::Handle h;
        assert(!h.valid());
        assert(!arena.contains(h));
        assert(arena.get(h) == nullptr);
        assert(!arena.remove(h).has_value());
    }

    // Insert, get, remove
    {
        gfxhal::Arena<std::string> arena;
        auto a = arena.insert("a");
        auto b = arena.insert("b");
        assert(arena.size() == 2);
        assert(*arena.get(a) == "a");
        assert(*arena.get(b) == "b");

        auto removed = arena.remove(a);
        assert(removed.has_value() && *removed == "a");
        assert(arena.size() == 1);
        assert(arena.get(a) == nullptr);
        assert(!arena.remove(a).has_value());
        std::printf("  insert/remove: ok\n");
    }

    // Reused slot gets a new generation; the old handle stays stale
    {
        gfxhal::Arena<int> arena;
        auto first = arena.insert(1);
        (void)arena.remove(first);
        auto second = arena.insert(2);
        assert(second.index == first.index);
        assert(second.generation != first.generation);
        assert(!arena.contains(first));
        assert(*arena.get(second) == 2);
        std::printf("  generation reuse: ok\n");
    }

    // Handle from another slot count is out of range
    {
        gfxhal::Arena<int> arena;
        (void)arena.insert(1);
        assert(!arena.contains(gfxhal::Handle{7, 1}));
    }

    // forEach visits live entries only
    {
        gfxhal::Arena<int> arena;
        auto a = arena.insert(10);
        (void)arena.insert(20);
        (void)arena.insert(30);
        (void)arena.remove(a);

        int sum = 0;
        int count = 0;
        arena.forEach([&](gfxhal::Handle h, int v) {
            assert(arena.contains(h));
            sum += v;
            ++count;
        });
        assert(count == 2);
        assert(sum == 50);
        std::printf("  forEach: ok\n");
    }

    std::printf("arena tests passed\n");
    return 0;
}

#include <cassert>
#include <cstring>
#include <iostream>

#include "pc_bridge/memory_arena.hpp"

using pc_bridge::ByteView;
using pc_bridge::MemoryArena;

void test_allocate_and_release() {
    MemoryArena arena;
    auto* block = arena.allocate(40);
    assert(block != nullptr);
    assert(arena.live_blocks() == 1);
    assert(arena.live_bytes() == 40);
    std::memset(block, 'X', 40);

    assert(!arena.release(block, 39));
    assert(arena.live_blocks() == 1);
    assert(arena.release(block, 40));
    assert(arena.live_blocks() == 0);
    assert(arena.live_bytes() == 0);
    assert(!arena.release(block, 40));
}

void test_unknown_pointer_rejected() {
    MemoryArena arena;
    std::uint8_t local[4] = {};
    assert(!arena.release(local, 4));
    assert(!arena.release(nullptr, 0));
}

void test_zero_length_block() {
    MemoryArena arena;
    auto* block = arena.allocate(0);
    assert(block != nullptr);
    assert(arena.view(block, 10).empty());
    assert(arena.release(block, 0));
}

void test_oversized_request() {
    MemoryArena arena(64);
    assert(arena.allocate(65) == nullptr);
    assert(arena.allocate(64) != nullptr);
    assert(arena.max_block_size() == 64);
}

void test_view_clamped_to_block() {
    MemoryArena arena;
    auto* block = arena.allocate(8);
    std::memcpy(block, "IOTSZLJI", 8);
    auto full = arena.view(block, 100);
    assert(full.size() == 8);
    assert(full.at(7) == 'I');
    auto tail = arena.view(block + 6, 100);
    assert(tail.size() == 2);
    assert(arena.view(block, 3).size() == 3);
    assert(arena.view(nullptr, 3).empty());

    bool threw = false;
    try {
        (void)full.at(8);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(arena.release(block, 8));
}

void test_untracked_view_uses_declared_length() {
    MemoryArena arena;
    std::uint8_t local[4] = {'I', 'O', 'T', 'S'};
    assert(arena.view(local, 4).size() == 4);
}

int main() {
    test_allocate_and_release();
    test_unknown_pointer_rejected();
    test_zero_length_block();
    test_oversized_request();
    test_view_clamped_to_block();
    test_untracked_view_uses_declared_length();
    std::cout << "All tests passed\n";
    return 0;
}

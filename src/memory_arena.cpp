#include "pc_bridge/memory_arena.hpp"

#include <algorithm>
#include <new>
#include <utility>

#include "pc_bridge/log.hpp"

namespace pc_bridge {

MemoryArena::MemoryArena(std::size_t max_block_size) : max_block_size_(max_block_size) {}

std::uint8_t* MemoryArena::allocate(std::size_t size) {
    if (size > max_block_size_) {
        PC_BRIDGE_LOG("refusing block of " << size << " bytes");
        return nullptr;
    }
    // Zero-length requests still get a distinct address so null keeps meaning failure.
    std::unique_ptr<std::uint8_t[]> data(new (std::nothrow) std::uint8_t[std::max<std::size_t>(size, 1)]);
    if (!data) {
        return nullptr;
    }
    auto* ptr = data.get();
    try {
        blocks_.emplace(ptr, Block{std::move(data), size});
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
    live_bytes_ += size;
    return ptr;
}

bool MemoryArena::release(std::uint8_t* ptr, std::size_t size) {
    auto it = blocks_.find(ptr);
    if (it == blocks_.end()) {
        PC_BRIDGE_LOG("release of unknown block");
        return false;
    }
    if (it->second.size != size) {
        PC_BRIDGE_LOG("release size " << size << " does not match block size " << it->second.size);
        return false;
    }
    live_bytes_ -= size;
    blocks_.erase(it);
    return true;
}

ByteView MemoryArena::view(const std::uint8_t* ptr, std::size_t length) const {
    if (ptr == nullptr) {
        return ByteView{};
    }
    auto it = blocks_.upper_bound(ptr);
    if (it == blocks_.begin()) {
        return ByteView(ptr, length);
    }
    --it;
    std::less<const std::uint8_t*> before;
    const std::uint8_t* block_end = it->first + it->second.size;
    if (before(ptr, it->first) || !before(ptr, it->first + std::max<std::size_t>(it->second.size, 1))) {
        return ByteView(ptr, length);
    }
    auto available = static_cast<std::size_t>(block_end - ptr);
    return ByteView(ptr, std::min(length, available));
}

}  // namespace pc_bridge

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

#include "pc_bridge/byte_view.hpp"

namespace pc_bridge {

inline constexpr std::size_t kMaxBlockSize = std::size_t{1} << 20;

// Tracks the blocks handed to the host for input staging. Each block is
// released exactly once, with the size it was allocated with.
class MemoryArena {
public:
    explicit MemoryArena(std::size_t max_block_size = kMaxBlockSize);

    MemoryArena(const MemoryArena&) = delete;
    MemoryArena& operator=(const MemoryArena&) = delete;

    // Null when the request is too large or memory is exhausted.
    std::uint8_t* allocate(std::size_t size);
    // False for pointers this arena does not own or a mismatched size.
    bool release(std::uint8_t* ptr, std::size_t size);

    // View of `length` bytes at `ptr`, clamped to the end of the owning block
    // when `ptr` lies inside one.
    ByteView view(const std::uint8_t* ptr, std::size_t length) const;

    std::size_t live_blocks() const { return blocks_.size(); }
    std::size_t live_bytes() const { return live_bytes_; }
    std::size_t max_block_size() const { return max_block_size_; }

private:
    struct Block {
        std::unique_ptr<std::uint8_t[]> data;
        std::size_t size{0};
    };

    std::map<const std::uint8_t*, Block, std::less<const std::uint8_t*>> blocks_;
    std::size_t max_block_size_;
    std::size_t live_bytes_{0};
};

}  // namespace pc_bridge

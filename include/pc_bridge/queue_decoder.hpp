#pragma once

#include <array>
#include <cstddef>

#include "pc_bridge/byte_view.hpp"
#include "pc_engine/types.hpp"

namespace pc_bridge {

inline constexpr std::size_t kQueueCapacity = 16;

// Ordered piece queue decoded from letters. Unknown bytes are skipped and
// anything past the capacity is dropped.
class PieceQueue {
public:
    PieceQueue() = default;

    static PieceQueue decode(ByteView text);

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    pc_engine::PieceKind operator[](std::size_t index) const { return pieces_[index]; }
    const pc_engine::PieceKind* begin() const { return pieces_.data(); }
    const pc_engine::PieceKind* end() const { return pieces_.data() + size_; }

private:
    std::array<pc_engine::PieceKind, kQueueCapacity> pieces_{};
    std::size_t size_{0};
};

}  // namespace pc_bridge

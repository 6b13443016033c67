#pragma once

#include <array>
#include <cstdint>

#include "pc_engine/types.hpp"

namespace pc_engine {

inline constexpr int kBoardWidth = 10;
inline constexpr int kMaxHeight = 24;
inline constexpr std::uint16_t kFullRow = (1u << kBoardWidth) - 1;

// Column 0 is the highest usable bit of a row; bits at or above kBoardWidth stay clear.
constexpr std::uint16_t column_bit(int x) {
    return static_cast<std::uint16_t>(1u << (kBoardWidth - 1 - x));
}

struct Board {
    std::array<std::uint16_t, kMaxHeight> rows{};

    bool occupied(Cell cell) const;
    bool occupied(int x, int y) const { return occupied(Cell{static_cast<std::int8_t>(x), static_cast<std::int8_t>(y)}); }
    void set(int x, int y);
    std::int8_t distance_to_ground(std::int8_t x, std::int8_t y) const;
    void place(const Placement& placement);
    std::uint32_t line_clears() const;
    void remove_lines(std::uint32_t mask);
    bool empty() const;
    int filled_cells() const;
    int stack_height() const;

    bool operator==(const Board& rhs) const { return rows == rhs.rows; }
    bool operator!=(const Board& rhs) const { return rows != rhs.rows; }
};

}  // namespace pc_engine

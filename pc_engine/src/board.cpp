#include "pc_engine/board.hpp"

#include <algorithm>
#include <cassert>

namespace pc_engine {

namespace {

inline int popcount16(std::uint16_t v) {
#if defined(__GNUG__)
    return __builtin_popcount(v);
#else
    int count = 0;
    while (v) {
        v &= static_cast<std::uint16_t>(v - 1);
        ++count;
    }
    return count;
#endif
}

}  // namespace

bool Board::occupied(Cell cell) const {
    auto [x, y] = cell;
    if (x < 0 || x >= kBoardWidth || y < 0 || y >= kMaxHeight) {
        return true;
    }
    return (rows[static_cast<std::size_t>(y)] & column_bit(x)) != 0;
}

void Board::set(int x, int y) {
    assert(x >= 0 && x < kBoardWidth && y >= 0 && y < kMaxHeight);
    rows[static_cast<std::size_t>(y)] |= column_bit(x);
}

std::int8_t Board::distance_to_ground(std::int8_t x, std::int8_t y) const {
    std::int8_t dist = 0;
    while (!occupied(x, y - dist - 1)) {
        ++dist;
    }
    return dist;
}

void Board::place(const Placement& placement) {
    for (auto [cx, cy] : placement.cells()) {
        set(cx, cy);
    }
}

std::uint32_t Board::line_clears() const {
    std::uint32_t mask = 0;
    for (std::size_t y = 0; y < rows.size(); ++y) {
        if (rows[y] == kFullRow) {
            mask |= 1u << y;
        }
    }
    return mask;
}

void Board::remove_lines(std::uint32_t mask) {
    std::size_t dst = 0;
    for (std::size_t src = 0; src < rows.size(); ++src) {
        if (mask & (1u << src)) {
            continue;
        }
        rows[dst++] = rows[src];
    }
    std::fill(rows.begin() + static_cast<std::ptrdiff_t>(dst), rows.end(), std::uint16_t{0});
}

bool Board::empty() const {
    return std::all_of(rows.begin(), rows.end(), [](std::uint16_t r) { return r == 0; });
}

int Board::filled_cells() const {
    int total = 0;
    for (auto r : rows) {
        total += popcount16(r);
    }
    return total;
}

int Board::stack_height() const {
    for (int y = kMaxHeight; y > 0; --y) {
        if (rows[static_cast<std::size_t>(y - 1)] != 0) {
            return y;
        }
    }
    return 0;
}

}  // namespace pc_engine

#pragma once

#include <algorithm>
#include <cstddef>

namespace pc_engine {

constexpr Facing cw(Facing f) {
    switch (f) {
        case Facing::Up:
            return Facing::Right;
        case Facing::Right:
            return Facing::Down;
        case Facing::Down:
            return Facing::Left;
        case Facing::Left:
            return Facing::Up;
    }
    return f;
}

constexpr Facing ccw(Facing f) {
    switch (f) {
        case Facing::Up:
            return Facing::Left;
        case Facing::Left:
            return Facing::Down;
        case Facing::Down:
            return Facing::Right;
        case Facing::Right:
            return Facing::Up;
    }
    return f;
}

// Cells relative to the reference point, indexed [piece][facing]. Right and
// Left hold the mirrored turn compared to sfinder's naming, and the vertical I
// is anchored one row above sfinder's rotation center. The coordinate
// transform in pc_bridge depends on this exact table.
inline constexpr std::array<std::array<std::array<Cell, 4>, 4>, 7> kShapes{{
    // I
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {2, 0}}},
        {{{0, -2}, {0, -1}, {0, 0}, {0, 1}}},
        {{{-2, 0}, {-1, 0}, {0, 0}, {1, 0}}},
        {{{0, -3}, {0, -2}, {0, -1}, {0, 0}}},
    }},
    // O
    {{
        {{{0, 0}, {1, 0}, {0, 1}, {1, 1}}},
        {{{0, 0}, {-1, 0}, {0, 1}, {-1, 1}}},
        {{{0, 0}, {-1, 0}, {0, -1}, {-1, -1}}},
        {{{0, 0}, {1, 0}, {0, -1}, {1, -1}}},
    }},
    // T
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {0, 1}}},
        {{{0, 1}, {0, 0}, {0, -1}, {-1, 0}}},
        {{{-1, 0}, {0, 0}, {1, 0}, {0, -1}}},
        {{{0, 1}, {0, 0}, {0, -1}, {1, 0}}},
    }},
    // S
    {{
        {{{-1, 0}, {0, 0}, {0, 1}, {1, 1}}},
        {{{0, 0}, {0, -1}, {-1, 0}, {-1, 1}}},
        {{{1, 0}, {0, 0}, {0, -1}, {-1, -1}}},
        {{{0, 0}, {0, 1}, {1, 0}, {1, -1}}},
    }},
    // Z
    {{
        {{{1, 0}, {0, 0}, {0, 1}, {-1, 1}}},
        {{{0, 0}, {-1, 0}, {0, 1}, {-1, -1}}},
        {{{-1, 0}, {0, 0}, {0, -1}, {1, -1}}},
        {{{0, 0}, {1, 0}, {0, -1}, {1, 1}}},
    }},
    // L
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {1, 1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {-1, 1}}},
        {{{1, 0}, {0, 0}, {-1, 0}, {-1, -1}}},
        {{{0, 1}, {0, 0}, {0, -1}, {1, -1}}},
    }},
    // J
    {{
        {{{-1, 0}, {0, 0}, {1, 0}, {-1, 1}}},
        {{{0, -1}, {0, 0}, {0, 1}, {-1, -1}}},
        {{{1, 0}, {0, 0}, {-1, 0}, {1, -1}}},
        {{{0, 1}, {0, 0}, {0, -1}, {1, 1}}},
    }},
}};

constexpr const std::array<Cell, 4>& shape_cells(PieceKind p, Facing f) {
    return kShapes[piece_index(p)][facing_index(f)];
}

inline std::array<Cell, 4> Placement::cells() const {
    auto translate = [this](Cell cell) {
        return Cell{static_cast<std::int8_t>(cell.first + x), static_cast<std::int8_t>(cell.second + y)};
    };

    const auto& shape = shape_cells(piece, facing);
    return {translate(shape[0]), translate(shape[1]), translate(shape[2]), translate(shape[3])};
}

inline Placement Placement::canonical_form() const {
    auto normalized = [](std::array<Cell, 4> cells) {
        std::sort(cells.begin(), cells.end());
        auto min_x = std::min({cells[0].first, cells[1].first, cells[2].first, cells[3].first});
        auto min_y = std::min({cells[0].second, cells[1].second, cells[2].second, cells[3].second});
        for (auto& cell : cells) {
            cell.first = static_cast<std::int8_t>(cell.first - min_x);
            cell.second = static_cast<std::int8_t>(cell.second - min_y);
        }
        return cells;
    };

    auto own = cells();
    auto own_shape = normalized(own);
    auto own_min = *std::min_element(own.begin(), own.end());
    for (auto f : kAllFacings) {
        if (f == facing) {
            return *this;
        }
        if (normalized(shape_cells(piece, f)) != own_shape) {
            continue;
        }
        // Same four cells under another facing: line up the lowest-sorted cell.
        const auto& other = shape_cells(piece, f);
        auto other_min = *std::min_element(other.begin(), other.end());
        return Placement{piece, f, static_cast<std::int8_t>(own_min.first - other_min.first),
                         static_cast<std::int8_t>(own_min.second - other_min.second)};
    }
    return *this;
}

inline std::size_t PlacementHash::operator()(const Placement& p) const noexcept {
    std::size_t h = 1469598103934665603ull;
    h ^= static_cast<std::size_t>(p.piece) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(p.facing) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(static_cast<std::uint8_t>(p.x)) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(static_cast<std::uint8_t>(p.y)) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    return h;
}

}  // namespace pc_engine

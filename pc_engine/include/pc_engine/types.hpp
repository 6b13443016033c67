#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace pc_engine {

struct Board;

enum class PieceKind : std::uint8_t {
    I,
    O,
    T,
    S,
    Z,
    L,
    J,
};

// Internal rotation states. Right is one clockwise step from Up in the
// engine's own naming, which is mirrored relative to sfinder's.
enum class Facing : std::uint8_t {
    Up,
    Right,
    Down,
    Left,
};

enum class RotationSystem : std::uint8_t {
    Srs,
    NoKicks,
};

using Cell = std::pair<std::int8_t, std::int8_t>;

inline constexpr std::array<PieceKind, 7> kAllPieces{
    PieceKind::I, PieceKind::O, PieceKind::T, PieceKind::S, PieceKind::Z, PieceKind::L, PieceKind::J};

inline constexpr std::array<Facing, 4> kAllFacings{
    Facing::Up, Facing::Right, Facing::Down, Facing::Left};

constexpr std::size_t piece_index(PieceKind p) {
    return static_cast<std::size_t>(p);
}

constexpr std::size_t facing_index(Facing f) {
    return static_cast<std::size_t>(f);
}

constexpr bool is_vertical(Facing f) {
    return f == Facing::Right || f == Facing::Left;
}

char piece_char(PieceKind p);
std::optional<PieceKind> piece_from_char(char c);

struct Placement {
    PieceKind piece{};
    Facing facing{Facing::Up};
    std::int8_t x{0};
    std::int8_t y{0};

    std::array<Cell, 4> cells() const;
    Placement canonical_form() const;
    bool obstructed(const Board& board) const;
    std::int8_t drop_distance(const Board& board) const;
    bool operator==(const Placement& rhs) const {
        return piece == rhs.piece && facing == rhs.facing && x == rhs.x && y == rhs.y;
    }
    bool operator!=(const Placement& rhs) const { return !(*this == rhs); }
};

struct PlacementHash {
    std::size_t operator()(const Placement& p) const noexcept;
};

}  // namespace pc_engine

#include "pc_engine/types.inl"

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "pc_engine/board.hpp"

namespace pc_engine {

inline constexpr std::size_t kPreviewSize = 7;
inline constexpr std::size_t kLookaheadCapacity = 7;

// Randomizer context. Pieces known beyond the preview window wait in the
// lookahead slots and are drawn only after the preview runs out.
struct Randomizer {
    std::array<std::optional<PieceKind>, kLookaheadCapacity> lookahead{};
};

struct GameState {
    Board board{};
    std::optional<PieceKind> hold;
    PieceKind current{PieceKind::I};
    std::array<std::optional<PieceKind>, kPreviewSize> preview{};
    Randomizer randomizer{};
    RotationSystem rotation_system{RotationSystem::Srs};

    // Current piece, then preview, then lookahead, stopping at the first empty slot.
    std::vector<PieceKind> upcoming() const;
    std::size_t piece_count() const;
};

}  // namespace pc_engine

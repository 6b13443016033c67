#include "pc_engine/state.hpp"

#include <algorithm>

namespace pc_engine {

bool Placement::obstructed(const Board& board) const {
    for (auto cell : cells()) {
        if (board.occupied(cell)) {
            return true;
        }
    }
    return false;
}

std::int8_t Placement::drop_distance(const Board& board) const {
    std::int8_t dist = kMaxHeight;
    for (auto [cx, cy] : cells()) {
        dist = std::min<std::int8_t>(dist, board.distance_to_ground(cx, cy));
    }
    return dist;
}

std::vector<PieceKind> GameState::upcoming() const {
    std::vector<PieceKind> pieces;
    pieces.reserve(1 + kPreviewSize + kLookaheadCapacity);
    pieces.push_back(current);
    for (const auto& slot : preview) {
        if (!slot) {
            return pieces;
        }
        pieces.push_back(*slot);
    }
    for (const auto& slot : randomizer.lookahead) {
        if (!slot) {
            break;
        }
        pieces.push_back(*slot);
    }
    return pieces;
}

std::size_t GameState::piece_count() const {
    return upcoming().size() + (hold ? 1 : 0);
}

}  // namespace pc_engine

#include "pc_bridge/game_state_builder.hpp"

using namespace pc_engine;

namespace pc_bridge {

static_assert(kQueueCapacity <= 2 + kPreviewSize + kLookaheadCapacity,
              "queue must fit into hold, current, preview and lookahead");

Outcome<GameState> build_game_state(const Board& board, const PieceQueue& queue) {
    if (queue.size() < 2) {
        return ErrorKind::InsufficientPieces;
    }

    GameState state;
    state.board = board;
    state.hold = queue[0];
    state.current = queue[1];

    std::size_t index = 2;
    for (auto& slot : state.preview) {
        if (index < queue.size()) {
            slot = queue[index++];
        }
    }
    for (auto& slot : state.randomizer.lookahead) {
        if (index < queue.size()) {
            slot = queue[index++];
        }
    }
    return state;
}

}  // namespace pc_bridge

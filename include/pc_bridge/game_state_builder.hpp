#pragma once

#include "pc_bridge/queue_decoder.hpp"
#include "pc_bridge/result.hpp"
#include "pc_engine/state.hpp"

namespace pc_bridge {

// Lays a queue onto the engine's slots: the first piece goes to hold, the
// second becomes current, then the preview fills and the rest go to the
// randomizer lookahead. Needs at least two pieces.
Outcome<pc_engine::GameState> build_game_state(const pc_engine::Board& board, const PieceQueue& queue);

}  // namespace pc_bridge

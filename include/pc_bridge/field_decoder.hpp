#pragma once

#include <cstdint>
#include <string>

#include "pc_bridge/byte_view.hpp"
#include "pc_engine/board.hpp"

namespace pc_bridge {

// Fills `board` from a top-down, row-major field text. The first byte is the
// leftmost cell of row `height - 1`; 'X' or 'x' marks a filled cell and every
// other byte is empty. Rows at or above the engine's maximum height are
// dropped, and bytes past the end of row 0 are ignored.
void decode_field(ByteView field, std::uint32_t height, pc_engine::Board& board);

// Inverse of decode_field for the lowest `height` rows, using 'X' and '_'.
std::string render_field(const pc_engine::Board& board, std::uint32_t height);

}  // namespace pc_bridge

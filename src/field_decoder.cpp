#include "pc_bridge/field_decoder.hpp"

using pc_engine::kBoardWidth;
using pc_engine::kMaxHeight;

namespace pc_bridge {

void decode_field(ByteView field, std::uint32_t height, pc_engine::Board& board) {
    board = pc_engine::Board{};
    if (height == 0) {
        return;
    }

    int x = 0;
    std::uint32_t row = height - 1;
    for (auto byte : field) {
        if ((byte == 'X' || byte == 'x') && row < static_cast<std::uint32_t>(kMaxHeight)) {
            board.set(x, static_cast<int>(row));
        }
        if (++x == kBoardWidth) {
            if (row == 0) {
                break;
            }
            x = 0;
            --row;
        }
    }
}

std::string render_field(const pc_engine::Board& board, std::uint32_t height) {
    std::string out;
    out.reserve(static_cast<std::size_t>(height) * kBoardWidth);
    for (std::uint32_t row = height; row > 0; --row) {
        auto y = row - 1;
        for (int x = 0; x < kBoardWidth; ++x) {
            bool filled = y < static_cast<std::uint32_t>(kMaxHeight) && board.occupied(x, static_cast<int>(y));
            out.push_back(filled ? 'X' : '_');
        }
    }
    return out;
}

}  // namespace pc_bridge

#include <cassert>
#include <iostream>
#include <string>

#include "pc_bridge/field_decoder.hpp"
#include "pc_bridge/queue_decoder.hpp"

using namespace pc_bridge;
using pc_engine::Board;
using pc_engine::PieceKind;

void test_single_row() {
    Board board;
    decode_field(ByteView::of("____XXXXXX"), 1, board);
    assert(board.filled_cells() == 6);
    assert(!board.occupied(3, 0));
    assert(board.occupied(4, 0));
    assert(render_field(board, 1) == "____XXXXXX");
}

void test_top_down_rows() {
    Board board;
    decode_field(ByteView::of("X_________"
                              "_x________"
                              "__X_______"),
                 3, board);
    assert(board.occupied(0, 2));
    assert(board.occupied(1, 1));
    assert(board.occupied(2, 0));
    assert(board.filled_cells() == 3);
    assert(render_field(board, 3) == "X_________"
                                     "_X________"
                                     "__X_______");
}

void test_short_field() {
    Board board;
    decode_field(ByteView::of("XX"), 4, board);
    assert(board.occupied(0, 3));
    assert(board.occupied(1, 3));
    assert(board.filled_cells() == 2);
}

void test_bytes_past_row_zero_ignored() {
    Board board;
    decode_field(ByteView::of("__________XXXXXXXXXX"), 1, board);
    assert(board.empty());
}

void test_zero_height_and_empty_input() {
    Board board;
    board.set(0, 0);
    decode_field(ByteView::of("XXXXXXXXXX"), 0, board);
    assert(board.empty());
    decode_field(ByteView{}, 4, board);
    assert(board.empty());
    decode_field(ByteView(nullptr, 40), 4, board);
    assert(board.empty());
}

void test_rows_above_ceiling_dropped() {
    std::string field(30 * 10, 'X');
    Board board;
    decode_field(ByteView::of(field), 30, board);
    assert(board.filled_cells() == pc_engine::kMaxHeight * pc_engine::kBoardWidth);
}

void test_queue_decoding() {
    auto queue = PieceQueue::decode(ByteView::of("iO-T zq\nL"));
    assert(queue.size() == 5);
    assert(queue[0] == PieceKind::I);
    assert(queue[1] == PieceKind::O);
    assert(queue[2] == PieceKind::T);
    assert(queue[3] == PieceKind::Z);
    assert(queue[4] == PieceKind::L);
}

void test_queue_truncates() {
    auto queue = PieceQueue::decode(ByteView::of("IIIIIIIIIIIIIIIIOOOO"));
    assert(queue.size() == kQueueCapacity);
    for (auto piece : queue) {
        assert(piece == PieceKind::I);
    }
}

void test_queue_without_pieces() {
    auto only_t = PieceQueue::decode(ByteView::of("QWERTY"));
    assert(only_t.size() == 1 && only_t[0] == PieceKind::T);
    assert(PieceQueue::decode(ByteView::of("qwrxyk")).empty());
    assert(PieceQueue::decode(ByteView{}).empty());
}

int main() {
    test_single_row();
    test_top_down_rows();
    test_short_field();
    test_bytes_past_row_zero_ignored();
    test_zero_height_and_empty_input();
    test_rows_above_ceiling_dropped();
    test_queue_decoding();
    test_queue_truncates();
    test_queue_without_pieces();
    std::cout << "All tests passed\n";
    return 0;
}

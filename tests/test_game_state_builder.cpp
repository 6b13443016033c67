#include <cassert>
#include <iostream>
#include <variant>

#include "pc_bridge/game_state_builder.hpp"

using namespace pc_bridge;
using pc_engine::Board;
using pc_engine::GameState;
using pc_engine::PieceKind;

void test_slot_layout() {
    auto queue = PieceQueue::decode(ByteView::of("LJOSZTI"));
    auto built = build_game_state(Board{}, queue);
    auto* state = std::get_if<GameState>(&built);
    assert(state);
    assert(state->hold == PieceKind::L);
    assert(state->current == PieceKind::J);
    assert(state->preview[0] == PieceKind::O);
    assert(state->preview[4] == PieceKind::I);
    assert(!state->preview[5]);
    assert(!state->randomizer.lookahead[0]);
    assert(state->piece_count() == 7);
    assert(state->rotation_system == pc_engine::RotationSystem::Srs);
}

void test_full_queue_spills_into_lookahead() {
    auto queue = PieceQueue::decode(ByteView::of("IOTSZLJIOTSZLJIO"));
    assert(queue.size() == kQueueCapacity);
    auto built = build_game_state(Board{}, queue);
    const auto& state = std::get<GameState>(built);
    for (const auto& slot : state.preview) {
        assert(slot.has_value());
    }
    for (const auto& slot : state.randomizer.lookahead) {
        assert(slot.has_value());
    }
    assert(state.randomizer.lookahead[6] == PieceKind::O);
    auto upcoming = state.upcoming();
    assert(upcoming.size() == kQueueCapacity - 1);
    assert(upcoming.front() == PieceKind::O);
    assert(upcoming.back() == PieceKind::O);
}

void test_board_is_copied() {
    Board board;
    board.set(2, 0);
    auto built = build_game_state(board, PieceQueue::decode(ByteView::of("IO")));
    assert(std::get<GameState>(built).board == board);
}

void test_insufficient_pieces() {
    auto one = build_game_state(Board{}, PieceQueue::decode(ByteView::of("I")));
    assert(std::get<ErrorKind>(one) == ErrorKind::InsufficientPieces);
    auto none = build_game_state(Board{}, PieceQueue{});
    assert(std::get<ErrorKind>(none) == ErrorKind::InsufficientPieces);
}

int main() {
    test_slot_layout();
    test_full_queue_spills_into_lookahead();
    test_board_is_copied();
    test_insufficient_pieces();
    std::cout << "All tests passed\n";
    return 0;
}

#include "pc_engine/types.hpp"

#include <stdexcept>

namespace pc_engine {

char piece_char(PieceKind p) {
    switch (p) {
        case PieceKind::I:
            return 'I';
        case PieceKind::O:
            return 'O';
        case PieceKind::T:
            return 'T';
        case PieceKind::S:
            return 'S';
        case PieceKind::Z:
            return 'Z';
        case PieceKind::L:
            return 'L';
        case PieceKind::J:
            return 'J';
    }
    throw std::logic_error("unreachable piece kind");
}

std::optional<PieceKind> piece_from_char(char c) {
    switch (c) {
        case 'I':
        case 'i':
            return PieceKind::I;
        case 'O':
        case 'o':
            return PieceKind::O;
        case 'T':
        case 't':
            return PieceKind::T;
        case 'S':
        case 's':
            return PieceKind::S;
        case 'Z':
        case 'z':
            return PieceKind::Z;
        case 'L':
        case 'l':
            return PieceKind::L;
        case 'J':
        case 'j':
            return PieceKind::J;
        default:
            return std::nullopt;
    }
}

}  // namespace pc_engine

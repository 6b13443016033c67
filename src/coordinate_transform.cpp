#include "pc_bridge/coordinate_transform.hpp"

#include <array>
#include <stdexcept>

using namespace pc_engine;

namespace pc_bridge {

namespace {

// Indexed [piece][facing] in PieceKind and Facing declaration order.
constexpr std::array<std::array<Offset, 4>, 7> kRotationCenterOffsets{{
    /* I */ {{{0, 0}, {0, -1}, {0, 0}, {0, -1}}},
    /* O */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
    /* T */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
    /* S */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
    /* Z */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
    /* L */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
    /* J */ {{{0, 0}, {0, 0}, {0, 0}, {0, 0}}},
}};

}  // namespace

Offset rotation_center_offset(PieceKind piece, Facing facing) {
    return kRotationCenterOffsets[piece_index(piece)][facing_index(facing)];
}

std::string_view external_rotation_name(Facing facing) {
    switch (facing) {
        case Facing::Up:
            return "Spawn";
        case Facing::Right:
            return "Left";
        case Facing::Down:
            return "Reverse";
        case Facing::Left:
            return "Right";
    }
    throw std::logic_error("unreachable facing");
}

}  // namespace pc_bridge

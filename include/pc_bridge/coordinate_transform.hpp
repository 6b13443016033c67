#pragma once

#include <string_view>

#include "pc_engine/types.hpp"

namespace pc_bridge {

struct Offset {
    int dx{0};
    int dy{0};

    bool operator==(const Offset& rhs) const { return dx == rhs.dx && dy == rhs.dy; }
    bool operator!=(const Offset& rhs) const { return !(*this == rhs); }
};

// Translation from the engine's reference point to sfinder's rotation center.
// The table is pinned against sfinder output; only vertical I differs.
Offset rotation_center_offset(pc_engine::PieceKind piece, pc_engine::Facing facing);

// sfinder's rotation name for an engine facing. The engine names its turns
// with the opposite handedness, so Right and Left swap.
std::string_view external_rotation_name(pc_engine::Facing facing);

}  // namespace pc_bridge

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "pc_bridge/coordinate_transform.hpp"
#include "pc_bridge/placement_encoder.hpp"

using namespace pc_engine;
using pc_bridge::external_rotation_name;
using pc_bridge::rotation_center_offset;

namespace {

using CellList = std::vector<std::pair<int, int>>;

// sfinder spawn shapes around the rotation center.
CellList sfinder_spawn(PieceKind piece) {
    switch (piece) {
        case PieceKind::I:
            return {{-1, 0}, {0, 0}, {1, 0}, {2, 0}};
        case PieceKind::O:
            return {{0, 0}, {1, 0}, {0, 1}, {1, 1}};
        case PieceKind::T:
            return {{0, 0}, {-1, 0}, {1, 0}, {0, 1}};
        case PieceKind::S:
            return {{0, 0}, {-1, 0}, {0, 1}, {1, 1}};
        case PieceKind::Z:
            return {{0, 0}, {1, 0}, {0, 1}, {-1, 1}};
        case PieceKind::L:
            return {{0, 0}, {-1, 0}, {1, 0}, {1, 1}};
        case PieceKind::J:
            return {{0, 0}, {-1, 0}, {1, 0}, {-1, 1}};
    }
    return {};
}

CellList sfinder_cells(PieceKind piece, const std::string& rotate, int x, int y) {
    CellList out;
    for (auto [cx, cy] : sfinder_spawn(piece)) {
        int rx = cx;
        int ry = cy;
        if (rotate == "Right") {
            rx = cy;
            ry = -cx;
        } else if (rotate == "Reverse") {
            rx = -cx;
            ry = -cy;
        } else if (rotate == "Left") {
            rx = -cy;
            ry = cx;
        }
        out.push_back({x + rx, y + ry});
    }
    std::sort(out.begin(), out.end());
    return out;
}

CellList engine_cells(const Placement& placement) {
    CellList out;
    for (auto [cx, cy] : placement.cells()) {
        out.push_back({cx, cy});
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

void test_every_orientation_matches_sfinder() {
    for (auto piece : kAllPieces) {
        for (auto facing : kAllFacings) {
            Placement placement{piece, facing, 4, 5};
            auto record = pc_bridge::to_wire_record(placement);
            assert(record.piece == piece_char(piece));
            assert(engine_cells(placement) == sfinder_cells(piece, std::string(record.rotate), record.x, record.y));
        }
    }
}

void test_rotation_names() {
    assert(external_rotation_name(Facing::Up) == "Spawn");
    assert(external_rotation_name(Facing::Right) == "Left");
    assert(external_rotation_name(Facing::Down) == "Reverse");
    assert(external_rotation_name(Facing::Left) == "Right");
}

void test_offsets() {
    for (auto piece : kAllPieces) {
        for (auto facing : kAllFacings) {
            auto offset = rotation_center_offset(piece, facing);
            if (piece == PieceKind::I && is_vertical(facing)) {
                assert((offset == pc_bridge::Offset{0, -1}));
            } else {
                assert((offset == pc_bridge::Offset{}));
            }
        }
    }
}

void test_vertical_i_record() {
    auto record = pc_bridge::to_wire_record(Placement{PieceKind::I, Facing::Right, 0, 2});
    assert((record == pc_bridge::WireRecord{'I', "Left", 0, 1}));
}

int main() {
    test_every_orientation_matches_sfinder();
    test_rotation_names();
    test_offsets();
    test_vertical_i_record();
    std::cout << "All tests passed\n";
    return 0;
}

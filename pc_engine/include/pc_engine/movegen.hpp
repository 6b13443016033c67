#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "pc_engine/state.hpp"

namespace pc_engine {

inline constexpr std::int8_t kSpawnX = 4;
inline constexpr std::int8_t kSpawnY = 20;

// Every distinct lock position reachable from spawn, in canonical form, paired
// with the number of soft-dropped rows needed to reach it.
std::vector<std::pair<Placement, std::uint32_t>> find_moves(
    const Board& board, PieceKind piece, RotationSystem system = RotationSystem::Srs);

}  // namespace pc_engine

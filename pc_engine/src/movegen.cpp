#include "pc_engine/movegen.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <queue>
#include <tuple>
#include <unordered_map>

namespace pc_engine {

namespace {

using KickList = std::array<Cell, 5>;

struct Intermediate {
    Placement mv;
    std::uint32_t soft_drops{0};

    // std::priority_queue is a max-heap; invert so the fewest soft drops expand first.
    bool operator<(const Intermediate& rhs) const { return soft_drops > rhs.soft_drops; }
};

// SRS state of an internal facing: 0 north, 1 east, 2 south, 3 west. The
// internal Right/Left are the mirrored turns.
constexpr std::size_t srs_state(Facing f) {
    switch (f) {
        case Facing::Up:
            return 0;
        case Facing::Right:
            return 3;
        case Facing::Down:
            return 2;
        case Facing::Left:
            return 1;
    }
    return 0;
}

// Distance from the SRS rotation center to the internal reference point.
constexpr Cell reference_adjust(PieceKind piece, Facing f) {
    if (piece == PieceKind::I && is_vertical(f)) {
        return {0, 1};
    }
    return {0, 0};
}

constexpr KickList offsets(PieceKind piece, std::size_t state) {
    switch (piece) {
        case PieceKind::O:
            switch (state) {
                case 0:
                    return {{{0, 0}, {0, 0}, {0, 0}, {0, 0}, {0, 0}}};
                case 1:
                    return {{{0, -1}, {0, -1}, {0, -1}, {0, -1}, {0, -1}}};
                case 2:
                    return {{{-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}}};
                default:
                    return {{{-1, 0}, {-1, 0}, {-1, 0}, {-1, 0}, {-1, 0}}};
            }
        case PieceKind::I:
            switch (state) {
                case 0:
                    return {{{0, 0}, {-1, 0}, {2, 0}, {-1, 0}, {2, 0}}};
                case 1:
                    return {{{-1, 0}, {0, 0}, {0, 0}, {0, 1}, {0, -2}}};
                case 2:
                    return {{{-1, 1}, {1, 1}, {-2, 1}, {1, 0}, {-2, 0}}};
                default:
                    return {{{0, 1}, {0, 1}, {0, 1}, {0, -1}, {0, 2}}};
            }
        default:
            switch (state) {
                case 0:
                case 2:
                    return {{{0, 0}, {0, 0}, {0, 0}, {0, 0}, {0, 0}}};
                case 1:
                    return {{{0, 0}, {1, 0}, {1, -1}, {0, 2}, {1, 2}}};
                default:
                    return {{{0, 0}, {-1, 0}, {-1, -1}, {0, 2}, {-1, 2}}};
            }
    }
    return {};
}

// Translations from the reference point before a turn to the candidate
// reference points after it, in test order.
constexpr KickList kicks(PieceKind piece, Facing from, Facing to) {
    KickList res{};
    auto from_offsets = offsets(piece, srs_state(from));
    auto to_offsets = offsets(piece, srs_state(to));
    auto from_adjust = reference_adjust(piece, from);
    auto to_adjust = reference_adjust(piece, to);
    for (std::size_t i = 0; i < res.size(); ++i) {
        res[i] = {static_cast<std::int8_t>(from_offsets[i].first - to_offsets[i].first - from_adjust.first +
                                           to_adjust.first),
                  static_cast<std::int8_t>(from_offsets[i].second - to_offsets[i].second - from_adjust.second +
                                           to_adjust.second)};
    }
    return res;
}

std::optional<Placement> shift(Placement location, const Board& board, int dx) {
    location.x = static_cast<std::int8_t>(location.x + dx);
    if (location.obstructed(board)) {
        return std::nullopt;
    }
    return location;
}

std::optional<Placement> rotate(
    const Placement& from, const Board& board, Facing to, RotationSystem system) {
    if (from.piece == PieceKind::O) {
        return std::nullopt;
    }
    static const auto lut = [] {
        std::array<std::array<std::array<KickList, 4>, 4>, 7> res{};
        for (auto p : kAllPieces) {
            for (auto f : kAllFacings) {
                for (auto t : kAllFacings) {
                    res[piece_index(p)][facing_index(f)][facing_index(t)] = kicks(p, f, t);
                }
            }
        }
        return res;
    }();

    const auto& tests = lut[piece_index(from.piece)][facing_index(from.facing)][facing_index(to)];
    std::size_t test_count = system == RotationSystem::Srs ? tests.size() : 1;
    for (std::size_t i = 0; i < test_count; ++i) {
        auto [dx, dy] = tests[i];
        Placement target{from.piece, to, static_cast<std::int8_t>(from.x + dx),
                         static_cast<std::int8_t>(from.y + dy)};
        if (!target.obstructed(board)) {
            return target;
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::pair<Placement, std::uint32_t>> find_moves(
    const Board& board, PieceKind piece, RotationSystem system) {
    std::priority_queue<Intermediate> queue;
    std::unordered_map<Placement, std::uint32_t, PlacementHash> values;
    std::unordered_map<Placement, std::uint32_t, PlacementHash> locks;

    Placement spawned{piece, Facing::Up, kSpawnX, kSpawnY};
    if (spawned.obstructed(board)) {
        spawned.y = static_cast<std::int8_t>(spawned.y + 1);
        if (spawned.obstructed(board)) {
            return {};
        }
    }

    auto update_position = [&](const Placement& target, std::uint32_t soft_drops) {
        auto it = values.find(target);
        if (it == values.end() || soft_drops < it->second) {
            values[target] = soft_drops;
            queue.push(Intermediate{target, soft_drops});
        }
    };
    update_position(spawned, 0);

    while (!queue.empty()) {
        auto expand = queue.top();
        queue.pop();
        auto it = values.find(expand.mv);
        if (it == values.end() || expand.soft_drops != it->second) {
            continue;
        }

        auto drop_dist = expand.mv.drop_distance(board);
        Placement dropped = expand.mv;
        dropped.y = static_cast<std::int8_t>(dropped.y - drop_dist);

        auto canonical = dropped.canonical_form();
        auto found = locks.find(canonical);
        if (found == locks.end() || expand.soft_drops < found->second) {
            locks[canonical] = expand.soft_drops;
        }

        update_position(dropped, expand.soft_drops + static_cast<std::uint32_t>(drop_dist));

        if (auto shifted = shift(expand.mv, board, -1)) {
            update_position(*shifted, expand.soft_drops);
        }
        if (auto shifted = shift(expand.mv, board, 1)) {
            update_position(*shifted, expand.soft_drops);
        }
        if (auto rotated = rotate(expand.mv, board, cw(expand.mv.facing), system)) {
            update_position(*rotated, expand.soft_drops);
        }
        if (auto rotated = rotate(expand.mv, board, ccw(expand.mv.facing), system)) {
            update_position(*rotated, expand.soft_drops);
        }
    }

    std::vector<std::pair<Placement, std::uint32_t>> result(locks.begin(), locks.end());
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        const auto& a = lhs.first;
        const auto& b = rhs.first;
        return std::make_tuple(lhs.second, a.y, a.x, a.facing) < std::make_tuple(rhs.second, b.y, b.x, b.facing);
    });
    return result;
}

}  // namespace pc_engine

#include "pc_engine/solver.hpp"

#include <algorithm>
#include <array>
#include <new>
#include <stdexcept>

#include "pc_engine/profiling.hpp"

namespace pc_engine {

namespace {

inline std::size_t hash_combine(std::size_t seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    return seed;
}

inline int popcount32(std::uint32_t v) {
#if defined(__GNUG__)
    return __builtin_popcount(v);
#else
    int count = 0;
    while (v) {
        v &= v - 1;
        ++count;
    }
    return count;
#endif
}

struct Candidate {
    Placement placement{};
    Board board{};
    int height{0};
    std::optional<PieceKind> hold;
    std::size_t next{0};
    double score{0.0};
};

}  // namespace

const char* solve_error_name(SolveError error) {
    switch (error) {
        case SolveError::InvalidHeight:
            return "InvalidHeight";
        case SolveError::NoPcExists:
            return "NoPcExists";
        case SolveError::SolutionTooLong:
            return "SolutionTooLong";
        case SolveError::NodeLimitReached:
            return "NodeLimitReached";
        case SolveError::OutOfMemory:
            return "OutOfMemory";
    }
    throw std::logic_error("unreachable solve error");
}

bool regions_fillable(const Board& board, int height) {
    std::array<bool, static_cast<std::size_t>(kBoardWidth * kMaxHeight)> visited{};
    std::vector<Cell> stack;
    stack.reserve(static_cast<std::size_t>(kBoardWidth * height));

    auto index = [](int x, int y) { return static_cast<std::size_t>(y * kBoardWidth + x); };

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < kBoardWidth; ++x) {
            if (visited[index(x, y)] || board.occupied(x, y)) {
                continue;
            }
            int region = 0;
            visited[index(x, y)] = true;
            stack.push_back({static_cast<std::int8_t>(x), static_cast<std::int8_t>(y)});
            while (!stack.empty()) {
                auto [cx, cy] = stack.back();
                stack.pop_back();
                ++region;
                for (auto [dx, dy] : {Cell{-1, 0}, Cell{1, 0}, Cell{0, -1}, Cell{0, 1}}) {
                    int nx = cx + dx;
                    int ny = cy + dy;
                    if (ny >= height || board.occupied(nx, ny) || visited[index(nx, ny)]) {
                        continue;
                    }
                    visited[index(nx, ny)] = true;
                    stack.push_back({static_cast<std::int8_t>(nx), static_cast<std::int8_t>(ny)});
                }
            }
            if (region % 4 != 0) {
                return false;
            }
        }
    }
    return true;
}

std::size_t PcSolver::SearchKeyHash::operator()(const SearchKey& key) const noexcept {
    std::size_t h = 1469598103934665603ull;
    for (auto row : key.board.rows) {
        h = hash_combine(h, row);
    }
    h = hash_combine(h, key.hold ? piece_index(*key.hold) + 1 : 0);
    h = hash_combine(h, key.next);
    h = hash_combine(h, static_cast<std::size_t>(key.height));
    return h;
}

PcSolver::PcSolver(const Model& model, SolverOptions options) : model_(model), options_(options) {}

SolveResult PcSolver::solve(const GameState& state, int min_height, std::size_t max_pieces) {
    PROFILE_FUNCTION();
    stats_ = Statistics{};
    if (min_height <= 0 || min_height > kMaxHeight) {
        return SolveError::InvalidHeight;
    }

    sequence_ = state.upcoming();
    rotation_system_ = state.rotation_system;

    const int filled = state.board.filled_cells();
    const int empty = kBoardWidth * state.board.stack_height() - filled;
    if (empty % 2 == 1) {
        return SolveError::NoPcExists;
    }

    // Every two extra rows take five more pieces.
    std::size_t pieces = static_cast<std::size_t>(empty % 4 == 2 ? (empty + 10) / 4 : empty / 4);
    if (pieces == 0) {
        pieces = 5;
    }

    try {
        for (; pieces <= max_pieces; pieces += 5) {
            int height = (4 * static_cast<int>(pieces) + filled) / kBoardWidth;
            if (height < min_height) {
                continue;
            }
            if (height > kMaxHeight) {
                break;
            }

            PROFILE_SCOPE("pc_height");
            ++stats_.heights_searched;
            pieces_needed_ = pieces;
            path_.clear();
            failed_.clear();
            switch (search(state.board, state.hold, 0, height, 0)) {
                case Search::Found:
                    return Solution{path_, height};
                case Search::NodeLimit:
                    return SolveError::NodeLimitReached;
                case Search::Exhausted:
                    break;
            }
        }
    } catch (const std::bad_alloc&) {
        failed_.clear();
        return SolveError::OutOfMemory;
    }

    return stats_.heights_searched > 0 ? SolveError::NoPcExists : SolveError::SolutionTooLong;
}

PcSolver::Search PcSolver::search(
    const Board& board, std::optional<PieceKind> hold, std::size_t next, int height, std::size_t placed) {
    if (placed == pieces_needed_) {
        return board.empty() ? Search::Found : Search::Exhausted;
    }
    std::size_t available = (sequence_.size() - next) + (hold ? 1 : 0);
    if (available < pieces_needed_ - placed) {
        return Search::Exhausted;
    }
    if (++stats_.nodes > options_.node_limit) {
        return Search::NodeLimit;
    }

    SearchKey key{board, hold, next, height};
    if (failed_.count(key) != 0) {
        return Search::Exhausted;
    }

    std::vector<Candidate> candidates;
    auto consider = [&](PieceKind piece, std::optional<PieceKind> next_hold, std::size_t next_index) {
        for (const auto& entry : find_moves(board, piece, rotation_system_)) {
            const auto& mv = entry.first;
            auto cells = mv.cells();
            bool fits = std::all_of(cells.begin(), cells.end(), [&](const Cell& c) { return c.second < height; });
            if (!fits) {
                continue;
            }
            Board after = board;
            after.place(mv);
            auto cleared = after.line_clears();
            after.remove_lines(cleared);
            int remaining = height - popcount32(cleared);
            if (!regions_fillable(after, remaining)) {
                continue;
            }
            candidates.push_back(
                Candidate{mv, after, remaining, next_hold, next_index, model_.score(after, remaining)});
        }
    };

    if (next < sequence_.size()) {
        PieceKind current = sequence_[next];
        consider(current, hold, next + 1);
        if (hold && *hold != current) {
            consider(*hold, current, next + 1);
        } else if (!hold && next + 1 < sequence_.size()) {
            consider(sequence_[next + 1], current, next + 2);
        }
    } else if (hold) {
        consider(*hold, std::nullopt, next);
    }
    ++stats_.expansions;

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& lhs, const Candidate& rhs) { return lhs.score > rhs.score; });

    for (const auto& candidate : candidates) {
        path_.push_back(candidate.placement);
        auto result = search(candidate.board, candidate.hold, candidate.next, candidate.height, placed + 1);
        if (result == Search::Found) {
            return result;
        }
        path_.pop_back();
        if (result == Search::NodeLimit) {
            return result;
        }
    }

    failed_.insert(std::move(key));
    return Search::Exhausted;
}

}  // namespace pc_engine

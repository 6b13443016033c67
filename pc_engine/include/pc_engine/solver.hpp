#pragma once

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <variant>
#include <vector>

#include "pc_engine/model.hpp"
#include "pc_engine/movegen.hpp"

namespace pc_engine {

struct SolverOptions {
    std::uint64_t node_limit{400'000};
};

struct Statistics {
    std::uint64_t nodes{0};
    std::uint64_t expansions{0};
    std::uint32_t heights_searched{0};
};

enum class SolveError {
    InvalidHeight,
    NoPcExists,
    SolutionTooLong,
    NodeLimitReached,
    OutOfMemory,
};

const char* solve_error_name(SolveError error);

struct Solution {
    // Each placement is relative to the board as it stands when that piece locks.
    std::vector<Placement> placements;
    int height{0};
};

using SolveResult = std::variant<Solution, SolveError>;

// Depth-first perfect-clear search over the known queue with hold. The model
// only decides the order in which candidate placements are tried.
class PcSolver {
public:
    explicit PcSolver(const Model& model, SolverOptions options = {});

    SolveResult solve(const GameState& state, int min_height, std::size_t max_pieces);
    const Statistics& stats() const { return stats_; }

private:
    enum class Search { Found, Exhausted, NodeLimit };

    struct SearchKey {
        Board board{};
        std::optional<PieceKind> hold;
        std::size_t next{0};
        int height{0};

        bool operator==(const SearchKey& rhs) const {
            return board == rhs.board && hold == rhs.hold && next == rhs.next && height == rhs.height;
        }
    };

    struct SearchKeyHash {
        std::size_t operator()(const SearchKey& key) const noexcept;
    };

    Search search(const Board& board, std::optional<PieceKind> hold, std::size_t next, int height,
                  std::size_t placed);

    const Model& model_;
    SolverOptions options_;
    Statistics stats_{};
    RotationSystem rotation_system_{RotationSystem::Srs};
    std::vector<PieceKind> sequence_;
    std::size_t pieces_needed_{0};
    std::vector<Placement> path_;
    std::unordered_set<SearchKey, SearchKeyHash> failed_;
};

// True when every empty region below `height` can be tiled by whole pieces by cell count.
bool regions_fillable(const Board& board, int height);

}  // namespace pc_engine

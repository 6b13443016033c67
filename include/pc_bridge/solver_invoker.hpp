#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "pc_bridge/result.hpp"
#include "pc_engine/model.hpp"
#include "pc_engine/solver.hpp"

namespace pc_bridge {

using ModelLoader = std::function<std::unique_ptr<pc_engine::Model>()>;

// Most placements a clear of `height` rows may use: one per queued piece,
// and never more than the cells of the target rows can absorb.
std::size_t placement_bound(std::size_t queue_length, std::uint32_t height);

// Loads the scoring model for one solve, runs the search and drops the
// model again before returning.
class SolverInvoker {
public:
    explicit SolverInvoker(ModelLoader loader = pc_engine::load_default_model,
                           pc_engine::SolverOptions options = {});

    Outcome<pc_engine::Solution> invoke(const pc_engine::GameState& state, std::uint32_t height,
                                        std::size_t max_pieces);

    const pc_engine::Statistics& last_stats() const { return last_stats_; }
    const pc_engine::SolverOptions& options() const { return options_; }

private:
    ModelLoader loader_;
    pc_engine::SolverOptions options_;
    pc_engine::Statistics last_stats_{};
};

}  // namespace pc_bridge

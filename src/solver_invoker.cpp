#include "pc_bridge/solver_invoker.hpp"

#include <algorithm>
#include <utility>

#include "pc_bridge/log.hpp"

using namespace pc_engine;

namespace pc_bridge {

std::size_t placement_bound(std::size_t queue_length, std::uint32_t height) {
    auto cells = static_cast<std::size_t>(height) * static_cast<std::size_t>(kBoardWidth);
    return std::min(queue_length, cells / 4);
}

SolverInvoker::SolverInvoker(ModelLoader loader, SolverOptions options)
    : loader_(std::move(loader)), options_(options) {}

Outcome<Solution> SolverInvoker::invoke(const GameState& state, std::uint32_t height, std::size_t max_pieces) {
    last_stats_ = Statistics{};

    std::unique_ptr<Model> model;
    try {
        model = loader_ ? loader_() : nullptr;
    } catch (const ModelLoadError& e) {
        PC_BRIDGE_LOG("model load failed: " << e.what());
        return ErrorKind::ModelUnavailable;
    }
    if (!model) {
        return ErrorKind::ModelUnavailable;
    }

    // Anything above the engine's ceiling is rejected by the solver as well.
    auto min_height = static_cast<int>(std::min<std::uint32_t>(height, kMaxHeight + 1));
    PcSolver solver(*model, options_);
    auto result = solver.solve(state, min_height, max_pieces);
    last_stats_ = solver.stats();
    PC_BRIDGE_LOG("solve height=" << height << " bound=" << max_pieces << " nodes=" << last_stats_.nodes);

    if (auto* error = std::get_if<SolveError>(&result)) {
        return from_solve_error(*error);
    }
    auto& solution = std::get<Solution>(result);
    if (solution.placements.empty()) {
        return ErrorKind::NoPcExists;
    }
    return std::move(solution);
}

}  // namespace pc_bridge

#include "pc_bridge/solver_context.hpp"

#include <new>
#include <string>
#include <utility>

#include "pc_bridge/field_decoder.hpp"
#include "pc_bridge/game_state_builder.hpp"
#include "pc_bridge/log.hpp"
#include "pc_bridge/placement_encoder.hpp"
#include "pc_bridge/queue_decoder.hpp"

using namespace pc_engine;

namespace pc_bridge {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

class SolverContext::CallGuard {
public:
    explicit CallGuard(bool& busy) : busy_(busy), acquired_(!busy) { busy_ = true; }
    ~CallGuard() {
        if (acquired_) {
            busy_ = false;
        }
    }

    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    bool& busy_;
    bool acquired_;
};

SolverContext::SolverContext(std::size_t output_capacity, ModelLoader loader, SolverOptions options)
    : output_(output_capacity), invoker_(std::move(loader), options) {
    output_.finish();
}

const char* SolverContext::busy_payload() {
    static const std::string payload = failure_json(ErrorKind::CallInProgress);
    return payload.c_str();
}

Outcome<Solution> SolverContext::solve(ByteView field, ByteView pieces, std::uint32_t height) {
    Board board;
    decode_field(field, height, board);
    auto queue = PieceQueue::decode(pieces);
    if (queue.empty()) {
        return ErrorKind::NoValidPieces;
    }
    auto state = build_game_state(board, queue);
    if (auto* error = std::get_if<ErrorKind>(&state)) {
        return *error;
    }
    return invoker_.invoke(std::get<GameState>(state), height, placement_bound(queue.size(), height));
}

const char* SolverContext::find_path(ByteView field, ByteView pieces, std::uint32_t height) {
    CallGuard guard(busy_);
    if (!guard.acquired()) {
        PC_BRIDGE_LOG("findPath called while a solve is running");
        return busy_payload();
    }

    try {
        auto outcome = solve(field, pieces, height);
        std::visit(Overloaded{
                       [&](const Solution& solution) { encode_solution(solution.placements, output_); },
                       [&](ErrorKind kind) { encode_failure(kind, output_); },
                   },
                   outcome);
    } catch (const std::bad_alloc&) {
        encode_failure(ErrorKind::OutOfMemory, output_);
    }
    return output_.data();
}

bool SolverContext::check_pc_possible(ByteView field, ByteView pieces, std::uint32_t height) {
    CallGuard guard(busy_);
    if (!guard.acquired()) {
        PC_BRIDGE_LOG("checkPCPossible called while a solve is running");
        return false;
    }

    try {
        auto outcome = solve(field, pieces, height);
        return std::holds_alternative<Solution>(outcome);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

}  // namespace pc_bridge

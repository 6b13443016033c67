#pragma once

#include <cstddef>
#include <cstdint>

#include "pc_bridge/byte_view.hpp"
#include "pc_bridge/result_buffer.hpp"
#include "pc_bridge/solver_invoker.hpp"

namespace pc_bridge {

// Owns the output buffer and runs the decode, build, solve and encode
// pipeline for the exported entry points. Calls are not reentrant: a call
// made while another is running gets the CallInProgress payload.
class SolverContext {
public:
    explicit SolverContext(std::size_t output_capacity = kOutputCapacity,
                           ModelLoader loader = pc_engine::load_default_model,
                           pc_engine::SolverOptions options = {});

    SolverContext(const SolverContext&) = delete;
    SolverContext& operator=(const SolverContext&) = delete;

    // Pointer stays valid until the next find_path on this context.
    const char* find_path(ByteView field, ByteView pieces, std::uint32_t height);
    bool check_pc_possible(ByteView field, ByteView pieces, std::uint32_t height);

    const ResultBuffer& output() const { return output_; }
    const pc_engine::Statistics& last_stats() const { return invoker_.last_stats(); }

    static const char* busy_payload();

private:
    class CallGuard;

    Outcome<pc_engine::Solution> solve(ByteView field, ByteView pieces, std::uint32_t height);

    ResultBuffer output_;
    SolverInvoker invoker_;
    bool busy_{false};
};

}  // namespace pc_bridge

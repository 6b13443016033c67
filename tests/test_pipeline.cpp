#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "nlohmann/json.hpp"
#include "pc_bridge/placement_encoder.hpp"
#include "pc_bridge/solver_context.hpp"
#include "pc_bridge/wasm_api.h"

using namespace pc_bridge;

namespace {

nlohmann::json run(SolverContext& context, const std::string& field, const std::string& pieces,
                   std::uint32_t height) {
    return nlohmann::json::parse(context.find_path(ByteView::of(field), ByteView::of(pieces), height));
}

std::string error_of(const nlohmann::json& j) {
    assert(!j.at("success").get<bool>());
    return j.at("error").get<std::string>();
}

}  // namespace

void test_single_line_clear() {
    SolverContext context;
    const char* out = context.find_path(ByteView::of("____XXXXXX"), ByteView::of("II"), 1);
    assert(std::string(out) ==
           R"({"success":true,"solutions":[{"patternSize":1,"placements":[{"piece":"I","rotate":"Spawn","x":1,"y":0}]}],"solutionCount":1})");
    assert(context.check_pc_possible(ByteView::of("____XXXXXX"), ByteView::of("II"), 1));
}

void test_vertical_i_from_hold() {
    SolverContext context;
    auto j = run(context, "_XXXXXXXXX_XXXXXXXXX_XXXXXXXXX_XXXXXXXXX", "IO", 4);
    assert(j.at("success").get<bool>());
    assert(j.at("solutionCount").get<int>() == 1);
    const auto& placements = j.at("solutions").at(0).at("placements");
    assert(placements.size() == 1);
    assert(placements.at(0) == nlohmann::json::parse(R"({"piece":"I","rotate":"Left","x":0,"y":1})"));
}

void test_two_line_o_clear() {
    SolverContext context;
    auto j = run(context, std::string(20, '_'), "OOOOO", 2);
    const auto& solution = j.at("solutions").at(0);
    assert(solution.at("patternSize").get<int>() == 5);
    std::set<int> columns;
    for (const auto& record : solution.at("placements")) {
        assert(record.at("piece").get<std::string>() == "O");
        assert(record.at("rotate").get<std::string>() == "Spawn");
        assert(record.at("y").get<int>() == 0);
        columns.insert(record.at("x").get<int>());
    }
    assert((columns == std::set<int>{0, 2, 4, 6, 8}));
}

void test_failures() {
    SolverContext context;
    assert(error_of(run(context, std::string(40, '_'), "LJOSZTI", 4)) == "SolutionTooLong");
    assert(error_of(run(context, std::string(20, '_'), "IIIII", 2)) == "NoPcExists");
    assert(error_of(run(context, "", "qwrxyk", 4)) == "NoValidPieces");
    assert(error_of(run(context, "", "QWERTY", 4)) == "InsufficientPieces");
    assert(error_of(run(context, "", "I", 4)) == "InsufficientPieces");
    assert(error_of(run(context, "", "IOTSZ", 0)) == "InvalidHeight");
    assert(error_of(run(context, "", "IOTSZ", 25)) == "InvalidHeight");
    assert(!context.check_pc_possible(ByteView::of(std::string(20, '_')), ByteView::of("IIIII"), 2));
}

void test_output_pointer_is_stable() {
    SolverContext context;
    const char* first = context.find_path(ByteView::of(""), ByteView::of("I"), 4);
    const char* second = context.find_path(ByteView::of("____XXXXXX"), ByteView::of("II"), 1);
    assert(first == second);
    assert(first == context.output().data());
}

void test_model_unavailable() {
    SolverContext failing(kOutputCapacity, [] () -> std::unique_ptr<pc_engine::Model> {
        throw pc_engine::ModelLoadError("missing");
    });
    assert(error_of(run(failing, "____XXXXXX", "II", 1)) == "ModelUnavailable");

    SolverContext empty(kOutputCapacity, [] { return std::unique_ptr<pc_engine::Model>(); });
    assert(error_of(run(empty, "____XXXXXX", "II", 1)) == "ModelUnavailable");
}

void test_node_limit() {
    SolverContext context(kOutputCapacity, pc_engine::load_default_model, pc_engine::SolverOptions{2});
    assert(error_of(run(context, std::string(20, '_'), "OOOOO", 2)) == "NodeLimitReached");
    assert(context.last_stats().nodes > 2);
}

void test_small_output_overflows() {
    SolverContext context(min_result_capacity());
    assert(error_of(run(context, std::string(20, '_'), "OOOOO", 2)) == "BufferOverflow");
}

void test_reentrant_call_rejected() {
    SolverContext* self = nullptr;
    std::string nested;
    bool nested_check = true;
    SolverContext context(kOutputCapacity, [&] {
        nested = self->find_path(ByteView::of("____XXXXXX"), ByteView::of("II"), 1);
        nested_check = self->check_pc_possible(ByteView::of("____XXXXXX"), ByteView::of("II"), 1);
        return pc_engine::load_default_model();
    });
    self = &context;

    auto j = run(context, "____XXXXXX", "II", 1);
    assert(j.at("success").get<bool>());
    assert(nested == R"({"success":false,"error":"CallInProgress"})");
    assert(nested == SolverContext::busy_payload());
    assert(!nested_check);
}

void test_c_api() {
    const std::string field = "____XXXXXX";
    const std::string pieces = "II";
    auto* field_block = alloc(static_cast<std::uint32_t>(field.size()));
    auto* pieces_block = alloc(static_cast<std::uint32_t>(pieces.size()));
    assert(field_block && pieces_block);
    std::memcpy(field_block, field.data(), field.size());
    std::memcpy(pieces_block, pieces.data(), pieces.size());

    const char* out = findPath(field_block, static_cast<std::uint32_t>(field.size()), pieces_block,
                               static_cast<std::uint32_t>(pieces.size()), 1);
    auto j = nlohmann::json::parse(out);
    assert(j.at("success").get<bool>());
    assert(getResultLength(out) == std::strlen(out));
    assert(checkPCPossible(field_block, static_cast<std::uint32_t>(field.size()), pieces_block,
                           static_cast<std::uint32_t>(pieces.size()), 1) == 1);

    // A declared length past the block is clamped to it.
    out = findPath(field_block, 1000, pieces_block, 1000, 1);
    assert(nlohmann::json::parse(out).at("success").get<bool>());

    dealloc(field_block, static_cast<std::uint32_t>(field.size()));
    dealloc(pieces_block, static_cast<std::uint32_t>(pieces.size()));
    dealloc(pieces_block, static_cast<std::uint32_t>(pieces.size()));

    out = findPath(nullptr, 0, nullptr, 0, 4);
    assert(error_of(nlohmann::json::parse(out)) == "NoValidPieces");
    assert(getResultLength(out) == std::strlen(out));
}

int main() {
    test_single_line_clear();
    test_vertical_i_from_hold();
    test_two_line_o_clear();
    test_failures();
    test_output_pointer_is_stable();
    test_model_unavailable();
    test_node_limit();
    test_small_output_overflows();
    test_reentrant_call_rejected();
    test_c_api();
    std::cout << "All tests passed\n";
    return 0;
}

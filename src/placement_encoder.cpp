#include "pc_bridge/placement_encoder.hpp"

#include <algorithm>

#include "nlohmann/json.hpp"
#include "pc_bridge/coordinate_transform.hpp"

using namespace pc_engine;

namespace pc_bridge {

WireRecord to_wire_record(const Placement& placement) {
    auto offset = rotation_center_offset(placement.piece, placement.facing);
    WireRecord record;
    record.piece = piece_char(placement.piece);
    record.rotate = external_rotation_name(placement.facing);
    record.x = placement.x + offset.dx;
    record.y = placement.y + offset.dy;
    return record;
}

std::string record_json(const WireRecord& record) {
    nlohmann::ordered_json j;
    j["piece"] = std::string(1, record.piece);
    j["rotate"] = std::string(record.rotate);
    j["x"] = record.x;
    j["y"] = record.y;
    return j.dump();
}

std::string failure_json(ErrorKind kind) {
    nlohmann::ordered_json j;
    j["success"] = false;
    j["error"] = error_name(kind);
    return j.dump();
}

std::size_t min_result_capacity() {
    std::size_t longest = 0;
    for (auto kind : kAllErrorKinds) {
        longest = std::max(longest, failure_json(kind).size());
    }
    return longest + 1;
}

bool encode_solution(const std::vector<Placement>& placements, ResultBuffer& out) {
    out.reset();
    out.append(R"({"success":true,"solutions":[{"patternSize":)");
    out.append(std::to_string(placements.size()));
    out.append(R"(,"placements":[)");
    for (std::size_t i = 0; i < placements.size(); ++i) {
        if (i > 0) {
            out.append(",");
        }
        out.append(record_json(to_wire_record(placements[i])));
    }
    out.append(R"(]}],"solutionCount":1})");
    out.finish();
    return !out.overflowed();
}

void encode_failure(ErrorKind kind, ResultBuffer& out) {
    out.reset();
    out.append(failure_json(kind));
    out.finish();
}

}  // namespace pc_bridge

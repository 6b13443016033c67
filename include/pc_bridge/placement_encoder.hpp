#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "pc_bridge/result.hpp"
#include "pc_bridge/result_buffer.hpp"
#include "pc_engine/types.hpp"

namespace pc_bridge {

// One placement as sfinder reports it.
struct WireRecord {
    char piece{'I'};
    std::string_view rotate;
    int x{0};
    int y{0};

    bool operator==(const WireRecord& rhs) const {
        return piece == rhs.piece && rotate == rhs.rotate && x == rhs.x && y == rhs.y;
    }
};

WireRecord to_wire_record(const pc_engine::Placement& placement);

std::string record_json(const WireRecord& record);
std::string failure_json(ErrorKind kind);

// Smallest buffer able to hold every failure payload.
std::size_t min_result_capacity();

// Both write a complete, NUL-terminated payload into `out`. encode_solution
// returns false when the solution did not fit and the overflow payload was
// written instead.
bool encode_solution(const std::vector<pc_engine::Placement>& placements, ResultBuffer& out);
void encode_failure(ErrorKind kind, ResultBuffer& out);

}  // namespace pc_bridge

#pragma once

#include <array>
#include <variant>

#include "pc_engine/solver.hpp"

namespace pc_bridge {

// Every failure the boundary can report. The wire name of each kind is its
// enumerator name.
enum class ErrorKind {
    NoValidPieces,
    InsufficientPieces,
    ModelUnavailable,
    InvalidHeight,
    NoPcExists,
    SolutionTooLong,
    NodeLimitReached,
    OutOfMemory,
    BufferOverflow,
    CallInProgress,
};

inline constexpr std::array<ErrorKind, 10> kAllErrorKinds{
    ErrorKind::NoValidPieces,   ErrorKind::InsufficientPieces, ErrorKind::ModelUnavailable,
    ErrorKind::InvalidHeight,   ErrorKind::NoPcExists,         ErrorKind::SolutionTooLong,
    ErrorKind::NodeLimitReached, ErrorKind::OutOfMemory,       ErrorKind::BufferOverflow,
    ErrorKind::CallInProgress,
};

const char* error_name(ErrorKind kind);
ErrorKind from_solve_error(pc_engine::SolveError error);

template <typename T>
using Outcome = std::variant<T, ErrorKind>;

}  // namespace pc_bridge

#include "pc_bridge/result.hpp"

#include <stdexcept>

namespace pc_bridge {

const char* error_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoValidPieces:
            return "NoValidPieces";
        case ErrorKind::InsufficientPieces:
            return "InsufficientPieces";
        case ErrorKind::ModelUnavailable:
            return "ModelUnavailable";
        case ErrorKind::InvalidHeight:
            return "InvalidHeight";
        case ErrorKind::NoPcExists:
            return "NoPcExists";
        case ErrorKind::SolutionTooLong:
            return "SolutionTooLong";
        case ErrorKind::NodeLimitReached:
            return "NodeLimitReached";
        case ErrorKind::OutOfMemory:
            return "OutOfMemory";
        case ErrorKind::BufferOverflow:
            return "BufferOverflow";
        case ErrorKind::CallInProgress:
            return "CallInProgress";
    }
    throw std::logic_error("unreachable error kind");
}

ErrorKind from_solve_error(pc_engine::SolveError error) {
    switch (error) {
        case pc_engine::SolveError::InvalidHeight:
            return ErrorKind::InvalidHeight;
        case pc_engine::SolveError::NoPcExists:
            return ErrorKind::NoPcExists;
        case pc_engine::SolveError::SolutionTooLong:
            return ErrorKind::SolutionTooLong;
        case pc_engine::SolveError::NodeLimitReached:
            return ErrorKind::NodeLimitReached;
        case pc_engine::SolveError::OutOfMemory:
            return ErrorKind::OutOfMemory;
    }
    throw std::logic_error("unreachable solve error");
}

}  // namespace pc_bridge

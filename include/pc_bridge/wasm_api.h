#pragma once

#include <cstdint>

// Exported entry points of the solver module. Inputs are staged in blocks
// obtained from alloc; results are NUL-terminated JSON owned by the module.
extern "C" {

const char* findPath(const std::uint8_t* field, std::uint32_t field_len, const std::uint8_t* pieces,
                     std::uint32_t pieces_len, std::uint32_t height);

std::uint32_t checkPCPossible(const std::uint8_t* field, std::uint32_t field_len, const std::uint8_t* pieces,
                              std::uint32_t pieces_len, std::uint32_t height);

std::uint32_t getResultLength(const char* result);

std::uint8_t* alloc(std::uint32_t len);
void dealloc(std::uint8_t* ptr, std::uint32_t len);

}  // extern "C"

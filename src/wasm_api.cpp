#include "pc_bridge/wasm_api.h"

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#else
#define EMSCRIPTEN_KEEPALIVE
#endif

#include "pc_bridge/log.hpp"
#include "pc_bridge/memory_arena.hpp"
#include "pc_bridge/solver_context.hpp"

namespace {

pc_bridge::SolverContext& context() {
    static pc_bridge::SolverContext instance;
    return instance;
}

pc_bridge::MemoryArena& arena() {
    static pc_bridge::MemoryArena instance;
    return instance;
}

}  // namespace

extern "C" {

EMSCRIPTEN_KEEPALIVE const char* findPath(const std::uint8_t* field, std::uint32_t field_len,
                                          const std::uint8_t* pieces, std::uint32_t pieces_len,
                                          std::uint32_t height) {
    return context().find_path(arena().view(field, field_len), arena().view(pieces, pieces_len), height);
}

EMSCRIPTEN_KEEPALIVE std::uint32_t checkPCPossible(const std::uint8_t* field, std::uint32_t field_len,
                                                   const std::uint8_t* pieces, std::uint32_t pieces_len,
                                                   std::uint32_t height) {
    return context().check_pc_possible(arena().view(field, field_len), arena().view(pieces, pieces_len), height)
               ? 1
               : 0;
}

EMSCRIPTEN_KEEPALIVE std::uint32_t getResultLength(const char* result) {
    return static_cast<std::uint32_t>(pc_bridge::ResultBuffer::bounded_length(result, context().output().capacity()));
}

EMSCRIPTEN_KEEPALIVE std::uint8_t* alloc(std::uint32_t len) { return arena().allocate(len); }

EMSCRIPTEN_KEEPALIVE void dealloc(std::uint8_t* ptr, std::uint32_t len) {
    if (!arena().release(ptr, len)) {
        PC_BRIDGE_LOG("dealloc ignored for " << static_cast<const void*>(ptr));
    }
}

}  // extern "C"

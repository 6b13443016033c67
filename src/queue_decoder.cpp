#include "pc_bridge/queue_decoder.hpp"

#include "pc_bridge/log.hpp"

namespace pc_bridge {

PieceQueue PieceQueue::decode(ByteView text) {
    PieceQueue queue;
    for (auto byte : text) {
        auto piece = pc_engine::piece_from_char(static_cast<char>(byte));
        if (!piece) {
            continue;
        }
        if (queue.size_ == kQueueCapacity) {
            PC_BRIDGE_LOG("queue truncated at " << kQueueCapacity << " pieces");
            break;
        }
        queue.pieces_[queue.size_++] = *piece;
    }
    return queue;
}

}  // namespace pc_bridge

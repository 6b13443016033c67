#include "pc_bridge/result_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

#include "pc_bridge/log.hpp"
#include "pc_bridge/placement_encoder.hpp"

namespace pc_bridge {

ResultBuffer::ResultBuffer(std::size_t capacity) {
    auto minimum = min_result_capacity();
    if (capacity < minimum) {
        throw std::invalid_argument("result buffer needs at least " + std::to_string(minimum) + " bytes");
    }
    storage_.assign(capacity, '\0');
}

void ResultBuffer::reset() {
    size_ = 0;
    overflowed_ = false;
    storage_[0] = '\0';
}

bool ResultBuffer::append(std::string_view chunk) {
    if (overflowed_) {
        return false;
    }
    // One byte stays reserved for the terminator.
    if (chunk.size() > storage_.size() - 1 - size_) {
        overflowed_ = true;
        return false;
    }
    std::memcpy(storage_.data() + size_, chunk.data(), chunk.size());
    size_ += chunk.size();
    return true;
}

const char* ResultBuffer::finish() {
    if (overflowed_) {
        PC_BRIDGE_LOG("payload exceeded " << storage_.size() << " bytes");
        auto payload = failure_json(ErrorKind::BufferOverflow);
        std::memcpy(storage_.data(), payload.data(), payload.size());
        size_ = payload.size();
    }
    storage_[size_] = '\0';
    return storage_.data();
}

std::size_t ResultBuffer::bounded_length(const char* text, std::size_t capacity) {
    if (text == nullptr) {
        return 0;
    }
    const char* end = std::find(text, text + capacity, '\0');
    return static_cast<std::size_t>(end - text);
}

}  // namespace pc_bridge

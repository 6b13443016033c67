#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace pc_bridge {

inline constexpr std::size_t kOutputCapacity = 8192;

// Fixed-capacity, NUL-terminated output area. Writes that would not fit
// leave the buffer marked as overflowed; finish() then swaps in the
// BufferOverflow failure payload so the host always reads valid JSON.
class ResultBuffer {
public:
    explicit ResultBuffer(std::size_t capacity = kOutputCapacity);

    void reset();
    bool append(std::string_view chunk);
    const char* finish();

    const char* data() const { return storage_.data(); }
    std::size_t size() const { return size_; }
    std::size_t capacity() const { return storage_.size(); }
    bool overflowed() const { return overflowed_; }

    // Length of a NUL-terminated string, scanning at most `capacity` bytes.
    static std::size_t bounded_length(const char* text, std::size_t capacity);

private:
    std::vector<char> storage_;
    std::size_t size_{0};
    bool overflowed_{false};
};

}  // namespace pc_bridge

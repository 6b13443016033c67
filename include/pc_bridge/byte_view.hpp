#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace pc_bridge {

// Read-only view of host-supplied bytes. A null pointer is an empty view
// whatever length was declared.
class ByteView {
public:
    ByteView() = default;
    ByteView(const std::uint8_t* data, std::size_t size)
        : data_(data), size_(data == nullptr ? 0 : size) {}

    static ByteView of(std::string_view text) {
        return ByteView(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    const std::uint8_t* data() const { return data_; }
    const std::uint8_t* begin() const { return data_; }
    const std::uint8_t* end() const { return data_ + size_; }

    std::uint8_t at(std::size_t index) const {
        if (index >= size_) {
            throw std::out_of_range("ByteView index out of range");
        }
        return data_[index];
    }

    ByteView first(std::size_t count) const { return ByteView(data_, std::min(count, size_)); }

private:
    const std::uint8_t* data_{nullptr};
    std::size_t size_{0};
};

}  // namespace pc_bridge

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audiocache {

using Bytes = std::vector<std::uint8_t>;

// Read-only view over audio bytes, in the spirit of std::span<const std::uint8_t>
// (which C++17 does not have). The viewed buffer must outlive the view.
class bytes_view {
public:
    bytes_view() : data_(nullptr), size_(0) {}
    bytes_view(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    bytes_view(const Bytes& vec) : data_(vec.data()), size_(vec.size()) {}
    bytes_view(const std::string& str)
        : data_(reinterpret_cast<const std::uint8_t*>(str.data())), size_(str.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const std::uint8_t* begin() const { return data_; }
    const std::uint8_t* end() const { return data_ + size_; }

    Bytes to_bytes() const { return Bytes(begin(), end()); }

private:
    const std::uint8_t* data_;
    std::size_t size_;
};

inline Bytes ToBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

inline std::string ToString(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace audiocache

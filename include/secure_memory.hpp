#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <sodium.h>

namespace hc {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

template <std::size_t N>
inline void secureZero(std::array<std::uint8_t, N>& bytes) {
    secureZero(bytes.data(), bytes.size());
}

// Move-only byte buffer that wipes its contents on destruction. Holds signing
// key material.
class SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(std::size_t count) : buffer_(count) {}

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : buffer_(std::move(other.buffer_)) {
        other.buffer_.clear();
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            buffer_ = std::move(other.buffer_);
            other.buffer_.clear();
        }
        return *this;
    }

    ~SecureBytes() { wipe(); }

    std::size_t size() const { return buffer_.size(); }
    bool empty() const { return buffer_.empty(); }

    unsigned char* data() { return buffer_.data(); }
    const unsigned char* data() const { return buffer_.data(); }

private:
    void wipe() {
        if (!buffer_.empty()) {
            hc::secureZero(buffer_.data(), buffer_.size());
        }
    }

    std::vector<unsigned char> buffer_;
};

} // namespace hc

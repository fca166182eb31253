#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <sodium.h>

namespace pm {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Fixed-size secret buffer that is wiped when destroyed or moved from.
template <std::size_t N>
class SecureBytes {
public:
    SecureBytes() { bytes_.fill(0); }

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept : bytes_(other.bytes_) {
        other.wipe();
    }

    SecureBytes& operator=(SecureBytes&& other) noexcept {
        if (this != &other) {
            bytes_ = other.bytes_;
            other.wipe();
        }
        return *this;
    }

    ~SecureBytes() { wipe(); }

    static constexpr std::size_t size() { return N; }
    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe() { secureZero(bytes_.data(), bytes_.size()); }

    std::array<unsigned char, N> bytes_;
};

} // namespace pm

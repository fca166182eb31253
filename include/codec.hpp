#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace pm {

// Little-endian writer for account records and instruction messages.
class ByteWriter {
public:
    void putU8(std::uint8_t v) { out_.push_back(v); }
    void putU16(std::uint16_t v) { putLe(v, 2); }
    void putU32(std::uint32_t v) { putLe(v, 4); }
    void putU64(std::uint64_t v) { putLe(v, 8); }
    void putI64(std::int64_t v) { putLe(static_cast<std::uint64_t>(v), 8); }
    void putBool(bool v) { putU8(v ? 1 : 0); }
    void putKey(const Pubkey& key) { out_.insert(out_.end(), key.begin(), key.end()); }
    void putRaw(const std::uint8_t* data, std::size_t len) { out_.insert(out_.end(), data, data + len); }
    void putString(const std::string& s) {
        putU32(static_cast<std::uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }
    void padTo(std::size_t size) {
        if (out_.size() < size) {
            out_.resize(size, 0);
        }
    }

    Bytes take() { return std::move(out_); }

private:
    void putLe(std::uint64_t v, int width) {
        for (int i = 0; i < width; ++i) {
            out_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    Bytes out_;
};

// Bounds-checked reader; any malformed input raises the error code supplied
// at construction.
class ByteReader {
public:
    ByteReader(const Bytes& in, ErrorCode onError) : in_(in), onError_(onError) {}

    std::uint8_t getU8() {
        require(1);
        return in_[pos_++];
    }
    std::uint16_t getU16() { return static_cast<std::uint16_t>(getLe(2)); }
    std::uint32_t getU32() { return static_cast<std::uint32_t>(getLe(4)); }
    std::uint64_t getU64() { return getLe(8); }
    std::int64_t getI64() { return static_cast<std::int64_t>(getLe(8)); }
    bool getBool() {
        std::uint8_t v = getU8();
        if (v > 1) {
            fail("boolean flag out of range");
        }
        return v == 1;
    }
    Pubkey getKey() {
        require(kPubkeyBytes);
        Pubkey key{};
        for (std::size_t i = 0; i < kPubkeyBytes; ++i) {
            key[i] = in_[pos_ + i];
        }
        pos_ += kPubkeyBytes;
        return key;
    }
    std::string getString(std::size_t maxLen) {
        std::uint32_t len = getU32();
        if (len > maxLen) {
            fail("string length exceeds bound");
        }
        require(len);
        std::string s(in_.begin() + static_cast<std::ptrdiff_t>(pos_),
                      in_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return s;
    }
    void expectEnd() const {
        if (pos_ != in_.size()) {
            fail("trailing bytes");
        }
    }

    [[noreturn]] void fail(const std::string& why) const { throw ProgramError(onError_, why); }

private:
    void require(std::size_t n) const {
        if (in_.size() - pos_ < n) {
            fail("truncated input");
        }
    }
    std::uint64_t getLe(int width) {
        require(static_cast<std::size_t>(width));
        std::uint64_t v = 0;
        for (int i = 0; i < width; ++i) {
            v |= static_cast<std::uint64_t>(in_[pos_ + static_cast<std::size_t>(i)]) << (8 * i);
        }
        pos_ += static_cast<std::size_t>(width);
        return v;
    }

    const Bytes& in_;
    ErrorCode onError_;
    std::size_t pos_ = 0;
};

} // namespace pm

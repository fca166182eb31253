#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pm {

std::string toHex(const std::uint8_t* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string toHex(const Pubkey& key) {
    return toHex(key.data(), key.size());
}

std::string toHex(const Bytes& bytes) {
    return toHex(bytes.data(), bytes.size());
}

Bytes hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

Pubkey pubkeyFromHex(const std::string& hex) {
    Bytes raw = hexToBytes(hex);
    if (raw.size() != kPubkeyBytes) {
        throw std::invalid_argument("public key must be 32 bytes (64 hex characters)");
    }
    Pubkey key{};
    std::copy(raw.begin(), raw.end(), key.begin());
    return key;
}

std::string shortKey(const Pubkey& key) {
    std::string hex = toHex(key);
    return hex.substr(0, 4) + ".." + hex.substr(hex.size() - 4);
}

} // namespace pm

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pm {

using Pubkey = std::array<std::uint8_t, 32>;
using Hash = std::array<std::uint8_t, 32>;
using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t kPubkeyBytes = 32;

std::string toHex(const std::uint8_t* data, std::size_t len);
std::string toHex(const Pubkey& key);
std::string toHex(const Bytes& bytes);

Bytes hexToBytes(const std::string& hex);
Pubkey pubkeyFromHex(const std::string& hex);

// First and last four hex digits, for log lines.
std::string shortKey(const Pubkey& key);

} // namespace pm

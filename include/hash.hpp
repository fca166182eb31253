#pragma once

#include "types.hpp"

#include <string>

namespace pm {

Hash sha256(const Bytes& data);
Hash sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

// Content hash binding a market address to its exact question text.
Hash hashQuestion(const std::string& question);

} // namespace pm

#include "hash.hpp"

#include "picosha2.h"

namespace pm {

Hash sha256(const Bytes& data) {
    Hash out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

Hash sha256(const std::string& data) {
    Hash out{};
    picosha2::hash256(data.begin(), data.end(), out.begin(), out.end());
    return out;
}

std::string sha256Hex(const std::string& data) {
    Hash digest = sha256(data);
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

Hash hashQuestion(const std::string& question) {
    return sha256(question);
}

} // namespace pm

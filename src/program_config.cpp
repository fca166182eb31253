#include "program_config.hpp"

#include "records.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace pm {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint16_t parseBasisPoints(const std::string& raw) {
    std::size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(raw, &consumed, 10);
    } catch (const std::exception& ex) {
        throw std::invalid_argument("PM_FEE_BASIS_POINTS must be an unsigned integer: " + std::string(ex.what()));
    }
    if (consumed != raw.size()) {
        throw std::invalid_argument("PM_FEE_BASIS_POINTS must be an unsigned integer");
    }
    if (value > Market::kBasisPointsDenominator) {
        throw std::invalid_argument("PM_FEE_BASIS_POINTS cannot exceed 10000");
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

ProgramConfig ProgramConfig::fromEnvironment() {
    ProgramConfig cfg;
    if (const char* env = std::getenv("PM_FEE_BASIS_POINTS")) {
        std::string value = trim(env);
        if (!value.empty()) {
            cfg.defaultFeeBasisPoints = parseBasisPoints(value);
        }
    }
    if (const char* env = std::getenv("PM_PROGRAM_LABEL")) {
        std::string value = trim(env);
        if (!value.empty()) {
            cfg.programLabel = value;
        }
    }
    cfg.validate();
    return cfg;
}

void ProgramConfig::validate() const {
    if (defaultFeeBasisPoints > Market::kBasisPointsDenominator) {
        std::ostringstream oss;
        oss << "Fee of " << defaultFeeBasisPoints << " basis points exceeds "
            << Market::kBasisPointsDenominator;
        throw std::invalid_argument(oss.str());
    }
    if (programLabel.empty()) {
        throw std::invalid_argument("Program label must not be empty");
    }
}

} // namespace pm

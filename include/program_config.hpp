#pragma once

#include <cstdint>
#include <string>

namespace pm {

struct ProgramConfig {
    std::uint16_t defaultFeeBasisPoints = 100;
    std::string programLabel = "prediction-market";

    // Applies PM_FEE_BASIS_POINTS and PM_PROGRAM_LABEL when set.
    static ProgramConfig fromEnvironment();
    // Throws std::invalid_argument on an unusable configuration.
    void validate() const;
};

} // namespace pm

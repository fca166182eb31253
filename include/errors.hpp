#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pm {

// Stable program error codes. Values are part of the external interface and
// must never be renumbered.
enum class ErrorCode : std::uint32_t {
    InvalidEndTime = 6000,
    AlreadyResolved = 6001,
    BettingPeriodEnded = 6002,
    BettingPeriodNotEnded = 6003,
    InvalidAmount = 6004,
    UnauthorizedResolution = 6005,
    MarketNotResolved = 6006,
    NotAWinner = 6007,
    AlreadyClaimed = 6008,
    MathOverflow = 6009,
    InvalidBettor = 6010,
    AlreadyExists = 6011,
    InsufficientPoolBalance = 6012,
    QuestionTooLong = 6013,
    QuestionHashMismatch = 6014,
    AccountNotFound = 6015,
    MissingSignature = 6016,
    InvalidSignature = 6017,
    UnauthorizedEscrowAccess = 6018,
    InsufficientFunds = 6019,
    InvalidAccountData = 6020,
    InvalidInstruction = 6021,
    InvalidSeeds = 6022,
};

const char* errorCodeName(ErrorCode code);
const char* errorCodeMessage(ErrorCode code);

class ProgramError : public std::runtime_error {
public:
    explicit ProgramError(ErrorCode code);
    ProgramError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace pm

#include "errors.hpp"

#include <sstream>

namespace pm {

namespace {

std::string formatError(ErrorCode code, const std::string& detail) {
    std::ostringstream oss;
    oss << errorCodeName(code) << " (" << static_cast<std::uint32_t>(code)
        << "): " << errorCodeMessage(code);
    if (!detail.empty()) {
        oss << " [" << detail << "]";
    }
    return oss.str();
}

} // namespace

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidEndTime: return "InvalidEndTime";
    case ErrorCode::AlreadyResolved: return "AlreadyResolved";
    case ErrorCode::BettingPeriodEnded: return "BettingPeriodEnded";
    case ErrorCode::BettingPeriodNotEnded: return "BettingPeriodNotEnded";
    case ErrorCode::InvalidAmount: return "InvalidAmount";
    case ErrorCode::UnauthorizedResolution: return "UnauthorizedResolution";
    case ErrorCode::MarketNotResolved: return "MarketNotResolved";
    case ErrorCode::NotAWinner: return "NotAWinner";
    case ErrorCode::AlreadyClaimed: return "AlreadyClaimed";
    case ErrorCode::MathOverflow: return "MathOverflow";
    case ErrorCode::InvalidBettor: return "InvalidBettor";
    case ErrorCode::AlreadyExists: return "AlreadyExists";
    case ErrorCode::InsufficientPoolBalance: return "InsufficientPoolBalance";
    case ErrorCode::QuestionTooLong: return "QuestionTooLong";
    case ErrorCode::QuestionHashMismatch: return "QuestionHashMismatch";
    case ErrorCode::AccountNotFound: return "AccountNotFound";
    case ErrorCode::MissingSignature: return "MissingSignature";
    case ErrorCode::InvalidSignature: return "InvalidSignature";
    case ErrorCode::UnauthorizedEscrowAccess: return "UnauthorizedEscrowAccess";
    case ErrorCode::InsufficientFunds: return "InsufficientFunds";
    case ErrorCode::InvalidAccountData: return "InvalidAccountData";
    case ErrorCode::InvalidInstruction: return "InvalidInstruction";
    case ErrorCode::InvalidSeeds: return "InvalidSeeds";
    }
    return "Unknown";
}

const char* errorCodeMessage(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidEndTime: return "Invalid end time - must be in the future";
    case ErrorCode::AlreadyResolved: return "Market has already been resolved";
    case ErrorCode::BettingPeriodEnded: return "Betting period has ended";
    case ErrorCode::BettingPeriodNotEnded: return "Betting period has not ended yet";
    case ErrorCode::InvalidAmount: return "Invalid bet amount";
    case ErrorCode::UnauthorizedResolution: return "Unauthorized to resolve market";
    case ErrorCode::MarketNotResolved: return "Market has not been resolved yet";
    case ErrorCode::NotAWinner: return "Bettor is not a winner";
    case ErrorCode::AlreadyClaimed: return "Winnings have already been claimed";
    case ErrorCode::MathOverflow: return "Math overflow";
    case ErrorCode::InvalidBettor: return "Invalid bettor";
    case ErrorCode::AlreadyExists: return "Account already exists";
    case ErrorCode::InsufficientPoolBalance: return "Escrow pool cannot cover the payout";
    case ErrorCode::QuestionTooLong: return "Question exceeds the maximum length";
    case ErrorCode::QuestionHashMismatch: return "Question hash does not match the question text";
    case ErrorCode::AccountNotFound: return "Account does not exist";
    case ErrorCode::MissingSignature: return "Required signature is missing";
    case ErrorCode::InvalidSignature: return "Signature verification failed";
    case ErrorCode::UnauthorizedEscrowAccess: return "Escrow account is not owned by the invoking program";
    case ErrorCode::InsufficientFunds: return "Payer balance is insufficient";
    case ErrorCode::InvalidAccountData: return "Account data is malformed";
    case ErrorCode::InvalidInstruction: return "Instruction data is malformed";
    case ErrorCode::InvalidSeeds: return "Seeds do not produce a valid program address";
    }
    return "Unknown error";
}

ProgramError::ProgramError(ErrorCode code)
    : std::runtime_error(formatError(code, {}))
    , code_(code) {}

ProgramError::ProgramError(ErrorCode code, const std::string& detail)
    : std::runtime_error(formatError(code, detail))
    , code_(code) {}

} // namespace pm

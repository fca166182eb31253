#include "program.hpp"

#include "address.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include "escrow.hpp"
#include "hash.hpp"
#include "payout.hpp"
#include "record_store.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

namespace pm {

PredictionMarketProgram::PredictionMarketProgram(ProgramConfig cfg)
    : config_(std::move(cfg)) {
    config_.validate();
    programId_ = programIdFromLabel(config_.programLabel);
}

void PredictionMarketProgram::processInstruction(InvokeContext& ctx, const Bytes& instruction) {
    Instruction ix = decodeInstruction(instruction);
    ctx.log(std::string("Instruction: ") + instructionName(ix));
    std::visit(
        [this, &ctx](const auto& args) {
            using T = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<T, CreateMarketArgs>) {
                createMarket(ctx, args);
            } else if constexpr (std::is_same_v<T, PlaceBetArgs>) {
                placeBet(ctx, args);
            } else if constexpr (std::is_same_v<T, ResolveMarketArgs>) {
                resolveMarket(ctx, args);
            } else {
                claimWinnings(ctx, args);
            }
        },
        ix);
}

void PredictionMarketProgram::createMarket(InvokeContext& ctx, const CreateMarketArgs& args) {
    ctx.requireSigner(args.creator);

    if (args.question.size() > Market::kMaxQuestionLength) {
        throw ProgramError(ErrorCode::QuestionTooLong);
    }
    if (hashQuestion(args.question) != args.questionHash) {
        throw ProgramError(ErrorCode::QuestionHashMismatch);
    }
    if (args.endTime <= ctx.now()) {
        throw ProgramError(ErrorCode::InvalidEndTime);
    }

    MarketStore markets(ctx);
    DerivedAddress address = markets.addressFor(args.creator, args.questionHash);
    if (markets.exists(address.address)) {
        throw ProgramError(ErrorCode::AlreadyExists, "market for this question already exists");
    }

    Market market;
    market.creator = args.creator;
    market.resolutionAuthority = args.resolutionAuthority.value_or(args.creator);
    market.question = args.question;
    market.questionHash = args.questionHash;
    market.endTime = args.endTime;
    market.outcome = Outcome::Unset;
    market.feeBasisPoints = config_.defaultFeeBasisPoints;
    market.bump = address.bump;
    markets.create(address.address, market);

    ctx.log("Market initialized: " + market.question);
}

void PredictionMarketProgram::placeBet(InvokeContext& ctx, const PlaceBetArgs& args) {
    ctx.requireSigner(args.bettor);

    MarketStore markets(ctx);
    Market market = markets.load(args.market);
    if (market.resolved()) {
        throw ProgramError(ErrorCode::AlreadyResolved);
    }
    if (ctx.now() >= market.endTime) {
        throw ProgramError(ErrorCode::BettingPeriodEnded);
    }
    if (args.amount == 0) {
        throw ProgramError(ErrorCode::InvalidAmount);
    }

    BetStore bets(ctx);
    DerivedAddress betAddress = bets.addressFor(args.market, args.bettor);
    if (bets.exists(betAddress.address)) {
        throw ProgramError(ErrorCode::AlreadyExists, "bettor already has a wager on this market");
    }

    if (args.outcome) {
        market.totalYesAmount = checkedAdd(market.totalYesAmount, args.amount);
    } else {
        market.totalNoAmount = checkedAdd(market.totalNoAmount, args.amount);
    }

    EscrowGateway(ctx).deposit(args.bettor, args.market, args.amount);

    Bet bet;
    bet.bettor = args.bettor;
    bet.market = args.market;
    bet.amount = args.amount;
    bet.outcomeChosen = args.outcome;
    bet.claimed = false;
    bet.bump = betAddress.bump;
    bets.create(betAddress.address, bet);
    markets.save(args.market, market);

    std::ostringstream oss;
    oss << "Bet placed: " << args.amount << " on " << (args.outcome ? "Yes" : "No");
    ctx.log(oss.str());
}

void PredictionMarketProgram::resolveMarket(InvokeContext& ctx, const ResolveMarketArgs& args) {
    ctx.requireSigner(args.authority);

    MarketStore markets(ctx);
    Market market = markets.load(args.market);
    if (args.authority != market.resolutionAuthority) {
        throw ProgramError(ErrorCode::UnauthorizedResolution);
    }
    if (market.resolved()) {
        throw ProgramError(ErrorCode::AlreadyResolved);
    }
    if (ctx.now() < market.endTime) {
        throw ProgramError(ErrorCode::BettingPeriodNotEnded);
    }

    market.outcome = outcomeFromBool(args.outcome);
    markets.save(args.market, market);

    ctx.log(std::string("Market resolved: ") + outcomeLabel(market.outcome));
}

void PredictionMarketProgram::claimWinnings(InvokeContext& ctx, const ClaimWinningsArgs& args) {
    ctx.requireSigner(args.bettor);

    MarketStore markets(ctx);
    Market market = markets.load(args.market);
    if (!market.resolved()) {
        throw ProgramError(ErrorCode::MarketNotResolved);
    }

    BetStore bets(ctx);
    if (bets.addressFor(args.market, args.bettor).address != args.bet) {
        throw ProgramError(ErrorCode::InvalidBettor, "bet address is not derived from this market and bettor");
    }
    Bet bet = bets.load(args.bet);
    if (bet.bettor != args.bettor || bet.market != args.market) {
        throw ProgramError(ErrorCode::InvalidBettor);
    }
    if (bet.outcomeChosen != market.yesWon()) {
        throw ProgramError(ErrorCode::NotAWinner);
    }
    if (bet.claimed) {
        throw ProgramError(ErrorCode::AlreadyClaimed);
    }

    PayoutBreakdown breakdown = computePayout(market, bet.amount);
    EscrowGateway(ctx).withdraw(args.market, args.bettor, breakdown.payout);

    bet.claimed = true;
    bets.save(args.bet, bet);

    std::ostringstream oss;
    oss << "Winnings claimed: " << breakdown.payout;
    ctx.log(oss.str());
}

} // namespace pm

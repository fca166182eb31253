#pragma once

#include "instruction.hpp"
#include "ledger.hpp"
#include "program_config.hpp"

namespace pm {

// Market lifecycle controller: create, place wager, resolve, claim. Each
// handler checks every precondition before the first mutation; arithmetic
// failures after that point abort the whole transaction.
class PredictionMarketProgram : public Program {
public:
    explicit PredictionMarketProgram(ProgramConfig cfg = {});

    const Pubkey& programId() const override { return programId_; }
    const ProgramConfig& config() const { return config_; }

    void processInstruction(InvokeContext& ctx, const Bytes& instruction) override;

    void createMarket(InvokeContext& ctx, const CreateMarketArgs& args);
    void placeBet(InvokeContext& ctx, const PlaceBetArgs& args);
    void resolveMarket(InvokeContext& ctx, const ResolveMarketArgs& args);
    void claimWinnings(InvokeContext& ctx, const ClaimWinningsArgs& args);

private:
    ProgramConfig config_;
    Pubkey programId_;
};

} // namespace pm

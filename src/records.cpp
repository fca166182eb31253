#include "records.hpp"

#include "codec.hpp"
#include "errors.hpp"
#include "hash.hpp"

#include <algorithm>
#include <array>

namespace pm {

namespace {

using Discriminator = std::array<std::uint8_t, kDiscriminatorLength>;

Discriminator discriminatorFor(const std::string& typeName) {
    Hash digest = sha256("account:" + typeName);
    Discriminator out{};
    std::copy(digest.begin(), digest.begin() + kDiscriminatorLength, out.begin());
    return out;
}

const Discriminator& marketDiscriminator() {
    static const Discriminator d = discriminatorFor("Market");
    return d;
}

const Discriminator& betDiscriminator() {
    static const Discriminator d = discriminatorFor("Bet");
    return d;
}

bool hasDiscriminator(const Bytes& data, const Discriminator& d) {
    return data.size() >= d.size() && std::equal(d.begin(), d.end(), data.begin());
}

void expectDiscriminator(ByteReader& reader, const Discriminator& d) {
    for (std::uint8_t expected : d) {
        if (reader.getU8() != expected) {
            reader.fail("account discriminator mismatch");
        }
    }
}

} // namespace

const char* outcomeLabel(Outcome outcome) {
    switch (outcome) {
    case Outcome::Yes: return "Yes";
    case Outcome::No: return "No";
    case Outcome::Unset: break;
    }
    return "Unset";
}

std::size_t Market::space() {
    return kDiscriminatorLength
        + 32                       // creator
        + 32                       // resolution authority
        + 4 + kMaxQuestionLength   // question
        + 32                       // question hash
        + 8                        // end time
        + 1                        // resolved
        + 2                        // outcome option
        + 8                        // total yes
        + 8                        // total no
        + 2                        // fee basis points
        + 1;                       // bump
}

std::size_t Bet::space() {
    return kDiscriminatorLength + 32 + 32 + 8 + 1 + 1 + 1;
}

Bytes encodeMarket(const Market& market) {
    if (market.question.size() > Market::kMaxQuestionLength) {
        throw ProgramError(ErrorCode::QuestionTooLong);
    }
    // | disc 8 | creator 32 | authority 32 | question u32+bytes | questionHash 32 |
    // | endTime i64 | resolved u8 | outcome option u8,u8 | yes u64 | no u64 | fee u16 | bump u8 |
    // The question is variable length, so trailing bytes are zero padding up to space().
    ByteWriter w;
    const auto& d = marketDiscriminator();
    w.putRaw(d.data(), d.size());
    w.putKey(market.creator);
    w.putKey(market.resolutionAuthority);
    w.putString(market.question);
    w.putKey(market.questionHash);
    w.putI64(market.endTime);
    w.putBool(market.resolved());
    w.putBool(market.resolved());
    w.putBool(market.yesWon());
    w.putU64(market.totalYesAmount);
    w.putU64(market.totalNoAmount);
    w.putU16(market.feeBasisPoints);
    w.putU8(market.bump);
    w.padTo(Market::space());
    return w.take();
}

Market decodeMarket(const Bytes& data) {
    if (data.size() != Market::space()) {
        throw ProgramError(ErrorCode::InvalidAccountData, "market account has the wrong size");
    }
    ByteReader r(data, ErrorCode::InvalidAccountData);
    expectDiscriminator(r, marketDiscriminator());

    Market m;
    m.creator = r.getKey();
    m.resolutionAuthority = r.getKey();
    m.question = r.getString(Market::kMaxQuestionLength);
    m.questionHash = r.getKey();
    m.endTime = r.getI64();
    bool resolved = r.getBool();
    bool hasOutcome = r.getBool();
    bool yes = r.getBool();
    if (resolved != hasOutcome) {
        r.fail("resolved flag disagrees with outcome");
    }
    if (!hasOutcome && yes) {
        r.fail("outcome value set without an outcome");
    }
    m.outcome = hasOutcome ? outcomeFromBool(yes) : Outcome::Unset;
    m.totalYesAmount = r.getU64();
    m.totalNoAmount = r.getU64();
    m.feeBasisPoints = r.getU16();
    if (m.feeBasisPoints > Market::kBasisPointsDenominator) {
        r.fail("fee exceeds 100%");
    }
    m.bump = r.getU8();
    return m;
}

Bytes encodeBet(const Bet& bet) {
    ByteWriter w;
    const auto& d = betDiscriminator();
    w.putRaw(d.data(), d.size());
    w.putKey(bet.bettor);
    w.putKey(bet.market);
    w.putU64(bet.amount);
    w.putBool(bet.outcomeChosen);
    w.putBool(bet.claimed);
    w.putU8(bet.bump);
    return w.take();
}

Bet decodeBet(const Bytes& data) {
    ByteReader r(data, ErrorCode::InvalidAccountData);
    expectDiscriminator(r, betDiscriminator());

    Bet b;
    b.bettor = r.getKey();
    b.market = r.getKey();
    b.amount = r.getU64();
    b.outcomeChosen = r.getBool();
    b.claimed = r.getBool();
    b.bump = r.getU8();
    r.expectEnd();
    return b;
}

bool isMarketAccount(const Bytes& data) {
    return hasDiscriminator(data, marketDiscriminator());
}

bool isBetAccount(const Bytes& data) {
    return hasDiscriminator(data, betDiscriminator());
}

} // namespace pm

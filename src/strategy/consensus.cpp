#include "../../include/strategy/consensus.hpp"

#include <algorithm>

namespace quantcode {
namespace strategy {

int VoteCounts::top() const { return std::max({buy, sell, hold}); }

VoteCounts tally(const std::vector<indicators::IndicatorResult>& results) {
    VoteCounts votes;
    for (const auto& r : results) {
        switch (r.signal) {
        case Signal::Buy:
            ++votes.buy;
            break;
        case Signal::Sell:
            ++votes.sell;
            break;
        case Signal::Hold:
            ++votes.hold;
            break;
        }
    }
    return votes;
}

Signal resolve(const VoteCounts& votes) {
    if (votes.buy >= 2 && votes.buy > votes.sell)
        return Signal::Buy;
    if (votes.sell >= 2 && votes.sell > votes.buy)
        return Signal::Sell;
    return Signal::Hold;
}

std::string confidence_label(const VoteCounts& votes) {
    const int top = votes.top();
    if (top >= 4)
        return "Strong consensus";

    // 2-1-1 counts only with BUY or SELL holding the pair; a HOLD pair
    // over one BUY and one SELL is a tie
    const bool split_211 =
        votes.hold == 1 && ((votes.buy == 2 && votes.sell == 1) || (votes.sell == 2 && votes.buy == 1));
    if (top == 3 || split_211)
        return "Moderate consensus";

    return "Mixed signals - no clear consensus";
}

ConsensusDecision decide(const std::vector<indicators::IndicatorResult>& results) {
    if (results.size() != VOTING_INDICATORS) {
        throw ValidationError("Consensus needs exactly " + std::to_string(VOTING_INDICATORS) +
                                  " indicator results, got " + std::to_string(results.size()),
                              "indicators");
    }

    ConsensusDecision decision;
    decision.votes = tally(results);
    decision.signal = resolve(decision.votes);
    decision.confidence = confidence_label(decision.votes);
    for (const auto& r : results)
        decision.total_score += r.score;
    return decision;
}

} // namespace strategy
} // namespace quantcode

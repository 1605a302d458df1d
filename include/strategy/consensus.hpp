#pragma once

#include "../indicators/indicator_result.hpp"
#include "signal.hpp"

#include <string>
#include <vector>

namespace quantcode {
namespace strategy {

struct VoteCounts {
    int buy = 0;
    int sell = 0;
    int hold = 0;

    int total() const { return buy + sell + hold; }
    int top() const;
};

struct ConsensusDecision {
    Signal signal = Signal::Hold;
    std::string confidence;
    int total_score = 0; // -4..+4
    VoteCounts votes;
};

/**
 * Consensus engine - majority vote over the four voting indicators
 *
 * - BUY  iff buy >= 2 and buy > sell
 * - SELL iff sell >= 2 and sell > buy
 * - HOLD otherwise (including 2-2 ties)
 *
 * Depends only on the multiset of votes, never on their order.
 */
VoteCounts tally(const std::vector<indicators::IndicatorResult>& results);

Signal resolve(const VoteCounts& votes);

/**
 * "Strong consensus" when one signal takes all four votes,
 * "Moderate consensus" for a top count of 3 or an exact 2-1-1 split,
 * "Mixed signals - no clear consensus" otherwise.
 */
std::string confidence_label(const VoteCounts& votes);

// Throws ValidationError unless exactly VOTING_INDICATORS results are given
ConsensusDecision decide(const std::vector<indicators::IndicatorResult>& results);

} // namespace strategy
} // namespace quantcode

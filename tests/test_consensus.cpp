/**
 * Consensus Engine Tests
 *
 * Majority rule, confidence labels, score sums and order independence.
 */

#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>
#include "../include/errors.hpp"
#include "../include/strategy/consensus.hpp"

using namespace quantcode;
using namespace quantcode::strategy;
using quantcode::indicators::IndicatorResult;
using quantcode::indicators::make_result;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)

std::vector<IndicatorResult> votes(std::vector<Signal> signals) {
    static const char* names[] = {"heiken_ashi", "bollinger_bands", "macd", "rsi", "extra"};
    std::vector<IndicatorResult> out;
    for (size_t i = 0; i < signals.size(); ++i)
        out.push_back(make_result(names[i % 5], signals[i], "", ""));
    return out;
}

constexpr Signal B = Signal::Buy;
constexpr Signal S = Signal::Sell;
constexpr Signal H = Signal::Hold;

// ============================================
// Majority rule
// ============================================

TEST(test_unanimous_buy) {
    auto d = decide(votes({B, B, B, B}));
    ASSERT_TRUE(d.signal == Signal::Buy);
    ASSERT_EQ(d.confidence, "Strong consensus");
    ASSERT_EQ(d.total_score, 4);
    ASSERT_EQ(d.votes.buy, 4);
}

TEST(test_unanimous_hold) {
    auto d = decide(votes({H, H, H, H}));
    ASSERT_TRUE(d.signal == Signal::Hold);
    ASSERT_EQ(d.confidence, "Strong consensus");
    ASSERT_EQ(d.total_score, 0);
}

TEST(test_three_sells) {
    auto d = decide(votes({S, S, B, S}));
    ASSERT_TRUE(d.signal == Signal::Sell);
    ASSERT_EQ(d.confidence, "Moderate consensus");
    ASSERT_EQ(d.total_score, -2);
}

TEST(test_two_sells_one_buy_one_hold) {
    auto d = decide(votes({B, S, H, S}));
    ASSERT_TRUE(d.signal == Signal::Sell);
    ASSERT_EQ(d.confidence, "Moderate consensus");
    ASSERT_EQ(d.total_score, -1);
    ASSERT_EQ(d.votes.buy, 1);
    ASSERT_EQ(d.votes.sell, 2);
    ASSERT_EQ(d.votes.hold, 1);
}

TEST(test_two_buys_two_holds) {
    auto d = decide(votes({B, H, B, H}));
    ASSERT_TRUE(d.signal == Signal::Buy);
    ASSERT_EQ(d.confidence, "Mixed signals - no clear consensus");
    ASSERT_EQ(d.total_score, 2);
}

TEST(test_buy_sell_tie_holds) {
    auto d = decide(votes({B, S, B, S}));
    ASSERT_TRUE(d.signal == Signal::Hold);
    ASSERT_EQ(d.confidence, "Mixed signals - no clear consensus");
    ASSERT_EQ(d.total_score, 0);
}

TEST(test_single_buy_is_not_enough) {
    auto d = decide(votes({B, H, H, H}));
    ASSERT_TRUE(d.signal == Signal::Hold);
    ASSERT_EQ(d.confidence, "Moderate consensus");
    ASSERT_EQ(d.total_score, 1);
}

TEST(test_hold_pair_split) {
    // 2-1-1 with the pair on HOLD is a BUY/SELL tie, not a majority
    auto d = decide(votes({B, S, H, H}));
    ASSERT_TRUE(d.signal == Signal::Hold);
    ASSERT_EQ(d.confidence, "Mixed signals - no clear consensus");
    ASSERT_EQ(d.total_score, 0);
}

TEST(test_label_over_every_distribution) {
    for (int buy = 0; buy <= 4; ++buy) {
        for (int sell = 0; buy + sell <= 4; ++sell) {
            VoteCounts v;
            v.buy = buy;
            v.sell = sell;
            v.hold = 4 - buy - sell;

            std::string expected = "Mixed signals - no clear consensus";
            if (v.top() == 4)
                expected = "Strong consensus";
            else if (v.top() == 3 || (v.hold == 1 && (buy == 2 || sell == 2) && buy != sell))
                expected = "Moderate consensus";
            ASSERT_EQ(confidence_label(v), expected);

            // Moderate or better never comes with a BUY/SELL tie
            if (expected != "Mixed signals - no clear consensus" && buy == sell)
                ASSERT_TRUE(resolve(v) == Signal::Hold && v.hold >= 3);
        }
    }
}

TEST(test_resolve_and_label_directly) {
    VoteCounts v;
    v.buy = 2;
    v.sell = 1;
    v.hold = 1;
    ASSERT_TRUE(resolve(v) == Signal::Buy);
    ASSERT_EQ(v.total(), 4);
    ASSERT_EQ(v.top(), 2);
    ASSERT_EQ(confidence_label(v), "Moderate consensus");
}

// ============================================
// Invariants
// ============================================

TEST(test_order_independent) {
    std::vector<std::vector<Signal>> cases = {
        {B, S, H, S}, {B, B, S, H}, {B, S, B, S}, {H, H, S, B}, {B, B, B, S},
    };
    for (auto signals : cases) {
        std::sort(signals.begin(), signals.end());
        auto expected = decide(votes(signals));
        do {
            auto d = decide(votes(signals));
            ASSERT_TRUE(d.signal == expected.signal);
            ASSERT_EQ(d.confidence, expected.confidence);
            ASSERT_EQ(d.total_score, expected.total_score);
        } while (std::next_permutation(signals.begin(), signals.end()));
    }
}

TEST(test_score_matches_counts) {
    std::vector<Signal> all = {B, S, H};
    for (Signal a : all)
        for (Signal b : all)
            for (Signal c : all)
                for (Signal d : all) {
                    auto dec = decide(votes({a, b, c, d}));
                    ASSERT_EQ(dec.total_score, dec.votes.buy - dec.votes.sell);
                    ASSERT_EQ(dec.votes.total(), 4);
                    ASSERT_TRUE(dec.total_score >= -4 && dec.total_score <= 4);
                }
}

TEST(test_wrong_vote_count_rejected) {
    bool thrown = false;
    try {
        decide(votes({B, B, B}));
    } catch (const ValidationError& e) {
        thrown = true;
        ASSERT_EQ(e.parameter(), "indicators");
    }
    ASSERT_TRUE(thrown);

    thrown = false;
    try {
        decide(votes({B, B, B, B, B}));
    } catch (const ValidationError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

TEST(test_signal_strings) {
    ASSERT_EQ(std::string(signal_to_string(Signal::Buy)), "BUY");
    ASSERT_EQ(std::string(signal_to_string(Signal::Sell)), "SELL");
    ASSERT_EQ(std::string(signal_to_string(Signal::Hold)), "HOLD");
    ASSERT_TRUE(signal_from_string("SELL") == Signal::Sell);
    ASSERT_TRUE(!signal_from_string("sideways").has_value());
}

int main() {
    std::cout << "\n=== Consensus Engine Tests ===\n\n";

    std::cout << "Majority rule:\n";
    RUN_TEST(test_unanimous_buy);
    RUN_TEST(test_unanimous_hold);
    RUN_TEST(test_three_sells);
    RUN_TEST(test_two_sells_one_buy_one_hold);
    RUN_TEST(test_two_buys_two_holds);
    RUN_TEST(test_buy_sell_tie_holds);
    RUN_TEST(test_single_buy_is_not_enough);
    RUN_TEST(test_hold_pair_split);
    RUN_TEST(test_label_over_every_distribution);
    RUN_TEST(test_resolve_and_label_directly);

    std::cout << "\nInvariants:\n";
    RUN_TEST(test_order_independent);
    RUN_TEST(test_score_matches_counts);
    RUN_TEST(test_wrong_vote_count_rejected);
    RUN_TEST(test_signal_strings);

    std::cout << "\n=== All Consensus Tests Passed! ===\n";
    return 0;
}

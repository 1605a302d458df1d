#include <cassert>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>
#include "../include/util/cli.hpp"

using namespace quantcode;
using namespace quantcode::util;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

// argv[0] is the program name, as on a real command line
bool parse(std::initializer_list<const char*> words, CLIArgs& args) {
    std::vector<std::string> storage{"quantcode"};
    for (const char* w : words)
        storage.emplace_back(w);
    std::vector<char*> argv;
    for (auto& s : storage)
        argv.push_back(s.data());
    return parse_args(static_cast<int>(argv.size()), argv.data(), args);
}

// ============================================
// parse_args
// ============================================

TEST(test_parse_analyze) {
    CLIArgs args;
    ASSERT_TRUE(parse({"analyze", "aapl", "-d", "data", "--json"}, args));
    ASSERT_EQ(args.command, "analyze");
    ASSERT_EQ(args.tickers.size(), 1u);
    ASSERT_EQ(args.tickers[0], "AAPL");
    ASSERT_EQ(args.data_dir, "data");
    ASSERT_TRUE(args.json_output);
}

TEST(test_parse_batch_list) {
    CLIArgs args;
    ASSERT_TRUE(parse({"batch", "AAPL, msft,,AAPL", "TSLA", "-p", "--alerts"}, args));
    ASSERT_EQ(args.tickers.size(), 3u);
    ASSERT_EQ(args.tickers[1], "MSFT");
    ASSERT_EQ(args.tickers[2], "TSLA");
    ASSERT_TRUE(args.parallel);
    ASSERT_TRUE(args.alerts);
    ASSERT_FALSE(args.use_watchlist);
}

TEST(test_parse_trade_numbers) {
    CLIArgs args;
    ASSERT_TRUE(parse({"pnl", "--type", "short", "--entry", "50", "--stop", "55", "--exit", "45.5"}, args));
    ASSERT_EQ(args.trade_type, "SHORT");
    ASSERT_NEAR(*args.entry, 50.0, 1e-12);
    ASSERT_NEAR(*args.stop, 55.0, 1e-12);
    ASSERT_NEAR(*args.exit, 45.5, 1e-12);
    ASSERT_FALSE(args.account.has_value());
}

TEST(test_parse_rejects_bad_input) {
    CLIArgs a;
    ASSERT_FALSE(parse({"size", "--entry", "100x"}, a));
    CLIArgs b;
    ASSERT_FALSE(parse({"size", "--stop"}, b));
    CLIArgs c;
    ASSERT_FALSE(parse({"size", "--entry", "inf"}, c));
    CLIArgs d;
    ASSERT_FALSE(parse({"analyze", "AAPL", "--bogus"}, d));
}

TEST(test_parse_journal_file) {
    CLIArgs args;
    ASSERT_TRUE(parse({"journal", "trades.csv"}, args));
    ASSERT_EQ(args.file, "trades.csv");
    ASSERT_TRUE(args.tickers.empty());
}

// ============================================
// Required options
// ============================================

TEST(test_pnl_requires_stop) {
    CLIArgs args;
    ASSERT_TRUE(parse({"pnl", "--entry", "100", "--exit", "110"}, args));
    auto missing = missing_options(args);
    ASSERT_EQ(missing.size(), 1u);
    ASSERT_EQ(missing[0], "--stop");

    CLIArgs full;
    ASSERT_TRUE(parse({"pnl", "--entry", "100", "--stop", "95", "--exit", "110"}, full));
    ASSERT_TRUE(missing_options(full).empty());
}

TEST(test_size_requires_entry_and_stop) {
    CLIArgs args;
    ASSERT_TRUE(parse({"size", "--account", "10000"}, args));
    auto missing = missing_options(args);
    ASSERT_EQ(missing.size(), 2u);
    ASSERT_EQ(missing[0], "--entry");
    ASSERT_EQ(missing[1], "--stop");
}

TEST(test_journal_requires_file) {
    CLIArgs args;
    ASSERT_TRUE(parse({"journal"}, args));
    auto missing = missing_options(args);
    ASSERT_EQ(missing.size(), 1u);
    ASSERT_EQ(missing[0], "FILE");
}

TEST(test_analysis_commands_need_no_trade_options) {
    CLIArgs a;
    ASSERT_TRUE(parse({"analyze", "AAPL"}, a));
    ASSERT_TRUE(missing_options(a).empty());
    CLIArgs b;
    ASSERT_TRUE(parse({"batch", "-w"}, b));
    ASSERT_TRUE(missing_options(b).empty());
}

int main() {
    std::cout << "\n=== CLI Tests ===\n\n";

    std::cout << "parse_args:\n";
    RUN_TEST(test_parse_analyze);
    RUN_TEST(test_parse_batch_list);
    RUN_TEST(test_parse_trade_numbers);
    RUN_TEST(test_parse_rejects_bad_input);
    RUN_TEST(test_parse_journal_file);

    std::cout << "\nRequired options:\n";
    RUN_TEST(test_pnl_requires_stop);
    RUN_TEST(test_size_requires_entry_and_stop);
    RUN_TEST(test_journal_requires_file);
    RUN_TEST(test_analysis_commands_need_no_trade_options);

    std::cout << "\n=== All CLI Tests Passed! ===\n";
    return 0;
}

/**
 * Price History Provider Tests
 *
 * CSV bar files, lookback trimming and Alpha Vantage response parsing.
 * No network access: the REST client is only exercised offline.
 */

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include "../include/errors.hpp"
#include "../include/exchange/alpha_vantage_rest.hpp"
#include "../include/exchange/history_provider.hpp"
#include "../include/exchange/market_data.hpp"
#include "../include/util/time_utils.hpp"

using namespace quantcode;
using namespace quantcode::exchange;

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

constexpr Timestamp DAY0 = 1704067200000ULL; // 2024-01-01
const std::string TMP_DIR = "/tmp";

std::vector<Bar> daily_bars(int n) {
    std::vector<Bar> bars;
    for (int i = 0; i < n; ++i) {
        Bar b;
        b.timestamp = DAY0 + static_cast<Timestamp>(i) * MS_PER_DAY;
        b.open = 100.0 + i;
        b.high = 102.0 + i;
        b.low = 99.0 + i;
        b.close = 101.0 + i;
        b.volume = 1000.0 * (i + 1);
        bars.push_back(b);
    }
    return bars;
}

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

template <typename Fn>
bool throws_upstream(Fn fn) {
    try {
        fn();
    } catch (const UpstreamDataError&) {
        return true;
    }
    return false;
}

// ============================================
// CSV files
// ============================================

TEST(test_csv_save_and_load) {
    const std::string path = TMP_DIR + "/QCTEST1.csv";
    auto bars = daily_bars(5);
    save_bars_csv(path, bars);

    auto loaded = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.size(), 5u);
    ASSERT_EQ(loaded[0].timestamp, DAY0);
    ASSERT_NEAR(loaded[4].close, 105.0, 1e-9);
    ASSERT_NEAR(loaded[2].volume, 3000.0, 1e-9);
}

TEST(test_csv_without_header_or_volume) {
    const std::string path = TMP_DIR + "/QCTEST2.csv";
    write_file(path, "2024-01-02,185.10,188.44,183.89,185.64\n\n2024-01-03,184.22,185.88,183.43,184.25\n");
    auto bars = load_bars_csv(path);
    std::remove(path.c_str());

    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(util::format_date(bars[1].timestamp), "2024-01-03");
    ASSERT_NEAR(bars[0].high, 188.44, 1e-9);
    ASSERT_NEAR(bars[0].volume, 0.0, 1e-12);
}

TEST(test_csv_malformed_row) {
    const std::string path = TMP_DIR + "/QCTEST3.csv";
    write_file(path, "date,open,high,low,close\n2024-01-02,185.10,abc,183.89,185.64\n");
    bool thrown = false;
    try {
        load_bars_csv(path);
    } catch (const std::runtime_error& e) {
        thrown = true;
        ASSERT_TRUE(std::string(e.what()).find(":2:") != std::string::npos);
    }
    std::remove(path.c_str());
    ASSERT_TRUE(thrown);
}

TEST(test_csv_provider) {
    save_bars_csv(TMP_DIR + "/QCPROV.csv", daily_bars(30));
    CsvHistoryProvider provider(TMP_DIR);

    ASSERT_EQ(provider.path_for("QCPROV"), "/tmp/QCPROV.csv");
    auto all = provider.fetch(" qcprov ", 0);
    ASSERT_EQ(all.size(), 30u);

    // Newest bar is day 29: a 10-day window keeps days 20..29
    auto recent = provider.fetch("QCPROV", 10);
    ASSERT_EQ(recent.size(), 10u);
    ASSERT_EQ(recent.front().timestamp, DAY0 + 20 * MS_PER_DAY);

    std::remove((TMP_DIR + "/QCPROV.csv").c_str());
}

TEST(test_csv_provider_errors) {
    CsvHistoryProvider provider(TMP_DIR + "/");
    ASSERT_EQ(provider.path_for("X"), "/tmp/X.csv");

    bool thrown = false;
    try {
        provider.fetch("QCMISSING", 30);
    } catch (const UpstreamDataError& e) {
        thrown = true;
        ASSERT_EQ(e.ticker(), "QCMISSING");
    }
    ASSERT_TRUE(thrown);

    write_file(TMP_DIR + "/QCEMPTY.csv", "date,open,high,low,close,volume\n");
    ASSERT_TRUE(throws_upstream([&] { provider.fetch("QCEMPTY", 30); }));
    std::remove((TMP_DIR + "/QCEMPTY.csv").c_str());

    thrown = false;
    try {
        provider.fetch("  ", 30);
    } catch (const ValidationError& e) {
        thrown = true;
        ASSERT_EQ(e.parameter(), "ticker");
    }
    ASSERT_TRUE(thrown);
}

TEST(test_trim_to_lookback) {
    auto bars = daily_bars(10);
    ASSERT_EQ(trim_to_lookback(bars, 0).size(), 10u);
    ASSERT_EQ(trim_to_lookback(bars, -5).size(), 10u);
    ASSERT_EQ(trim_to_lookback(bars, 3).size(), 3u);
    ASSERT_EQ(trim_to_lookback(bars, 100).size(), 10u);
    ASSERT_TRUE(trim_to_lookback({}, 5).empty());
}

// ============================================
// Alpha Vantage
// ============================================

const char* DAILY_RESPONSE = R"json({
    "Meta Data": { "2. Symbol": "IBM" },
    "Time Series (Daily)": {
        "2024-01-03": { "1. open": "161.00", "2. high": "161.73", "3. low": "160.08",
                        "4. close": "160.10", "5. volume": "4086130" },
        "2024-01-02": { "1. open": "162.83", "2. high": "163.29", "3. low": "160.38",
                        "4. close": "161.50", "5. volume": "3795728" }
    }
})json";

TEST(test_parse_daily_json) {
    auto bars = AlphaVantageRest::parse_daily_json(DAILY_RESPONSE, "IBM");
    ASSERT_EQ(bars.size(), 2u);
    // Sorted oldest first
    ASSERT_EQ(util::format_date(bars[0].timestamp), "2024-01-02");
    ASSERT_NEAR(bars[0].open, 162.83, 1e-9);
    ASSERT_NEAR(bars[1].close, 160.10, 1e-9);
    ASSERT_NEAR(bars[1].volume, 4086130.0, 1e-6);
}

TEST(test_parse_api_errors) {
    bool thrown = false;
    try {
        AlphaVantageRest::parse_daily_json(R"({"Error Message": "Invalid API call."})", "ZZZZ");
    } catch (const UpstreamDataError& e) {
        thrown = true;
        ASSERT_EQ(std::string(e.what()), "Alpha Vantage: Invalid API call.");
        ASSERT_EQ(e.ticker(), "ZZZZ");
    }
    ASSERT_TRUE(thrown);

    ASSERT_TRUE(throws_upstream([] { AlphaVantageRest::parse_daily_json(R"({"Note": "rate limit"})"); }));
    ASSERT_TRUE(throws_upstream([] { AlphaVantageRest::parse_daily_json(R"({"Information": {"x": 1}})"); }));
}

TEST(test_parse_malformed_responses) {
    ASSERT_TRUE(throws_upstream([] { AlphaVantageRest::parse_daily_json("<html>"); }));
    ASSERT_TRUE(throws_upstream([] { AlphaVantageRest::parse_daily_json("{}"); }));
    ASSERT_TRUE(throws_upstream([] { AlphaVantageRest::parse_daily_json(R"json({"Time Series (Daily)": {}})json"); }));
    ASSERT_TRUE(throws_upstream([] {
        AlphaVantageRest::parse_daily_json(R"json({"Time Series (Daily)": {"2024-01-02": {"1. open": "x"}}})json");
    }));
    ASSERT_TRUE(throws_upstream([] {
        AlphaVantageRest::parse_daily_json(
            R"json({"Time Series (Daily)": {"yesterday": {"1. open": "1", "2. high": "1", "3. low": "1", "4. close": "1"}}})json");
    }));
}

TEST(test_build_url) {
    AlphaVantageRest client("demo", "http://localhost:1");
    std::string compact = client.build_url("IBM", 30);
    ASSERT_EQ(compact, "http://localhost:1/query?function=TIME_SERIES_DAILY&symbol=IBM&outputsize=compact&apikey=demo");
    ASSERT_TRUE(client.build_url("IBM", 365).find("outputsize=full") != std::string::npos);
}

TEST(test_missing_api_key) {
    bool thrown = false;
    try {
        AlphaVantageRest client("");
    } catch (const ValidationError& e) {
        thrown = true;
        ASSERT_EQ(e.parameter(), "api_key");
    }
    ASSERT_TRUE(thrown);
}

int main() {
    std::cout << "\n=== Price History Provider Tests ===\n\n";

    std::cout << "CSV files:\n";
    RUN_TEST(test_csv_save_and_load);
    RUN_TEST(test_csv_without_header_or_volume);
    RUN_TEST(test_csv_malformed_row);
    RUN_TEST(test_csv_provider);
    RUN_TEST(test_csv_provider_errors);
    RUN_TEST(test_trim_to_lookback);

    std::cout << "\nAlpha Vantage:\n";
    RUN_TEST(test_parse_daily_json);
    RUN_TEST(test_parse_api_errors);
    RUN_TEST(test_parse_malformed_responses);
    RUN_TEST(test_build_url);
    RUN_TEST(test_missing_api_key);

    std::cout << "\n=== All Provider Tests Passed! ===\n";
    return 0;
}

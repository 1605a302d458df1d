/**
 * Daily History Fetcher
 *
 * Downloads daily bars from Alpha Vantage and saves them in the CSV
 * format read by CsvHistoryProvider.
 *
 * Usage:
 *   ALPHA_VANTAGE_API_KEY=... ./fetch_history AAPL
 *   ALPHA_VANTAGE_API_KEY=... ./fetch_history MSFT data/MSFT.csv 365
 */

#include "../include/config/defaults.hpp"
#include "../include/exchange/alpha_vantage_rest.hpp"
#include "../include/exchange/market_data.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/time_utils.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>

using namespace quantcode;
using namespace quantcode::exchange;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " SYMBOL [OUTPUT_FILE] [LOOKBACK_DAYS]\n"
              << "\n"
              << "Arguments:\n"
              << "  SYMBOL         Equity ticker (e.g., AAPL, MSFT)\n"
              << "  OUTPUT_FILE    Output CSV file, default: SYMBOL.csv\n"
              << "  LOOKBACK_DAYS  Calendar days to keep, default: " << config::data::LOOKBACK_DAYS << "\n"
              << "\n"
              << "Environment:\n"
              << "  " << config::data::API_KEY_ENV << "  Alpha Vantage API key (required)\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " AAPL\n"
              << "  " << prog << " MSFT data/MSFT.csv 365\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string symbol = util::normalize_ticker(argv[1]);
    const std::string output_file = argc >= 3 ? argv[2] : symbol + ".csv";
    int lookback_days = config::data::LOOKBACK_DAYS;
    if (argc >= 4) {
        auto days = util::parse_number(argv[3]);
        if (!days || *days <= 0) {
            std::cerr << "Error: LOOKBACK_DAYS must be a positive number\n";
            return 1;
        }
        lookback_days = static_cast<int>(*days);
    }

    const char* api_key = std::getenv(config::data::API_KEY_ENV);
    if (!api_key || !*api_key) {
        std::cerr << "Error: " << config::data::API_KEY_ENV << " is not set\n";
        return 1;
    }

    std::cout << "Fetching " << symbol << " daily bars (" << lookback_days << " days)...\n";

    try {
        AlphaVantageRest client(api_key);
        auto bars = client.fetch(symbol, lookback_days);

        std::cout << "Downloaded " << bars.size() << " bars\n";
        std::cout << "Period: " << util::format_date(bars.front().timestamp) << " to "
                  << util::format_date(bars.back().timestamp) << "\n";
        std::cout << std::fixed << std::setprecision(2) << "Last close: $" << bars.back().close << "\n";

        save_bars_csv(output_file, bars);
        std::cout << "Saved to " << output_file << "\n";
    } catch (const AnalysisError& e) {
        std::cerr << "Error (" << e.kind_name() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

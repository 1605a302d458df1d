#pragma once

#include "../types.hpp"
#include "../util/string_utils.hpp"
#include "../util/time_utils.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace quantcode {
namespace exchange {

/**
 * Daily OHLCV bar
 *
 * One trading session. Volume is informational (0 when the source
 * does not provide it) and never validated.
 */
struct Bar {
    Timestamp timestamp = 0; // Session date, 00:00 UTC (ms)
    Price open = 0;
    Price high = 0;
    Price low = 0;
    Price close = 0;
    Volume volume = 0;
};

/**
 * Load daily bars from CSV file
 *
 * Expected format (header optional, volume optional):
 * date,open,high,low,close[,volume]
 * 2024-01-02,185.10,188.44,183.89,185.64,82488700
 *
 * Rows are returned in file order; ordering is checked later by the
 * series preprocessor. A malformed row is an error, not skipped.
 */
inline std::vector<Bar> load_bars_csv(const std::string& filename) {
    std::vector<Bar> bars;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        line = util::trim(line);
        if (line.empty())
            continue;

        // Skip header if present
        if (line_no == 1) {
            std::string lower = util::to_lower(line);
            if (lower.find("date") != std::string::npos || lower.find("timestamp") != std::string::npos) {
                continue;
            }
        }

        auto tokens = util::split(line, ',');
        if (tokens.size() < 5) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": expected at least 5 columns");
        }

        auto ts = util::parse_date(tokens[0]);
        if (!ts) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": bad date '" + tokens[0] + "'");
        }

        Bar b;
        b.timestamp = *ts;
        try {
            b.open = std::stod(tokens[1]);
            b.high = std::stod(tokens[2]);
            b.low = std::stod(tokens[3]);
            b.close = std::stod(tokens[4]);
            if (tokens.size() > 5 && !tokens[5].empty()) {
                b.volume = std::stod(tokens[5]);
            }
        } catch (const std::exception&) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) + ": bad number");
        }

        bars.push_back(b);
    }

    return bars;
}

/**
 * Save daily bars to CSV file (format read by load_bars_csv)
 */
inline void save_bars_csv(const std::string& filename, const std::vector<Bar>& bars) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    // Header
    file << "date,open,high,low,close,volume\n";
    file << std::setprecision(10);

    for (const auto& b : bars) {
        file << util::format_date(b.timestamp) << ","
             << b.open << ","
             << b.high << ","
             << b.low << ","
             << b.close << ","
             << b.volume << "\n";
    }
}

} // namespace exchange
} // namespace quantcode

#pragma once

/**
 * String utilities shared by the CSV loader, ticker normalization
 * and command-line parsing.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace quantcode {
namespace util {

inline std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * Split on a delimiter, trimming each field. Empty fields are kept
 * so column positions stay stable.
 */
inline std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

/**
 * Normalize a ticker symbol: trimmed and upper-cased ("aapl " -> "AAPL").
 */
inline std::string normalize_ticker(const std::string& raw) {
    return to_upper(trim(raw));
}

/**
 * Split a comma-separated ticker list into normalized, non-empty,
 * de-duplicated symbols (first occurrence wins).
 */
inline std::vector<std::string> split_tickers(const std::string& s) {
    std::vector<std::string> result;
    for (const auto& item : split(s, ',')) {
        std::string ticker = normalize_ticker(item);
        if (ticker.empty())
            continue;
        if (std::find(result.begin(), result.end(), ticker) == result.end()) {
            result.push_back(ticker);
        }
    }
    return result;
}

} // namespace util
} // namespace quantcode

#pragma once

/**
 * CLI utilities for the quantcode command-line tool
 *
 * Provides command-line argument parsing and related utilities.
 */

#include "string_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace quantcode {
namespace util {

/**
 * Command-line arguments for the quantcode tool.
 */
struct CLIArgs {
    std::string command; // analyze | batch | size | pnl | journal
    bool help = false;
    bool json_output = false;
    bool verbose = false;
    bool parallel = false;
    bool use_watchlist = false;
    bool alerts = false;

    std::string config_path;
    std::string data_dir;  // overrides config data.directory
    std::string provider;  // overrides config data.provider
    std::vector<std::string> tickers;
    std::string file;      // journal CSV

    // size
    std::optional<double> account;
    std::optional<double> risk_percent;
    std::optional<double> entry;
    std::optional<double> stop;

    // pnl
    std::string trade_type = "LONG";
    std::optional<double> exit;
};

/**
 * Print help message for the quantcode tool.
 */
inline void print_help() {
    std::cout << R"(
QuantCode Signal Engine
=======================

Usage: quantcode COMMAND [options]

Commands:
  analyze TICKER             Four-indicator consensus for one ticker
  batch TICKERS              Consensus for a comma-separated list (or --watchlist)
  size                       Fixed-fractional position size
  pnl                        P&L of a single trade
  journal FILE               Replay a trade journal CSV and summarize it
                             (ticker,type,entry,stop[,exit] per line)

Options:
  -c, --config FILE          JSON config file
  -d, --data DIR             Directory of <TICKER>.csv files
  --provider NAME            csv | alpha_vantage
  -w, --watchlist            batch: use the watchlist from the config
  -p, --parallel             batch: evaluate tickers concurrently
  --alerts                   batch: alert on BUY/SELL, once per ticker and signal a day
  --account N                size: account size
  --risk PCT                 size: percent of account at risk (default: 1)
  --entry PRICE              size/pnl: entry price
  --stop PRICE               size/pnl: stop loss price (required)
  --exit PRICE               pnl: exit price (omit for an open trade)
  --type LONG|SHORT          pnl: trade direction (default: LONG)
  -j, --json                 JSON output
  -v, --verbose              Debug logging to stderr
  -h, --help                 Show this help

Examples:
  quantcode analyze AAPL -d data
  quantcode batch AAPL,MSFT,TSLA --parallel --json
  quantcode size --account 10000 --entry 100 --stop 95
  quantcode pnl --type SHORT --entry 50 --stop 55 --exit 45
)";
}

/**
 * Parse a finite number. std::nullopt on trailing garbage or overflow.
 */
inline std::optional<double> parse_number(const std::string& s) {
    const std::string t = trim(s);
    if (t.empty())
        return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || !std::isfinite(v))
        return std::nullopt;
    return v;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    auto number_arg = [&](int& i, const std::string& name, std::optional<double>& out) {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << name << "\n";
            return false;
        }
        out = parse_number(argv[++i]);
        if (!out) {
            std::cerr << "Invalid number for " << name << ": " << argv[i] << "\n";
            return false;
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--json" || arg == "-j") {
            args.json_output = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--parallel" || arg == "-p") {
            args.parallel = true;
        } else if (arg == "--watchlist" || arg == "-w") {
            args.use_watchlist = true;
        } else if (arg == "--alerts") {
            args.alerts = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "--data" || arg == "-d") && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--provider" && i + 1 < argc) {
            args.provider = argv[++i];
        } else if (arg == "--type" && i + 1 < argc) {
            args.trade_type = to_upper(argv[++i]);
        } else if (arg == "--account") {
            if (!number_arg(i, arg, args.account))
                return false;
        } else if (arg == "--risk") {
            if (!number_arg(i, arg, args.risk_percent))
                return false;
        } else if (arg == "--entry") {
            if (!number_arg(i, arg, args.entry))
                return false;
        } else if (arg == "--stop") {
            if (!number_arg(i, arg, args.stop))
                return false;
        } else if (arg == "--exit") {
            if (!number_arg(i, arg, args.exit))
                return false;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positionals: command, then tickers / file
            if (args.command.empty()) {
                args.command = arg;
            } else if (args.command == "journal") {
                args.file = arg;
            } else {
                for (auto& t : split_tickers(arg))
                    args.tickers.push_back(t);
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

/**
 * Options the command requires but were not given, in flag form.
 * A trade without a stop loss is never sized or recorded.
 */
inline std::vector<std::string> missing_options(const CLIArgs& args) {
    std::vector<std::string> missing;
    if (args.command == "size" || args.command == "pnl") {
        if (!args.entry)
            missing.push_back("--entry");
        if (!args.stop)
            missing.push_back("--stop");
    }
    if (args.command == "journal" && args.file.empty())
        missing.push_back("FILE");
    return missing;
}

} // namespace util
} // namespace quantcode

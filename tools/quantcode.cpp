/**
 * QuantCode command-line tool
 *
 * Four-indicator consensus signals, position sizing and trade P&L.
 *
 * Usage:
 *   ./quantcode analyze AAPL -d data
 *   ./quantcode batch AAPL,MSFT --json
 *   ./quantcode batch --watchlist --alerts -c quantcode.json
 *   ./quantcode size --account 10000 --risk 1 --entry 100 --stop 95
 *   ./quantcode pnl --type LONG --entry 100 --stop 95 --exit 110
 *   ./quantcode journal trades.csv
 */

#include "../include/analysis/analyzer.hpp"
#include "../include/analysis/result_json.hpp"
#include "../include/analysis/signal_alerts.hpp"
#include "../include/config/app_config.hpp"
#include "../include/exchange/alpha_vantage_rest.hpp"
#include "../include/exchange/history_provider.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/risk/position_sizer.hpp"
#include "../include/trading/trade_journal.hpp"
#include "../include/trading/watchlist.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/time_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace quantcode;
using namespace quantcode::analysis;

namespace {

std::unique_ptr<exchange::IPriceHistoryProvider> make_provider(const config::AppConfig& cfg) {
    if (cfg.provider == config::ProviderType::AlphaVantage) {
        const char* key = std::getenv(cfg.api_key_env.c_str());
        if (!key || !*key) {
            throw ValidationError("Alpha Vantage API key not found in $" + cfg.api_key_env, "api_key");
        }
        return std::make_unique<exchange::AlphaVantageRest>(key);
    }
    return std::make_unique<exchange::CsvHistoryProvider>(cfg.data_dir);
}

void print_result(const ConsensusResult& r) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\n=== " << r.ticker << " (" << util::format_date(r.latest_timestamp) << ") ===\n";
    std::cout << "Close:         $" << r.latest_close << "\n";
    std::cout << "Signal:        " << strategy::signal_to_string(r.final_signal) << "\n";
    std::cout << "Confidence:    " << r.confidence << "\n";
    std::cout << "Score:         " << std::showpos << r.total_score << std::noshowpos << " (buy " << r.votes.buy
              << " / sell " << r.votes.sell << " / hold " << r.votes.hold << ")\n";
    std::cout << "Primary trend: " << indicators::trend_to_string(r.primary_trend.trend) << " ("
              << r.primary_trend.reason << ")\n\n";

    for (const auto& a : r.analyses) {
        std::cout << "  " << std::left << std::setw(16) << a.name << std::setw(5)
                  << strategy::signal_to_string(a.signal) << " " << a.details << "\n";
    }
    std::cout << std::right;

    if (r.trade_setup) {
        const auto& s = *r.trade_setup;
        std::cout << "\nTrade setup (capital $" << s.capital << ", risk " << s.risk_percent << "%, R:R 1:"
                  << s.rr_ratio << ")\n";
        std::cout << "  Entry:  $" << s.entry_price << "\n";
        std::cout << "  Stop:   $" << s.stop_loss_price << "\n";
        std::cout << "  Target: $" << s.target_price << "\n";
        std::cout << "  Size:   " << s.position.max_shares << " shares ($" << s.position.total_investment << ")\n";
    }
}

int cmd_analyze(const util::CLIArgs& args, const config::AppConfig& cfg, logging::AsyncLogger& logger) {
    if (args.tickers.size() != 1) {
        std::cerr << "analyze needs exactly one ticker\n";
        return 1;
    }

    Analyzer analyzer(cfg.analysis, &logger);
    auto provider = make_provider(cfg);
    ConsensusResult result = analyzer.analyze(args.tickers[0], *provider);

    if (args.json_output)
        std::cout << to_json(result).dump(2) << "\n";
    else
        print_result(result);
    return 0;
}

// Alerts go to the log at WARN so they show at the default level.
// The full text is printed too unless stdout carries JSON.
class LogSignalNotifier : public ISignalNotifier {
public:
    LogSignalNotifier(logging::AsyncLogger& logger, bool print_body) : logger_(logger), print_body_(print_body) {}

    bool notify(const SignalAlert& alert) override {
        LOGF_WARN(logger_, Consensus, "%s", alert.subject.c_str());
        if (print_body_)
            std::cout << "\n" << alert.subject << "\n" << alert.body;
        return true;
    }

private:
    logging::AsyncLogger& logger_;
    bool print_body_;
};

void send_alerts(const BatchResult& batch, const util::CLIArgs& args, const config::AppConfig& cfg,
                 logging::AsyncLogger& logger) {
    LogSignalNotifier notifier(logger, !args.json_output);
    SignalAlertTracker tracker(notifier);
    const Timestamp now = util::wall_clock_ms();

    tracker.load_state(cfg.alert_state_file);
    tracker.prune(now);
    const size_t sent = tracker.process(batch, now);
    tracker.save_state(cfg.alert_state_file);
    LOGF_INFO(logger, Consensus, "%zu alert(s) sent, %zu today", sent, tracker.sent_today(now));
}

int cmd_batch(const util::CLIArgs& args, const config::AppConfig& cfg, logging::AsyncLogger& logger) {
    trading::InMemoryWatchlist watchlist(args.use_watchlist ? cfg.watchlist : args.tickers);
    if (watchlist.get().empty()) {
        std::cerr << "batch needs at least one ticker\n";
        return 1;
    }

    AnalysisParams params = cfg.analysis;
    if (args.parallel)
        params.parallel_batch = true;

    Analyzer analyzer(params, &logger);
    auto provider = make_provider(cfg);
    BatchResult batch = analyzer.batch_analyze(watchlist, *provider);

    if (args.json_output) {
        std::cout << to_json(batch).dump(2) << "\n";
        if (args.alerts || cfg.alerts_enabled)
            send_alerts(batch, args, cfg, logger);
        return 0;
    }

    for (const auto& entry : batch.entries) {
        if (entry.ok()) {
            print_result(*entry.result);
        } else {
            std::cout << "\n=== " << entry.ticker << " ===\nError (" << error_kind_to_string(entry.error->kind)
                      << "): " << entry.error->message << "\n";
        }
    }
    std::cout << "\nSummary: " << batch.entries.size() << " requested, " << batch.successful() << " successful, "
              << batch.failed() << " failed\n";
    if (args.alerts || cfg.alerts_enabled)
        send_alerts(batch, args, cfg, logger);
    return 0;
}

int cmd_size(const util::CLIArgs& args, const config::AppConfig& cfg, logging::AsyncLogger& logger) {
    const double account = args.account.value_or(cfg.analysis.risk.capital);
    const double risk_pct = args.risk_percent.value_or(cfg.analysis.risk.risk_percent);

    risk::PositionSizePlan plan = risk::calculate_position_size(account, risk_pct, *args.entry, *args.stop);
    LOGF_INFO(logger, Risk, "Position size: account %.2f, risk %.2f%%, entry %.2f, stop %.2f -> %lld shares", account,
              risk_pct, *args.entry, *args.stop, static_cast<long long>(plan.max_shares));

    if (args.json_output) {
        std::cout << position_size_json(plan).dump(2) << "\n";
        return 0;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Account:          $" << plan.account_size << "\n";
    std::cout << "Risk:             " << plan.risk_percent << "% ($" << plan.risk_amount << ")\n";
    std::cout << "Risk per share:   $" << plan.risk_per_share << "\n";
    std::cout << "Max shares:       " << plan.max_shares << "\n";
    std::cout << "Total investment: $" << plan.total_investment << "\n";
    return 0;
}

void print_trade(const trading::TradeRecord& t) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "#" << t.id << " " << std::left << std::setw(8) << t.ticker << std::setw(6)
              << trading::trade_type_to_string(t.type) << std::setw(7) << trading::trade_status_to_string(t.status)
              << std::right << " entry $" << t.entry_price;
    if (auto pnl = trading::compute_pnl(t)) {
        std::cout << " exit $" << *t.exit_price << " P&L " << std::showpos << *pnl << " ("
                  << *trading::pnl_percent(t) << "%)" << std::noshowpos;
    }
    std::cout << "\n";
}

int cmd_pnl(const util::CLIArgs& args, logging::AsyncLogger& logger) {
    trading::InMemoryTradeJournal journal;
    trading::TradeRecord record;
    record.ticker = args.tickers.empty() ? "TRADE" : args.tickers[0];
    record.type = trading::trade_type_from_string(args.trade_type);
    record.entry_price = *args.entry;
    record.stop_loss_price = *args.stop;
    record.entry_timestamp = util::wall_clock_ms();

    record = journal.add(record);
    if (args.exit) {
        record = journal.update(record.id, *args.exit);
        LOGF_INFO(logger, Journal, "Closed %s %s: entry %.2f exit %.2f", record.ticker.c_str(),
                  trading::trade_type_to_string(record.type), record.entry_price, *args.exit);
    }

    if (args.json_output)
        std::cout << to_json(record).dump(2) << "\n";
    else
        print_trade(record);
    return 0;
}

/**
 * Journal CSV: ticker,type,entry,stop[,exit] (header optional).
 * Rows with an exit price are closed at that price.
 */
int cmd_journal(const util::CLIArgs& args, logging::AsyncLogger& logger) {
    std::ifstream file(args.file);
    if (!file.is_open()) {
        throw ValidationError("Cannot open journal file: " + args.file, "file");
    }

    trading::InMemoryTradeJournal journal;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = util::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line_no == 1 && util::to_lower(line).find("ticker") != std::string::npos)
            continue;

        auto cols = util::split(line, ',');
        auto entry = cols.size() >= 4 ? util::parse_number(cols[2]) : std::nullopt;
        auto stop = cols.size() >= 4 ? util::parse_number(cols[3]) : std::nullopt;
        if (!entry || !stop) {
            throw ValidationError(args.file + ":" + std::to_string(line_no) + ": expected ticker,type,entry,stop[,exit]",
                                  "file");
        }

        trading::TradeRecord record;
        record.ticker = cols[0];
        record.type = trading::trade_type_from_string(cols[1]);
        record.entry_price = *entry;
        record.stop_loss_price = *stop;
        record = journal.add(record);

        if (cols.size() >= 5 && !cols[4].empty()) {
            auto exit = util::parse_number(cols[4]);
            if (!exit) {
                throw ValidationError(args.file + ":" + std::to_string(line_no) + ": bad exit price", "exit_price");
            }
            journal.update(record.id, *exit);
        }
    }

    const auto records = journal.list();
    const auto summary = trading::summarize(records);
    LOGF_INFO(logger, Journal, "Journal: %zu open, %zu closed, realized %.2f", summary.open, summary.closed,
              summary.realized_pnl);

    if (args.json_output) {
        json trades = json::array();
        for (const auto& r : records)
            trades.push_back(to_json(r));
        std::cout << json{{"trades", trades}, {"summary", to_json(summary)}}.dump(2) << "\n";
        return 0;
    }

    for (const auto& r : records)
        print_trade(r);
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "\nOpen: " << summary.open << "  Closed: " << summary.closed << "  Winners: " << summary.winners
              << "  Losers: " << summary.losers << "\n";
    std::cout << "Realized P&L: " << std::showpos << summary.realized_pnl << std::noshowpos
              << "  Win rate: " << summary.win_rate_pct() << "%\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help || args.command.empty()) {
        util::print_help();
        return args.help ? 0 : 1;
    }

    const auto missing = util::missing_options(args);
    if (!missing.empty()) {
        std::cerr << args.command << " needs";
        for (const auto& opt : missing)
            std::cerr << " " << opt;
        std::cerr << "\n";
        return 1;
    }

    logging::AsyncLogger logger;
    int rc = 1;

    try {
        config::AppConfig cfg;
        if (!args.config_path.empty()) {
            cfg = config::ConfigParser::load(args.config_path);
        }
        if (!args.data_dir.empty()) {
            cfg.data_dir = args.data_dir;
        }
        if (args.provider == "csv") {
            cfg.provider = config::ProviderType::Csv;
        } else if (args.provider == "alpha_vantage") {
            cfg.provider = config::ProviderType::AlphaVantage;
        } else if (!args.provider.empty()) {
            throw ValidationError("unknown provider '" + args.provider + "'", "provider");
        }

        logger.set_min_level(args.verbose ? logging::LogLevel::Debug : cfg.log_level);
        logger.start();

        if (args.command == "analyze") {
            rc = cmd_analyze(args, cfg, logger);
        } else if (args.command == "batch") {
            rc = cmd_batch(args, cfg, logger);
        } else if (args.command == "size") {
            rc = cmd_size(args, cfg, logger);
        } else if (args.command == "pnl") {
            rc = cmd_pnl(args, logger);
        } else if (args.command == "journal") {
            rc = cmd_journal(args, logger);
        } else {
            std::cerr << "Unknown command: " << args.command << "\n";
            std::cerr << "Use --help for usage information.\n";
        }
    } catch (const AnalysisError& e) {
        if (args.json_output)
            std::cout << error_json(e).dump(2) << "\n";
        else
            std::cerr << "Error (" << e.kind_name() << "): " << e.what() << "\n";
        rc = 1;
    }

    logger.stop();
    return rc;
}

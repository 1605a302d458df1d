#pragma once

#include "../analysis/analysis_params.hpp"
#include "../logging/async_logger.hpp"
#include "defaults.hpp"

#include <string>
#include <vector>

namespace quantcode {
namespace config {

enum class ProviderType { Csv, AlphaVantage };

inline const char* provider_type_to_string(ProviderType p) {
    return p == ProviderType::Csv ? "csv" : "alpha_vantage";
}

/**
 * Runtime configuration for the CLI tools.
 *
 * Example (every key optional):
 * {
 *   "log_level": "info",
 *   "watchlist": ["AAPL", "MSFT"],
 *   "data": { "provider": "csv", "directory": "data",
 *             "api_key_env": "ALPHA_VANTAGE_API_KEY" },
 *   "analysis": { "lookback_days": 180, "parallel_batch": false,
 *                 "include_trade_setup": true, "swing_window": 3 },
 *   "indicators": {
 *     "heiken_ashi": { "wick_epsilon": 1e-9 },
 *     "bollinger":   { "window": 20, "multiplier": 2.0 },
 *     "macd":        { "fast": 12, "slow": 26, "signal": 9 },
 *     "rsi":         { "period": 14, "oversold": 30, "overbought": 70 }
 *   },
 *   "risk": { "capital": 5000, "risk_percent": 1.0, "rr_ratio": 3.0 },
 *   "alerts": { "enabled": false, "state_file": ".alert_state.json" }
 * }
 */
struct AppConfig {
    analysis::AnalysisParams analysis;

    ProviderType provider = ProviderType::Csv;
    std::string data_dir = data::DIRECTORY;
    std::string api_key_env = data::API_KEY_ENV;

    logging::LogLevel log_level = logging::LogLevel::Info;
    std::vector<std::string> watchlist;

    // BUY/SELL alerts for watchlist batches, once per ticker and signal per day
    bool alerts_enabled = false;
    std::string alert_state_file = alerts::STATE_FILE;
};

/**
 * JSON config loader (nlohmann/json)
 *
 * Unknown keys are ignored. A known key with the wrong type or an
 * out-of-range value throws ValidationError naming the key path
 * (e.g. "indicators.macd.fast").
 */
class ConfigParser {
public:
    static AppConfig load(const std::string& filename);
    static AppConfig parse(const std::string& json_text);
    static std::string dump(const AppConfig& config);
    static void save(const std::string& filename, const AppConfig& config);
};

} // namespace config
} // namespace quantcode

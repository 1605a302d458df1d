#pragma once

#include <cstddef>

/**
 * Centralized configuration defaults for the analysis engine.
 *
 * All default values are defined here to avoid duplication across:
 * - Indicator configs
 * - RiskConfig
 * - AnalysisParams / AppConfig
 *
 * Naming:
 * - _PCT suffix: percentage in percent units (1.0 = 1%)
 * - _DAYS suffix: calendar days
 */

namespace quantcode::config {

// =============================================================================
// Indicators (textbook parameters)
// =============================================================================
namespace heiken_ashi {
// |ha_open - ha_low| at or below this counts as "no wick"
constexpr double WICK_EPSILON = 1e-9;
} // namespace heiken_ashi

namespace bollinger {
constexpr size_t WINDOW = 20;
constexpr double MULTIPLIER = 2.0;
} // namespace bollinger

namespace macd {
constexpr size_t FAST = 12;
constexpr size_t SLOW = 26;
constexpr size_t SIGNAL = 9;
} // namespace macd

namespace rsi {
constexpr size_t PERIOD = 14;
constexpr double OVERSOLD = 30.0;
constexpr double OVERBOUGHT = 70.0;
} // namespace rsi

namespace trend {
// Bars on each side a swing extreme must dominate
constexpr size_t SWING_WINDOW = 3;
} // namespace trend

// =============================================================================
// Risk / Position Sizing
// =============================================================================
namespace risk {
constexpr double CAPITAL = 5000.0;
constexpr double RISK_PCT = 1.0;
constexpr double MAX_RISK_PCT = 100.0;
constexpr double RR_RATIO = 3.0;
} // namespace risk

// =============================================================================
// Data
// =============================================================================
namespace data {
// ~125 sessions: comfortably above the 35-bar MACD minimum
constexpr int LOOKBACK_DAYS = 180;
constexpr const char* DIRECTORY = "data";
constexpr const char* API_KEY_ENV = "ALPHA_VANTAGE_API_KEY";
} // namespace data

// =============================================================================
// Signal alerts
// =============================================================================
namespace alerts {
constexpr const char* STATE_FILE = ".alert_state.json";
} // namespace alerts

} // namespace quantcode::config

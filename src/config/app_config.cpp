#include "../../include/config/app_config.hpp"

#include "../../include/errors.hpp"
#include "../../include/util/string_utils.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace quantcode {
namespace config {

using json = nlohmann::json;

namespace {

std::string join_path(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

const json* section(const json& parent, const char* key, const std::string& path) {
    if (!parent.contains(key))
        return nullptr;
    const json& node = parent.at(key);
    if (!node.is_object()) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be an object", join_path(path, key));
    }
    return &node;
}

void read(const json& obj, const char* key, const std::string& path, double& out) {
    if (!obj.contains(key))
        return;
    const json& v = obj.at(key);
    if (!v.is_number()) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be a number", join_path(path, key));
    }
    out = v.get<double>();
}

void read(const json& obj, const char* key, const std::string& path, size_t& out) {
    if (!obj.contains(key))
        return;
    const json& v = obj.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be a non-negative integer",
                              join_path(path, key));
    }
    out = v.get<size_t>();
}

void read(const json& obj, const char* key, const std::string& path, int& out) {
    if (!obj.contains(key))
        return;
    const json& v = obj.at(key);
    if (!v.is_number_integer()) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be an integer", join_path(path, key));
    }
    out = v.get<int>();
}

void read(const json& obj, const char* key, const std::string& path, bool& out) {
    if (!obj.contains(key))
        return;
    const json& v = obj.at(key);
    if (!v.is_boolean()) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be true or false", join_path(path, key));
    }
    out = v.get<bool>();
}

void read(const json& obj, const char* key, const std::string& path, std::string& out) {
    if (!obj.contains(key))
        return;
    const json& v = obj.at(key);
    if (!v.is_string()) {
        throw ValidationError("config: '" + join_path(path, key) + "' must be a string", join_path(path, key));
    }
    out = v.get<std::string>();
}

} // namespace

AppConfig ConfigParser::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ValidationError("Cannot open config file: " + filename, "config");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

AppConfig ConfigParser::parse(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("config: invalid JSON: ") + e.what(), "config");
    }
    if (!root.is_object()) {
        throw ValidationError("config: top level must be an object", "config");
    }

    AppConfig config;
    auto& params = config.analysis;

    std::string level;
    read(root, "log_level", "", level);
    if (!level.empty()) {
        auto parsed = logging::level_from_string(level);
        if (!parsed) {
            throw ValidationError("config: unknown log_level '" + level + "'", "log_level");
        }
        config.log_level = *parsed;
    }

    if (root.contains("watchlist")) {
        const json& list = root.at("watchlist");
        if (!list.is_array()) {
            throw ValidationError("config: 'watchlist' must be an array of strings", "watchlist");
        }
        for (const auto& item : list) {
            if (!item.is_string()) {
                throw ValidationError("config: 'watchlist' must be an array of strings", "watchlist");
            }
            std::string t = util::normalize_ticker(item.get<std::string>());
            if (!t.empty())
                config.watchlist.push_back(t);
        }
    }

    if (const json* data = section(root, "data", "")) {
        std::string provider;
        read(*data, "provider", "data", provider);
        if (provider == "csv") {
            config.provider = ProviderType::Csv;
        } else if (provider == "alpha_vantage") {
            config.provider = ProviderType::AlphaVantage;
        } else if (!provider.empty()) {
            throw ValidationError("config: data.provider must be 'csv' or 'alpha_vantage'", "data.provider");
        }
        read(*data, "directory", "data", config.data_dir);
        read(*data, "api_key_env", "data", config.api_key_env);
    }

    if (const json* analysis = section(root, "analysis", "")) {
        read(*analysis, "lookback_days", "analysis", params.lookback_days);
        read(*analysis, "parallel_batch", "analysis", params.parallel_batch);
        read(*analysis, "include_trade_setup", "analysis", params.include_trade_setup);
        read(*analysis, "swing_window", "analysis", params.swing_window);
        if (params.lookback_days <= 0) {
            throw ValidationError("config: analysis.lookback_days must be positive", "analysis.lookback_days");
        }
    }

    if (const json* ind = section(root, "indicators", "")) {
        if (const json* ha = section(*ind, "heiken_ashi", "indicators")) {
            read(*ha, "wick_epsilon", "indicators.heiken_ashi", params.heiken_ashi.wick_epsilon);
        }
        if (const json* bb = section(*ind, "bollinger", "indicators")) {
            read(*bb, "window", "indicators.bollinger", params.bollinger.window);
            read(*bb, "multiplier", "indicators.bollinger", params.bollinger.multiplier);
        }
        if (const json* macd = section(*ind, "macd", "indicators")) {
            read(*macd, "fast", "indicators.macd", params.macd.fast);
            read(*macd, "slow", "indicators.macd", params.macd.slow);
            read(*macd, "signal", "indicators.macd", params.macd.signal);
        }
        if (const json* rsi = section(*ind, "rsi", "indicators")) {
            read(*rsi, "period", "indicators.rsi", params.rsi.period);
            read(*rsi, "oversold", "indicators.rsi", params.rsi.oversold);
            read(*rsi, "overbought", "indicators.rsi", params.rsi.overbought);
        }
    }

    if (const json* risk = section(root, "risk", "")) {
        read(*risk, "capital", "risk", params.risk.capital);
        read(*risk, "risk_percent", "risk", params.risk.risk_percent);
        read(*risk, "rr_ratio", "risk", params.risk.rr_ratio);
    }

    if (const json* alerts = section(root, "alerts", "")) {
        read(*alerts, "enabled", "alerts", config.alerts_enabled);
        read(*alerts, "state_file", "alerts", config.alert_state_file);
        if (config.alert_state_file.empty()) {
            throw ValidationError("config: alerts.state_file must not be empty", "alerts.state_file");
        }
    }

    return config;
}

std::string ConfigParser::dump(const AppConfig& config) {
    const auto& p = config.analysis;

    json root = {
        {"log_level", util::to_lower(util::trim(logging::level_to_string(config.log_level)))},
        {"watchlist", config.watchlist},
        {"data",
         {{"provider", provider_type_to_string(config.provider)},
          {"directory", config.data_dir},
          {"api_key_env", config.api_key_env}}},
        {"analysis",
         {{"lookback_days", p.lookback_days},
          {"parallel_batch", p.parallel_batch},
          {"include_trade_setup", p.include_trade_setup},
          {"swing_window", p.swing_window}}},
        {"indicators",
         {{"heiken_ashi", {{"wick_epsilon", p.heiken_ashi.wick_epsilon}}},
          {"bollinger", {{"window", p.bollinger.window}, {"multiplier", p.bollinger.multiplier}}},
          {"macd", {{"fast", p.macd.fast}, {"slow", p.macd.slow}, {"signal", p.macd.signal}}},
          {"rsi",
           {{"period", p.rsi.period}, {"oversold", p.rsi.oversold}, {"overbought", p.rsi.overbought}}}}},
        {"risk",
         {{"capital", p.risk.capital}, {"risk_percent", p.risk.risk_percent}, {"rr_ratio", p.risk.rr_ratio}}},
        {"alerts", {{"enabled", config.alerts_enabled}, {"state_file", config.alert_state_file}}},
    };
    return root.dump(2);
}

void ConfigParser::save(const std::string& filename, const AppConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ValidationError("Cannot create config file: " + filename, "config");
    }
    file << dump(config) << "\n";
}

} // namespace config
} // namespace quantcode

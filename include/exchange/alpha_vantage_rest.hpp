#pragma once

#include "history_provider.hpp"

#include <algorithm>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace quantcode {
namespace exchange {

using json = nlohmann::json;

/**
 * Alpha Vantage REST client for daily equity bars
 *
 * Uses libcurl for HTTP requests, TIME_SERIES_DAILY endpoint.
 * No caching, no retry: one request per fetch().
 */
class AlphaVantageRest : public IPriceHistoryProvider {
public:
    static constexpr const char* BASE_URL = "https://www.alphavantage.co";

    // "compact" returns the latest 100 sessions (~140 calendar days)
    static constexpr int COMPACT_CALENDAR_DAYS = 140;

    explicit AlphaVantageRest(std::string api_key, std::string base_url = BASE_URL)
        : api_key_(std::move(api_key))
        , base_url_(std::move(base_url))
        , curl_(nullptr) {
        if (api_key_.empty()) {
            throw ValidationError("Alpha Vantage API key is required", "api_key");
        }
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_ = curl_easy_init();
        if (!curl_) {
            throw UpstreamDataError("Failed to initialize CURL");
        }
    }

    ~AlphaVantageRest() override {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
        curl_global_cleanup();
    }

    // Non-copyable
    AlphaVantageRest(const AlphaVantageRest&) = delete;
    AlphaVantageRest& operator=(const AlphaVantageRest&) = delete;

    std::vector<Bar> fetch(const std::string& ticker, int lookback_days) override {
        const std::string symbol = util::normalize_ticker(ticker);
        if (symbol.empty()) {
            throw ValidationError("ticker is required", "ticker");
        }

        std::string response = http_get(build_url(symbol, lookback_days));
        return trim_to_lookback(parse_daily_json(response, symbol), lookback_days);
    }

    std::string build_url(const std::string& symbol, int lookback_days) const {
        std::stringstream url;
        url << base_url_ << "/query?function=TIME_SERIES_DAILY"
            << "&symbol=" << symbol
            << "&outputsize=" << (lookback_days > COMPACT_CALENDAR_DAYS ? "full" : "compact")
            << "&apikey=" << api_key_;
        return url.str();
    }

    /**
     * Parse a TIME_SERIES_DAILY response into bars, oldest first.
     *
     * Alpha Vantage reports failures with HTTP 200 and one of
     * "Error Message", "Note" (rate limit) or "Information" in the body.
     *
     * @throws UpstreamDataError on API errors, malformed JSON or no data
     */
    static std::vector<Bar> parse_daily_json(const std::string& body, const std::string& symbol = "") {
        json data;
        try {
            data = json::parse(body);
        } catch (const json::exception& e) {
            throw UpstreamDataError(std::string("Invalid JSON from Alpha Vantage: ") + e.what(), symbol);
        }

        for (const char* key : {"Error Message", "Note", "Information"}) {
            if (data.contains(key)) {
                const auto& msg = data[key];
                throw UpstreamDataError("Alpha Vantage: " + (msg.is_string() ? msg.get<std::string>() : msg.dump()),
                                        symbol);
            }
        }

        if (!data.contains("Time Series (Daily)") || !data["Time Series (Daily)"].is_object()) {
            throw UpstreamDataError("No daily time series in Alpha Vantage response", symbol);
        }

        std::vector<Bar> bars;
        try {
            for (const auto& [date, fields] : data["Time Series (Daily)"].items()) {
                auto ts = util::parse_date(date);
                if (!ts) {
                    throw UpstreamDataError("Bad date '" + date + "' in Alpha Vantage response", symbol);
                }

                Bar b;
                b.timestamp = *ts;
                b.open = std::stod(fields.at("1. open").get<std::string>());
                b.high = std::stod(fields.at("2. high").get<std::string>());
                b.low = std::stod(fields.at("3. low").get<std::string>());
                b.close = std::stod(fields.at("4. close").get<std::string>());
                if (fields.contains("5. volume")) {
                    b.volume = std::stod(fields["5. volume"].get<std::string>());
                }
                bars.push_back(b);
            }
        } catch (const json::exception& e) {
            throw UpstreamDataError(std::string("Malformed Alpha Vantage bar: ") + e.what(), symbol);
        } catch (const std::logic_error& e) {
            throw UpstreamDataError(std::string("Malformed Alpha Vantage price: ") + e.what(), symbol);
        }

        if (bars.empty()) {
            throw UpstreamDataError("No data found for ticker '" + symbol + "' from Alpha Vantage", symbol);
        }

        // Response is newest first
        std::sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
        return bars;
    }

private:
    std::string api_key_;
    std::string base_url_;
    CURL* curl_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t total_size = size * nmemb;
        userp->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::string http_get(const std::string& url) {
        std::string response;

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 30L);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);

        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            throw UpstreamDataError(std::string("CURL error: ") + curl_easy_strerror(res));
        }

        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 200) {
            throw UpstreamDataError("HTTP error " + std::to_string(http_code) + ": " + response);
        }

        return response;
    }
};

} // namespace exchange
} // namespace quantcode

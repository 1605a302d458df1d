#include "../../include/indicators/moving_average.hpp"

namespace quantcode {
namespace indicators {

double sma(const std::vector<double>& values, size_t end, size_t period) {
    double sum = 0;
    for (size_t i = end - period; i < end; ++i) {
        sum += values[i];
    }
    return sum / static_cast<double>(period);
}

double sample_stddev(const std::vector<double>& values, size_t end, size_t period) {
    double mean = sma(values, end, period);
    double sq = 0;
    for (size_t i = end - period; i < end; ++i) {
        double d = values[i] - mean;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(period - 1));
}

std::vector<double> ema_series(const std::vector<double>& values, size_t period, size_t start) {
    std::vector<double> out(values.size(), UNDEFINED);
    if (period == 0 || start + period > values.size())
        return out;

    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    size_t seed = start + period - 1;

    out[seed] = sma(values, seed + 1, period);
    for (size_t t = seed + 1; t < values.size(); ++t) {
        out[t] = values[t] * alpha + out[t - 1] * (1.0 - alpha);
    }
    return out;
}

} // namespace indicators
} // namespace quantcode

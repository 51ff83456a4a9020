#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace trendpilot {
namespace analytics {

Series TechnicalIndicators::calculateEMAVector(const std::vector<double>& values, int period) {
    Series out(values.size());
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return out;
    }

    // Seed: simple average of the first period values
    double seed = 0.0;
    for (int i = 0; i < period; ++i) seed += values[i];
    seed /= period;

    const double k = 2.0 / (period + 1.0);
    double ema = seed;
    out[period - 1] = ema;

    for (size_t i = period; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
        out[i] = ema;
    }
    return out;
}

Series TechnicalIndicators::calculateTrueRange(const std::vector<Candle>& candles) {
    Series tr(candles.size());
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const double prev_close = candles[i - 1].close;

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev_close);
        double tr3 = std::abs(current.low - prev_close);
        tr[i] = std::max({tr1, tr2, tr3});
    }
    return tr;
}

Series TechnicalIndicators::calculateATRVector(const std::vector<Candle>& candles, int period) {
    Series out(candles.size());
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return out;
    }

    const Series tr = calculateTrueRange(candles);

    // First TR sits at index 1; the seed covers tr[1..period]
    double atr = 0.0;
    for (int i = 1; i <= period; ++i) atr += *tr[i];
    atr /= period;
    out[period] = atr;

    // Wilder's smoothing
    for (size_t i = period + 1; i < candles.size(); ++i) {
        atr = ((atr * (period - 1)) + *tr[i]) / period;
        out[i] = atr;
    }
    return out;
}

double TechnicalIndicators::gaussianWeight(double offset, double bandwidth) {
    return std::exp(-(offset * offset) / (2.0 * bandwidth * bandwidth));
}

std::optional<TechnicalIndicators::Envelope> TechnicalIndicators::calculateEnvelopeAt(
    const std::vector<double>& closes,
    size_t end_index,
    double bandwidth,
    double multiplier,
    int window
) {
    if (window <= 0 || bandwidth <= 0.0 || end_index >= closes.size()) {
        return std::nullopt;
    }
    // offsets 0..window used by the MAE need window + 1 bars
    if (end_index < static_cast<size_t>(window)) {
        return std::nullopt;
    }

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (int i = 0; i < window; ++i) {
        const double w = gaussianWeight(static_cast<double>(i), bandwidth);
        weighted_sum += closes[end_index - i] * w;
        weight_total += w;
    }

    Envelope env;
    env.mid = weighted_sum / weight_total;

    // Mean absolute error over offsets 1..window (endpoint excluded)
    double abs_err = 0.0;
    for (int i = 1; i <= window; ++i) {
        abs_err += std::abs(closes[end_index - i] - env.mid);
    }
    const double mae = (abs_err / window) * multiplier;

    env.upper = env.mid + mae;
    env.lower = env.mid - mae;
    return env;
}

std::optional<TechnicalIndicators::Envelope> TechnicalIndicators::calculateEnvelope(
    const std::vector<double>& closes,
    double bandwidth,
    double multiplier,
    int window
) {
    if (closes.empty()) return std::nullopt;
    return calculateEnvelopeAt(closes, closes.size() - 1, bandwidth, multiplier, window);
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

} // namespace analytics
} // namespace trendpilot

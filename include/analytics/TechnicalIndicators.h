#pragma once

#include <optional>
#include <vector>
#include "common/Types.h"

namespace trendpilot {
namespace analytics {

// Series value that is undefined until enough history exists
using SeriesValue = std::optional<double>;
using Series = std::vector<SeriesValue>;

// Technical indicators over closed bars only.
// Every series is aligned with its input: out[i] uses inputs [0..i] and
// nothing later, and is std::nullopt while the lookback is not filled.
class TechnicalIndicators {
public:
    // EMA: seed = SMA of the first `period` values, then
    // e[i] = v[i] * k + e[i-1] * (1 - k), k = 2 / (period + 1)
    static Series calculateEMAVector(const std::vector<double>& values, int period);

    // True range; tr[0] is undefined (needs a previous close)
    static Series calculateTrueRange(const std::vector<Candle>& candles);

    // ATR with Wilder smoothing, seeded with the mean of the first `period` true ranges
    static Series calculateATRVector(const std::vector<Candle>& candles, int period);

    // Gaussian-kernel regression envelope anchored at the last close
    struct Envelope {
        double upper;
        double lower;
        double mid;

        Envelope() : upper(0), lower(0), mid(0) {}
        bool contains(double price) const { return price >= lower && price <= upper; }
    };

    // Needs at least window + 1 closes
    static std::optional<Envelope> calculateEnvelope(const std::vector<double>& closes,
                                                     double bandwidth,
                                                     double multiplier,
                                                     int window);

    // Envelope evaluated at `end_index` using closes[0..end_index] only
    static std::optional<Envelope> calculateEnvelopeAt(const std::vector<double>& closes,
                                                       size_t end_index,
                                                       double bandwidth,
                                                       double multiplier,
                                                       int window);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

private:
    static double gaussianWeight(double offset, double bandwidth);
};

} // namespace analytics
} // namespace trendpilot

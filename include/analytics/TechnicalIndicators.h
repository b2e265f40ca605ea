#pragma once

#include <cstddef>
#include <vector>
#include "common/Types.h"

namespace exitforge {
namespace analytics {

// Indicator helpers for entry signals.
// Window helpers read candles in [end - period, end); `end` is exclusive so a
// caller evaluating index i passes i + 1 to include the current candle and i to
// look only at history. Nothing here reads past `end`.
class TechnicalIndicators {
public:
    // RSI, Wilder smoothing. 50 when there is not enough data.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // Mean of the last `period` values, 0 when there is not enough data.
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Close prices of the window [end - count, end)
    static std::vector<double> closesWindow(const std::vector<Candle>& candles, size_t end, int count);

    static double smaClose(const std::vector<Candle>& candles, size_t end, int period);
    static double averageVolume(const std::vector<Candle>& candles, size_t end, int period);
    static double highestHigh(const std::vector<Candle>& candles, size_t end, int period);
    static double lowestLow(const std::vector<Candle>& candles, size_t end, int period);

    // Normalized Bollinger width, 2 * stddev / sma over the window
    static double bollingerWidth(const std::vector<Candle>& candles, size_t end, int period);

    // Number of consecutive same-direction candles ending at `index` (inclusive).
    // Positive for green runs, negative for red runs, 0 for a doji.
    static int consecutiveDirection(const std::vector<Candle>& candles, size_t index, int max_lookback);

    // Close-to-close percent change of candle `index` vs the previous one
    static double percentChange(const std::vector<Candle>& candles, size_t index);

    // Parkinson range volatility per candle
    static double parkinsonVolatility(const std::vector<Candle>& candles);

private:
    static bool hasWindow(size_t end, int period) {
        return period > 0 && end >= static_cast<size_t>(period);
    }
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace exitforge

#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace exitforge {
namespace analytics {

// Wilder smoothing over the whole input
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

std::vector<double> TechnicalIndicators::closesWindow(
    const std::vector<Candle>& candles,
    size_t end,
    int count
) {
    std::vector<double> out;
    end = std::min(end, candles.size());
    if (!hasWindow(end, count)) return out;

    out.reserve(count);
    for (size_t i = end - count; i < end; ++i) {
        out.push_back(candles[i].close);
    }
    return out;
}

double TechnicalIndicators::smaClose(const std::vector<Candle>& candles, size_t end, int period) {
    end = std::min(end, candles.size());
    if (!hasWindow(end, period)) return 0.0;

    double sum = 0.0;
    for (size_t i = end - period; i < end; ++i) {
        sum += candles[i].close;
    }
    return sum / period;
}

double TechnicalIndicators::averageVolume(const std::vector<Candle>& candles, size_t end, int period) {
    end = std::min(end, candles.size());
    if (!hasWindow(end, period)) return 0.0;

    double sum = 0.0;
    for (size_t i = end - period; i < end; ++i) {
        sum += candles[i].volume;
    }
    return sum / period;
}

double TechnicalIndicators::highestHigh(const std::vector<Candle>& candles, size_t end, int period) {
    end = std::min(end, candles.size());
    if (!hasWindow(end, period)) return 0.0;

    double hi = -std::numeric_limits<double>::infinity();
    for (size_t i = end - period; i < end; ++i) {
        hi = std::max(hi, candles[i].high);
    }
    return hi;
}

double TechnicalIndicators::lowestLow(const std::vector<Candle>& candles, size_t end, int period) {
    end = std::min(end, candles.size());
    if (!hasWindow(end, period)) return 0.0;

    double lo = std::numeric_limits<double>::infinity();
    for (size_t i = end - period; i < end; ++i) {
        lo = std::min(lo, candles[i].low);
    }
    return lo;
}

double TechnicalIndicators::bollingerWidth(const std::vector<Candle>& candles, size_t end, int period) {
    const auto closes = closesWindow(candles, end, period);
    if (closes.empty()) return 0.0;

    const double sma = calculateSMA(closes, period);
    if (sma <= 0.0) return 0.0;

    const double std_dev = calculateStandardDeviation(closes, sma);
    return (std_dev * 2.0) / sma;
}

int TechnicalIndicators::consecutiveDirection(
    const std::vector<Candle>& candles,
    size_t index,
    int max_lookback
) {
    if (index >= candles.size() || max_lookback <= 0) return 0;

    const bool green = candles[index].isGreen();
    const bool red = candles[index].isRed();
    if (!green && !red) return 0;

    int count = 0;
    for (size_t k = 0; k < static_cast<size_t>(max_lookback) && k <= index; ++k) {
        const Candle& c = candles[index - k];
        if ((green && c.isGreen()) || (red && c.isRed())) {
            ++count;
        } else {
            break;
        }
    }
    return green ? count : -count;
}

double TechnicalIndicators::percentChange(const std::vector<Candle>& candles, size_t index) {
    if (index == 0 || index >= candles.size()) return 0.0;
    const double prev = candles[index - 1].close;
    if (prev <= 0.0) return 0.0;
    return (candles[index].close - prev) / prev * 100.0;
}

double TechnicalIndicators::parkinsonVolatility(const std::vector<Candle>& candles) {
    double sum_sq = 0.0;
    int n = 0;
    for (const auto& c : candles) {
        if (c.high <= 0.0 || c.low <= 0.0 || c.high < c.low) continue;
        const double r = std::log(c.high / c.low);
        sum_sq += r * r;
        ++n;
    }
    if (n == 0) return 0.0;
    return std::sqrt(sum_sq / (4.0 * n * std::log(2.0)));
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

} // namespace analytics
} // namespace exitforge

#include "strategy/EntrySignals.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <limits>

namespace exitforge {
namespace strategy {

using analytics::TechnicalIndicators;

namespace {
bool inRange(const std::vector<Candle>& candles, size_t index, size_t lookback) {
    return index < candles.size() && index >= lookback;
}

// Current volume over the average of the window ending at index (inclusive)
double volumeSpike(const std::vector<Candle>& candles, size_t index, int window) {
    const double avg = TechnicalIndicators::averageVolume(candles, index + 1, window);
    if (avg <= 0.0) return 0.0;
    return candles[index].volume / avg;
}
}

bool MomentumSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;
    if (!candles[index].isGreen()) return false;

    const auto closes = TechnicalIndicators::closesWindow(candles, index + 1, config_.rsi_period + 1);
    const double rsi = TechnicalIndicators::calculateRSI(closes, config_.rsi_period);
    return rsi >= config_.rsi_lower && rsi <= config_.rsi_upper;
}

bool MeanReversionSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;
    if (!candles[index].isGreen()) return false;

    // SMA of the closes before this candle
    const double sma = TechnicalIndicators::smaClose(candles, index, config_.sma_period);
    if (sma <= 0.0) return false;

    double recent_low_close = std::numeric_limits<double>::infinity();
    const int window = std::max(1, config_.dip_window);
    for (int k = 0; k < window && static_cast<size_t>(k) <= index; ++k) {
        recent_low_close = std::min(recent_low_close, candles[index - k].close);
    }
    return recent_low_close < sma * config_.dip_ratio;
}

bool BreakoutSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    const double prior_high = TechnicalIndicators::highestHigh(candles, index, config_.lookback);
    const double prior_volume = TechnicalIndicators::averageVolume(candles, index, config_.lookback);
    const Candle& c = candles[index];

    return prior_high > 0.0 &&
           c.close >= prior_high &&
           c.volume > prior_volume * config_.volume_ratio;
}

bool TrendFollowSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    const double sma = TechnicalIndicators::smaClose(candles, index + 1, config_.sma_period);
    const double avg_volume = TechnicalIndicators::averageVolume(candles, index, config_.sma_period);
    const double prev_close = candles[index - 1].close;
    const Candle& c = candles[index];

    return prev_close <= sma &&
           c.close > sma &&
           c.volume > avg_volume * config_.volume_ratio;
}

bool SqueezeBreakoutSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    const double prev_width = TechnicalIndicators::bollingerWidth(candles, index, config_.bb_period);
    const double width = TechnicalIndicators::bollingerWidth(candles, index + 1, config_.bb_period);
    const double middle = TechnicalIndicators::smaClose(candles, index + 1, config_.bb_period);

    return prev_width > 0.0 &&
           prev_width < config_.squeeze_width &&
           width > prev_width &&
           candles[index].close > middle;
}

bool FreshPumpSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    return candles[index].isGreen() &&
           TechnicalIndicators::percentChange(candles, index) > config_.min_change_pct &&
           volumeSpike(candles, index, config_.volume_window) > config_.volume_spike;
}

size_t AggressiveSignal::lookback() const {
    return static_cast<size_t>(std::max(config_.volume_window, config_.sma_period));
}

bool AggressiveSignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    const double sma = TechnicalIndicators::smaClose(candles, index + 1, config_.sma_period);
    return TechnicalIndicators::percentChange(candles, index) > config_.min_change_pct &&
           volumeSpike(candles, index, config_.volume_window) > config_.volume_spike &&
           candles[index].close > sma;
}

bool DipBuySignal::shouldEnter(const std::vector<Candle>& candles, size_t index) const {
    if (!inRange(candles, index, lookback())) return false;

    const Candle& c = candles[index];
    if (!c.isGreen()) return false;
    if (TechnicalIndicators::percentChange(candles, index) <= config_.min_bounce_pct) return false;

    double max_open = 0.0;
    double min_close = std::numeric_limits<double>::infinity();
    for (size_t k = index - config_.drop_window; k < index; ++k) {
        max_open = std::max(max_open, candles[k].open);
        min_close = std::min(min_close, candles[k].close);
    }
    if (max_open <= 0.0) return false;

    const double drop_pct = (max_open - min_close) / max_open * 100.0;
    if (drop_pct <= config_.min_drop_pct) return false;

    // Red streak immediately before the bounce
    const int streak = TechnicalIndicators::consecutiveDirection(candles, index - 1, config_.drop_window + 1);
    return streak <= -config_.min_red_streak;
}

} // namespace strategy
} // namespace exitforge

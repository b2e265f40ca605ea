#pragma once

#include "strategy/IEntrySignal.h"
#include "strategy/SignalConfig.h"

namespace exitforge {
namespace strategy {

// RSI in [lower, upper] on a green candle
class MomentumSignal : public IEntrySignal {
public:
    explicit MomentumSignal(const MomentumSignalConfig& config = MomentumSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "momentum"; }
    size_t lookback() const override { return static_cast<size_t>(config_.rsi_period); }

private:
    MomentumSignalConfig config_;
};

// Recent close dipped under the prior SMA, current candle green
class MeanReversionSignal : public IEntrySignal {
public:
    explicit MeanReversionSignal(const MeanReversionSignalConfig& config = MeanReversionSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "mean_reversion"; }
    size_t lookback() const override { return static_cast<size_t>(config_.sma_period); }

private:
    MeanReversionSignalConfig config_;
};

// Close at or above the N-candle high on expanded volume
class BreakoutSignal : public IEntrySignal {
public:
    explicit BreakoutSignal(const BreakoutSignalConfig& config = BreakoutSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "breakout"; }
    size_t lookback() const override { return static_cast<size_t>(config_.lookback); }

private:
    BreakoutSignalConfig config_;
};

// Close crosses above the SMA with volume confirmation
class TrendFollowSignal : public IEntrySignal {
public:
    explicit TrendFollowSignal(const TrendFollowSignalConfig& config = TrendFollowSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "trend_follow"; }
    size_t lookback() const override { return static_cast<size_t>(config_.sma_period); }

private:
    TrendFollowSignalConfig config_;
};

// Bollinger width expands out of a squeeze, close above the middle band
class SqueezeBreakoutSignal : public IEntrySignal {
public:
    explicit SqueezeBreakoutSignal(const SqueezeBreakoutSignalConfig& config = SqueezeBreakoutSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "squeeze_breakout"; }
    size_t lookback() const override { return static_cast<size_t>(config_.bb_period); }

private:
    SqueezeBreakoutSignalConfig config_;
};

class FreshPumpSignal : public IEntrySignal {
public:
    explicit FreshPumpSignal(const FreshPumpSignalConfig& config = FreshPumpSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "fresh_pump"; }
    size_t lookback() const override { return static_cast<size_t>(config_.volume_window); }

private:
    FreshPumpSignalConfig config_;
};

class AggressiveSignal : public IEntrySignal {
public:
    explicit AggressiveSignal(const AggressiveSignalConfig& config = AggressiveSignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "aggressive"; }
    size_t lookback() const override;

private:
    AggressiveSignalConfig config_;
};

// Bounce after a multi-candle red drop
class DipBuySignal : public IEntrySignal {
public:
    explicit DipBuySignal(const DipBuySignalConfig& config = DipBuySignalConfig())
        : config_(config) {}

    bool shouldEnter(const std::vector<Candle>& candles, size_t index) const override;
    std::string name() const override { return "dip_buy"; }
    size_t lookback() const override { return static_cast<size_t>(config_.drop_window); }

private:
    DipBuySignalConfig config_;
};

} // namespace strategy
} // namespace exitforge

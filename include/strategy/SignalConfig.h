#pragma once

namespace exitforge {
namespace strategy {

// Default parameters for each entry signal variant.

struct MomentumSignalConfig {
    int rsi_period = 14;
    double rsi_lower = 50.0;
    double rsi_upper = 70.0;
};

struct MeanReversionSignalConfig {
    int sma_period = 20;
    int dip_window = 3;             // last N closes, current included
    double dip_ratio = 0.99;        // close below sma * ratio
};

struct BreakoutSignalConfig {
    int lookback = 12;
    double volume_ratio = 1.5;
};

struct TrendFollowSignalConfig {
    int sma_period = 20;
    double volume_ratio = 1.2;
};

struct SqueezeBreakoutSignalConfig {
    int bb_period = 20;
    double squeeze_width = 0.04;    // 2 * std / sma
};

struct FreshPumpSignalConfig {
    double min_change_pct = 3.0;
    int volume_window = 5;
    double volume_spike = 1.8;
};

struct AggressiveSignalConfig {
    double min_change_pct = 2.0;
    int volume_window = 5;
    double volume_spike = 1.3;
    int sma_period = 5;
};

struct DipBuySignalConfig {
    int drop_window = 3;
    double min_drop_pct = 3.0;
    double min_bounce_pct = 0.5;
    int min_red_streak = 2;
};

} // namespace strategy
} // namespace exitforge

#pragma once

#include <string>
#include <vector>

namespace exitforge {

using Price = double;
using Volume = double;
using TimestampMs = long long;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // epoch ms

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    bool isGreen() const { return close > open; }
    bool isRed() const { return close < open; }
};

// One instrument's candle series, ascending by timestamp.
struct InstrumentSeries {
    std::string instrument;
    std::string interval;
    std::vector<Candle> candles;
};

} // namespace exitforge

#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

// Source of historical candles. Results are ascending and deduplicated.
// Failures come back as an empty series; callers check length before simulating.
class ICandleProvider {
public:
    virtual ~ICandleProvider() = default;

    virtual std::vector<Candle> fetch(const std::string& instrument,
                                      const std::string& interval,
                                      TimestampMs start_ms,
                                      TimestampMs end_ms) = 0;

    // Where the series is read from, recorded in evidence manifests
    virtual std::string sourceOf(const std::string& instrument, const std::string& interval) const = 0;
};

} // namespace backtest
} // namespace exitforge

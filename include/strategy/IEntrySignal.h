#pragma once

#include "common/Types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace exitforge {
namespace strategy {

// Stateless entry predicate over a bounded trailing window.
// shouldEnter() may read candles[0..index] only.
class IEntrySignal {
public:
    virtual ~IEntrySignal() = default;

    virtual bool shouldEnter(const std::vector<Candle>& candles, size_t index) const = 0;

    virtual std::string name() const = 0;

    // Smallest index at which shouldEnter() can fire
    virtual size_t lookback() const = 0;
};

} // namespace strategy
} // namespace exitforge

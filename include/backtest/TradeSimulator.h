#pragma once

#include "backtest/BacktestResult.h"
#include "strategy/IEntrySignal.h"
#include "strategy/ExitPolicy.h"

#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

struct SimulationSettings {
    size_t min_candles = 200;
};

// Replays one candle series with one (entry signal, exit policy) pair.
// At most one open position; entries fill at the next candle's open.
// Pure: identical inputs give identical ledgers.
class TradeSimulator {
public:
    explicit TradeSimulator(const SimulationSettings& settings = SimulationSettings());

    // Throws InvalidConfigurationError for an invalid policy.
    // Short series come back flagged insufficient_data with no trades.
    SimulationRun run(const InstrumentSeries& series,
                      const strategy::IEntrySignal& signal,
                      const strategy::ExitPolicy& policy) const;

    SimulationRun run(const std::vector<Candle>& candles,
                      const strategy::IEntrySignal& signal,
                      const strategy::ExitPolicy& policy) const;

    const SimulationSettings& settings() const { return settings_; }

private:
    SimulationSettings settings_;

    // Opens at entry_index and walks forward until an exit fires.
    // Returns the index of the exit candle.
    size_t simulatePosition(const std::vector<Candle>& candles,
                            size_t entry_index,
                            const strategy::ExitPolicy& policy,
                            TradeRecord& trade) const;
};

} // namespace backtest
} // namespace exitforge

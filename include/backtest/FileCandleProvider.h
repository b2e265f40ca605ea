#pragma once

#include "backtest/ICandleProvider.h"

namespace exitforge {
namespace backtest {

// Reads <dir>/<instrument>_<interval>.csv, falling back to .json
class FileCandleProvider : public ICandleProvider {
public:
    explicit FileCandleProvider(std::string data_dir);

    std::vector<Candle> fetch(const std::string& instrument,
                              const std::string& interval,
                              TimestampMs start_ms,
                              TimestampMs end_ms) override;

    std::string sourceOf(const std::string& instrument, const std::string& interval) const override;

private:
    std::string data_dir_;
};

} // namespace backtest
} // namespace exitforge

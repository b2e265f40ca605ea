#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace exitforge {
namespace backtest {

class DataHistory {
public:
    // timestamp,open,high,low,close,volume. Header rows are skipped.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects with long (open) or short (o) keys
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Ascending, one candle per timestamp (first wins), positive prices only,
    // second timestamps promoted to milliseconds.
    static std::vector<Candle> normalize(std::vector<Candle> candles);

    // Candles with start_ms <= timestamp <= end_ms. A bound of 0 is open.
    static std::vector<Candle> filterByRange(const std::vector<Candle>& candles,
                                             TimestampMs start_ms,
                                             TimestampMs end_ms);

    static TimestampMs toMsTimestamp(TimestampMs ts);
};

} // namespace backtest
} // namespace exitforge

#include "backtest/FileCandleProvider.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <filesystem>

namespace exitforge {
namespace backtest {

FileCandleProvider::FileCandleProvider(std::string data_dir)
    : data_dir_(std::move(data_dir)) {
}

std::string FileCandleProvider::sourceOf(const std::string& instrument,
                                         const std::string& interval) const {
    const std::filesystem::path base = std::filesystem::path(data_dir_) / (instrument + "_" + interval);
    std::filesystem::path csv = base;
    csv += ".csv";
    std::filesystem::path json = base;
    json += ".json";

    std::error_code ec;
    if (std::filesystem::exists(csv, ec)) return csv.string();
    if (std::filesystem::exists(json, ec)) return json.string();
    return "";
}

std::vector<Candle> FileCandleProvider::fetch(const std::string& instrument,
                                              const std::string& interval,
                                              TimestampMs start_ms,
                                              TimestampMs end_ms) {
    const std::string path = sourceOf(instrument, interval);
    if (path.empty()) {
        LOG_WARN("[{}] no candle file for interval {} under {}", instrument, interval, data_dir_);
        return {};
    }

    std::vector<Candle> raw = (std::filesystem::path(path).extension() == ".csv")
        ? DataHistory::loadCSV(path)
        : DataHistory::loadJSON(path);

    return DataHistory::filterByRange(DataHistory::normalize(std::move(raw)), start_ms, end_ms);
}

} // namespace backtest
} // namespace exitforge

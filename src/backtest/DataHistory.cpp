#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"

namespace exitforge {
namespace backtest {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

double numberField(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key) && item[long_key].is_number()) return item[long_key].get<double>();
    if (item.contains(short_key) && item[short_key].is_number()) return item[short_key].get<double>();
    return 0.0;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;
    int bad_rows = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            continue;   // header
        }

        try {
            candles.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
        } catch (const std::exception& e) {
            ++bad_rows;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {} ({} bad rows)", candles.size(), file_path, bad_rows);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        const nlohmann::json& rows = j.contains("candles") ? j["candles"] : j;
        for (const auto& item : rows) {
            Candle candle;
            candle.timestamp = static_cast<long long>(numberField(item, "timestamp", "t"));
            candle.open = numberField(item, "open", "o");
            candle.high = numberField(item, "high", "h");
            candle.low = numberField(item, "low", "l");
            candle.close = numberField(item, "close", "c");
            candle.volume = numberField(item, "volume", "v");
            candles.push_back(candle);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

TimestampMs DataHistory::toMsTimestamp(TimestampMs ts) {
    // Anything below 1e11 is epoch seconds (year 5138 in ms)
    if (ts > 0 && ts < 100000000000LL) {
        return ts * 1000;
    }
    return ts;
}

std::vector<Candle> DataHistory::normalize(std::vector<Candle> candles) {
    const size_t before = candles.size();

    for (auto& c : candles) {
        c.timestamp = toMsTimestamp(c.timestamp);
    }

    candles.erase(std::remove_if(candles.begin(), candles.end(), [](const Candle& c) {
        return c.open <= 0.0 || c.high <= 0.0 || c.low <= 0.0 || c.close <= 0.0;
    }), candles.end());

    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });

    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp == b.timestamp;
    }), candles.end());

    if (candles.size() != before) {
        LOG_INFO("Normalized candles: {} -> {}", before, candles.size());
    }
    return candles;
}

std::vector<Candle> DataHistory::filterByRange(const std::vector<Candle>& candles,
                                               TimestampMs start_ms,
                                               TimestampMs end_ms) {
    std::vector<Candle> out;
    for (const auto& c : candles) {
        if (start_ms > 0 && c.timestamp < start_ms) continue;
        if (end_ms > 0 && c.timestamp > end_ms) continue;
        out.push_back(c);
    }
    return out;
}

} // namespace backtest
} // namespace exitforge

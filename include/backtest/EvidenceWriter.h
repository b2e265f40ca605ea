#pragma once

#include "backtest/BacktestResult.h"
#include "strategy/StrategyConfig.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exitforge {
namespace backtest {

struct EvidenceBundle {
    std::string run_id;
    std::string run_kind;                       // in_sample / out_of_sample / full
    strategy::StrategyConfig config;
    std::vector<InstrumentSeries> inputs;
    std::map<std::string, std::string> sources; // instrument -> file
    BacktestResult result;
};

struct EvidencePaths {
    std::filesystem::path dir;
    std::filesystem::path trades_csv;
    std::filesystem::path config_json;
    std::filesystem::path manifest_json;
};

// Writes evidence/<runId>/{trades.csv, config.json, manifest.json} so a run can
// be re-derived from its inputs.
class EvidenceWriter {
public:
    explicit EvidenceWriter(std::filesystem::path root_dir);

    std::optional<EvidencePaths> write(const EvidenceBundle& bundle) const;

    // True when evidence/<runId> is already on disk
    bool exists(const std::string& run_id) const;

    // Hex SHA-256 of the canonical CSV rendering of a candle series
    static std::string datasetHash(const std::vector<Candle>& candles);
    static std::string sha256Hex(const std::string& data);

    static std::string tradesCsv(const std::vector<TradeRecord>& trades);

private:
    std::filesystem::path root_dir_;
};

} // namespace backtest
} // namespace exitforge

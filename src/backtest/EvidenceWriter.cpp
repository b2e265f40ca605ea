#include "backtest/EvidenceWriter.h"
#include "common/AtomicFile.h"
#include "common/Logger.h"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace exitforge {
namespace backtest {

EvidenceWriter::EvidenceWriter(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {
}

std::string EvidenceWriter::sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.length(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string EvidenceWriter::datasetHash(const std::vector<Candle>& candles) {
    std::ostringstream oss;
    oss << std::setprecision(12);
    for (const auto& c : candles) {
        oss << c.timestamp << ',' << c.open << ',' << c.high << ','
            << c.low << ',' << c.close << ',' << c.volume << '\n';
    }
    return sha256Hex(oss.str());
}

std::string EvidenceWriter::tradesCsv(const std::vector<TradeRecord>& trades) {
    std::ostringstream oss;
    oss << "instrument,entry_time,exit_time,entry_price,exit_price,pnl_pct,pnl_net,"
           "log_return,exit_reason,hold_candles,high_water_mark_pct,low_water_mark_pct,max_drawdown_pct\n";
    oss << std::setprecision(10);
    for (const auto& t : trades) {
        oss << t.instrument << ',' << t.entry_time << ',' << t.exit_time << ','
            << t.entry_price << ',' << t.exit_price << ',' << t.pnl_pct << ','
            << t.pnl_net << ',' << t.log_return << ',' << risk::toString(t.exit_reason) << ','
            << t.hold_candles << ',' << t.high_water_mark_pct << ','
            << t.low_water_mark_pct << ',' << t.max_drawdown_pct << '\n';
    }
    return oss.str();
}

bool EvidenceWriter::exists(const std::string& run_id) const {
    std::error_code ec;
    return std::filesystem::exists(root_dir_ / "evidence" / run_id, ec);
}

std::optional<EvidencePaths> EvidenceWriter::write(const EvidenceBundle& bundle) const {
    EvidencePaths paths;
    paths.dir = root_dir_ / "evidence" / bundle.run_id;
    paths.trades_csv = paths.dir / "trades.csv";
    paths.config_json = paths.dir / "config.json";
    paths.manifest_json = paths.dir / "manifest.json";

    nlohmann::json manifest;
    manifest["run_id"] = bundle.run_id;
    manifest["run_kind"] = bundle.run_kind;
    manifest["strategy_id"] = bundle.config.strategy_id;
    manifest["inputs"] = nlohmann::json::array();
    for (const auto& input : bundle.inputs) {
        nlohmann::json entry;
        entry["instrument"] = input.instrument;
        entry["interval"] = input.interval;
        entry["candles"] = input.candles.size();
        entry["sha256"] = datasetHash(input.candles);
        auto it = bundle.sources.find(input.instrument);
        entry["source"] = (it != bundle.sources.end()) ? it->second : "";
        if (!input.candles.empty()) {
            entry["start"] = input.candles.front().timestamp;
            entry["end"] = input.candles.back().timestamp;
        }
        manifest["inputs"].push_back(entry);
    }
    manifest["summary"] = toJson(bundle.result);

    const bool ok =
        utils::writeFileAtomic(paths.trades_csv, tradesCsv(bundle.result.trades)) &&
        utils::writeFileAtomic(paths.config_json, strategy::toJson(bundle.config).dump(2)) &&
        utils::writeFileAtomic(paths.manifest_json, manifest.dump(2));

    if (!ok) {
        LOG_ERROR("[{}] failed to write evidence under {}", bundle.run_id, paths.dir.string());
        return std::nullopt;
    }
    return paths;
}

} // namespace backtest
} // namespace exitforge

#include "backtest/EvidenceWriter.h"
#include "TestCandles.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace exitforge;
using namespace exitforge::testing;
using backtest::EvidenceWriter;

namespace {

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main() {
    std::cout << "[TEST] Starting EvidenceWriter Test..." << std::endl;

    TEST_CHECK(EvidenceWriter::sha256Hex("abc") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    const auto candles = oscillatingTrend(50);
    auto shifted = candles;
    shifted[10].close += 0.01;
    TEST_CHECK(EvidenceWriter::datasetHash(candles) == EvidenceWriter::datasetHash(oscillatingTrend(50)));
    TEST_CHECK(EvidenceWriter::datasetHash(candles) != EvidenceWriter::datasetHash(shifted));
    TEST_CHECK(EvidenceWriter::datasetHash(candles).size() == 64);

    backtest::TradeRecord trade;
    trade.instrument = "SOL";
    trade.entry_time = 3600000;
    trade.exit_time = 7200000;
    trade.entry_price = 100.0;
    trade.exit_price = 115.0;
    trade.pnl_pct = 15.0;
    trade.pnl_net = 14.8;
    trade.exit_reason = risk::ExitReason::TAKE_PROFIT;
    trade.hold_candles = 2;

    const std::string csv = EvidenceWriter::tradesCsv({trade});
    TEST_CHECK(csv.rfind("instrument,entry_time,exit_time,", 0) == 0);
    TEST_CHECK(csv.find("\nSOL,3600000,7200000,100,115,15,14.8,") != std::string::npos);
    TEST_CHECK(csv.find(",tp,2,") != std::string::npos);

    const auto root = std::filesystem::temp_directory_path() / "exitforge_test_evidence";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);

    backtest::EvidenceBundle bundle;
    bundle.run_id = "alpha-r1-oos";
    bundle.run_kind = "out_of_sample";
    bundle.config.strategy_id = "alpha";
    bundle.config.entry_signal = "mean_reversion";
    bundle.config.exit_policy.stop_loss_pct = 8.0;
    bundle.config.exit_policy.take_profit_pct = 15.0;
    bundle.inputs = {makeSeries("SOL", candles)};
    bundle.sources = {{"SOL", "data/SOL_1h.csv"}};
    bundle.result.strategy_id = "alpha";
    bundle.result.total_trades = 1;
    bundle.result.trades = {trade};

    const EvidenceWriter writer(root);
    const auto paths = writer.write(bundle);
    TEST_CHECK(paths.has_value());
    TEST_CHECK(paths->dir == root / "evidence" / "alpha-r1-oos");
    TEST_CHECK(std::filesystem::exists(paths->trades_csv));
    TEST_CHECK(std::filesystem::exists(paths->config_json));
    TEST_CHECK(std::filesystem::exists(paths->manifest_json));

    TEST_CHECK(readAll(paths->trades_csv) == csv);

    const auto config = nlohmann::json::parse(readAll(paths->config_json));
    TEST_CHECK(config["strategy_id"] == "alpha");
    TEST_CHECK(config["exit_policy"]["take_profit_pct"] == 15.0);

    const auto manifest = nlohmann::json::parse(readAll(paths->manifest_json));
    TEST_CHECK(manifest["run_kind"] == "out_of_sample");
    TEST_CHECK(manifest["inputs"].size() == 1);
    TEST_CHECK(manifest["inputs"][0]["sha256"] == EvidenceWriter::datasetHash(candles));
    TEST_CHECK(manifest["inputs"][0]["source"] == "data/SOL_1h.csv");
    TEST_CHECK(manifest["inputs"][0]["candles"] == 50);
    TEST_CHECK(manifest["inputs"][0]["end"] == candles.back().timestamp);
    TEST_CHECK(manifest["summary"]["total_trades"] == 1);

    // Rewriting the same run replaces the files in place
    TEST_CHECK(writer.write(bundle).has_value());
    TEST_CHECK(readAll(paths->trades_csv) == csv);

    std::filesystem::remove_all(root, ec);

    std::cout << "[TEST] EvidenceWriter PASSED" << std::endl;
    return 0;
}

#include "backtest/FileCandleProvider.h"
#include "backtest/ResultAggregator.h"
#include "backtest/TradeSimulator.h"
#include "campaign/CampaignReporter.h"
#include "campaign/CampaignRunner.h"
#include "campaign/CampaignStateStoreJsonl.h"
#include "strategy/EntrySignalFactory.h"
#include "CampaignFixtures.h"
#include "TestCandles.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace exitforge;
using namespace exitforge::testing;

namespace {

constexpr long long kEpochMs = 1700000000000LL;

void writeCsv(const std::filesystem::path& path, const std::vector<Candle>& candles) {
    std::ofstream out(path);
    out << "timestamp,open,high,low,close,volume\n";
    out << std::setprecision(17);
    for (const auto& c : candles) {
        out << kEpochMs + c.timestamp << ',' << c.open << ',' << c.high << ','
            << c.low << ',' << c.close << ',' << c.volume << '\n';
    }
}

void writeJson(const std::filesystem::path& path, const std::vector<Candle>& candles) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& c : candles) {
        rows.push_back({{"t", kEpochMs + c.timestamp}, {"o", c.open}, {"h", c.high},
                        {"l", c.low}, {"c", c.close}, {"v", c.volume}});
    }
    std::ofstream out(path);
    out << nlohmann::json{{"candles", rows}}.dump();
}

strategy::StrategyConfig strategyUnderTest() {
    strategy::StrategyConfig c;
    c.strategy_id = "mr-e2e";
    c.entry_signal = "mean-reversion";
    c.asset_family = strategy::AssetFamily::ESTABLISHED;
    c.exit_policy.stop_loss_pct = 8.0;
    c.exit_policy.take_profit_pct = 15.0;
    c.exit_policy.trailing_stop_pct = 2.0;
    c.exit_policy.max_hold_candles = 48;
    c.exit_policy.slippage_pct = 0.1;
    c.exit_policy.fee_pct = 0.1;
    return c;
}

// A series that only rises never dips below its moving average, so mean
// reversion never enters. The run reports zero trades and the campaign keeps
// the strategy out of promotion instead of crediting it.
int testMonotonicSeriesNeverEnters() {
    const auto config = strategyUnderTest();
    const std::vector<InstrumentSeries> series = {makeSeries("SOL", monotonicTrend(1000))};

    const auto signal = strategy::EntrySignalFactory::create(config.entry_signal);
    const backtest::TradeSimulator simulator;
    const auto run = simulator.run(series[0], *signal, config.exit_policy);
    TEST_CHECK(run.trades.empty());
    TEST_CHECK(!run.insufficient_data);

    const backtest::ResultAggregator aggregator;
    const auto result = aggregator.aggregate(config.strategy_id, config.exit_policy, {run});
    TEST_CHECK(result.total_trades == 0);
    TEST_NEAR(result.expectancy, 0.0, 1e-12);
    TEST_NEAR(result.max_drawdown_pct, 0.0, 1e-12);
    TEST_NEAR(result.profit_factor, 0.0, 1e-12);

    auto store = std::make_shared<MemoryCampaignStore>();
    campaign::CampaignEngine engine("e2e-monotonic", store);
    const backtest::WalkForwardValidator validator{backtest::SimulationSettings(),
                                                   backtest::AggregationSettings(),
                                                   backtest::WalkForwardSettings()};
    campaign::CampaignRunner runner(engine, validator, nullptr);
    const auto outcome = runner.runRound(config, series);
    TEST_CHECK(outcome.report.verdict.rfind("inconclusive", 0) == 0);
    TEST_CHECK(!outcome.report.overfit);
    TEST_CHECK(outcome.standing.has_value());
    TEST_CHECK(!outcome.standing->promoted);
    TEST_CHECK(outcome.standing->stage == campaign::CampaignStage::SANITY);
    TEST_CHECK(outcome.standing->cumulative_trades == 0);
    TEST_CHECK(!outcome.standing->insufficiency_reason.empty());
    return 0;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting EndToEnd Test..." << std::endl;

    if (testMonotonicSeriesNeverEnters() != 0) return 1;

    // Rising trend with regular pullbacks, the shape mean reversion trades

    const auto root = std::filesystem::temp_directory_path() / "exitforge_test_e2e";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root / "data");

    const auto candles = oscillatingTrend(1000);
    writeCsv(root / "data" / "SOL_1h.csv", candles);
    writeJson(root / "data" / "ETH_1h.json", candles);

    // Load through the same provider the CLI uses
    backtest::FileCandleProvider provider((root / "data").string());
    std::vector<InstrumentSeries> series;
    std::map<std::string, std::string> sources;
    for (const std::string instrument : {"ETH", "SOL"}) {
        auto loaded = provider.fetch(instrument, "1h", 0, 0);
        TEST_CHECK(loaded.size() == 1000);
        TEST_CHECK(loaded.front().timestamp == kEpochMs);
        sources[instrument] = provider.sourceOf(instrument, "1h");
        series.push_back(makeSeries(instrument, std::move(loaded)));
    }

    const auto config = strategyUnderTest();

    // Full-history backtest
    const auto signal = strategy::EntrySignalFactory::create(config.entry_signal);
    const backtest::TradeSimulator simulator;
    std::vector<backtest::SimulationRun> runs;
    for (const auto& s : series) {
        runs.push_back(simulator.run(s, *signal, config.exit_policy));
    }
    TEST_CHECK(runs[0].trades.size() == runs[1].trades.size());

    const backtest::ResultAggregator aggregator;
    const auto full = aggregator.aggregate(config.strategy_id, config.exit_policy, runs);
    TEST_CHECK(full.total_trades > 0);
    TEST_CHECK(full.total_trades == static_cast<int>(runs[0].trades.size() * 2));
    TEST_CHECK(full.win_rate > 0.45);
    TEST_CHECK(full.profit_factor > 1.0);
    TEST_CHECK(full.expectancy > 0.0);
    TEST_CHECK(full.instruments == 2);
    TEST_CHECK(full.data_start == kEpochMs);

    // Two campaign rounds with small stage targets
    campaign::CampaignSettings settings;
    settings.stages.sanity_trades = 5;
    settings.stages.stability_trades = 10;
    settings.stages.promotion_trades = 20;
    settings.gate.min_trades = 20;

    auto store = std::make_shared<campaign::CampaignStateStoreJsonl>(root / "state" / "e2e.jsonl");
    campaign::CampaignEngine engine("e2e", store, settings);
    TEST_CHECK(engine.restore() == 0);

    const backtest::WalkForwardValidator validator{backtest::SimulationSettings(),
                                                   backtest::AggregationSettings(),
                                                   backtest::WalkForwardSettings()};
    const backtest::EvidenceWriter evidence(root / "artifacts");
    campaign::CampaignRunner runner(engine, validator, &evidence);

    const auto first = runner.runRound(config, series, sources);
    TEST_CHECK(first.in_sample_run_id == "mr-e2e-r1-is");
    TEST_CHECK(first.out_of_sample_run_id == "mr-e2e-r1-oos");
    TEST_CHECK(first.standing.has_value());
    TEST_CHECK(first.standing->cumulative_trades ==
               first.report.in_sample.total_trades + first.report.out_of_sample.total_trades);
    TEST_CHECK(first.report.out_of_sample.total_trades >= 5);
    TEST_CHECK(first.standing->stage != campaign::CampaignStage::SANITY);
    TEST_CHECK(std::filesystem::exists(root / "artifacts" / "evidence" / "mr-e2e-r1-oos" / "manifest.json"));

    const auto second = runner.runRound(config, series, sources);
    TEST_CHECK(second.out_of_sample_run_id == "mr-e2e-r2-oos");
    TEST_CHECK(engine.runCount(config.strategy_id) == 4);
    TEST_CHECK(second.standing->cumulative_trades == 2 * first.standing->cumulative_trades);
    TEST_CHECK(second.standing->stage == campaign::CampaignStage::PROMOTION);

    // Every run carries its three evidence files
    const auto state = engine.snapshot();
    TEST_CHECK(state.artifact_index.size() == 4);
    for (const auto& entry : state.artifact_index) {
        TEST_CHECK(entry.files.size() == 3);
        for (const auto& file : entry.files) {
            TEST_CHECK(std::filesystem::exists(file));
        }
    }

    std::ifstream manifest_file(root / "artifacts" / "evidence" / "mr-e2e-r1-is" / "manifest.json");
    const auto manifest = nlohmann::json::parse(manifest_file);
    TEST_CHECK(manifest["inputs"].size() == 2);
    TEST_CHECK(manifest["inputs"][0]["candles"] == 700);
    TEST_CHECK(manifest["inputs"][0]["source"] == sources["ETH"]);

    const campaign::CampaignReporter reporter(root / "report");
    TEST_CHECK(reporter.writeAll(state));
    for (const char* name : {"scoreboard.csv", "promoted_params.json",
                             "insufficiency_report.md", "artifact_index.json"}) {
        TEST_CHECK(std::filesystem::exists(root / "report" / name));
    }
    const auto scoreboard = campaign::CampaignReporter::scoreboardCsv(state);
    TEST_CHECK(scoreboard.find("\nmr-e2e,established,promotion,") != std::string::npos);

    // A fresh process sees the same campaign
    auto reopened = std::make_shared<campaign::CampaignStateStoreJsonl>(root / "state" / "e2e.jsonl");
    campaign::CampaignEngine restored("e2e", reopened, settings);
    TEST_CHECK(restored.restore() == 4);
    TEST_CHECK(restored.standing(config.strategy_id)->promoted == second.standing->promoted);
    TEST_CHECK(restored.standing(config.strategy_id)->cumulative_trades == second.standing->cumulative_trades);

    std::filesystem::remove_all(root, ec);

    std::cout << "[TEST] EndToEnd PASSED" << std::endl;
    return 0;
}

#pragma once

#include "backtest/BacktestResult.h"
#include "strategy/StrategyConfig.h"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace exitforge {
namespace campaign {

enum class CampaignStage {
    SANITY,
    STABILITY,
    PROMOTION
};

std::string toString(CampaignStage stage);
CampaignStage campaignStageFromString(const std::string& name);

enum class RunKind {
    IN_SAMPLE,
    OUT_OF_SAMPLE,
    FULL
};

std::string toString(RunKind kind);
RunKind runKindFromString(const std::string& name);

// Minimum cumulative trades to leave each stage
struct StageTargets {
    int sanity_trades = 100;
    int stability_trades = 1000;
    int promotion_trades = 5000;

    int targetFor(CampaignStage stage) const;
};

struct GateThresholds {
    int min_trades = 5000;
    double min_expectancy_pct = 0.0;        // strict: expectancy must exceed this
    double min_profit_factor = 1.05;
    double max_drawdown_volatile_pct = 45.0;
    double max_drawdown_default_pct = 30.0;
    double min_win_rate_volatile = 0.40;
    double min_win_rate_default = 0.45;
};

// What the campaign keeps from a BacktestResult. Gross sums are carried so
// profit factor stays exact when runs are combined.
struct RunMetrics {
    int trades = 0;
    int wins = 0;
    int losses = 0;
    double gross_win = 0.0;
    double gross_loss = 0.0;
    double expectancy = 0.0;
    double profit_factor = 0.0;
    double win_rate = 0.0;
    double max_drawdown_pct = 0.0;
    double sharpe_like = 0.0;

    static RunMetrics fromResult(const backtest::BacktestResult& result);

    // Trade-weighted; drawdown is the worst run's
    static RunMetrics combine(const std::vector<RunMetrics>& runs);
};

nlohmann::json toJson(const RunMetrics& metrics);
RunMetrics runMetricsFromJson(const nlohmann::json& j);

struct RunRecord {
    std::uint64_t seq = 0;
    std::string run_id;
    std::string strategy_id;
    RunKind kind = RunKind::FULL;
    long long ts_ms = 0;
    RunMetrics metrics;
    std::vector<std::string> artifacts;     // evidence files for this run
};

struct StrategyStanding {
    std::string strategy_id;
    strategy::AssetFamily asset_family = strategy::AssetFamily::OTHER;
    CampaignStage stage = CampaignStage::SANITY;
    int cumulative_trades = 0;
    RunMetrics combined;                    // every run
    RunMetrics gate_metrics;                // runs the promotion gate looks at
    bool promoted = false;
    std::string promotion_reason;
    std::string insufficiency_reason;
};

struct ArtifactIndexEntry {
    std::string run_id;
    std::string strategy_id;
    RunKind kind = RunKind::FULL;
    std::vector<std::string> files;
};

struct CampaignState {
    std::string campaign_id;
    std::vector<strategy::StrategyConfig> strategies;
    std::map<std::string, std::vector<std::string>> runs_by_strategy;
    std::map<std::string, RunRecord> run_metrics_by_run_id;
    std::map<std::string, StrategyStanding> standings;
    std::vector<ArtifactIndexEntry> artifact_index;
    int cumulative_trades = 0;
};

} // namespace campaign
} // namespace exitforge

#include "campaign/CampaignEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace exitforge {
namespace campaign {

namespace {
long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

CampaignStage nextStage(CampaignStage stage) {
    switch (stage) {
        case CampaignStage::SANITY: return CampaignStage::STABILITY;
        case CampaignStage::STABILITY: return CampaignStage::PROMOTION;
        case CampaignStage::PROMOTION: break;
    }
    return CampaignStage::PROMOTION;
}
}

CampaignEngine::CampaignEngine(std::string campaign_id,
                               std::shared_ptr<ICampaignStateStore> store,
                               const CampaignSettings& settings)
    : store_(std::move(store))
    , settings_(settings)
    , gate_(settings.gate) {
    state_.campaign_id = std::move(campaign_id);
}

size_t CampaignEngine::restore() {
    const CampaignJournal journal = store_->load();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    CampaignState fresh;
    fresh.campaign_id = state_.campaign_id;
    state_ = std::move(fresh);

    for (const auto& config : journal.strategies) {
        registerLocked(config);
    }

    size_t replayed = 0;
    for (const auto& run : journal.runs) {
        if (!findStrategyLocked(run.strategy_id)) {
            LOG_WARN("[{}] journal run {} references unknown strategy {}",
                     state_.campaign_id, run.run_id, run.strategy_id);
            continue;
        }
        if (state_.run_metrics_by_run_id.count(run.run_id) > 0) {
            LOG_WARN("[{}] journal repeats run id {}, keeping the first", state_.campaign_id, run.run_id);
            continue;
        }
        applyRunLocked(run);
        ++replayed;
    }

    LOG_INFO("[{}] restored {} strategies, {} runs", state_.campaign_id,
             state_.strategies.size(), replayed);
    return replayed;
}

bool CampaignEngine::addStrategy(const strategy::StrategyConfig& config) {
    config.exit_policy.validate();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (findStrategyLocked(config.strategy_id)) {
        return true;
    }
    if (!store_->appendStrategy(config)) {
        LOG_ERROR("[{}] failed to persist strategy {}", state_.campaign_id, config.strategy_id);
        return false;
    }
    registerLocked(config);
    return true;
}

std::optional<StrategyStanding> CampaignEngine::recordRun(const std::string& strategy_id,
                                                          const std::string& run_id,
                                                          RunKind kind,
                                                          const RunMetrics& metrics,
                                                          const std::vector<std::string>& artifacts) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!findStrategyLocked(strategy_id)) {
        throw InvalidConfigurationError("run " + run_id + " for unregistered strategy " + strategy_id);
    }
    if (state_.run_metrics_by_run_id.count(run_id) > 0) {
        throw InvalidConfigurationError("run id " + run_id + " already recorded");
    }

    RunRecord record;
    record.run_id = run_id;
    record.strategy_id = strategy_id;
    record.kind = kind;
    record.ts_ms = nowMs();
    record.metrics = metrics;
    record.artifacts = artifacts;

    if (!store_->appendRun(record)) {
        LOG_ERROR("[{}] failed to persist run {}", state_.campaign_id, run_id);
        return std::nullopt;
    }

    const CampaignStage before = state_.standings[strategy_id].stage;
    applyRunLocked(record);
    const StrategyStanding& after = state_.standings[strategy_id];

    if (after.stage != before) {
        LOG_INFO("[{}] {} advanced {} -> {} at {} trades", state_.campaign_id, strategy_id,
                 toString(before), toString(after.stage), after.cumulative_trades);
    }
    if (after.promoted) {
        LOG_INFO("[{}] {} promoted: {}", state_.campaign_id, strategy_id, after.promotion_reason);
    } else {
        LOG_INFO("[{}] {} not promoted: {}", state_.campaign_id, strategy_id, after.insufficiency_reason);
    }
    return after;
}

void CampaignEngine::registerLocked(const strategy::StrategyConfig& config) {
    if (findStrategyLocked(config.strategy_id)) {
        return;
    }
    state_.strategies.push_back(config);
    state_.runs_by_strategy[config.strategy_id];

    StrategyStanding standing;
    standing.strategy_id = config.strategy_id;
    standing.asset_family = config.asset_family;
    standing.insufficiency_reason = "no runs recorded";
    state_.standings[config.strategy_id] = standing;
}

void CampaignEngine::applyRunLocked(const RunRecord& record) {
    state_.runs_by_strategy[record.strategy_id].push_back(record.run_id);
    state_.run_metrics_by_run_id[record.run_id] = record;
    state_.cumulative_trades += record.metrics.trades;

    ArtifactIndexEntry entry;
    entry.run_id = record.run_id;
    entry.strategy_id = record.strategy_id;
    entry.kind = record.kind;
    entry.files = record.artifacts;
    state_.artifact_index.push_back(std::move(entry));

    reevaluateLocked(state_.standings[record.strategy_id]);
}

void CampaignEngine::reevaluateLocked(StrategyStanding& standing) {
    std::vector<RunMetrics> all;
    std::vector<RunMetrics> gated;
    for (const auto& run_id : state_.runs_by_strategy[standing.strategy_id]) {
        const RunRecord& run = state_.run_metrics_by_run_id.at(run_id);
        all.push_back(run.metrics);
        if (!settings_.require_out_of_sample || run.kind == RunKind::OUT_OF_SAMPLE) {
            gated.push_back(run.metrics);
        }
    }

    standing.combined = RunMetrics::combine(all);
    standing.gate_metrics = RunMetrics::combine(gated);
    standing.cumulative_trades = standing.combined.trades;

    // Stages only move forward
    while (standing.stage != CampaignStage::PROMOTION &&
           standing.cumulative_trades >= settings_.stages.targetFor(standing.stage)) {
        standing.stage = nextStage(standing.stage);
    }

    if (standing.promoted) {
        return;
    }

    if (all.empty()) {
        standing.insufficiency_reason = "no runs recorded";
        return;
    }

    if (standing.stage != CampaignStage::PROMOTION) {
        std::ostringstream oss;
        oss << "stage " << toString(standing.stage) << ": " << standing.cumulative_trades
            << "/" << settings_.stages.targetFor(standing.stage) << " trades";
        standing.insufficiency_reason = oss.str();
        return;
    }

    const GateDecision decision = gate_.evaluate(standing.gate_metrics, standing.asset_family);
    if (!decision.passed) {
        standing.insufficiency_reason = std::string("promotion gate (") +
            (settings_.require_out_of_sample ? "out-of-sample" : "all runs") + "): " +
            decision.summary();
        return;
    }

    const RunMetrics& m = standing.gate_metrics;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "passed gate: " << m.trades << " trades, expectancy " << m.expectancy
        << "%, PF " << m.profit_factor << ", DD " << m.max_drawdown_pct
        << "%, WR " << m.win_rate;
    standing.promoted = true;
    standing.promotion_reason = oss.str();
    standing.insufficiency_reason.clear();
}

const strategy::StrategyConfig* CampaignEngine::findStrategyLocked(const std::string& strategy_id) const {
    for (const auto& s : state_.strategies) {
        if (s.strategy_id == strategy_id) return &s;
    }
    return nullptr;
}

CampaignState CampaignEngine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

std::optional<StrategyStanding> CampaignEngine::standing(const std::string& strategy_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = state_.standings.find(strategy_id);
    if (it == state_.standings.end()) return std::nullopt;
    return it->second;
}

size_t CampaignEngine::runCount(const std::string& strategy_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = state_.runs_by_strategy.find(strategy_id);
    return it == state_.runs_by_strategy.end() ? 0 : it->second.size();
}

bool CampaignEngine::hasRun(const std::string& run_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.run_metrics_by_run_id.count(run_id) > 0;
}

} // namespace campaign
} // namespace exitforge

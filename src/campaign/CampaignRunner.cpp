#include "campaign/CampaignRunner.h"
#include "common/Logger.h"

namespace exitforge {
namespace campaign {

CampaignRunner::CampaignRunner(CampaignEngine& engine,
                               const backtest::WalkForwardValidator& validator,
                               const backtest::EvidenceWriter* evidence)
    : engine_(engine)
    , validator_(validator)
    , evidence_(evidence) {
}

bool CampaignRunner::runIdTaken(const std::string& run_id) const {
    return engine_.hasRun(run_id) || (evidence_ && evidence_->exists(run_id));
}

std::vector<std::string> CampaignRunner::writeEvidence(
    const std::string& run_id,
    RunKind kind,
    const strategy::StrategyConfig& config,
    const std::vector<InstrumentSeries>& inputs,
    const std::map<std::string, std::string>& sources,
    const backtest::BacktestResult& result
) const {
    std::vector<std::string> files;
    if (!evidence_) {
        return files;
    }

    backtest::EvidenceBundle bundle;
    bundle.run_id = run_id;
    bundle.run_kind = toString(kind);
    bundle.config = config;
    bundle.inputs = inputs;
    bundle.sources = sources;
    bundle.result = result;

    const auto paths = evidence_->write(bundle);
    if (paths) {
        files.push_back(paths->trades_csv.string());
        files.push_back(paths->config_json.string());
        files.push_back(paths->manifest_json.string());
    }
    return files;
}

RoundOutcome CampaignRunner::runRound(const strategy::StrategyConfig& config,
                                      const std::vector<InstrumentSeries>& series,
                                      const std::map<std::string, std::string>& sources) {
    RoundOutcome outcome;
    if (!engine_.addStrategy(config)) {
        LOG_ERROR("[{}] strategy {} could not be registered, round skipped",
                  engine_.campaignId(), config.strategy_id);
        return outcome;
    }

    outcome.report = validator_.validate(config, series);

    // Lowest round whose ids are free in the ledger and on disk. A round that
    // failed to persist leaves a gap, never a reused id.
    size_t round = 1;
    for (;; ++round) {
        const std::string prefix = config.strategy_id + "-r" + std::to_string(round);
        if (!runIdTaken(prefix + "-is") && !runIdTaken(prefix + "-oos")) {
            outcome.in_sample_run_id = prefix + "-is";
            outcome.out_of_sample_run_id = prefix + "-oos";
            break;
        }
    }

    const auto is_files = writeEvidence(outcome.in_sample_run_id, RunKind::IN_SAMPLE, config,
                                        outcome.report.in_sample_inputs, sources,
                                        outcome.report.in_sample);
    const auto oos_files = writeEvidence(outcome.out_of_sample_run_id, RunKind::OUT_OF_SAMPLE, config,
                                         outcome.report.out_of_sample_inputs, sources,
                                         outcome.report.out_of_sample);

    if (!engine_.recordRun(config.strategy_id, outcome.in_sample_run_id, RunKind::IN_SAMPLE,
                           RunMetrics::fromResult(outcome.report.in_sample), is_files)) {
        outcome.failure = "in-sample run " + outcome.in_sample_run_id + " not persisted";
        LOG_ERROR("[{}] round {} for {} failed: {}", engine_.campaignId(), round,
                  config.strategy_id, outcome.failure);
        return outcome;
    }
    outcome.standing = engine_.recordRun(config.strategy_id, outcome.out_of_sample_run_id,
                                         RunKind::OUT_OF_SAMPLE,
                                         RunMetrics::fromResult(outcome.report.out_of_sample),
                                         oos_files);
    if (!outcome.standing) {
        outcome.failure = "out-of-sample run " + outcome.out_of_sample_run_id + " not persisted";
        LOG_ERROR("[{}] round {} for {} failed: {}", engine_.campaignId(), round,
                  config.strategy_id, outcome.failure);
    }

    for (const auto& instrument : outcome.report.out_of_sample.insufficient_instruments) {
        LOG_WARN("[{}] {} out-of-sample data insufficient for {}", engine_.campaignId(),
                 config.strategy_id, instrument);
    }
    return outcome;
}

} // namespace campaign
} // namespace exitforge

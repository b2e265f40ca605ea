#pragma once

#include "backtest/EvidenceWriter.h"
#include "backtest/WalkForwardValidator.h"
#include "campaign/CampaignEngine.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exitforge {
namespace campaign {

struct RoundOutcome {
    std::string in_sample_run_id;
    std::string out_of_sample_run_id;
    backtest::WalkForwardReport report;
    std::optional<StrategyStanding> standing;
    std::string failure;                        // empty when both runs were recorded
};

// One campaign round for one strategy: walk-forward over the supplied series,
// evidence for both halves, both runs appended to the campaign.
class CampaignRunner {
public:
    CampaignRunner(CampaignEngine& engine,
                   const backtest::WalkForwardValidator& validator,
                   const backtest::EvidenceWriter* evidence);

    RoundOutcome runRound(const strategy::StrategyConfig& config,
                          const std::vector<InstrumentSeries>& series,
                          const std::map<std::string, std::string>& sources = {});

private:
    CampaignEngine& engine_;
    const backtest::WalkForwardValidator& validator_;
    const backtest::EvidenceWriter* evidence_;

    bool runIdTaken(const std::string& run_id) const;

    std::vector<std::string> writeEvidence(const std::string& run_id,
                                           RunKind kind,
                                           const strategy::StrategyConfig& config,
                                           const std::vector<InstrumentSeries>& inputs,
                                           const std::map<std::string, std::string>& sources,
                                           const backtest::BacktestResult& result) const;
};

} // namespace campaign
} // namespace exitforge

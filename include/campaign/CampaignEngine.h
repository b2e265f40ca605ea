#pragma once

#include "campaign/CampaignTypes.h"
#include "campaign/ICampaignStateStore.h"
#include "campaign/PromotionGate.h"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace exitforge {
namespace campaign {

struct CampaignSettings {
    StageTargets stages;
    GateThresholds gate;
    bool require_out_of_sample = true;
};

// Promotion state machine over an append-only run ledger.
// Writes are serialized, readers take a shared lock.
class CampaignEngine {
public:
    CampaignEngine(std::string campaign_id,
                   std::shared_ptr<ICampaignStateStore> store,
                   const CampaignSettings& settings = CampaignSettings());

    // Rebuilds state by replaying the store. Returns the number of runs replayed.
    size_t restore();

    // Registers a strategy. Re-registering the same id is a no-op.
    // Returns false when the store refuses the append.
    bool addStrategy(const strategy::StrategyConfig& config);

    // Appends one run and re-evaluates the strategy's standing.
    // Throws InvalidConfigurationError for an unknown strategy or a reused run id.
    // Returns std::nullopt when the store refuses the append; state is unchanged then.
    std::optional<StrategyStanding> recordRun(const std::string& strategy_id,
                                              const std::string& run_id,
                                              RunKind kind,
                                              const RunMetrics& metrics,
                                              const std::vector<std::string>& artifacts = {});

    CampaignState snapshot() const;
    std::optional<StrategyStanding> standing(const std::string& strategy_id) const;
    size_t runCount(const std::string& strategy_id) const;
    bool hasRun(const std::string& run_id) const;

    const std::string& campaignId() const { return state_.campaign_id; }
    const CampaignSettings& settings() const { return settings_; }

private:
    std::shared_ptr<ICampaignStateStore> store_;
    CampaignSettings settings_;
    PromotionGate gate_;

    mutable std::shared_mutex mutex_;
    CampaignState state_;

    void registerLocked(const strategy::StrategyConfig& config);
    void applyRunLocked(const RunRecord& record);
    void reevaluateLocked(StrategyStanding& standing);
    const strategy::StrategyConfig* findStrategyLocked(const std::string& strategy_id) const;
};

} // namespace campaign
} // namespace exitforge

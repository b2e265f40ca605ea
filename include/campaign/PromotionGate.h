#pragma once

#include "campaign/CampaignTypes.h"

#include <string>
#include <vector>

namespace exitforge {
namespace campaign {

// Not meeting the gate is a normal outcome, carried as reasons rather than thrown.
struct GateDecision {
    bool passed = false;
    std::vector<std::string> reasons;

    std::string summary() const;
};

class PromotionGate {
public:
    explicit PromotionGate(const GateThresholds& thresholds = GateThresholds());

    // All thresholds must hold; every failing one contributes a reason.
    GateDecision evaluate(const RunMetrics& metrics, strategy::AssetFamily family) const;

    double maxDrawdownFor(strategy::AssetFamily family) const;
    double minWinRateFor(strategy::AssetFamily family) const;

    const GateThresholds& thresholds() const { return thresholds_; }

private:
    GateThresholds thresholds_;
};

} // namespace campaign
} // namespace exitforge

#pragma once

#include "campaign/CampaignTypes.h"

#include <cstdint>
#include <vector>

namespace exitforge {
namespace campaign {

// Everything a campaign has ever appended, in append order
struct CampaignJournal {
    std::vector<strategy::StrategyConfig> strategies;
    std::vector<RunRecord> runs;
};

// Append-only persistence for one campaign. Nothing is updated in place.
class ICampaignStateStore {
public:
    virtual ~ICampaignStateStore() = default;

    virtual bool appendStrategy(const strategy::StrategyConfig& config) = 0;

    // Assigns record.seq on success
    virtual bool appendRun(RunRecord& record) = 0;

    virtual CampaignJournal load() = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace campaign
} // namespace exitforge

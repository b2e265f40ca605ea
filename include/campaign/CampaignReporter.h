#pragma once

#include "campaign/CampaignTypes.h"

#include <filesystem>
#include <string>

namespace exitforge {
namespace campaign {

// Renders a campaign snapshot to scoreboard.csv, promoted_params.json,
// insufficiency_report.md and artifact_index.json under output_dir.
class CampaignReporter {
public:
    explicit CampaignReporter(std::filesystem::path output_dir);

    bool writeAll(const CampaignState& state) const;

    static std::string scoreboardCsv(const CampaignState& state);
    static nlohmann::json promotedParams(const CampaignState& state);
    static std::string insufficiencyReport(const CampaignState& state);
    static nlohmann::json artifactIndex(const CampaignState& state);

private:
    std::filesystem::path output_dir_;
};

} // namespace campaign
} // namespace exitforge

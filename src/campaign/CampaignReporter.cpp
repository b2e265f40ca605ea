#include "campaign/CampaignReporter.h"
#include "common/AtomicFile.h"
#include "common/Logger.h"

#include <iomanip>
#include <sstream>

namespace exitforge {
namespace campaign {

CampaignReporter::CampaignReporter(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {
}

std::string CampaignReporter::scoreboardCsv(const CampaignState& state) {
    std::ostringstream oss;
    oss << "strategy_id,asset_family,stage,trades,gate_trades,win_rate,expectancy,"
           "profit_factor,max_drawdown_pct,promoted\n";
    oss << std::fixed << std::setprecision(4);

    // Registration order
    for (const auto& config : state.strategies) {
        auto it = state.standings.find(config.strategy_id);
        if (it == state.standings.end()) continue;
        const StrategyStanding& s = it->second;
        oss << s.strategy_id << ','
            << strategy::toString(s.asset_family) << ','
            << toString(s.stage) << ','
            << s.combined.trades << ','
            << s.gate_metrics.trades << ','
            << s.combined.win_rate << ','
            << s.combined.expectancy << ','
            << s.combined.profit_factor << ','
            << s.combined.max_drawdown_pct << ','
            << (s.promoted ? "true" : "false") << '\n';
    }
    return oss.str();
}

nlohmann::json CampaignReporter::promotedParams(const CampaignState& state) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& config : state.strategies) {
        auto it = state.standings.find(config.strategy_id);
        if (it == state.standings.end() || !it->second.promoted) continue;

        nlohmann::json entry = strategy::toJson(config);
        entry["promotion_reason"] = it->second.promotion_reason;
        entry["metrics"] = toJson(it->second.gate_metrics);
        out.push_back(entry);
    }
    return out;
}

std::string CampaignReporter::insufficiencyReport(const CampaignState& state) {
    std::ostringstream oss;
    oss << "# Insufficiency report: " << state.campaign_id << "\n\n";

    int count = 0;
    for (const auto& config : state.strategies) {
        auto it = state.standings.find(config.strategy_id);
        if (it == state.standings.end() || it->second.promoted) continue;
        const StrategyStanding& s = it->second;
        oss << "- **" << s.strategy_id << "** (" << strategy::toString(s.asset_family)
            << ", stage " << toString(s.stage) << ", " << s.cumulative_trades << " trades): "
            << s.insufficiency_reason << "\n";
        ++count;
    }
    if (count == 0) {
        oss << "All strategies promoted.\n";
    }
    return oss.str();
}

nlohmann::json CampaignReporter::artifactIndex(const CampaignState& state) {
    nlohmann::json out;
    out["campaign_id"] = state.campaign_id;
    out["cumulative_trades"] = state.cumulative_trades;
    out["runs"] = nlohmann::json::array();
    for (const auto& entry : state.artifact_index) {
        nlohmann::json row;
        row["run_id"] = entry.run_id;
        row["strategy_id"] = entry.strategy_id;
        row["kind"] = toString(entry.kind);
        row["files"] = entry.files;
        auto it = state.run_metrics_by_run_id.find(entry.run_id);
        if (it != state.run_metrics_by_run_id.end()) {
            row["seq"] = it->second.seq;
            row["metrics"] = toJson(it->second.metrics);
        }
        out["runs"].push_back(row);
    }
    return out;
}

bool CampaignReporter::writeAll(const CampaignState& state) const {
    const bool ok =
        utils::writeFileAtomic(output_dir_ / "scoreboard.csv", scoreboardCsv(state)) &&
        utils::writeFileAtomic(output_dir_ / "promoted_params.json", promotedParams(state).dump(2)) &&
        utils::writeFileAtomic(output_dir_ / "insufficiency_report.md", insufficiencyReport(state)) &&
        utils::writeFileAtomic(output_dir_ / "artifact_index.json", artifactIndex(state).dump(2));

    if (!ok) {
        LOG_ERROR("[{}] failed to write campaign reports to {}", state.campaign_id, output_dir_.string());
        return false;
    }
    LOG_INFO("[{}] campaign reports written to {}", state.campaign_id, output_dir_.string());
    return true;
}

} // namespace campaign
} // namespace exitforge

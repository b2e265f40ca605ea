#include "campaign/CampaignTypes.h"
#include "common/Errors.h"

#include <algorithm>

namespace exitforge {
namespace campaign {

namespace {
constexpr double kProfitFactorCap = 999.0;

double profitFactor(double gross_win, double gross_loss, int wins) {
    if (gross_loss > 1e-12) return std::min(kProfitFactorCap, gross_win / gross_loss);
    return wins > 0 ? kProfitFactorCap : 0.0;
}
}

std::string toString(CampaignStage stage) {
    switch (stage) {
        case CampaignStage::SANITY: return "sanity";
        case CampaignStage::STABILITY: return "stability";
        case CampaignStage::PROMOTION: return "promotion";
    }
    return "sanity";
}

CampaignStage campaignStageFromString(const std::string& name) {
    if (name == "sanity") return CampaignStage::SANITY;
    if (name == "stability") return CampaignStage::STABILITY;
    if (name == "promotion") return CampaignStage::PROMOTION;
    throw InvalidConfigurationError("unknown campaign stage '" + name + "'");
}

std::string toString(RunKind kind) {
    switch (kind) {
        case RunKind::IN_SAMPLE: return "in_sample";
        case RunKind::OUT_OF_SAMPLE: return "out_of_sample";
        case RunKind::FULL: return "full";
    }
    return "full";
}

RunKind runKindFromString(const std::string& name) {
    if (name == "in_sample") return RunKind::IN_SAMPLE;
    if (name == "out_of_sample") return RunKind::OUT_OF_SAMPLE;
    if (name == "full") return RunKind::FULL;
    throw InvalidConfigurationError("unknown run kind '" + name + "'");
}

int StageTargets::targetFor(CampaignStage stage) const {
    switch (stage) {
        case CampaignStage::SANITY: return sanity_trades;
        case CampaignStage::STABILITY: return stability_trades;
        case CampaignStage::PROMOTION: return promotion_trades;
    }
    return promotion_trades;
}

RunMetrics RunMetrics::fromResult(const backtest::BacktestResult& result) {
    RunMetrics m;
    m.trades = result.total_trades;
    m.wins = result.wins;
    m.losses = result.losses;
    m.gross_win = result.gross_win;
    m.gross_loss = result.gross_loss;
    m.expectancy = result.expectancy;
    m.profit_factor = result.profit_factor;
    m.win_rate = result.win_rate;
    m.max_drawdown_pct = result.max_drawdown_pct;
    m.sharpe_like = result.sharpe_like;
    return m;
}

RunMetrics RunMetrics::combine(const std::vector<RunMetrics>& runs) {
    RunMetrics out;
    double expectancy_sum = 0.0;
    double sharpe_sum = 0.0;

    for (const auto& r : runs) {
        out.trades += r.trades;
        out.wins += r.wins;
        out.losses += r.losses;
        out.gross_win += r.gross_win;
        out.gross_loss += r.gross_loss;
        out.max_drawdown_pct = std::max(out.max_drawdown_pct, r.max_drawdown_pct);
        expectancy_sum += r.expectancy * r.trades;
        sharpe_sum += r.sharpe_like * r.trades;
    }

    if (out.trades > 0) {
        out.expectancy = expectancy_sum / out.trades;
        out.sharpe_like = sharpe_sum / out.trades;
        out.win_rate = static_cast<double>(out.wins) / out.trades;
    }
    out.profit_factor = profitFactor(out.gross_win, out.gross_loss, out.wins);
    return out;
}

nlohmann::json toJson(const RunMetrics& m) {
    nlohmann::json j;
    j["trades"] = m.trades;
    j["wins"] = m.wins;
    j["losses"] = m.losses;
    j["gross_win"] = m.gross_win;
    j["gross_loss"] = m.gross_loss;
    j["expectancy"] = m.expectancy;
    j["profit_factor"] = m.profit_factor;
    j["win_rate"] = m.win_rate;
    j["max_drawdown_pct"] = m.max_drawdown_pct;
    j["sharpe_like"] = m.sharpe_like;
    return j;
}

RunMetrics runMetricsFromJson(const nlohmann::json& j) {
    RunMetrics m;
    m.trades = j.value("trades", 0);
    m.wins = j.value("wins", 0);
    m.losses = j.value("losses", 0);
    m.gross_win = j.value("gross_win", 0.0);
    m.gross_loss = j.value("gross_loss", 0.0);
    m.expectancy = j.value("expectancy", 0.0);
    m.profit_factor = j.value("profit_factor", 0.0);
    m.win_rate = j.value("win_rate", 0.0);
    m.max_drawdown_pct = j.value("max_drawdown_pct", 0.0);
    m.sharpe_like = j.value("sharpe_like", 0.0);
    return m;
}

} // namespace campaign
} // namespace exitforge

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/GridSearchOptimizer.h"
#include "backtest/ResultAggregator.h"
#include "backtest/TradeSimulator.h"
#include "backtest/WalkForwardValidator.h"
#include "campaign/CampaignEngine.h"
#include "risk/RiskTriggerEngine.h"

namespace exitforge {

// Process-wide settings. Only executables read it; components take the
// typed structs at construction.
class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults. Returns false when the file exists but could not be parsed.
    bool load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);

    std::string getLogDir() const { return log_dir_; }
    std::string getLogLevel() const { return log_level_; }

    backtest::SimulationSettings getSimulationSettings() const { return simulation_; }
    backtest::AggregationSettings getAggregationSettings() const { return aggregation_; }
    backtest::WalkForwardSettings getWalkForwardSettings() const { return walk_forward_; }
    backtest::GridSearchSettings getGridSearchSettings() const { return grid_; }

    campaign::CampaignSettings getCampaignSettings() const { return campaign_; }
    std::string getStateDir() const { return state_dir_; }
    std::string getArtifactsDir() const { return artifacts_dir_; }

    risk::RiskEngineSettings getRiskEngineSettings() const { return risk_engine_; }

    void reset();

private:
    Config() = default;

    std::string log_dir_ = "logs";
    std::string log_level_ = "info";

    backtest::SimulationSettings simulation_;
    backtest::AggregationSettings aggregation_;
    backtest::WalkForwardSettings walk_forward_;
    backtest::GridSearchSettings grid_;

    campaign::CampaignSettings campaign_;
    std::string state_dir_ = "state";
    std::string artifacts_dir_ = "artifacts";

    risk::RiskEngineSettings risk_engine_;
};

} // namespace exitforge

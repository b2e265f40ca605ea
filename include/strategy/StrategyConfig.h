#pragma once

#include "strategy/ExitPolicy.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace exitforge {
namespace strategy {

enum class AssetFamily {
    MEMECOIN,
    BAGS,
    BLUECHIP,
    ESTABLISHED,
    XSTOCK,
    INDEX,
    OTHER
};

std::string toString(AssetFamily family);
// Throws InvalidConfigurationError on unknown names
AssetFamily assetFamilyFromString(const std::string& name);

// Memecoin and bags launches get the wider drawdown / lower win-rate allowance.
bool isVolatileFamily(AssetFamily family);

// The unit the campaign promotes or rejects, and the artifact shipped to production.
struct StrategyConfig {
    std::string strategy_id;
    std::string entry_signal;
    ExitPolicy exit_policy;
    AssetFamily asset_family = AssetFamily::OTHER;
};

nlohmann::json toJson(const StrategyConfig& config);
StrategyConfig strategyConfigFromJson(const nlohmann::json& j);
std::vector<StrategyConfig> loadStrategyConfigs(const std::string& file_path);

} // namespace strategy
} // namespace exitforge

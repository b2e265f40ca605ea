#include "strategy/StrategyConfig.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace exitforge {
namespace strategy {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(AssetFamily family) {
    switch (family) {
        case AssetFamily::MEMECOIN: return "memecoin";
        case AssetFamily::BAGS: return "bags";
        case AssetFamily::BLUECHIP: return "bluechip";
        case AssetFamily::ESTABLISHED: return "established";
        case AssetFamily::XSTOCK: return "xstock";
        case AssetFamily::INDEX: return "index";
        case AssetFamily::OTHER: return "other";
    }
    return "other";
}

AssetFamily assetFamilyFromString(const std::string& name) {
    const std::string n = toLowerCopy(name);
    if (n == "memecoin" || n == "meme") return AssetFamily::MEMECOIN;
    if (n == "bags") return AssetFamily::BAGS;
    if (n == "bluechip" || n == "blue_chip") return AssetFamily::BLUECHIP;
    if (n == "established") return AssetFamily::ESTABLISHED;
    if (n == "xstock" || n == "prestock") return AssetFamily::XSTOCK;
    if (n == "index") return AssetFamily::INDEX;
    if (n == "other" || n.empty()) return AssetFamily::OTHER;
    throw InvalidConfigurationError("unknown asset family '" + name + "'");
}

bool isVolatileFamily(AssetFamily family) {
    return family == AssetFamily::MEMECOIN || family == AssetFamily::BAGS;
}

nlohmann::json toJson(const StrategyConfig& config) {
    nlohmann::json j;
    j["strategy_id"] = config.strategy_id;
    j["entry_signal"] = config.entry_signal;
    j["asset_family"] = toString(config.asset_family);
    j["exit_policy"] = toJson(config.exit_policy);
    return j;
}

StrategyConfig strategyConfigFromJson(const nlohmann::json& j) {
    StrategyConfig config;
    config.strategy_id = j.value("strategy_id", std::string());
    config.entry_signal = j.value("entry_signal", std::string());
    config.asset_family = assetFamilyFromString(j.value("asset_family", std::string("other")));
    config.exit_policy = exitPolicyFromJson(j.value("exit_policy", nlohmann::json::object()));
    if (config.strategy_id.empty()) {
        throw InvalidConfigurationError("strategy_id is empty");
    }
    return config;
}

std::vector<StrategyConfig> loadStrategyConfigs(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw InvalidConfigurationError("cannot open strategy file " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidConfigurationError("strategy file " + file_path + ": " + e.what());
    }

    std::vector<StrategyConfig> out;
    const nlohmann::json& rows = j.contains("strategies") ? j["strategies"] : j;
    if (rows.is_array()) {
        for (const auto& row : rows) {
            out.push_back(strategyConfigFromJson(row));
        }
    } else {
        out.push_back(strategyConfigFromJson(rows));
    }

    LOG_INFO("Loaded {} strategy configs from {}", out.size(), file_path);
    return out;
}

} // namespace strategy
} // namespace exitforge

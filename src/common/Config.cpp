#include "common/Config.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace exitforge {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_dir_ = "logs";
    log_level_ = "info";
    simulation_ = backtest::SimulationSettings();
    aggregation_ = backtest::AggregationSettings();
    walk_forward_ = backtest::WalkForwardSettings();
    grid_ = backtest::GridSearchSettings();
    campaign_ = campaign::CampaignSettings();
    state_dir_ = "state";
    artifacts_dir_ = "artifacts";
    risk_engine_ = risk::RiskEngineSettings();
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path(path);
    if (!config_path.is_absolute() && !std::filesystem::exists(config_path)) {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found: " << config_path << std::endl;
        std::cout << "Using defaults." << std::endl;
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "Warning: cannot open config file: " << config_path << std::endl;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        applyJson(j);
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Config loaded: min_candles=" << simulation_.min_candles
              << ", promotion_trades=" << campaign_.stages.promotion_trades
              << ", risk interval=" << risk_engine_.interval_ms << "ms" << std::endl;
    return true;
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_dir_ = l.value("dir", log_dir_);
        log_level_ = l.value("level", log_level_);
    }

    if (j.contains("backtest")) {
        const auto& b = j["backtest"];
        simulation_.min_candles = b.value("min_candles", simulation_.min_candles);

        walk_forward_.split_ratio = b.value("walk_forward_split", walk_forward_.split_ratio);
        walk_forward_.overfit_profit_factor_ratio =
            b.value("overfit_profit_factor_ratio", walk_forward_.overfit_profit_factor_ratio);
        walk_forward_.robust_win_rate_delta = b.value("robust_win_rate_delta", walk_forward_.robust_win_rate_delta);
        walk_forward_.min_oos_trades = b.value("min_oos_trades", walk_forward_.min_oos_trades);

        const size_t workers = b.value("worker_threads", walk_forward_.worker_threads);
        walk_forward_.worker_threads = workers;
        grid_.worker_threads = workers;

        grid_.top_k = b.value("grid_top_k", grid_.top_k);
        grid_.min_trades = b.value("grid_min_trades", grid_.min_trades);
        grid_.confidence_half_trades = b.value("confidence_half_trades", grid_.confidence_half_trades);

        aggregation_.equity_curve_points = b.value("equity_curve_points", aggregation_.equity_curve_points);
        aggregation_.clt_min_trades = b.value("clt_min_trades", aggregation_.clt_min_trades);
        aggregation_.ewma_decay = b.value("ewma_decay", aggregation_.ewma_decay);
        aggregation_.regime_shift_ratio = b.value("regime_shift_ratio", aggregation_.regime_shift_ratio);
    }

    if (j.contains("campaign")) {
        const auto& c = j["campaign"];
        auto& stages = campaign_.stages;
        stages.sanity_trades = c.value("sanity_trades", stages.sanity_trades);
        stages.stability_trades = c.value("stability_trades", stages.stability_trades);
        stages.promotion_trades = c.value("promotion_trades", stages.promotion_trades);

        campaign_.require_out_of_sample = c.value("require_out_of_sample", campaign_.require_out_of_sample);

        auto& gate = campaign_.gate;
        gate.min_trades = c.value("min_trades", stages.promotion_trades);
        gate.min_expectancy_pct = c.value("min_expectancy_pct", gate.min_expectancy_pct);
        gate.min_profit_factor = c.value("min_profit_factor", gate.min_profit_factor);
        gate.max_drawdown_volatile_pct = c.value("max_drawdown_volatile_pct", gate.max_drawdown_volatile_pct);
        gate.max_drawdown_default_pct = c.value("max_drawdown_default_pct", gate.max_drawdown_default_pct);
        gate.min_win_rate_volatile = c.value("min_win_rate_volatile", gate.min_win_rate_volatile);
        gate.min_win_rate_default = c.value("min_win_rate_default", gate.min_win_rate_default);

        state_dir_ = c.value("state_dir", state_dir_);
        artifacts_dir_ = c.value("artifacts_dir", artifacts_dir_);
    }

    if (j.contains("risk_engine")) {
        const auto& r = j["risk_engine"];
        risk_engine_.interval_ms = r.value("interval_ms", risk_engine_.interval_ms);
        risk_engine_.debounce_ms = r.value("debounce_ms", risk_engine_.debounce_ms);
        risk_engine_.fetch_timeout_ms = r.value("fetch_timeout_ms", risk_engine_.fetch_timeout_ms);
        risk_engine_.max_backoff_ms = r.value("max_backoff_ms", risk_engine_.max_backoff_ms);
        risk_engine_.primary_price_url = r.value("primary_price_url", risk_engine_.primary_price_url);
        risk_engine_.fallback_price_url = r.value("fallback_price_url", risk_engine_.fallback_price_url);
    }
}

} // namespace exitforge

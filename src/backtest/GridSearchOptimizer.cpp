#include "backtest/GridSearchOptimizer.h"
#include "strategy/EntrySignalFactory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/WorkerPool.h"

#include <algorithm>

namespace exitforge {
namespace backtest {

namespace {
template<typename T>
void checkDimension(const std::vector<T>& values, size_t max_values, const char* name) {
    if (values.empty()) {
        throw InvalidConfigurationError(std::string("grid dimension ") + name + " is empty");
    }
    if (values.size() > max_values) {
        throw InvalidConfigurationError(std::string("grid dimension ") + name + " has " +
                                        std::to_string(values.size()) + " values, max " +
                                        std::to_string(max_values));
    }
}
}

GridSearchOptimizer::GridSearchOptimizer(const SimulationSettings& simulation,
                                         const AggregationSettings& aggregation,
                                         const GridSearchSettings& settings)
    : simulator_(simulation)
    , aggregator_(aggregation)
    , settings_(settings) {
}

void GridSearchOptimizer::checkSpace(const GridSearchSpace& space) const {
    checkDimension(space.stop_loss_pct, settings_.max_stop_loss_values, "stop_loss_pct");
    checkDimension(space.take_profit_pct, settings_.max_take_profit_values, "take_profit_pct");
    checkDimension(space.trailing_stop_pct, settings_.max_trailing_values, "trailing_stop_pct");
    checkDimension(space.max_hold_candles, settings_.max_hold_values, "max_hold_candles");
}

double GridSearchOptimizer::score(const BacktestResult& result) const {
    const double n = static_cast<double>(result.total_trades);
    if (n <= 0.0) return 0.0;
    return result.expectancy * n / (n + settings_.confidence_half_trades);
}

GridSearchReport GridSearchOptimizer::optimize(const strategy::StrategyConfig& base,
                                               const std::vector<InstrumentSeries>& series,
                                               const GridSearchSpace& space) const {
    checkSpace(space);
    const auto signal = strategy::EntrySignalFactory::create(base.entry_signal);

    // Sweep order: SL outermost, hold innermost
    std::vector<strategy::ExitPolicy> policies;
    policies.reserve(space.combinations());
    for (double sl : space.stop_loss_pct) {
        for (double tp : space.take_profit_pct) {
            for (double trail : space.trailing_stop_pct) {
                for (int hold : space.max_hold_candles) {
                    strategy::ExitPolicy p = base.exit_policy;
                    p.stop_loss_pct = sl;
                    p.take_profit_pct = tp;
                    p.trailing_stop_pct = trail;
                    p.max_hold_candles = hold;
                    policies.push_back(p);
                }
            }
        }
    }

    GridSearchReport report;
    report.strategy_id = base.strategy_id;
    report.combinations = policies.size();

    std::vector<bool> valid(policies.size(), false);
    for (size_t i = 0; i < policies.size(); ++i) {
        const std::string err = policies[i].validationError();
        if (err.empty()) {
            valid[i] = true;
        } else {
            report.skipped_invalid++;
            LOG_INFO("[{}] grid combination {} skipped: {}", base.strategy_id, policies[i].describe(), err);
        }
    }

    std::vector<BacktestResult> results(policies.size());
    WorkerPool pool(settings_.worker_threads);
    pool.forEachIndex(policies.size(), [&](size_t i) {
        if (!valid[i]) return;
        std::vector<SimulationRun> runs;
        runs.reserve(series.size());
        for (const auto& s : series) {
            runs.push_back(simulator_.run(s, *signal, policies[i]));
        }
        results[i] = aggregator_.aggregate(base.strategy_id, policies[i], runs);
    });

    std::vector<GridCandidate> ranked;
    for (size_t i = 0; i < policies.size(); ++i) {
        if (!valid[i]) continue;
        if (results[i].total_trades < settings_.min_trades) {
            report.below_min_trades++;
            continue;
        }
        GridCandidate c;
        c.sweep_index = i;
        c.exit_policy = policies[i];
        c.score = score(results[i]);
        c.result = std::move(results[i]);
        ranked.push_back(std::move(c));
    }

    std::sort(ranked.begin(), ranked.end(), [](const GridCandidate& a, const GridCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.result.profit_factor != b.result.profit_factor) {
            return a.result.profit_factor > b.result.profit_factor;
        }
        return a.sweep_index < b.sweep_index;
    });

    if (ranked.size() > settings_.top_k) {
        ranked.resize(settings_.top_k);
    }
    report.top = std::move(ranked);

    LOG_INFO("[{}] grid search: {} combinations, {} skipped, {} below {} trades, {} ranked",
             base.strategy_id, report.combinations, report.skipped_invalid,
             report.below_min_trades, settings_.min_trades, report.top.size());
    return report;
}

} // namespace backtest
} // namespace exitforge

#include "backtest/WalkForwardValidator.h"
#include "strategy/EntrySignalFactory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/WorkerPool.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace exitforge {
namespace backtest {

WalkForwardValidator::WalkForwardValidator(const SimulationSettings& simulation,
                                           const AggregationSettings& aggregation,
                                           const WalkForwardSettings& settings)
    : simulator_(simulation)
    , aggregator_(aggregation)
    , settings_(settings) {
}

InstrumentSeries WalkForwardValidator::slice(const InstrumentSeries& series, size_t begin, size_t end) {
    InstrumentSeries out;
    out.instrument = series.instrument;
    out.interval = series.interval;
    end = std::min(end, series.candles.size());
    if (begin < end) {
        out.candles.assign(series.candles.begin() + begin, series.candles.begin() + end);
    }
    return out;
}

std::vector<SimulationRun> WalkForwardValidator::simulateAll(
    const strategy::StrategyConfig& config,
    const std::vector<InstrumentSeries>& jobs
) const {
    const auto signal = strategy::EntrySignalFactory::create(config.entry_signal);
    std::vector<SimulationRun> runs(jobs.size());

    WorkerPool pool(settings_.worker_threads);
    pool.forEachIndex(jobs.size(), [&](size_t i) {
        runs[i] = simulator_.run(jobs[i], *signal, config.exit_policy);
    });
    return runs;
}

WalkForwardReport WalkForwardValidator::validate(const strategy::StrategyConfig& config,
                                                 const std::vector<InstrumentSeries>& series) const {
    if (!(settings_.split_ratio > 0.0 && settings_.split_ratio < 1.0)) {
        throw InvalidConfigurationError("walk-forward split ratio must be in (0, 1)");
    }
    config.exit_policy.validate();

    std::vector<InstrumentSeries> jobs;
    jobs.reserve(series.size() * 2);
    for (const auto& s : series) {
        const size_t split = static_cast<size_t>(std::floor(s.candles.size() * settings_.split_ratio));
        jobs.push_back(slice(s, 0, split));
        jobs.push_back(slice(s, split, s.candles.size()));
    }

    const auto runs = simulateAll(config, jobs);

    WalkForwardReport report;
    report.strategy_id = config.strategy_id;
    for (size_t i = 0; i < runs.size(); ++i) {
        if (i % 2 == 0) {
            report.in_sample_runs.push_back(runs[i]);
            report.in_sample_inputs.push_back(std::move(jobs[i]));
        } else {
            report.out_of_sample_runs.push_back(runs[i]);
            report.out_of_sample_inputs.push_back(std::move(jobs[i]));
        }
    }

    report.in_sample = aggregator_.aggregate(config.strategy_id, config.exit_policy, report.in_sample_runs);
    report.out_of_sample = aggregator_.aggregate(config.strategy_id, config.exit_policy, report.out_of_sample_runs);
    classify(report);

    LOG_INFO("[{}] walk-forward IS {} trades PF {:.2f} / OOS {} trades PF {:.2f}: {}",
             config.strategy_id,
             report.in_sample.total_trades, report.in_sample.profit_factor,
             report.out_of_sample.total_trades, report.out_of_sample.profit_factor,
             report.verdict);
    return report;
}

void WalkForwardValidator::classify(WalkForwardReport& report) const {
    const BacktestResult& is = report.in_sample;
    const BacktestResult& oos = report.out_of_sample;

    report.overfit = is.total_trades > 0 && is.profit_factor > 0.0 &&
                     oos.profit_factor < is.profit_factor * settings_.overfit_profit_factor_ratio;

    const double wr_delta = std::abs(is.win_rate - oos.win_rate);
    const bool enough_oos = oos.total_trades >= settings_.min_oos_trades;
    report.robust = !report.overfit && enough_oos && wr_delta <= settings_.robust_win_rate_delta;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (report.overfit) {
        oss << "overfit: out-of-sample profit factor " << oos.profit_factor
            << " below " << settings_.overfit_profit_factor_ratio << " x in-sample " << is.profit_factor;
    } else if (!enough_oos) {
        oss << "inconclusive: " << oos.total_trades << " out-of-sample trades, need "
            << settings_.min_oos_trades;
    } else if (!report.robust) {
        oss << "unstable: win rate moved " << wr_delta << " between in-sample and out-of-sample";
    } else {
        oss << "robust: win rate delta " << wr_delta << ", out-of-sample profit factor "
            << oos.profit_factor;
    }
    report.verdict = oss.str();
}

std::vector<WalkForwardFold> WalkForwardValidator::validateFolds(
    const strategy::StrategyConfig& config,
    const std::vector<InstrumentSeries>& series,
    int folds
) const {
    if (folds < 1) {
        throw InvalidConfigurationError("walk-forward fold count must be >= 1");
    }
    config.exit_policy.validate();

    const size_t segments = static_cast<size_t>(folds) + 1;

    // Job layout: [fold][instrument][train, test]
    std::vector<InstrumentSeries> jobs;
    jobs.reserve(static_cast<size_t>(folds) * series.size() * 2);
    for (int k = 0; k < folds; ++k) {
        for (const auto& s : series) {
            const size_t seg = s.candles.size() / segments;
            const size_t train_end = seg * (k + 1);
            const size_t test_end = (k + 1 == folds) ? s.candles.size() : seg * (k + 2);
            jobs.push_back(slice(s, 0, train_end));
            jobs.push_back(slice(s, train_end, test_end));
        }
    }

    const auto runs = simulateAll(config, jobs);

    std::vector<WalkForwardFold> out;
    size_t cursor = 0;
    for (int k = 0; k < folds; ++k) {
        std::vector<SimulationRun> train_runs;
        std::vector<SimulationRun> test_runs;
        for (size_t s = 0; s < series.size(); ++s) {
            train_runs.push_back(runs[cursor++]);
            test_runs.push_back(runs[cursor++]);
        }

        WalkForwardFold fold;
        fold.index = k;
        fold.train = aggregator_.aggregate(config.strategy_id, config.exit_policy, train_runs);
        fold.test = aggregator_.aggregate(config.strategy_id, config.exit_policy, test_runs);
        out.push_back(std::move(fold));
    }
    return out;
}

} // namespace backtest
} // namespace exitforge

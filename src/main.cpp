#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/AtomicFile.h"
#include "backtest/EvidenceWriter.h"
#include "backtest/FileCandleProvider.h"
#include "backtest/GridSearchOptimizer.h"
#include "backtest/ResultAggregator.h"
#include "backtest/TradeSimulator.h"
#include "backtest/WalkForwardValidator.h"
#include "campaign/CampaignEngine.h"
#include "campaign/CampaignReporter.h"
#include "campaign/CampaignRunner.h"
#include "campaign/CampaignStateStoreJsonl.h"
#include "strategy/EntrySignalFactory.h"
#include "strategy/StrategyConfig.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace exitforge;

namespace {

struct CliOptions {
    std::string command;
    std::string config_path = "config/config.json";
    std::string data_dir = "data";
    std::string strategy_path;
    std::string grid_path;
    std::string interval = "1h";
    std::string out_dir;
    std::string campaign_id = "default";
    std::vector<std::string> instruments;
    int folds = 0;
};

void printUsage() {
    std::cout << "Usage: exitforge <backtest|walkforward|grid|campaign> --strategy <strategies.json>\n"
              << "       [--config config/config.json] [--data <dir>] [--instruments a,b]\n"
              << "       [--interval 1h] [--out <dir>] [--grid <grid.json>] [--folds n]\n"
              << "       [--campaign <id>]\n";
}

std::vector<std::string> splitCsv(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        const auto last = token.find_last_not_of(" \t");
        if (last == std::string::npos) {
            continue;
        }
        token.erase(last + 1);
        out.push_back(token);
    }
    return out;
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--data" && has_value) {
            options.data_dir = argv[++i];
        } else if (arg == "--strategy" && has_value) {
            options.strategy_path = argv[++i];
        } else if (arg == "--grid" && has_value) {
            options.grid_path = argv[++i];
        } else if (arg == "--instruments" && has_value) {
            options.instruments = splitCsv(argv[++i]);
        } else if (arg == "--interval" && has_value) {
            options.interval = argv[++i];
        } else if (arg == "--out" && has_value) {
            options.out_dir = argv[++i];
        } else if (arg == "--campaign" && has_value) {
            options.campaign_id = argv[++i];
        } else if (arg == "--folds" && has_value) {
            try {
                options.folds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --folds value: " << argv[i] << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }

    return !options.strategy_path.empty();
}

// Every <instrument>_<interval>.csv|json in the data directory
std::vector<std::string> discoverInstruments(const std::string& data_dir, const std::string& interval) {
    std::set<std::string> found;
    const std::string suffix = "_" + interval;

    std::error_code ec;
    if (!std::filesystem::is_directory(data_dir, ec)) {
        return {};
    }

    for (const auto& entry : std::filesystem::directory_iterator(data_dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto ext = entry.path().extension().string();
        if (ext != ".csv" && ext != ".json") {
            continue;
        }
        const auto stem = entry.path().stem().string();
        if (stem.size() > suffix.size() &&
            stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
            found.insert(stem.substr(0, stem.size() - suffix.size()));
        }
    }
    return std::vector<std::string>(found.begin(), found.end());
}

std::vector<InstrumentSeries> loadSeries(backtest::ICandleProvider& provider,
                                         const std::vector<std::string>& instruments,
                                         const std::string& interval,
                                         std::map<std::string, std::string>& sources) {
    std::vector<InstrumentSeries> out;
    for (const auto& instrument : instruments) {
        InstrumentSeries series;
        series.instrument = instrument;
        series.interval = interval;
        series.candles = provider.fetch(instrument, interval, 0, 0);
        if (series.candles.empty()) {
            LOG_WARN("No candles for {} ({}), skipped", instrument, interval);
            continue;
        }
        sources[instrument] = provider.sourceOf(instrument, interval);
        LOG_INFO("Loaded {} candles for {} from {}", series.candles.size(), instrument, sources[instrument]);
        out.push_back(std::move(series));
    }
    return out;
}

backtest::GridSearchSpace defaultGridSpace() {
    backtest::GridSearchSpace space;
    space.stop_loss_pct = {3.0, 5.0, 8.0, 12.0};
    space.take_profit_pct = {5.0, 10.0, 15.0, 25.0, 40.0};
    space.trailing_stop_pct = {0.0, 2.0, 4.0, 8.0};
    space.max_hold_candles = {0, 24, 48, 96};
    return space;
}

backtest::GridSearchSpace loadGridSpace(const std::string& path) {
    if (path.empty()) {
        return defaultGridSpace();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw InvalidConfigurationError("cannot open grid file: " + path);
    }

    nlohmann::json j;
    in >> j;

    const backtest::GridSearchSpace defaults = defaultGridSpace();
    backtest::GridSearchSpace space;
    space.stop_loss_pct = j.value("stop_loss_pct", defaults.stop_loss_pct);
    space.take_profit_pct = j.value("take_profit_pct", defaults.take_profit_pct);
    space.trailing_stop_pct = j.value("trailing_stop_pct", defaults.trailing_stop_pct);
    space.max_hold_candles = j.value("max_hold_candles", defaults.max_hold_candles);
    return space;
}

void printResult(const backtest::BacktestResult& r) {
    std::cout << "  " << std::left << std::setw(24) << r.strategy_id
              << " trades=" << std::setw(6) << r.total_trades
              << " wr=" << std::setw(18) << r.win_rate_display
              << " exp=" << std::fixed << std::setprecision(3) << r.expectancy << "%"
              << " pf=" << std::setprecision(2) << r.profit_factor
              << " dd=" << r.max_drawdown_pct << "%"
              << " sharpe=" << r.sharpe_like
              << (r.volatility_regime_shift ? " [regime shift]" : "")
              << "\n";
}

bool writeJson(const std::filesystem::path& path, const nlohmann::json& j) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (!utils::writeFileAtomic(path, j.dump(2))) {
        LOG_ERROR("Failed to write {}", path.string());
        return false;
    }
    LOG_INFO("Wrote {}", path.string());
    return true;
}

int runBacktest(const CliOptions& options,
                const std::vector<strategy::StrategyConfig>& configs,
                const std::vector<InstrumentSeries>& series,
                const std::map<std::string, std::string>& sources,
                const std::filesystem::path& out_dir) {
    const auto& config = Config::getInstance();
    backtest::TradeSimulator simulator(config.getSimulationSettings());
    backtest::ResultAggregator aggregator(config.getAggregationSettings());
    backtest::EvidenceWriter evidence(out_dir);

    std::cout << "\n[Backtest] " << series.size() << " instruments, interval " << options.interval << "\n";
    bool ok = true;
    for (const auto& cfg : configs) {
        auto signal = strategy::EntrySignalFactory::create(cfg.entry_signal);

        std::vector<backtest::SimulationRun> runs;
        for (const auto& s : series) {
            runs.push_back(simulator.run(s, *signal, cfg.exit_policy));
        }

        const auto result = aggregator.aggregate(cfg.strategy_id, cfg.exit_policy, runs);
        printResult(result);

        backtest::EvidenceBundle bundle;
        bundle.run_id = cfg.strategy_id + "-full";
        bundle.run_kind = "full";
        bundle.config = cfg;
        bundle.inputs = series;
        bundle.sources = sources;
        bundle.result = result;
        ok = evidence.write(bundle).has_value() && ok;
    }
    return ok ? 0 : 1;
}

int runWalkForward(const CliOptions& options,
                   const std::vector<strategy::StrategyConfig>& configs,
                   const std::vector<InstrumentSeries>& series,
                   const std::filesystem::path& out_dir) {
    const auto& config = Config::getInstance();
    backtest::WalkForwardValidator validator(config.getSimulationSettings(),
                                             config.getAggregationSettings(),
                                             config.getWalkForwardSettings());

    nlohmann::json report = nlohmann::json::array();
    std::cout << "\n[Walk-forward] split " << config.getWalkForwardSettings().split_ratio << "\n";
    for (const auto& cfg : configs) {
        const auto wf = validator.validate(cfg, series);
        std::cout << cfg.strategy_id << ": " << wf.verdict << "\n";
        printResult(wf.in_sample);
        printResult(wf.out_of_sample);

        nlohmann::json entry;
        entry["strategy_id"] = cfg.strategy_id;
        entry["verdict"] = wf.verdict;
        entry["overfit"] = wf.overfit;
        entry["robust"] = wf.robust;
        entry["in_sample"] = backtest::toJson(wf.in_sample);
        entry["out_of_sample"] = backtest::toJson(wf.out_of_sample);

        if (options.folds > 0) {
            nlohmann::json folds = nlohmann::json::array();
            for (const auto& fold : validator.validateFolds(cfg, series, options.folds)) {
                folds.push_back({
                    {"index", fold.index},
                    {"train", backtest::toJson(fold.train)},
                    {"test", backtest::toJson(fold.test)}
                });
                std::cout << "  fold " << fold.index
                          << " train pf=" << fold.train.profit_factor
                          << " test pf=" << fold.test.profit_factor << "\n";
            }
            entry["folds"] = folds;
        }
        report.push_back(entry);
    }

    return writeJson(out_dir / "walkforward_report.json", report) ? 0 : 1;
}

int runGrid(const CliOptions& options,
            const std::vector<strategy::StrategyConfig>& configs,
            const std::vector<InstrumentSeries>& series,
            const std::filesystem::path& out_dir) {
    const auto& config = Config::getInstance();
    backtest::GridSearchOptimizer optimizer(config.getSimulationSettings(),
                                            config.getAggregationSettings(),
                                            config.getGridSearchSettings());
    const auto space = loadGridSpace(options.grid_path);

    nlohmann::json report = nlohmann::json::array();
    for (const auto& cfg : configs) {
        const auto grid = optimizer.optimize(cfg, series, space);
        std::cout << "\n[Grid] " << cfg.strategy_id << ": " << grid.combinations << " combinations, "
                  << grid.skipped_invalid << " invalid, " << grid.below_min_trades << " below min trades\n";

        nlohmann::json top = nlohmann::json::array();
        for (const auto& candidate : grid.top) {
            std::cout << "  #" << candidate.sweep_index << " " << candidate.exit_policy.describe()
                      << " score=" << std::setprecision(4) << candidate.score << "\n";
            top.push_back({
                {"sweep_index", candidate.sweep_index},
                {"score", candidate.score},
                {"exit_policy", strategy::toJson(candidate.exit_policy)},
                {"result", backtest::toJson(candidate.result)}
            });
        }
        report.push_back({
            {"strategy_id", cfg.strategy_id},
            {"combinations", grid.combinations},
            {"skipped_invalid", grid.skipped_invalid},
            {"below_min_trades", grid.below_min_trades},
            {"top", top}
        });
    }

    return writeJson(out_dir / "grid_report.json", report) ? 0 : 1;
}

int runCampaign(const CliOptions& options,
                const std::vector<strategy::StrategyConfig>& configs,
                const std::vector<InstrumentSeries>& series,
                const std::map<std::string, std::string>& sources,
                const std::filesystem::path& out_dir) {
    const auto& config = Config::getInstance();

    const std::filesystem::path state_path =
        std::filesystem::path(config.getStateDir()) / (options.campaign_id + ".jsonl");
    auto store = std::make_shared<campaign::CampaignStateStoreJsonl>(state_path);

    campaign::CampaignEngine engine(options.campaign_id, store, config.getCampaignSettings());
    const size_t replayed = engine.restore();
    LOG_INFO("Campaign {}: replayed {} runs from {}", options.campaign_id, replayed, state_path.string());

    backtest::WalkForwardValidator validator(config.getSimulationSettings(),
                                             config.getAggregationSettings(),
                                             config.getWalkForwardSettings());
    backtest::EvidenceWriter evidence(out_dir);
    campaign::CampaignRunner runner(engine, validator, &evidence);

    for (const auto& cfg : configs) {
        engine.addStrategy(cfg);
        const auto outcome = runner.runRound(cfg, series, sources);
        if (!outcome.standing) {
            LOG_ERROR("Round for {} was not recorded: {}", cfg.strategy_id, outcome.failure);
            continue;
        }
        const auto& s = *outcome.standing;
        std::cout << "  " << std::left << std::setw(24) << s.strategy_id
                  << " stage=" << std::setw(10) << campaign::toString(s.stage)
                  << " trades=" << std::setw(7) << s.cumulative_trades
                  << (s.promoted ? " PROMOTED" : " " + s.insufficiency_reason) << "\n";
    }

    campaign::CampaignReporter reporter(out_dir);
    return reporter.writeAll(engine.snapshot()) ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 2;
    }

    auto& config = Config::getInstance();
    if (!config.load(options.config_path)) {
        return 2;
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    try {
        const auto configs = strategy::loadStrategyConfigs(options.strategy_path);
        if (configs.empty()) {
            LOG_ERROR("No strategies in {}", options.strategy_path);
            return 2;
        }

        auto instruments = options.instruments;
        if (instruments.empty()) {
            instruments = discoverInstruments(options.data_dir, options.interval);
        }
        if (instruments.empty()) {
            LOG_ERROR("No instruments found in {} for interval {}", options.data_dir, options.interval);
            return 2;
        }

        backtest::FileCandleProvider provider(options.data_dir);
        std::map<std::string, std::string> sources;
        const auto series = loadSeries(provider, instruments, options.interval, sources);

        const std::filesystem::path out_dir = options.out_dir.empty()
            ? std::filesystem::path(config.getArtifactsDir()) / options.campaign_id
            : std::filesystem::path(options.out_dir);

        if (options.command == "backtest") {
            return runBacktest(options, configs, series, sources, out_dir);
        }
        if (options.command == "walkforward") {
            return runWalkForward(options, configs, series, out_dir);
        }
        if (options.command == "grid") {
            return runGrid(options, configs, series, out_dir);
        }
        if (options.command == "campaign") {
            return runCampaign(options, configs, series, sources, out_dir);
        }

        std::cerr << "Unknown command: " << options.command << "\n";
        printUsage();
        return 2;
    } catch (const InvalidConfigurationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}

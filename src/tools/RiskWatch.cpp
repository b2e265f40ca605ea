#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "network/CurlHttpClient.h"
#include "network/FallbackPriceSource.h"
#include "network/PriceProviders.h"
#include "risk/RiskTriggerEngine.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace exitforge;

namespace {

std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void printUsage() {
    std::cout << "Usage: exitforge_riskwatch --positions <positions.json> [--config config/config.json]\n"
              << "       [--interval-ms 1500]\n";
}

// Accepts a bare array or {"positions": [...], "interval_ms": n}
risk::SyncCommand loadPositions(const std::string& path, long long default_interval_ms) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw InvalidConfigurationError("cannot open positions file: " + path);
    }

    nlohmann::json j;
    in >> j;

    risk::SyncCommand sync;
    sync.interval_ms = default_interval_ms;

    const nlohmann::json* list = &j;
    if (j.is_object()) {
        sync.interval_ms = j.value("interval_ms", default_interval_ms);
        if (!j.contains("positions")) {
            throw InvalidConfigurationError("positions file has no 'positions' array: " + path);
        }
        list = &j["positions"];
    }
    if (!list->is_array()) {
        throw InvalidConfigurationError("positions must be an array: " + path);
    }

    for (const auto& item : *list) {
        sync.positions.push_back(risk::livePositionFromJson(item));
    }
    return sync;
}

void logOutbound(const risk::RiskOutbound& message) {
    std::visit([](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, risk::PriceUpdateMessage>) {
            for (const auto& u : m.updates) {
                LOG_INFO("PRICE_UPDATE {} price={} pnl={:.2f}% hwm={:.2f}%",
                         u.id, u.price, u.pnl_pct, u.high_water_mark_pct);
            }
        } else {
            LOG_INFO("TRIGGER {} {} pnl={:.2f}% price={} hwm={:.2f}%",
                     m.position_id, m.kindName(), m.pnl_pct, m.price, m.high_water_mark_pct);
        }
    }, message);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string positions_path;
    long long interval_override = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--positions" && i + 1 < argc) {
            positions_path = argv[++i];
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            try {
                interval_override = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --interval-ms value: " << argv[i] << "\n";
                return 2;
            }
        } else {
            printUsage();
            return 2;
        }
    }

    if (positions_path.empty()) {
        printUsage();
        return 2;
    }

    auto& config = Config::getInstance();
    if (!config.load(config_path)) {
        return 2;
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    auto settings = config.getRiskEngineSettings();
    if (interval_override > 0) {
        settings.interval_ms = interval_override;
    }

    risk::SyncCommand sync;
    try {
        sync = loadPositions(positions_path, settings.interval_ms);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot load positions: {}", e.what());
        return 2;
    }

    auto http = std::make_shared<network::CurlHttpClient>(static_cast<long>(settings.fetch_timeout_ms));
    auto primary = std::make_shared<network::JupiterPriceProvider>(http, settings.primary_price_url);
    auto fallback = std::make_shared<network::DexScreenerPriceProvider>(http, settings.fallback_price_url);
    auto prices = std::make_shared<network::FallbackPriceSource>(primary, fallback);

    risk::RiskTriggerEngine engine(prices, settings);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!engine.start()) {
        return 1;
    }

    LOG_INFO("Watching {} positions (Ctrl+C to stop)", sync.positions.size());
    engine.send(std::move(sync));

    while (!g_stop_requested) {
        auto message = engine.receive(std::chrono::milliseconds(250));
        if (message) {
            logOutbound(*message);
        }
    }

    LOG_INFO("Shutdown requested");
    engine.send(risk::StopCommand{});
    engine.shutdown();

    while (auto rest = engine.receive(std::chrono::milliseconds(0))) {
        logOutbound(*rest);
    }
    return 0;
}

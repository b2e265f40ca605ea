#pragma once

#include "common/MessageChannel.h"
#include "network/FallbackPriceSource.h"
#include "risk/RiskEvaluator.h"
#include "risk/RiskTypes.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace exitforge {
namespace risk {

struct RiskEngineSettings {
    long long interval_ms = 1500;
    long long debounce_ms = 15000;
    long long fetch_timeout_ms = 4000;
    long long max_backoff_ms = 30000;
    std::string primary_price_url = "https://lite-api.jup.ag/price/v3";
    std::string fallback_price_url = "https://api.dexscreener.com/latest/dex/tokens";
};

// Live exit-trigger loop on its own thread. Talks to the outside only through
// the inbox (SYNC/STOP) and the outbox (PRICE_UPDATE/TRIGGER). Never places
// orders.
class RiskTriggerEngine {
public:
    using Clock = std::function<long long()>;

    RiskTriggerEngine(std::shared_ptr<network::FallbackPriceSource> prices,
                      RiskEngineSettings settings,
                      Clock clock = Clock());
    ~RiskTriggerEngine();

    RiskTriggerEngine(const RiskTriggerEngine&) = delete;
    RiskTriggerEngine& operator=(const RiskTriggerEngine&) = delete;

    bool start();
    // Joins the worker thread. Safe to call more than once.
    void shutdown();

    bool send(RiskInbound message);
    std::optional<RiskOutbound> receive(std::chrono::milliseconds timeout);

    bool isRunning() const { return running_; }
    bool isTicking() const { return ticking_; }
    size_t trackedPositions() const { return tracked_; }
    int consecutiveFailures() const { return consecutive_failures_; }
    long long currentDelayMs() const { return current_delay_ms_; }

private:
    void run();
    void handle(const RiskInbound& message);
    void tick();
    long long nowMs() const;

    std::shared_ptr<network::FallbackPriceSource> prices_;
    RiskEngineSettings settings_;
    Clock clock_;

    RiskEvaluator evaluator_;
    MessageChannel<RiskInbound> inbox_;
    MessageChannel<RiskOutbound> outbox_;

    std::atomic<bool> running_{false};
    std::atomic<bool> ticking_{false};
    std::atomic<size_t> tracked_{0};
    std::atomic<int> consecutive_failures_{0};
    std::atomic<long long> current_delay_ms_{0};
    long long interval_ms_;
    bool tick_now_ = false;

    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace risk
} // namespace exitforge

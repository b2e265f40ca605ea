#include "risk/RiskTriggerEngine.h"
#include "PriceFakes.h"
#include "TestCandles.h"

#include <chrono>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <thread>
#include <type_traits>
#include <variant>

using namespace exitforge;
using namespace exitforge::testing;
using namespace std::chrono_literals;

namespace {

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

risk::LivePosition position(const std::string& id, const std::string& instrument, double entry,
                            double sl, double tp) {
    risk::LivePosition p;
    p.id = id;
    p.instrument = instrument;
    p.entry_price = entry;
    p.exits.stop_loss_pct = sl;
    p.exits.take_profit_pct = tp;
    return p;
}

risk::SyncCommand syncOf(std::vector<risk::LivePosition> positions, long long interval_ms) {
    risk::SyncCommand cmd;
    cmd.positions = std::move(positions);
    cmd.interval_ms = interval_ms;
    return cmd;
}

// Collects outbound messages until a trigger for position_id shows up
std::optional<risk::TriggerEvent> awaitTrigger(risk::RiskTriggerEngine& engine,
                                               const std::string& position_id,
                                               int& price_updates) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto msg = engine.receive(100ms);
        if (!msg) continue;
        if (auto* trigger = std::get_if<risk::TriggerEvent>(&*msg)) {
            if (trigger->position_id == position_id) return *trigger;
        } else {
            ++price_updates;
        }
    }
    return std::nullopt;
}

int countTriggers(risk::RiskTriggerEngine& engine, std::chrono::milliseconds window) {
    int triggers = 0;
    const auto deadline = std::chrono::steady_clock::now() + window;
    while (std::chrono::steady_clock::now() < deadline) {
        auto msg = engine.receive(20ms);
        if (msg && std::holds_alternative<risk::TriggerEvent>(*msg)) ++triggers;
    }
    return triggers;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RiskTriggerEngine Test..." << std::endl;

    risk::RiskEngineSettings settings;
    settings.interval_ms = 50;
    settings.max_backoff_ms = 400;

    {
        risk::RiskTriggerEngine orphan(nullptr, settings);
        TEST_CHECK(!orphan.start());
    }

    auto primary = std::make_shared<FakePriceProvider>("primary");
    auto fallback = std::make_shared<FakePriceProvider>("fallback");
    primary->setPrice("SOL", 94.0);
    fallback->setPrice("BONK", 2.0);
    auto source = std::make_shared<network::FallbackPriceSource>(primary, fallback);

    risk::RiskTriggerEngine engine(source, settings);
    TEST_CHECK(engine.start());
    TEST_CHECK(!engine.start());
    TEST_CHECK(engine.isRunning());
    TEST_CHECK(!engine.isTicking());

    // Idle engine never fetches
    std::this_thread::sleep_for(100ms);
    TEST_CHECK(primary->calls() == 0);

    // SYNC ticks at once; the stop loss fires exactly once inside the debounce window
    TEST_CHECK(engine.send(syncOf({position("p1", "SOL", 100.0, 5.0, 0.0)}, 50)));
    int updates = 0;
    auto sl = awaitTrigger(engine, "p1", updates);
    TEST_CHECK(sl.has_value());
    TEST_CHECK(sl->kind == risk::ExitReason::STOP_LOSS);
    TEST_CHECK(sl->instrument == "SOL");
    TEST_NEAR(sl->pnl_pct, -6.0, 1e-9);
    TEST_CHECK(updates >= 1);
    TEST_CHECK(engine.isTicking());
    TEST_CHECK(engine.trackedPositions() == 1);
    TEST_CHECK(countTriggers(engine, 300ms) == 0);
    TEST_CHECK(primary->calls() >= 3);

    // Ids the primary cannot price come from the fallback
    TEST_CHECK(engine.send(syncOf({position("p1", "SOL", 100.0, 5.0, 0.0),
                                   position("p2", "BONK", 1.0, 0.0, 50.0)}, 50)));
    auto tp = awaitTrigger(engine, "p2", updates);
    TEST_CHECK(tp.has_value());
    TEST_CHECK(tp->kind == risk::ExitReason::TAKE_PROFIT);
    TEST_NEAR(tp->price, 2.0, 1e-12);
    TEST_CHECK(engine.trackedPositions() == 2);

    // STOP: no more ticks, thread stays up
    TEST_CHECK(engine.send(risk::StopCommand{}));
    TEST_CHECK(waitFor([&] { return !engine.isTicking(); }, 2000ms));
    TEST_CHECK(engine.trackedPositions() == 0);
    while (engine.receive(0ms)) {
    }
    const int calls_after_stop = primary->calls();
    TEST_CHECK(!engine.receive(300ms).has_value());
    TEST_CHECK(primary->calls() == calls_after_stop);
    TEST_CHECK(engine.isRunning());

    // Every source failing backs off exponentially up to the cap
    primary->setFailing(true);
    fallback->setFailing(true);
    TEST_CHECK(engine.send(syncOf({position("p1", "SOL", 100.0, 5.0, 0.0)}, 50)));
    TEST_CHECK(waitFor([&] { return engine.currentDelayMs() == 400; }, 3000ms));
    TEST_CHECK(engine.consecutiveFailures() >= 3);

    primary->setFailing(false);
    fallback->setFailing(false);
    TEST_CHECK(waitFor([&] {
        return engine.consecutiveFailures() == 0 && engine.currentDelayMs() == 50;
    }, 3000ms));

    // A reader that falls behind finds only the newest price update queued
    TEST_CHECK(engine.send(syncOf({position("p3", "SOL", 90.0, 0.0, 0.0)}, 50)));
    std::this_thread::sleep_for(500ms);
    TEST_CHECK(engine.send(risk::StopCommand{}));
    TEST_CHECK(waitFor([&] { return !engine.isTicking(); }, 2000ms));
    int queued_updates = 0;
    while (auto msg = engine.receive(0ms)) {
        if (std::holds_alternative<risk::PriceUpdateMessage>(*msg)) ++queued_updates;
    }
    TEST_CHECK(queued_updates == 1);

    // An oversized interval is held to the backoff ceiling and never overflows
    primary->setFailing(true);
    fallback->setFailing(true);
    TEST_CHECK(engine.send(syncOf({position("p3", "SOL", 90.0, 0.0, 0.0)},
                                  std::numeric_limits<long long>::max())));
    TEST_CHECK(waitFor([&] {
        return engine.consecutiveFailures() >= 2 && engine.currentDelayMs() == 400;
    }, 3000ms));
    primary->setFailing(false);
    fallback->setFailing(false);
    TEST_CHECK(waitFor([&] {
        return engine.consecutiveFailures() == 0 && engine.currentDelayMs() == 400;
    }, 3000ms));

    engine.shutdown();
    TEST_CHECK(!engine.isRunning());
    TEST_CHECK(!engine.send(risk::StopCommand{}));
    engine.shutdown();

    std::cout << "[TEST] RiskTriggerEngine PASSED" << std::endl;
    return 0;
}

#include "risk/RiskEvaluator.h"
#include "common/Errors.h"
#include "TestCandles.h"

#include <iostream>

using namespace exitforge;
using risk::ExitReason;
using risk::LivePosition;

namespace {

LivePosition makePosition(const std::string& id, const std::string& instrument, double entry,
                          double sl, double tp, double trail) {
    LivePosition p;
    p.id = id;
    p.instrument = instrument;
    p.entry_price = entry;
    p.exits.stop_loss_pct = sl;
    p.exits.take_profit_pct = tp;
    p.exits.trailing_stop_pct = trail;
    return p;
}

int testStopLossDebounce() {
    risk::RiskEvaluator evaluator;
    evaluator.sync({makePosition("p1", "SOL", 100.0, 5.0, 20.0, 3.0)});

    int sl_hits = 0;
    for (long long now : {0LL, 1500LL, 3000LL}) {
        const auto r = evaluator.evaluate({{"SOL", 94.0}}, now);
        TEST_CHECK(r.updates.size() == 1);
        TEST_NEAR(r.updates[0].pnl_pct, -6.0, 1e-9);
        for (const auto& t : r.triggers) {
            TEST_CHECK(t.kind == ExitReason::STOP_LOSS);
            TEST_CHECK(t.kindName() == "sl_hit");
            TEST_CHECK(t.ts_ms == 0);
            ++sl_hits;
        }
    }
    TEST_CHECK(sl_hits == 1);

    // Window elapsed
    const auto later = evaluator.evaluate({{"SOL", 94.0}}, 15000);
    TEST_CHECK(later.triggers.size() == 1);

    // No price this tick: nothing for the position at all
    const auto silent = evaluator.evaluate({{"BONK", 1.0}}, 16000);
    TEST_CHECK(silent.updates.empty());
    TEST_CHECK(silent.triggers.empty());
    return 0;
}

int testTrailingRatchet() {
    risk::RiskEvaluator evaluator;
    evaluator.sync({makePosition("p2", "BONK", 1.0, 10.0, 0.0, 3.0)});

    auto r = evaluator.evaluate({{"BONK", 1.02}}, 0);
    TEST_CHECK(r.triggers.empty());
    TEST_NEAR(evaluator.position("p2")->high_water_mark_pct, 2.0, 1e-9);

    r = evaluator.evaluate({{"BONK", 1.05}}, 1000);
    TEST_CHECK(r.triggers.empty());
    TEST_NEAR(r.updates[0].high_water_mark_pct, 5.0, 1e-9);

    // Peak holds while price falls back
    r = evaluator.evaluate({{"BONK", 1.03}}, 2000);
    TEST_CHECK(r.triggers.empty());
    TEST_NEAR(r.updates[0].high_water_mark_pct, 5.0, 1e-9);

    r = evaluator.evaluate({{"BONK", 1.015}}, 3000);
    TEST_CHECK(r.triggers.size() == 1);
    TEST_CHECK(r.triggers[0].kind == ExitReason::TRAILING_STOP);
    TEST_CHECK(r.triggers[0].kindName() == "trail_stop");
    TEST_NEAR(r.triggers[0].high_water_mark_pct, 5.0, 1e-9);
    TEST_NEAR(r.triggers[0].price, 1.015, 1e-12);
    return 0;
}

int testTrailNotArmedBelowDistance() {
    risk::RiskEvaluator evaluator;
    evaluator.sync({makePosition("p3", "WIF", 100.0, 0.0, 0.0, 3.0)});

    // Peak of 2% never clears the 3% trail distance
    evaluator.evaluate({{"WIF", 102.0}}, 0);
    const auto r = evaluator.evaluate({{"WIF", 97.0}}, 1000);
    TEST_CHECK(r.triggers.empty());
    return 0;
}

int testPriority() {
    risk::RiskEvaluator evaluator;
    auto tp_and_trail = makePosition("tp", "A", 100.0, 5.0, 10.0, 2.0);
    tp_and_trail.high_water_mark_pct = 20.0;

    auto expired_and_sl = makePosition("old", "B", 100.0, 5.0, 0.0, 0.0);
    expired_and_sl.entry_time_ms = 0;
    expired_and_sl.max_age_ms = 60000;

    evaluator.sync({tp_and_trail, expired_and_sl});
    const auto r = evaluator.evaluate({{"A", 110.0}, {"B", 90.0}}, 60000);

    TEST_CHECK(r.triggers.size() == 2);
    for (const auto& t : r.triggers) {
        if (t.position_id == "tp") {
            TEST_CHECK(t.kind == ExitReason::TAKE_PROFIT);
        } else {
            TEST_CHECK(t.position_id == "old");
            TEST_CHECK(t.kind == ExitReason::EXPIRED);
        }
    }

    // Not yet old enough: the stop loss is what fires
    risk::RiskEvaluator young;
    young.sync({expired_and_sl});
    const auto y = young.evaluate({{"B", 90.0}}, 59999);
    TEST_CHECK(y.triggers.size() == 1);
    TEST_CHECK(y.triggers[0].kind == ExitReason::STOP_LOSS);
    return 0;
}

int testNoExitPositionOnlyUpdates() {
    risk::RiskEvaluator evaluator;
    evaluator.sync({makePosition("hodl", "JUP", 1.0, 0.0, 0.0, 0.0)});

    const auto r = evaluator.evaluate({{"JUP", 0.01}}, 0);
    TEST_CHECK(r.updates.size() == 1);
    TEST_NEAR(r.updates[0].pnl_pct, -99.0, 1e-9);
    TEST_CHECK(r.triggers.empty());
    return 0;
}

int testSyncSemantics() {
    risk::RiskEvaluator evaluator;
    evaluator.sync({makePosition("p1", "SOL", 100.0, 5.0, 0.0, 0.0),
                    makePosition("p2", "SOL", 50.0, 0.0, 0.0, 4.0),
                    makePosition("p3", "BONK", 1.0, 5.0, 0.0, 0.0)});
    TEST_CHECK(evaluator.size() == 3);

    const auto instruments = evaluator.instruments();
    TEST_CHECK(instruments.size() == 2);
    TEST_CHECK(instruments[0] == "BONK" && instruments[1] == "SOL");

    evaluator.evaluate({{"SOL", 55.0}}, 0);   // p2 +10%, p1 -45% stop
    TEST_NEAR(evaluator.position("p2")->high_water_mark_pct, 10.0, 1e-9);

    // A stale re-sync never lowers the tracked peak, a higher one raises it
    auto stale = makePosition("p2", "SOL", 50.0, 0.0, 0.0, 4.0);
    stale.high_water_mark_pct = 1.0;
    evaluator.sync({makePosition("p1", "SOL", 100.0, 5.0, 0.0, 0.0), stale});
    TEST_CHECK(evaluator.size() == 2);
    TEST_CHECK(!evaluator.position("p3").has_value());
    TEST_NEAR(evaluator.position("p2")->high_water_mark_pct, 10.0, 1e-9);

    stale.high_water_mark_pct = 12.0;
    evaluator.sync({makePosition("p1", "SOL", 100.0, 5.0, 0.0, 0.0), stale});
    TEST_NEAR(evaluator.position("p2")->high_water_mark_pct, 12.0, 1e-9);

    // p1 stays tracked, so its stop stays debounced
    auto r = evaluator.evaluate({{"SOL", 55.0}}, 1000);
    for (const auto& t : r.triggers) {
        TEST_CHECK(t.position_id != "p1");
    }

    // Dropped and re-added: debounce history is gone
    evaluator.sync({stale});
    evaluator.sync({makePosition("p1", "SOL", 100.0, 5.0, 0.0, 0.0)});
    r = evaluator.evaluate({{"SOL", 55.0}}, 2000);
    TEST_CHECK(r.triggers.size() == 1);
    TEST_CHECK(r.triggers[0].position_id == "p1");

    evaluator.clear();
    TEST_CHECK(evaluator.size() == 0);
    TEST_CHECK(evaluator.instruments().empty());
    return 0;
}

int testPositionJson() {
    const auto p = risk::livePositionFromJson(nlohmann::json::parse(
        R"({"id": "a", "instrument": "SOL", "entry_price": 150.5, "stop_loss_pct": 8,
            "trailing_stop_pct": 2.5, "max_age_ms": 3600000, "high_water_mark_pct": 4})"));
    TEST_CHECK(p.id == "a");
    TEST_NEAR(p.entry_price, 150.5, 1e-12);
    TEST_NEAR(p.exits.trailing_stop_pct, 2.5, 1e-12);
    TEST_CHECK(p.max_age_ms == 3600000);
    TEST_CHECK(p.hasAnyExit());

    bool thrown = false;
    try {
        risk::livePositionFromJson(nlohmann::json::parse(R"({"instrument": "SOL", "entry_price": 1})"));
    } catch (const InvalidConfigurationError&) {
        thrown = true;
    }
    TEST_CHECK(thrown);

    thrown = false;
    try {
        risk::livePositionFromJson(nlohmann::json::parse(R"({"id": "b", "instrument": "SOL", "entry_price": 0})"));
    } catch (const InvalidConfigurationError&) {
        thrown = true;
    }
    TEST_CHECK(thrown);
    return 0;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RiskEvaluator Test..." << std::endl;

    if (testStopLossDebounce() != 0) return 1;
    if (testTrailingRatchet() != 0) return 1;
    if (testTrailNotArmedBelowDistance() != 0) return 1;
    if (testPriority() != 0) return 1;
    if (testNoExitPositionOnlyUpdates() != 0) return 1;
    if (testSyncSemantics() != 0) return 1;
    if (testPositionJson() != 0) return 1;

    std::cout << "[TEST] RiskEvaluator PASSED" << std::endl;
    return 0;
}

#pragma once

#include "risk/ExitRules.h"
#include "strategy/ExitPolicy.h"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace exitforge {
namespace risk {

// Open position as tracked by the live loop
struct LivePosition {
    std::string id;
    std::string instrument;
    double entry_price = 0.0;
    strategy::ExitPolicy exits;         // slippage/fee and max_hold_candles unused live
    long long entry_time_ms = 0;
    long long max_age_ms = 0;           // 0: never expires
    double high_water_mark_pct = 0.0;

    // Long-conviction holdings get price updates but never trigger
    bool hasAnyExit() const {
        return exits.stop_loss_pct > 0.0 || exits.take_profit_pct > 0.0 ||
               exits.trailing_stop_pct > 0.0 || max_age_ms > 0;
    }
};

LivePosition livePositionFromJson(const nlohmann::json& j);

struct PriceUpdate {
    std::string id;
    double price = 0.0;
    double pnl_pct = 0.0;
    double high_water_mark_pct = 0.0;
};

struct TriggerEvent {
    std::string position_id;
    std::string instrument;
    ExitReason kind = ExitReason::NONE;
    double pnl_pct = 0.0;
    double price = 0.0;
    double high_water_mark_pct = 0.0;
    long long ts_ms = 0;

    std::string kindName() const { return triggerKindName(kind); }
};

// Inbound: SYNC replaces the tracked set, STOP halts ticking and clears it
struct SyncCommand {
    std::vector<LivePosition> positions;
    long long interval_ms = 1500;
};

struct StopCommand {};

using RiskInbound = std::variant<SyncCommand, StopCommand>;

// Outbound
struct PriceUpdateMessage {
    std::vector<PriceUpdate> updates;
    long long ts_ms = 0;
};

using RiskOutbound = std::variant<PriceUpdateMessage, TriggerEvent>;

} // namespace risk
} // namespace exitforge

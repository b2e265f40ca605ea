#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace exitforge {
namespace strategy {

// All percentages are percent of the closed-trade return (8.0 == 8%).
struct ExitPolicy {
    double stop_loss_pct = 0.0;
    double take_profit_pct = 0.0;
    double trailing_stop_pct = 0.0;     // 0: disabled
    int max_hold_candles = 0;           // 0: no expiry
    double slippage_pct = 0.0;          // applied against the trader on both legs
    double fee_pct = 0.0;               // per leg

    // Empty string when the policy is usable, otherwise the first violation.
    std::string validationError() const;
    bool isValid() const { return validationError().empty(); }

    // Throws InvalidConfigurationError
    void validate() const;

    bool hasAnyExit() const {
        return stop_loss_pct > 0.0 || take_profit_pct > 0.0 ||
               trailing_stop_pct > 0.0 || max_hold_candles > 0;
    }

    std::string describe() const;
};

nlohmann::json toJson(const ExitPolicy& policy);
ExitPolicy exitPolicyFromJson(const nlohmann::json& j);

} // namespace strategy
} // namespace exitforge

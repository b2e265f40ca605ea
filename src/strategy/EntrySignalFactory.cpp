#include "strategy/EntrySignalFactory.h"
#include "strategy/EntrySignals.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace exitforge {
namespace strategy {

namespace {
std::string normalizeSignalName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return name;
}
}

std::unique_ptr<IEntrySignal> EntrySignalFactory::create(const std::string& name) {
    const std::string n = normalizeSignalName(name);

    if (n == "momentum") return std::make_unique<MomentumSignal>();
    if (n == "mean_reversion") return std::make_unique<MeanReversionSignal>();
    if (n == "breakout") return std::make_unique<BreakoutSignal>();
    if (n == "trend_follow") return std::make_unique<TrendFollowSignal>();
    if (n == "squeeze_breakout") return std::make_unique<SqueezeBreakoutSignal>();
    if (n == "fresh_pump") return std::make_unique<FreshPumpSignal>();
    if (n == "aggressive") return std::make_unique<AggressiveSignal>();
    if (n == "dip_buy") return std::make_unique<DipBuySignal>();

    throw InvalidConfigurationError("unknown entry signal '" + name + "'");
}

std::vector<std::string> EntrySignalFactory::availableSignals() {
    return {
        "momentum", "mean_reversion", "breakout", "trend_follow",
        "squeeze_breakout", "fresh_pump", "aggressive", "dip_buy"
    };
}

} // namespace strategy
} // namespace exitforge

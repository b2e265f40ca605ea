#pragma once

#include "risk/RiskTypes.h"
#include "risk/TriggerDebouncer.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exitforge {
namespace risk {

struct EvaluationResult {
    std::vector<PriceUpdate> updates;
    std::vector<TriggerEvent> triggers;
};

// Tracked position set plus the per-tick exit decision. Not thread-safe;
// owned by one engine thread.
class RiskEvaluator {
public:
    explicit RiskEvaluator(long long debounce_ms = 15000);

    // Replaces the tracked set. A position that stays tracked keeps the larger
    // of its current and synced high-water mark.
    void sync(const std::vector<LivePosition>& positions);
    void clear();

    // prices is keyed by instrument; positions without a price this tick are skipped
    EvaluationResult evaluate(const std::map<std::string, double>& prices, long long now_ms);

    // Distinct instruments across tracked positions
    std::vector<std::string> instruments() const;

    std::optional<LivePosition> position(const std::string& id) const;
    size_t size() const { return positions_.size(); }

private:
    std::map<std::string, LivePosition> positions_;
    TriggerDebouncer debouncer_;
};

} // namespace risk
} // namespace exitforge

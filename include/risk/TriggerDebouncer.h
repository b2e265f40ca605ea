#pragma once

#include "risk/ExitRules.h"

#include <map>
#include <set>
#include <string>
#include <utility>

namespace exitforge {
namespace risk {

// Suppresses re-emission of the same (position, kind) inside the window.
class TriggerDebouncer {
public:
    explicit TriggerDebouncer(long long window_ms = 15000) : window_ms_(window_ms) {}

    // True when the trigger may be emitted now; records the emission.
    bool allow(const std::string& position_id, ExitReason kind, long long now_ms);

    // Drops entries for positions no longer tracked
    void retain(const std::set<std::string>& position_ids);

    void clear() { last_emit_ms_.clear(); }
    size_t size() const { return last_emit_ms_.size(); }

private:
    long long window_ms_;
    std::map<std::pair<std::string, ExitReason>, long long> last_emit_ms_;
};

} // namespace risk
} // namespace exitforge

#include "risk/TriggerDebouncer.h"

namespace exitforge {
namespace risk {

bool TriggerDebouncer::allow(const std::string& position_id, ExitReason kind, long long now_ms) {
    const auto key = std::make_pair(position_id, kind);
    auto it = last_emit_ms_.find(key);
    if (it != last_emit_ms_.end() && now_ms - it->second < window_ms_) {
        return false;
    }
    last_emit_ms_[key] = now_ms;
    return true;
}

void TriggerDebouncer::retain(const std::set<std::string>& position_ids) {
    for (auto it = last_emit_ms_.begin(); it != last_emit_ms_.end();) {
        if (position_ids.count(it->first.first) == 0) {
            it = last_emit_ms_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace risk
} // namespace exitforge

#pragma once

#include "strategy/IEntrySignal.h"

#include <memory>
#include <string>
#include <vector>

namespace exitforge {
namespace strategy {

class EntrySignalFactory {
public:
    // Accepts "mean_reversion" and "mean-reversion" spellings.
    // Throws InvalidConfigurationError on unknown names.
    static std::unique_ptr<IEntrySignal> create(const std::string& name);

    static std::vector<std::string> availableSignals();
};

} // namespace strategy
} // namespace exitforge

#pragma once

#include "network/IPriceProvider.h"

#include <memory>
#include <string>
#include <vector>

namespace exitforge {
namespace network {

struct PriceBatch {
    std::map<std::string, double> prices;
    std::vector<std::string> missing;       // retried next tick
    bool primary_failed = false;            // every primary batch failed
    bool fallback_used = false;
    bool all_failed = false;                // nothing priced and every batch failed
    std::vector<std::string> errors;
};

// Primary first; ids it did not price go to the fallback.
class FallbackPriceSource {
public:
    FallbackPriceSource(std::shared_ptr<IPriceProvider> primary,
                        std::shared_ptr<IPriceProvider> fallback);

    // Deduplicates ids. Never throws for source problems.
    PriceBatch fetch(const std::vector<std::string>& instrument_ids);

private:
    std::shared_ptr<IPriceProvider> primary_;
    std::shared_ptr<IPriceProvider> fallback_;
};

} // namespace network
} // namespace exitforge

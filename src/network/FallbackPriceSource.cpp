#include "network/FallbackPriceSource.h"
#include "common/Logger.h"

#include <set>

namespace exitforge {
namespace network {

FallbackPriceSource::FallbackPriceSource(std::shared_ptr<IPriceProvider> primary,
                                         std::shared_ptr<IPriceProvider> fallback)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback)) {
}

PriceBatch FallbackPriceSource::fetch(const std::vector<std::string>& instrument_ids) {
    PriceBatch batch;

    std::vector<std::string> ids;
    std::set<std::string> seen;
    for (const auto& id : instrument_ids) {
        if (!id.empty() && seen.insert(id).second) {
            ids.push_back(id);
        }
    }
    if (ids.empty()) {
        return batch;
    }

    int batches = 0;
    int failed = 0;

    if (primary_) {
        PriceFetch primary = primary_->fetch(ids);
        batches += primary.batches;
        failed += primary.failed_batches;
        batch.primary_failed = primary.allFailed();
        batch.prices = std::move(primary.prices);
        for (const auto& e : primary.errors) {
            batch.errors.push_back(e);
            LOG_WARN("Price source {} failed for {} ids: {}", primary_->name(), ids.size(), e);
        }
    }

    std::vector<std::string> remaining;
    for (const auto& id : ids) {
        if (batch.prices.find(id) == batch.prices.end()) {
            remaining.push_back(id);
        }
    }

    if (!remaining.empty() && fallback_) {
        batch.fallback_used = true;
        PriceFetch fallback = fallback_->fetch(remaining);
        batches += fallback.batches;
        failed += fallback.failed_batches;
        for (const auto& [id, price] : fallback.prices) {
            batch.prices[id] = price;
        }
        for (const auto& e : fallback.errors) {
            batch.errors.push_back(e);
            LOG_WARN("Price source {} failed for {} ids: {}", fallback_->name(), remaining.size(), e);
        }
    }

    for (const auto& id : ids) {
        if (batch.prices.find(id) == batch.prices.end()) {
            batch.missing.push_back(id);
        }
    }

    batch.all_failed = batch.prices.empty() && batches > 0 && failed == batches;
    return batch;
}

} // namespace network
} // namespace exitforge

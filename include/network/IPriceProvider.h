#pragma once

#include <map>
#include <string>
#include <vector>

namespace exitforge {
namespace network {

// Partial results are normal: ids the source did not price are simply absent.
struct PriceFetch {
    std::map<std::string, double> prices;
    int batches = 0;
    int failed_batches = 0;
    std::vector<std::string> errors;

    bool allFailed() const { return batches > 0 && failed_batches == batches; }
};

class IPriceProvider {
public:
    virtual ~IPriceProvider() = default;

    // Never throws for transport or parse problems; those land in PriceFetch::errors.
    virtual PriceFetch fetch(const std::vector<std::string>& instrument_ids) = 0;

    virtual std::string name() const = 0;
};

} // namespace network
} // namespace exitforge

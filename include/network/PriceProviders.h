#pragma once

#include "network/IHttpClient.h"
#include "network/IPriceProvider.h"

#include <memory>

namespace exitforge {
namespace network {

// GET <base>?ids=a,b,c
// Accepts {"data": {id: {"price": ...}}} and {id: {"usdPrice": ...}} bodies.
class JupiterPriceProvider : public IPriceProvider {
public:
    JupiterPriceProvider(std::shared_ptr<IHttpClient> http,
                         std::string base_url,
                         size_t batch_size = 100);

    PriceFetch fetch(const std::vector<std::string>& instrument_ids) override;
    std::string name() const override { return "jupiter"; }

    static std::map<std::string, double> parseBody(const nlohmann::json& body);

private:
    std::shared_ptr<IHttpClient> http_;
    std::string base_url_;
    size_t batch_size_;
};

// GET <base>/<a,b,c>, at most 30 addresses per request.
// Picks the deepest-liquidity pair per base token.
class DexScreenerPriceProvider : public IPriceProvider {
public:
    DexScreenerPriceProvider(std::shared_ptr<IHttpClient> http,
                             std::string base_url,
                             size_t batch_size = 30);

    PriceFetch fetch(const std::vector<std::string>& instrument_ids) override;
    std::string name() const override { return "dexscreener"; }

    static std::map<std::string, double> parseBody(const nlohmann::json& body);

private:
    std::shared_ptr<IHttpClient> http_;
    std::string base_url_;
    size_t batch_size_;
};

std::vector<std::vector<std::string>> chunkIds(const std::vector<std::string>& ids, size_t size);

} // namespace network
} // namespace exitforge

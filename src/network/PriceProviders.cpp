#include "network/PriceProviders.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace exitforge {
namespace network {

namespace {
// Price fields arrive as numbers or decimal strings
bool readPrice(const nlohmann::json& v, double& out) {
    double price = 0.0;
    if (v.is_number()) {
        price = v.get<double>();
    } else if (v.is_string()) {
        try {
            price = std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return false;
        }
    } else {
        return false;
    }
    if (!std::isfinite(price) || price <= 0.0) return false;
    out = price;
    return true;
}

std::string joinIds(const std::vector<std::string>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ",";
        oss << ids[i];
    }
    return oss.str();
}

// Runs one request per batch; a failed batch never aborts the others
template<typename Request, typename Parse>
PriceFetch fetchBatched(const std::string& source,
                        const std::vector<std::string>& ids,
                        size_t batch_size,
                        Request request,
                        Parse parse) {
    PriceFetch result;
    for (const auto& batch : chunkIds(ids, batch_size)) {
        result.batches++;
        try {
            const HttpResponse response = request(batch);
            if (!response.isSuccess()) {
                result.failed_batches++;
                result.errors.push_back(source + " HTTP " + std::to_string(response.status_code));
                continue;
            }
            const auto prices = parse(response.json());
            for (const auto& id : batch) {
                auto it = prices.find(id);
                if (it != prices.end()) {
                    result.prices[id] = it->second;
                }
            }
        } catch (const std::exception& e) {
            result.failed_batches++;
            result.errors.push_back(source + ": " + e.what());
        }
    }
    return result;
}
}

std::vector<std::vector<std::string>> chunkIds(const std::vector<std::string>& ids, size_t size) {
    std::vector<std::vector<std::string>> out;
    if (size == 0) size = 1;
    for (size_t i = 0; i < ids.size(); i += size) {
        out.emplace_back(ids.begin() + i, ids.begin() + std::min(ids.size(), i + size));
    }
    return out;
}

JupiterPriceProvider::JupiterPriceProvider(std::shared_ptr<IHttpClient> http,
                                           std::string base_url,
                                           size_t batch_size)
    : http_(std::move(http))
    , base_url_(std::move(base_url))
    , batch_size_(batch_size) {
}

std::map<std::string, double> JupiterPriceProvider::parseBody(const nlohmann::json& body) {
    std::map<std::string, double> out;
    const nlohmann::json& data = (body.contains("data") && body["data"].is_object()) ? body["data"] : body;
    if (!data.is_object()) return out;

    for (auto it = data.begin(); it != data.end(); ++it) {
        const nlohmann::json& entry = it.value();
        if (!entry.is_object()) continue;
        double price = 0.0;
        if ((entry.contains("price") && readPrice(entry["price"], price)) ||
            (entry.contains("usdPrice") && readPrice(entry["usdPrice"], price))) {
            out[it.key()] = price;
        }
    }
    return out;
}

PriceFetch JupiterPriceProvider::fetch(const std::vector<std::string>& instrument_ids) {
    return fetchBatched(name(), instrument_ids, batch_size_,
        [this](const std::vector<std::string>& batch) {
            return http_->get(base_url_, {{"ids", joinIds(batch)}});
        },
        &JupiterPriceProvider::parseBody);
}

DexScreenerPriceProvider::DexScreenerPriceProvider(std::shared_ptr<IHttpClient> http,
                                                   std::string base_url,
                                                   size_t batch_size)
    : http_(std::move(http))
    , base_url_(std::move(base_url))
    , batch_size_(std::min<size_t>(batch_size, 30)) {
}

std::map<std::string, double> DexScreenerPriceProvider::parseBody(const nlohmann::json& body) {
    std::map<std::string, double> out;
    std::map<std::string, double> best_liquidity;
    if (!body.contains("pairs") || !body["pairs"].is_array()) return out;

    for (const auto& pair : body["pairs"]) {
        if (!pair.is_object() || !pair.contains("baseToken") || !pair.contains("priceUsd")) continue;
        const std::string address = pair["baseToken"].value("address", std::string());
        if (address.empty()) continue;

        double price = 0.0;
        if (!readPrice(pair["priceUsd"], price)) continue;

        double liquidity = 0.0;
        if (pair.contains("liquidity") && pair["liquidity"].is_object()) {
            liquidity = pair["liquidity"].value("usd", 0.0);
        }

        auto it = best_liquidity.find(address);
        if (it == best_liquidity.end() || liquidity > it->second) {
            best_liquidity[address] = liquidity;
            out[address] = price;
        }
    }
    return out;
}

PriceFetch DexScreenerPriceProvider::fetch(const std::vector<std::string>& instrument_ids) {
    return fetchBatched(name(), instrument_ids, batch_size_,
        [this](const std::vector<std::string>& batch) {
            std::string url = base_url_;
            if (!url.empty() && url.back() != '/') url += "/";
            return http_->get(url + joinIds(batch));
        },
        &DexScreenerPriceProvider::parseBody);
}

} // namespace network
} // namespace exitforge

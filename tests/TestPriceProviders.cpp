#include "network/FallbackPriceSource.h"
#include "network/PriceProviders.h"
#include "PriceFakes.h"
#include "TestCandles.h"

#include <iostream>
#include <memory>

using namespace exitforge;
using namespace exitforge::testing;

namespace {

int testChunking() {
    const std::vector<std::string> ids = {"a", "b", "c", "d", "e"};
    const auto chunks = network::chunkIds(ids, 2);
    TEST_CHECK(chunks.size() == 3);
    TEST_CHECK(chunks[0].size() == 2 && chunks[2].size() == 1);
    TEST_CHECK(chunks[2][0] == "e");
    TEST_CHECK(network::chunkIds({}, 30).empty());
    TEST_CHECK(network::chunkIds(ids, 0).size() == 5);
    return 0;
}

int testJupiterParse() {
    const auto nested = network::JupiterPriceProvider::parseBody(nlohmann::json::parse(
        R"({"data": {"SOL": {"id": "SOL", "price": "151.25"}, "BAD": {"price": "n/a"}, "ZERO": {"price": 0}}})"));
    TEST_CHECK(nested.size() == 1);
    TEST_NEAR(nested.at("SOL"), 151.25, 1e-12);

    const auto flat = network::JupiterPriceProvider::parseBody(nlohmann::json::parse(
        R"({"JUP": {"usdPrice": 0.85, "blockId": 1}, "SOL": {"usdPrice": 150}, "junk": 3})"));
    TEST_CHECK(flat.size() == 2);
    TEST_NEAR(flat.at("JUP"), 0.85, 1e-12);
    TEST_NEAR(flat.at("SOL"), 150.0, 1e-12);
    return 0;
}

int testDexScreenerParse() {
    const auto prices = network::DexScreenerPriceProvider::parseBody(nlohmann::json::parse(R"({
        "pairs": [
            {"baseToken": {"address": "MINT1"}, "priceUsd": "0.010", "liquidity": {"usd": 5000}},
            {"baseToken": {"address": "MINT1"}, "priceUsd": "0.012", "liquidity": {"usd": 90000}},
            {"baseToken": {"address": "MINT1"}, "priceUsd": "0.011", "liquidity": {"usd": 100}},
            {"baseToken": {"address": "MINT2"}, "priceUsd": "2.5"},
            {"baseToken": {"address": "MINT3"}}
        ]
    })"));
    TEST_CHECK(prices.size() == 2);
    TEST_NEAR(prices.at("MINT1"), 0.012, 1e-12);
    TEST_NEAR(prices.at("MINT2"), 2.5, 1e-12);

    TEST_CHECK(network::DexScreenerPriceProvider::parseBody(nlohmann::json::parse(R"({"pairs": null})")).empty());
    return 0;
}

int testBatchedRequests() {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->enqueue(200, R"({"A": {"usdPrice": 1.5}, "B": {"usdPrice": 2.5}, "X": {"usdPrice": 9}})");
    http->enqueue(0, "");

    network::JupiterPriceProvider jupiter(http, "https://prices.example/v3", 2);
    const auto fetch = jupiter.fetch({"A", "B", "C"});

    TEST_CHECK(http->calls.size() == 2);
    TEST_CHECK(http->calls[0].url == "https://prices.example/v3");
    TEST_CHECK(http->calls[0].query.at("ids") == "A,B");
    TEST_CHECK(http->calls[1].query.at("ids") == "C");

    // Only requested ids are kept, and a failed batch does not void the others
    TEST_CHECK(fetch.prices.size() == 2);
    TEST_CHECK(fetch.prices.count("X") == 0);
    TEST_CHECK(fetch.batches == 2);
    TEST_CHECK(fetch.failed_batches == 1);
    TEST_CHECK(!fetch.allFailed());
    TEST_CHECK(fetch.errors.size() == 1);

    auto dex_http = std::make_shared<ScriptedHttpClient>();
    dex_http->enqueue(429, "");
    network::DexScreenerPriceProvider dex(dex_http, "https://dex.example/tokens", 100);
    const auto limited = dex.fetch({"M1", "M2"});
    TEST_CHECK(dex_http->calls.size() == 1);
    TEST_CHECK(dex_http->calls[0].url == "https://dex.example/tokens/M1,M2");
    TEST_CHECK(limited.allFailed());
    TEST_CHECK(limited.errors[0] == "dexscreener HTTP 429");
    return 0;
}

int testFallbackSource() {
    auto primary = std::make_shared<FakePriceProvider>("primary");
    auto fallback = std::make_shared<FakePriceProvider>("fallback");
    primary->setPrice("SOL", 150.0);
    fallback->setPrice("SOL", 149.0);
    fallback->setPrice("BONK", 0.00002);

    network::FallbackPriceSource source(primary, fallback);

    auto batch = source.fetch({"SOL", "BONK", "SOL", "WIF", ""});
    TEST_CHECK(primary->requested().back().size() == 3);
    TEST_CHECK(fallback->requested().back().size() == 2);
    TEST_NEAR(batch.prices.at("SOL"), 150.0, 1e-12);
    TEST_NEAR(batch.prices.at("BONK"), 0.00002, 1e-15);
    TEST_CHECK(batch.fallback_used);
    TEST_CHECK(!batch.primary_failed);
    TEST_CHECK(!batch.all_failed);
    TEST_CHECK(batch.missing.size() == 1 && batch.missing[0] == "WIF");

    // Primary covers everything: fallback untouched
    const int fallback_calls = fallback->calls();
    batch = source.fetch({"SOL"});
    TEST_CHECK(!batch.fallback_used);
    TEST_CHECK(fallback->calls() == fallback_calls);

    primary->setFailing(true);
    batch = source.fetch({"SOL", "BONK"});
    TEST_CHECK(batch.primary_failed);
    TEST_CHECK(!batch.all_failed);
    TEST_NEAR(batch.prices.at("SOL"), 149.0, 1e-12);
    TEST_CHECK(batch.errors.size() == 1);

    fallback->setFailing(true);
    batch = source.fetch({"SOL", "BONK"});
    TEST_CHECK(batch.all_failed);
    TEST_CHECK(batch.prices.empty());
    TEST_CHECK(batch.missing.size() == 2);

    TEST_CHECK(!source.fetch({}).all_failed);
    return 0;
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PriceProviders Test..." << std::endl;

    if (testChunking() != 0) return 1;
    if (testJupiterParse() != 0) return 1;
    if (testDexScreenerParse() != 0) return 1;
    if (testBatchedRequests() != 0) return 1;
    if (testFallbackSource() != 0) return 1;

    std::cout << "[TEST] PriceProviders PASSED" << std::endl;
    return 0;
}

#pragma once

#include "network/IHttpClient.h"
#include "network/IPriceProvider.h"

#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace exitforge {
namespace testing {

// Serves a fixed price table, or fails every batch when told to
class FakePriceProvider : public network::IPriceProvider {
public:
    explicit FakePriceProvider(std::string name) : name_(std::move(name)) {}

    network::PriceFetch fetch(const std::vector<std::string>& ids) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        requested_.push_back(ids);

        network::PriceFetch out;
        out.batches = 1;
        if (failing_) {
            out.failed_batches = 1;
            out.errors.push_back(name_ + " unavailable");
            return out;
        }
        for (const auto& id : ids) {
            auto it = prices_.find(id);
            if (it != prices_.end()) out.prices[id] = it->second;
        }
        return out;
    }

    std::string name() const override { return name_; }

    void setPrice(const std::string& id, double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_[id] = price;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::vector<std::string>> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, double> prices_;
    bool failing_ = false;
    int calls_ = 0;
    std::vector<std::vector<std::string>> requested_;
};

// Replays queued responses in order; an empty status throws like a timeout
class ScriptedHttpClient : public network::IHttpClient {
public:
    struct Call {
        std::string url;
        std::map<std::string, std::string> query;
    };

    void enqueue(int status, std::string body) {
        responses_.push_back({status, std::move(body)});
    }

    network::HttpResponse get(const std::string& url,
                              const std::map<std::string, std::string>& query_params) override {
        calls.push_back({url, query_params});
        if (responses_.empty()) {
            throw std::runtime_error("no scripted response");
        }
        auto next = responses_.front();
        responses_.pop_front();
        if (next.first == 0) {
            throw std::runtime_error("timed out");
        }
        network::HttpResponse response;
        response.status_code = next.first;
        response.body = next.second;
        return response;
    }

    std::vector<Call> calls;

private:
    std::deque<std::pair<int, std::string>> responses_;
};

} // namespace testing
} // namespace exitforge

#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace exitforge {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Read-only HTTP. Transport failures and timeouts throw std::runtime_error.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;
};

} // namespace network
} // namespace exitforge

#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace exitforge {
namespace network {

class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(long timeout_ms = 4000);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

private:
    CURL* curl_;
    long timeout_ms_;
    std::mutex mutex_;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);
};

} // namespace network
} // namespace exitforge

#include "network/CurlHttpClient.h"

#include <sstream>
#include <stdexcept>

namespace exitforge {
namespace network {

CurlHttpClient::CurlHttpClient(long timeout_ms)
    : curl_(nullptr)
    , timeout_ms_(timeout_ms)
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(
    const std::string& url,
    const std::map<std::string, std::string>& query_params
) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string full_url = url;
    if (!query_params.empty()) {
        full_url += (url.find('?') == std::string::npos ? "?" : "&") + buildQueryString(query_params);
    }

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);

    response.status_code = static_cast<int>(http_code);
    response.body = response_body;
    response.headers = response_headers;

    return response;
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t CurlHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string CurlHttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        oss << key << "=" << (escaped ? escaped : value.c_str());
        if (escaped) curl_free(escaped);
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace exitforge

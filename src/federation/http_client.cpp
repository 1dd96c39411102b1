#include "fedtrust/federation/http_client.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include <curl/curl.h>
#include <memory>

namespace fedtrust::federation {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

bool ensure_curl_initialized() {
    static bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    return curl_ready;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}

HttpClientConfig HttpClientConfig::from_config(const core::Config& config) {
    HttpClientConfig result;
    result.user_agent = config.get_string("http.user_agent", result.user_agent);
    result.max_redirects = config.get_int("http.max_redirects", static_cast<int>(result.max_redirects));
    result.verify_tls = config.get_bool("http.verify_tls", result.verify_tls);
    return result;
}

long redirect_limit(const HttpRequest& request, const HttpClientConfig& config) {
    if (request.connect_to || config.max_redirects < 0) {
        return 0;
    }
    return config.max_redirects;
}

CurlHttpClient::CurlHttpClient(HttpClientConfig config)
    : config_(std::move(config)) {
}

FederationResult CurlHttpClient::perform(const HttpRequest& request, HttpResponse& out_response) {
    if (!ensure_curl_initialized()) {
        return FederationResult(FederationError::HTTP_FAILURE, "Unable to initialize libcurl");
    }
    
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return FederationResult(FederationError::HTTP_FAILURE, "Unable to allocate curl handle");
    }
    
    out_response = HttpResponse{};
    
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    long redirects = redirect_limit(request, config_);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, redirects > 0 ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, redirects);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out_response.body);
    
    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    
    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        raw_headers = curl_slist_append(raw_headers, line.c_str());
    }
    std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    
    std::unique_ptr<curl_slist, CurlListDeleter> connect_to;
    if (request.connect_to) {
        // Empty HOST and PORT match whatever the URL names, which is safe
        // only because pinned requests do not follow redirects
        std::string mapping = "::" + *request.connect_to;
        connect_to.reset(curl_slist_append(nullptr, mapping.c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECT_TO, connect_to.get());
    }
    
    LOG_DEBUG("HTTP {} {}{}", request.method, request.url,
              request.connect_to ? " via " + *request.connect_to : std::string());
    
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        LOG_DEBUG("HTTP {} {} failed: {}", request.method, request.url, curl_easy_strerror(rc));
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            return FederationResult(FederationError::HTTP_FAILURE,
                "Request to " + request.url + " timed out");
        }
        return FederationResult(FederationError::HTTP_FAILURE, curl_easy_strerror(rc));
    }
    
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out_response.status);
    LOG_DEBUG("HTTP {} {} -> {}", request.method, request.url, out_response.status);
    return FederationResult();
}

}

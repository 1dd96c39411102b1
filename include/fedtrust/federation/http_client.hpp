#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fedtrust::core {
class Config;
}

namespace fedtrust::federation {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    
    // Pins the TCP connection to this "ip:port" while the URL host keeps
    // driving TLS SNI and certificate validation
    std::optional<std::string> connect_to;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
    
    bool ok() const { return status >= 200 && status < 300; }
};

struct HttpClientConfig {
    std::string user_agent = "fedtrust/1.0";
    long max_redirects = 5;
    bool verify_tls = true;
    
    static HttpClientConfig from_config(const core::Config& config);
};

// Redirects allowed for a request. A pinned request follows none, because
// the pin would carry over to whatever host the redirect names.
long redirect_limit(const HttpRequest& request, const HttpClientConfig& config);

class HttpClient {
public:
    virtual ~HttpClient() = default;
    
    // Transport failures only; any HTTP status is a successful exchange
    virtual FederationResult perform(const HttpRequest& request, HttpResponse& out_response) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config = {});
    
    FederationResult perform(const HttpRequest& request, HttpResponse& out_response) override;

private:
    HttpClientConfig config_;
};

}

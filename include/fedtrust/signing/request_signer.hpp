#pragma once

#include "fedtrust/json/canonical_json.hpp"
#include "fedtrust/keys/key_provider.hpp"
#include <memory>
#include <optional>
#include <string>

namespace fedtrust::signing {

// The parsed fields of an "Authorization: X-Matrix ..." header
struct XMatrixAuth {
    std::string origin;
    std::string destination;
    std::string key_id;
    std::string signature;
    
    std::string to_header() const;
};

// Signs outbound federation requests over
// {method, uri, origin, destination[, content]}
class RequestSigner {
public:
    RequestSigner(std::shared_ptr<keys::LocalKeyProvider> key_provider, std::string server_name);
    
    // Throws SigningError
    XMatrixAuth sign_request(
        const std::string& method,
        const std::string& uri,
        const std::string& destination,
        const std::optional<json::Value>& content = std::nullopt
    ) const;
    
    static json::Value request_object(
        const std::string& method,
        const std::string& uri,
        const std::string& origin,
        const std::string& destination,
        const std::optional<json::Value>& content
    );

private:
    std::shared_ptr<keys::LocalKeyProvider> key_provider_;
    std::string server_name_;
};

}

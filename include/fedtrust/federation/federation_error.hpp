#pragma once

#include <string>

namespace fedtrust::federation {

enum class FederationError {
    SUCCESS = 0,
    INVALID_SERVER_NAME,
    INVALID_JSON,
    DNS_FAILURE,
    DNS_TIMEOUT,
    NO_SERVER_FOUND,
    WELL_KNOWN_FAILURE,
    HTTP_FAILURE,
    INVALID_RESPONSE,
    INVALID_SIGNATURE,
    KEY_NOT_FOUND,
    KEY_EXPIRED,
    UNTRUSTED_KEY_BUNDLE,
    SERVER_NAME_MISMATCH,
    CONTENT_HASH_MISMATCH,
    BACKOFF,
    STORAGE_FAILURE
};

// Broad failure categories. Only Network failures feed the backoff tracker;
// Trust failures are cached negatively; Policy failures clear themselves.
enum class ErrorClass {
    None,
    Encoding,
    Crypto,
    Network,
    Trust,
    Policy
};

const char* to_string(FederationError error);
const char* to_string(ErrorClass error_class);
ErrorClass classify(FederationError error);

struct FederationResult {
    FederationError error;
    std::string message;
    
    FederationResult(FederationError err = FederationError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == FederationError::SUCCESS; }
    operator bool() const { return success(); }
    
    ErrorClass error_class() const { return classify(error); }
    std::string describe() const;
};

}

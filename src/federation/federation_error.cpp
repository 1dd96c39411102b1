#include "fedtrust/federation/federation_error.hpp"

namespace fedtrust::federation {

const char* to_string(FederationError error) {
    switch (error) {
        case FederationError::SUCCESS: return "SUCCESS";
        case FederationError::INVALID_SERVER_NAME: return "INVALID_SERVER_NAME";
        case FederationError::INVALID_JSON: return "INVALID_JSON";
        case FederationError::DNS_FAILURE: return "DNS_FAILURE";
        case FederationError::DNS_TIMEOUT: return "DNS_TIMEOUT";
        case FederationError::NO_SERVER_FOUND: return "NO_SERVER_FOUND";
        case FederationError::WELL_KNOWN_FAILURE: return "WELL_KNOWN_FAILURE";
        case FederationError::HTTP_FAILURE: return "HTTP_FAILURE";
        case FederationError::INVALID_RESPONSE: return "INVALID_RESPONSE";
        case FederationError::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case FederationError::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
        case FederationError::KEY_EXPIRED: return "KEY_EXPIRED";
        case FederationError::UNTRUSTED_KEY_BUNDLE: return "UNTRUSTED_KEY_BUNDLE";
        case FederationError::SERVER_NAME_MISMATCH: return "SERVER_NAME_MISMATCH";
        case FederationError::CONTENT_HASH_MISMATCH: return "CONTENT_HASH_MISMATCH";
        case FederationError::BACKOFF: return "BACKOFF";
        case FederationError::STORAGE_FAILURE: return "STORAGE_FAILURE";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::None: return "none";
        case ErrorClass::Encoding: return "encoding";
        case ErrorClass::Crypto: return "crypto";
        case ErrorClass::Network: return "network";
        case ErrorClass::Trust: return "trust";
        case ErrorClass::Policy: return "policy";
    }
    return "unknown";
}

ErrorClass classify(FederationError error) {
    switch (error) {
        case FederationError::SUCCESS:
            return ErrorClass::None;
        
        case FederationError::INVALID_SERVER_NAME:
        case FederationError::INVALID_JSON:
            return ErrorClass::Encoding;
        
        case FederationError::INVALID_SIGNATURE:
        case FederationError::CONTENT_HASH_MISMATCH:
            return ErrorClass::Crypto;
        
        case FederationError::DNS_FAILURE:
        case FederationError::DNS_TIMEOUT:
        case FederationError::NO_SERVER_FOUND:
        case FederationError::WELL_KNOWN_FAILURE:
        case FederationError::HTTP_FAILURE:
        case FederationError::INVALID_RESPONSE:
        case FederationError::STORAGE_FAILURE:
            return ErrorClass::Network;
        
        case FederationError::KEY_NOT_FOUND:
        case FederationError::KEY_EXPIRED:
        case FederationError::UNTRUSTED_KEY_BUNDLE:
        case FederationError::SERVER_NAME_MISMATCH:
            return ErrorClass::Trust;
        
        case FederationError::BACKOFF:
            return ErrorClass::Policy;
    }
    return ErrorClass::Network;
}

std::string FederationResult::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}

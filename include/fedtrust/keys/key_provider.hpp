#pragma once

#include "fedtrust/federation/federation_error.hpp"
#include "fedtrust/storage/key_cache_store.hpp"
#include <string>

namespace fedtrust::keys {

// Source of trusted remote public keys (base64)
class PublicKeyProvider {
public:
    virtual ~PublicKeyProvider() = default;
    
    virtual federation::FederationResult get_server_public_key(
        const std::string& server_name,
        const std::string& key_id,
        std::string& out_public_key
    ) = 0;
};

// Source of this server's own signing key
class LocalKeyProvider {
public:
    virtual ~LocalKeyProvider() = default;
    
    virtual federation::FederationResult get_server_signing_key(
        const std::string& server_name,
        storage::ServerSigningKey& out_key
    ) = 0;
};

}

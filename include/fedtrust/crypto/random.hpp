#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include <span>

namespace fedtrust::crypto {

// Thin wrapper over libsodium's CSPRNG
class SecureRandom {
public:
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    
    // Throws std::runtime_error when the generator is unavailable
    static SecureBytes generate_bytes(size_t count);
    
    // Fresh Ed25519 seed for minting a server signing key
    static CryptoResult generate_seed(SecureBytes& out_seed);
};

}

#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include <memory>
#include <span>
#include <string>

namespace fedtrust::crypto {

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    Sha256Hash finalize();
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Sha256Hash hash_string(const std::string& str);

// Unpadded standard base64 of the SHA-256 digest, the form used in event hashes
std::string hash_to_base64(const Sha256Hash& hash);

}

}

#include "fedtrust/crypto/hash.hpp"
#include "fedtrust/crypto/base64.hpp"
#include <sodium.h>
#include <stdexcept>

namespace fedtrust::crypto {

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

CryptoResult Sha256Hasher::initialize() {
    ensure_sodium_initialized();
    
    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to initialize SHA-256 hasher");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Sha256Hash Sha256Hasher::finalize() {
    Sha256Hash result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.describe());
    }
    return result;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    ensure_sodium_initialized();
    
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

namespace hash_utils {

Sha256Hash hash_string(const std::string& str) {
    return Sha256Hasher::hash(as_bytes(str));
}

std::string hash_to_base64(const Sha256Hash& hash) {
    return encode_base64(std::span(hash), Base64Variant::Standard);
}

}

}

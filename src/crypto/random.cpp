#include "fedtrust/crypto/random.hpp"
#include "fedtrust/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace fedtrust::crypto {

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    try {
        ensure_sodium_initialized();
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Random generator unavailable: {}", e.what());
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, e.what());
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.describe());
    }
    return result;
}

CryptoResult SecureRandom::generate_seed(SecureBytes& out_seed) {
    SecureBytes seed(ED25519_SEED_SIZE);
    auto result = generate_bytes(seed.span());
    if (!result) {
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, result.message);
    }
    
    out_seed = std::move(seed);
    return CryptoResult();
}

}

#include "fedtrust/crypto/crypto_types.hpp"
#include <sodium.h>
#include <stdexcept>

namespace fedtrust::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::vector<std::uint8_t>& bytes) : data(bytes) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) 
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept 
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

SecureBytes SecureBytes::clone() const {
    return SecureBytes(span());
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    size_t old_size = data.size();
    data.resize(new_size);
    
    if (new_size > old_size) {
        sodium_memzero(data.data() + old_size, new_size - old_size);
    }
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "SUCCESS";
        case CryptoError::INVALID_KEY: return "INVALID_KEY";
        case CryptoError::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case CryptoError::INVALID_ENCODING: return "INVALID_ENCODING";
        case CryptoError::KEY_GENERATION_FAILED: return "KEY_GENERATION_FAILED";
        case CryptoError::SIGNING_FAILED: return "SIGNING_FAILED";
        case CryptoError::HASH_FAILED: return "HASH_FAILED";
        case CryptoError::BUFFER_TOO_SMALL: return "BUFFER_TOO_SMALL";
        case CryptoError::RANDOM_GENERATION_FAILED: return "RANDOM_GENERATION_FAILED";
        case CryptoError::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

std::string CryptoResult::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

void ensure_sodium_initialized() {
    // sodium_init returns 1 when already initialised
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

}

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fedtrust::crypto {

// Key sizes for Ed25519 as used by Matrix federation
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

constexpr size_t SHA256_HASH_SIZE = 32;

using Ed25519PublicKey = std::array<std::uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using Ed25519Signature = std::array<std::uint8_t, ED25519_SIGNATURE_SIZE>;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const std::vector<std::uint8_t>& bytes);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    SecureBytes clone() const;
    void clear();
    void resize(size_t new_size);
};

enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY,
    INVALID_SIGNATURE,
    INVALID_ENCODING,
    KEY_GENERATION_FAILED,
    SIGNING_FAILED,
    HASH_FAILED,
    BUFFER_TOO_SMALL,
    RANDOM_GENERATION_FAILED,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
    
    // "SIGNING_FAILED: message", for exception texts and log lines
    std::string describe() const;
};

const char* to_string(CryptoError error);

// Throws std::runtime_error if libsodium cannot be initialised. Safe to call repeatedly.
void ensure_sodium_initialized();

inline std::span<const std::uint8_t> as_bytes(const std::string& str) {
    return std::span(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
}

}

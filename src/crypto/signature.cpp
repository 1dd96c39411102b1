#include "fedtrust/crypto/signature.hpp"
#include "fedtrust/crypto/base64.hpp"
#include "fedtrust/crypto/random.hpp"
#include <sodium.h>

namespace fedtrust::crypto {

namespace {

// libsodium signs with the 64-byte expanded key, seed || public key
CryptoResult expand_seed(std::span<const std::uint8_t> seed,
                         Ed25519PublicKey& out_public_key,
                         SecureBytes& out_secret_key) {
    if (seed.size() != ED25519_SEED_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY,
            "Ed25519 seed must be " + std::to_string(ED25519_SEED_SIZE) + " bytes, got " +
            std::to_string(seed.size()));
    }
    
    ensure_sodium_initialized();
    out_secret_key.resize(ED25519_SECRET_KEY_SIZE);
    if (crypto_sign_seed_keypair(out_public_key.data(), out_secret_key.data_ptr(), seed.data()) != 0) {
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "crypto_sign_seed_keypair rejected the seed");
    }
    return CryptoResult();
}

}

CryptoResult keypair_from_seed(std::span<const std::uint8_t> seed, KeyPair& out_keypair) {
    Ed25519PublicKey public_key;
    SecureBytes secret_key;
    auto result = expand_seed(seed, public_key, secret_key);
    if (!result) {
        return result;
    }
    
    out_keypair.public_key = public_key;
    out_keypair.seed = SecureBytes(seed);
    return CryptoResult();
}

CryptoResult generate_signing_key(KeyPair& out_keypair) {
    SecureBytes seed;
    auto result = SecureRandom::generate_seed(seed);
    if (!result) {
        return result;
    }
    
    return keypair_from_seed(seed.span(), out_keypair);
}

std::string encode_public_key(const Ed25519PublicKey& public_key) {
    return encode_base64(std::span(public_key), Base64Variant::StandardPadded);
}

std::string encode_signature(const Ed25519Signature& signature) {
    return encode_base64(std::span(signature), Base64Variant::StandardPadded);
}

SignatureEngine::SignatureEngine() {
    ensure_sodium_initialized();
}

CryptoResult SignatureEngine::sign(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> seed,
    Ed25519Signature& out_signature) const {
    
    Ed25519PublicKey public_key;
    SecureBytes secret_key;
    auto expanded = expand_seed(seed, public_key, secret_key);
    if (!expanded) {
        return CryptoResult(CryptoError::INVALID_KEY, expanded.message);
    }
    
    unsigned long long length = 0;
    if (crypto_sign_detached(out_signature.data(), &length, message.data(), message.size(),
                             secret_key.data_ptr()) != 0 ||
        length != ED25519_SIGNATURE_SIZE) {
        return CryptoResult(CryptoError::SIGNING_FAILED, "crypto_sign_detached failed");
    }
    return CryptoResult();
}

CryptoResult SignatureEngine::verify(
    std::span<const std::uint8_t> message,
    const Ed25519Signature& signature,
    const Ed25519PublicKey& public_key) const {
    
    if (crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                    public_key.data()) != 0) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Signature does not match message and key");
    }
    return CryptoResult();
}

CryptoResult SignatureEngine::sign_base64(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> seed,
    std::string& out_signature_b64) const {
    
    Ed25519Signature signature;
    auto result = sign(message, seed, signature);
    if (result) {
        out_signature_b64 = encode_signature(signature);
    }
    return result;
}

CryptoResult SignatureEngine::verify_base64(
    const std::string& signature_b64,
    std::span<const std::uint8_t> message,
    const std::string& public_key_b64) const {
    
    Ed25519Signature signature;
    Ed25519PublicKey public_key;
    if (!decode_base64_fixed(signature_b64, signature)) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Signature is not 64 bytes of base64");
    }
    if (!decode_base64_fixed(public_key_b64, public_key)) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Public key is not 32 bytes of base64");
    }
    return verify(message, signature, public_key);
}

}

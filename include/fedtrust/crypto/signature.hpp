#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include <span>
#include <string>

namespace fedtrust::crypto {

// An Ed25519 identity. The private half is kept as the 32-byte seed, the
// form persisted by key stores and exchanged with other implementations.
struct KeyPair {
    Ed25519PublicKey public_key{};
    SecureBytes seed;
};

CryptoResult generate_signing_key(KeyPair& out_keypair);
CryptoResult keypair_from_seed(std::span<const std::uint8_t> seed, KeyPair& out_keypair);

// Padded standard base64, the wire form of keys and signatures
std::string encode_public_key(const Ed25519PublicKey& public_key);
std::string encode_signature(const Ed25519Signature& signature);

// Stateless apart from libsodium's global initialisation, which the
// constructor performs. Instances are cheap and safe to share between threads.
class SignatureEngine {
public:
    SignatureEngine();
    
    CryptoResult sign(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> seed,
        Ed25519Signature& out_signature
    ) const;
    
    CryptoResult verify(
        std::span<const std::uint8_t> message,
        const Ed25519Signature& signature,
        const Ed25519PublicKey& public_key
    ) const;
    
    // Wire-level helpers over base64 text. verify_base64 fails closed: any
    // decoding, length or cryptographic failure is INVALID_SIGNATURE.
    CryptoResult sign_base64(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> seed,
        std::string& out_signature_b64
    ) const;
    
    CryptoResult verify_base64(
        const std::string& signature_b64,
        std::span<const std::uint8_t> message,
        const std::string& public_key_b64
    ) const;
};

}

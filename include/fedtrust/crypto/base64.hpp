#pragma once

#include "fedtrust/crypto/crypto_types.hpp"
#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fedtrust::crypto {

enum class Base64Variant {
    Standard,         // standard alphabet, no padding (hashes, signatures)
    StandardPadded,   // standard alphabet, '=' padding (published keys)
    UrlSafe           // URL-safe alphabet, no padding (v4+ event ids)
};

std::string encode_base64(std::span<const std::uint8_t> data,
                          Base64Variant variant = Base64Variant::Standard);

// Accepts input with or without trailing '=' padding. Whitespace is rejected.
CryptoResult decode_base64(std::string_view encoded,
                           std::vector<std::uint8_t>& out,
                           Base64Variant variant = Base64Variant::Standard);

template<size_t N>
CryptoResult decode_base64_fixed(std::string_view encoded, std::array<std::uint8_t, N>& out) {
    std::vector<std::uint8_t> decoded;
    auto result = decode_base64(encoded, decoded);
    if (!result) {
        return result;
    }
    if (decoded.size() != N) {
        return CryptoResult(CryptoError::INVALID_ENCODING,
            "Expected " + std::to_string(N) + " bytes, got " + std::to_string(decoded.size()));
    }
    std::copy(decoded.begin(), decoded.end(), out.begin());
    return CryptoResult();
}

}

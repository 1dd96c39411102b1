#include "fedtrust/crypto/base64.hpp"
#include <sodium.h>

namespace fedtrust::crypto {

namespace {

int sodium_variant(Base64Variant variant) {
    switch (variant) {
        case Base64Variant::Standard:
            return sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
        case Base64Variant::StandardPadded:
            return sodium_base64_VARIANT_ORIGINAL;
        case Base64Variant::UrlSafe:
            return sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    }
    return sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
}

}

std::string encode_base64(std::span<const std::uint8_t> data, Base64Variant variant) {
    ensure_sodium_initialized();
    
    const int sv = sodium_variant(variant);
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), sv);
    
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), sv);
    
    // encoded_len includes the terminating NUL
    encoded.resize(encoded_len - 1);
    return encoded;
}

CryptoResult decode_base64(std::string_view encoded,
                           std::vector<std::uint8_t>& out,
                           Base64Variant variant) {
    ensure_sodium_initialized();
    
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.remove_suffix(1);
    }
    
    const int sv = variant == Base64Variant::UrlSafe
        ? sodium_base64_VARIANT_URLSAFE_NO_PADDING
        : sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
    
    out.assign(encoded.size() * 3 / 4 + 1, 0);
    size_t decoded_len = 0;
    const char* end = nullptr;
    
    int rc = sodium_base642bin(out.data(), out.size(),
                               encoded.data(), encoded.size(),
                               nullptr, &decoded_len, &end, sv);
    
    if (rc != 0 || end != encoded.data() + encoded.size()) {
        out.clear();
        return CryptoResult(CryptoError::INVALID_ENCODING, "Invalid base64 input");
    }
    
    out.resize(decoded_len);
    return CryptoResult();
}

}

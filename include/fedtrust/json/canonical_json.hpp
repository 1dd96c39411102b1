#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fedtrust::json {

using Value = nlohmann::json;

constexpr size_t MAX_NESTING_DEPTH = 512;

// Raised for values outside the JSON data model (NaN, infinities, binary
// blobs), nesting beyond MAX_NESTING_DEPTH, and unparseable input.
class CanonicalJsonError : public std::runtime_error {
public:
    explicit CanonicalJsonError(const std::string& what) : std::runtime_error(what) {}
};

// Matrix canonical JSON: object keys sorted by UTF-8 byte order, no
// insignificant whitespace, shortest round-trip numbers, raw UTF-8 strings.
std::string encode_canonical(const Value& value);

Value parse(std::string_view text);
std::optional<Value> try_parse(std::string_view text);

}

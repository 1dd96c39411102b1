#include "fedtrust/json/canonical_json.hpp"
#include <array>
#include <charconv>
#include <cmath>

namespace fedtrust::json {

namespace {

void append_string(std::string& out, const std::string& str) {
    static constexpr char hex_digits[] = "0123456789abcdef";
    
    out.push_back('"');
    for (char c : str) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(hex_digits[byte >> 4]);
                    out.push_back(hex_digits[byte & 0x0f]);
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void append_double(std::string& out, double value) {
    if (!std::isfinite(value)) {
        throw CanonicalJsonError("Non-finite number cannot be canonicalised");
    }
    
    if (value == 0.0) {
        out.push_back('0'); // -0.0 collapses to 0
        return;
    }
    
    std::array<char, 32> buffer;
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        throw CanonicalJsonError("Failed to format number");
    }
    out.append(buffer.data(), end);
}

void encode_value(std::string& out, const Value& value, size_t depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw CanonicalJsonError("JSON nesting exceeds " + std::to_string(MAX_NESTING_DEPTH) + " levels");
    }
    
    switch (value.type()) {
        case Value::value_t::null:
            out += "null";
            break;
        case Value::value_t::boolean:
            out += value.get<bool>() ? "true" : "false";
            break;
        case Value::value_t::number_integer:
            out += std::to_string(value.get<std::int64_t>());
            break;
        case Value::value_t::number_unsigned:
            out += std::to_string(value.get<std::uint64_t>());
            break;
        case Value::value_t::number_float:
            append_double(out, value.get<double>());
            break;
        case Value::value_t::string:
            append_string(out, value.get_ref<const std::string&>());
            break;
        case Value::value_t::array: {
            out.push_back('[');
            bool first = true;
            for (const auto& element : value) {
                if (!first) out.push_back(',');
                first = false;
                encode_value(out, element, depth + 1);
            }
            out.push_back(']');
            break;
        }
        case Value::value_t::object: {
            // object_t is a std::map; std::string ordering compares bytes as
            // unsigned char, which is UTF-8 code point order
            out.push_back('{');
            bool first = true;
            for (const auto& [key, element] : value.items()) {
                if (!first) out.push_back(',');
                first = false;
                append_string(out, key);
                out.push_back(':');
                encode_value(out, element, depth + 1);
            }
            out.push_back('}');
            break;
        }
        case Value::value_t::binary:
            throw CanonicalJsonError("Binary values are not part of the JSON data model");
        case Value::value_t::discarded:
            throw CanonicalJsonError("Discarded value cannot be canonicalised");
    }
}

}

std::string encode_canonical(const Value& value) {
    std::string out;
    encode_value(out, value, 0);
    return out;
}

Value parse(std::string_view text) {
    try {
        return Value::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw CanonicalJsonError(std::string("Malformed JSON: ") + e.what());
    }
}

std::optional<Value> try_parse(std::string_view text) {
    auto value = Value::parse(text.begin(), text.end(), nullptr, false);
    if (value.is_discarded()) {
        return std::nullopt;
    }
    return value;
}

}

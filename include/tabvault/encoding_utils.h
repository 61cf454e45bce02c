// @include/tabvault/encoding_utils.h
#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabvault {

// Scalar values that may appear in a primary key or an index key
using KeyValue = std::variant<int64_t, std::string>;
using Key = std::vector<KeyValue>;

// Type tags keep integers ordered before strings when a field holds mixed types
constexpr char kIntKeyTag = '\x10';
constexpr char kStringKeyTag = '\x20';

inline std::string encodeInt64OrderPreserving(int64_t value) {
    // Flip the sign bit so negative values sort before positive ones
    uint64_t uvalue = static_cast<uint64_t>(value) ^ (1ULL << 63);
    std::string encoded(8, '\0');
    for (int i = 0; i < 8; ++i) {
        encoded[i] = static_cast<char>((uvalue >> (56 - i * 8)) & 0xFF);
    }
    return encoded;
}

// 0x00 is escaped to 0x00 0xFF and the value is terminated by 0x00 0x01, so
// concatenated composite parts still compare part by part.
inline std::string encodeStringOrderPreserving(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() + 2);
    for (char c : value) {
        encoded.push_back(c);
        if (c == '\0') encoded.push_back('\xFF');
    }
    encoded.push_back('\0');
    encoded.push_back('\x01');
    return encoded;
}

inline std::string encodeKeyValue(const KeyValue& value) {
    if (std::holds_alternative<int64_t>(value)) {
        return kIntKeyTag + encodeInt64OrderPreserving(std::get<int64_t>(value));
    }
    return kStringKeyTag + encodeStringOrderPreserving(std::get<std::string>(value));
}

inline std::string encodeKey(const Key& parts) {
    std::string encoded;
    for (const auto& part : parts) {
        encoded += encodeKeyValue(part);
    }
    return encoded;
}

// Integers and strings are indexable; everything else (floats, objects, null) is not.
inline std::optional<KeyValue> keyValueFromJson(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return KeyValue(value.get<int64_t>());
    }
    if (value.is_string()) {
        return KeyValue(value.get<std::string>());
    }
    return std::nullopt;
}

inline nlohmann::json keyToJson(const Key& key) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& part : key) {
        if (std::holds_alternative<int64_t>(part)) {
            out.push_back(std::get<int64_t>(part));
        } else {
            out.push_back(std::get<std::string>(part));
        }
    }
    return out;
}

// nullopt when the value is not an array of integers and strings
inline std::optional<Key> keyFromJson(const nlohmann::json& value) {
    if (!value.is_array()) return std::nullopt;
    Key key;
    for (const auto& part : value) {
        auto kv = keyValueFromJson(part);
        if (!kv) return std::nullopt;
        key.push_back(std::move(*kv));
    }
    return key;
}

} // namespace tabvault

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/json_utils.h — JSON data model for fetched resource objects
// ═══════════════════════════════════════════════════════════════════
//  Fetched elements, identifiers and arguments are all nlohmann/json.
//  JsonValue wraps a document with lookups that never throw, which is
//  what resolvers want when the fetch layer returned partial data.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <optional>
#include <vector>

namespace restql {

// ── One fetched element of a resource ──
using DataMap = nlohmann::json;

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ─────────────────────────────────────────────
//  class JsonValue
//  Non-throwing view over a JSON document.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    template <JsonSerializable T>
    JsonValue(const T& value) : data_(nlohmann::json(value)) {}

    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    JsonValue operator[](std::size_t index) const {
        if (data_.is_array() && index < data_.size()) {
            return JsonValue(data_[index]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](int index) const {
        return operator[](static_cast<std::size_t>(index));
    }

    // ── Typed getters ──
    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    template <typename T>
    std::optional<T> opt(const std::string& key) const {
        if (!data_.is_object()) return std::nullopt;
        auto it = data_.find(key);
        if (it == data_.end() || it->is_null()) return std::nullopt;
        try {
            return it->get<T>();
        } catch (const nlohmann::json::type_error&) {
            return std::nullopt;
        }
    }

    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        return opt<T>(key).value_or(defaultValue);
    }

    // ── Array field as a list; anything else reads as empty ──
    std::vector<nlohmann::json> list(const std::string& key) const {
        std::vector<nlohmann::json> out;
        if (!data_.is_object()) return out;
        auto it = data_.find(key);
        if (it == data_.end() || !it->is_array()) return out;
        out.assign(it->begin(), it->end());
        return out;
    }

    // ── Inspection ──
    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isArray() const { return data_.is_array(); }
    bool isString() const { return data_.is_string(); }
    bool isNumber() const { return data_.is_number(); }
    bool isEmpty() const { return data_.is_null() || data_.empty(); }
    bool has(const std::string& key) const { return data_.is_object() && data_.contains(key); }
    std::size_t size() const { return data_.size(); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }
    bool operator!=(const JsonValue& other) const { return data_ != other.data_; }

    template <std::same_as<JsonValue> V>
    friend void to_json(nlohmann::json& j, const V& v) { j = v.data_; }
    template <std::same_as<JsonValue> V>
    friend void from_json(const nlohmann::json& j, V& v) { v.data_ = j; }

private:
    nlohmann::json data_;
};

// ─────────────────────────────────────────────
//  idToString: the cursor form of an identifier.
//  Strings render raw, everything else as compact JSON.
// ─────────────────────────────────────────────
inline std::string idToString(const nlohmann::json& id) {
    if (id.is_string()) return id.get<std::string>();
    return id.dump();
}

// Integer value saturated to the int range; nullopt for non-integers
inline std::optional<int> clampedInt(const nlohmann::json& v) {
    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    if (v.is_number_unsigned()) {
        auto n = v.get<std::uint64_t>();
        return n > static_cast<std::uint64_t>(hi) ? hi : static_cast<int>(n);
    }
    if (!v.is_number_integer()) return std::nullopt;
    auto n = v.get<std::int64_t>();
    if (n < lo) return lo;
    if (n > hi) return hi;
    return static_cast<int>(n);
}

} // namespace restql

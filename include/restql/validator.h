#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/validator.h — Rule-based validation of JSON argument objects
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    validator::Rules rules;
//    rules.field("limit").isInt().min(1);
//    rules.field("ids").required().isArrayOf("string");
//    auto errors = rules.validate(args);
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace restql::validator {

struct ValidationError {
    std::string field;
    std::string message;
    std::string rule;
};

namespace detail {

inline bool hasType(const nlohmann::json& v, const std::string& type) {
    if (type == "string")  return v.is_string();
    if (type == "integer") return v.is_number_integer();
    if (type == "int32") {
        if (v.is_number_unsigned()) {
            return v.get<std::uint64_t>() <= static_cast<std::uint64_t>(INT32_MAX);
        }
        if (!v.is_number_integer()) return false;
        auto n = v.get<std::int64_t>();
        return n >= INT32_MIN && n <= INT32_MAX;
    }
    if (type == "number")  return v.is_number();
    if (type == "boolean") return v.is_boolean();
    if (type == "array")   return v.is_array();
    if (type == "object")  return v.is_object();
    if (type == "id")      return v.is_string() || v.is_number_integer();
    return true;
}

} // namespace detail

// ── Field rule builder (fluent API) ──
class FieldRule {
public:
    explicit FieldRule(const std::string& name) : name_(name) {}

    FieldRule& required() { required_ = true; return *this; }
    FieldRule& optional() { required_ = false; return *this; }
    FieldRule& isString() { type_ = "string"; return *this; }
    FieldRule& isNumber() { type_ = "number"; return *this; }
    FieldRule& isInt() { type_ = "integer"; return *this; }
    FieldRule& isBool() { type_ = "boolean"; return *this; }
    FieldRule& isId() { type_ = "id"; return *this; }
    FieldRule& isObject() { type_ = "object"; return *this; }
    FieldRule& isArray() { type_ = "array"; return *this; }
    FieldRule& ofType(const std::string& type) { type_ = type; return *this; }

    FieldRule& isArrayOf(const std::string& elementType) {
        type_ = "array";
        elementType_ = elementType;
        return *this;
    }

    FieldRule& min(double n) { min_ = n; return *this; }
    FieldRule& max(double n) { max_ = n; return *this; }

    FieldRule& oneOf(std::vector<std::string> values) {
        enum_ = std::move(values);
        return *this;
    }

    FieldRule& custom(std::function<std::optional<std::string>(const JsonValue&)> fn) {
        customValidators_.push_back(std::move(fn));
        return *this;
    }

    std::vector<ValidationError> validate(const JsonValue& body) const {
        std::vector<ValidationError> errors;
        bool exists = body.has(name_);
        auto val = body[name_];

        if (required_ && (!exists || val.isNull())) {
            errors.push_back({name_, name_ + " is required", "required"});
            return errors;
        }

        if (!exists || val.isNull()) return errors;

        if (!type_.empty() && !detail::hasType(val.raw(), type_)) {
            errors.push_back({name_, name_ + " must be " + type_, "type"});
            return errors;
        }

        if (!elementType_.empty()) {
            for (auto& element : val.raw()) {
                if (!element.is_null() && !detail::hasType(element, elementType_)) {
                    errors.push_back({name_, name_ + " must only contain " + elementType_ + " values",
                                      "type"});
                    return errors;
                }
            }
        }

        if (val.isString() && !enum_.empty()) {
            auto str = val.get<std::string>();
            bool found = false;
            for (auto& v : enum_) if (v == str) { found = true; break; }
            if (!found) {
                errors.push_back({name_, name_ + " must be one of the allowed values", "oneOf"});
            }
        }

        if (val.isNumber()) {
            double num = val.get<double>();
            if (min_.has_value() && num < *min_) {
                errors.push_back({name_, name_ + " must be >= " + formatNumber(*min_), "min"});
            }
            if (max_.has_value() && num > *max_) {
                errors.push_back({name_, name_ + " must be <= " + formatNumber(*max_), "max"});
            }
        }

        for (auto& fn : customValidators_) {
            auto err = fn(val);
            if (err.has_value()) {
                errors.push_back({name_, *err, "custom"});
            }
        }

        return errors;
    }

    const std::string& fieldName() const { return name_; }

private:
    std::string name_;
    bool required_ = false;
    std::string type_;
    std::string elementType_;
    std::optional<double> min_;
    std::optional<double> max_;
    std::vector<std::string> enum_;
    std::vector<std::function<std::optional<std::string>(const JsonValue&)>> customValidators_;

    static std::string formatNumber(double n) {
        return nlohmann::json(n).dump();
    }
};

// ── A collection of field rules ──
class Rules {
public:
    FieldRule& field(const std::string& name) {
        rules_.emplace_back(name);
        return rules_.back();
    }

    std::vector<ValidationError> validate(const JsonValue& body) const {
        std::vector<ValidationError> allErrors;
        for (auto& rule : rules_) {
            auto errs = rule.validate(body);
            allErrors.insert(allErrors.end(), errs.begin(), errs.end());
        }
        return allErrors;
    }

    bool isValid(const JsonValue& body) const {
        return validate(body).empty();
    }

    bool covers(const std::string& name) const {
        for (auto& rule : rules_) {
            if (rule.fieldName() == name) return true;
        }
        return false;
    }

private:
    std::vector<FieldRule> rules_;
};

} // namespace restql::validator

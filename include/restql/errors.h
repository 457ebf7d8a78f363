#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/errors.h — Schema-construction error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//  Field construction reports failure as a value: Result<T> holds
//  either the built thing or a SchemaError. The only exception is
//  SchemaGenerationException, thrown while constructing a type whose
//  resource metadata is structurally absent.
//
// ═══════════════════════════════════════════════════════════════════

#include "resource.h"
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace restql {

enum class SchemaErrorCode {
    ResourceNotFound,
    SchemaMissing,
    MissingMultiGetHandler,
    MissingFinderParameter,
    PaginationNotSupportedForSingleElement,
};

inline const char* toString(SchemaErrorCode code) {
    switch (code) {
        case SchemaErrorCode::ResourceNotFound: return "ResourceNotFound";
        case SchemaErrorCode::SchemaMissing: return "SchemaMissing";
        case SchemaErrorCode::MissingMultiGetHandler: return "MissingMultiGetHandler";
        case SchemaErrorCode::MissingFinderParameter: return "MissingFinderParameter";
        case SchemaErrorCode::PaginationNotSupportedForSingleElement:
            return "PaginationNotSupportedForSingleElement";
    }
    return "Unknown";
}

struct SchemaError {
    SchemaErrorCode code;
    ResourceName resource;
    std::string field;
    std::string message;

    static SchemaError resourceNotFound(const ResourceName& resource, const std::string& field) {
        return {SchemaErrorCode::ResourceNotFound, resource, field,
                "Cannot find resource " + resource.identifier()};
    }

    static SchemaError schemaMissing(const ResourceName& resource, const std::string& field) {
        return {SchemaErrorCode::SchemaMissing, resource, field,
                "Cannot find schema for " + resource.identifier()};
    }

    static SchemaError missingMultiGet(const ResourceName& resource, const std::string& field) {
        return {SchemaErrorCode::MissingMultiGetHandler, resource, field,
                "Field '" + field + "' relates to " + resource.identifier() +
                " which has no MULTI_GET handler"};
    }

    static SchemaError missingFinderParameter(const ResourceName& resource, const std::string& field) {
        return {SchemaErrorCode::MissingFinderParameter, resource, field,
                "Finder relation '" + field + "' must name a finder of " +
                resource.identifier() + " in its 'q' argument"};
    }

    static SchemaError singleElementRelation(const ResourceName& resource, const std::string& field) {
        return {SchemaErrorCode::PaginationNotSupportedForSingleElement, resource, field,
                "Cannot use a paginated field for a single-element relationship: " + field};
    }
};

inline std::ostream& operator<<(std::ostream& os, const SchemaError& e) {
    return os << toString(e.code) << " (" << e.resource << "/" << e.field << "): " << e.message;
}

// ── Thrown when type construction finds metadata structurally absent ──
class SchemaGenerationException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────
//  Result<T>: a built value or the reason it could not be built
// ─────────────────────────────────────────────
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(SchemaError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) throw SchemaGenerationException(error().message);
        return std::get<T>(data_);
    }

    T& value() {
        if (!ok()) throw SchemaGenerationException(error().message);
        return std::get<T>(data_);
    }

    const SchemaError& error() const { return std::get<SchemaError>(data_); }

private:
    std::variant<T, SchemaError> data_;
};

} // namespace restql

// ═══════════════════════════════════════════════════════════════════
//  resource.cpp — Resource descriptor lookups and JSON mapping
// ═══════════════════════════════════════════════════════════════════

#include "restql/resource.h"
#include <algorithm>
#include <stdexcept>

namespace restql {

ResourceName ResourceName::parse(const std::string& identifier) {
    auto dot = identifier.rfind(".v");
    if (dot == std::string::npos || dot == 0 || dot + 2 >= identifier.size()) {
        throw std::runtime_error("Malformed resource name '" + identifier + "'");
    }
    auto digits = identifier.substr(dot + 2);
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::runtime_error("Malformed resource version in '" + identifier + "'");
    }
    try {
        return {identifier.substr(0, dot), std::stoi(digits)};
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Malformed resource version in '" + identifier + "'");
    }
}

const Handler* Resource::findHandler(HandlerKind kind) const {
    auto it = std::find_if(handlers.begin(), handlers.end(),
                           [kind](const Handler& h) { return h.kind == kind; });
    return it != handlers.end() ? &*it : nullptr;
}

const Handler* Resource::findHandler(const std::string& handlerName) const {
    auto it = std::find_if(handlers.begin(), handlers.end(),
                           [&](const Handler& h) { return h.name == handlerName; });
    return it != handlers.end() ? &*it : nullptr;
}

// ── ResourceName: "courses.v1" or {"name": "courses", "version": 1} ──

void to_json(nlohmann::json& j, const ResourceName& r) {
    j = r.identifier();
}

void from_json(const nlohmann::json& j, ResourceName& r) {
    if (j.is_string()) {
        r = ResourceName::parse(j.get<std::string>());
        return;
    }
    r.name = j.at("name").get<std::string>();
    r.version = j.value("version", 0);
}

void to_json(nlohmann::json& j, const Parameter& p) {
    j = {{"name", p.name}, {"type", p.type}, {"required", p.required}};
    if (p.defaultValue) j["default"] = *p.defaultValue;
}

void from_json(const nlohmann::json& j, Parameter& p) {
    p.name = j.at("name").get<std::string>();
    p.type = j.value("type", std::string("string"));
    p.required = j.value("required", false);
    if (j.contains("default")) p.defaultValue = j.at("default");
}

void to_json(nlohmann::json& j, const Handler& h) {
    j = {{"name", h.name}, {"kind", h.kind}, {"parameters", h.parameters}};
}

void from_json(const nlohmann::json& j, Handler& h) {
    h.name = j.at("name").get<std::string>();
    h.kind = j.value("kind", HandlerKind::Unknown);
    h.parameters = j.value("parameters", std::vector<Parameter>{});
}

void from_json(const nlohmann::json& j, ReverseRelationAnnotation& a) {
    a.resourceName = j.at("resourceName").get<ResourceName>();
    a.relationType = j.value("relationType", RelationType::Unknown);
    a.arguments.clear();
    if (j.contains("arguments")) {
        for (auto& [key, value] : j.at("arguments").items()) {
            a.arguments[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
}

void from_json(const nlohmann::json& j, RecordField& f) {
    f.name = j.at("name").get<std::string>();
    f.type = j.value("type", std::string("string"));
    f.related.reset();
    if (j.contains("related")) f.related = j.at("related").get<ResourceName>();
}

void from_json(const nlohmann::json& j, RecordSchema& s) {
    s.name = j.at("name").get<std::string>();
    s.fields = j.value("fields", std::vector<RecordField>{});
}

void from_json(const nlohmann::json& j, Resource& r) {
    r.name = j.at("name").get<std::string>();
    r.version = j.value("version", 0);
    r.keyType = j.value("keyType", std::string("string"));
    r.handlers = j.value("handlers", std::vector<Handler>{});
    r.schema.reset();
    if (j.contains("schema") && !j.at("schema").is_null()) {
        r.schema = j.at("schema").get<RecordSchema>();
    }
    r.reverseRelations.clear();
    if (j.contains("reverseRelations")) {
        for (auto& [field, annotation] : j.at("reverseRelations").items()) {
            r.reverseRelations[field] = annotation.get<ReverseRelationAnnotation>();
        }
    }
}

} // namespace restql

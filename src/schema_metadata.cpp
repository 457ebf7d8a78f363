// ═══════════════════════════════════════════════════════════════════
//  schema_metadata.cpp — In-memory resource metadata
// ═══════════════════════════════════════════════════════════════════

#include "restql/schema_metadata.h"
#include "restql/console.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace restql {

InMemorySchemaMetadata::InMemorySchemaMetadata(std::vector<Resource> resources) {
    for (auto& resource : resources) {
        add(std::move(resource));
    }
}

InMemorySchemaMetadata InMemorySchemaMetadata::fromJson(const nlohmann::json& j) {
    const nlohmann::json& list = j.is_object() ? j.value("resources", nlohmann::json::array()) : j;
    if (!list.is_array()) {
        throw std::runtime_error("Resource metadata must be an array of resources");
    }
    try {
        return InMemorySchemaMetadata(list.get<std::vector<Resource>>());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid resource metadata: ") + e.what());
    }
}

InMemorySchemaMetadata InMemorySchemaMetadata::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open resource metadata: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    try {
        return fromJson(nlohmann::json::parse(ss.str()));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + e.what());
    }
}

InMemorySchemaMetadata& InMemorySchemaMetadata::add(Resource resource) {
    auto key = resource.resourceName();
    if (resources_.count(key)) {
        console::warn("Replacing duplicate resource", key.identifier());
    }
    resources_[key] = std::move(resource);
    return *this;
}

const Resource* InMemorySchemaMetadata::getResource(const ResourceName& name) const {
    auto it = resources_.find(name);
    return it != resources_.end() ? &it->second : nullptr;
}

const RecordSchema* InMemorySchemaMetadata::getSchema(const Resource& resource) const {
    return resource.schema ? &*resource.schema : nullptr;
}

std::vector<const Resource*> InMemorySchemaMetadata::resources() const {
    std::vector<const Resource*> out;
    out.reserve(resources_.size());
    for (auto& [_, resource] : resources_) {
        out.push_back(&resource);
    }
    return out;
}

} // namespace restql

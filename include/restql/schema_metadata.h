#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/schema_metadata.h — Resource metadata lookup
// ═══════════════════════════════════════════════════════════════════

#include "resource.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace restql {

// ── Read-only view of every resource the REST layer publishes ──
class SchemaMetadata {
public:
    virtual ~SchemaMetadata() = default;

    virtual const Resource* getResource(const ResourceName& name) const = 0;
    virtual const RecordSchema* getSchema(const Resource& resource) const = 0;

    // Every resource, ordered by name then version
    virtual std::vector<const Resource*> resources() const = 0;
};

// ═══════════════════════════════════════════
//  InMemorySchemaMetadata
//  Populated once at startup, immutable afterwards.
// ═══════════════════════════════════════════
class InMemorySchemaMetadata : public SchemaMetadata {
public:
    InMemorySchemaMetadata() = default;
    explicit InMemorySchemaMetadata(std::vector<Resource> resources);

    // ── {"resources": [ ... ]} or a bare array of resources ──
    static InMemorySchemaMetadata fromJson(const nlohmann::json& j);
    static InMemorySchemaMetadata fromFile(const std::string& path);

    InMemorySchemaMetadata& add(Resource resource);

    const Resource* getResource(const ResourceName& name) const override;
    const RecordSchema* getSchema(const Resource& resource) const override;
    std::vector<const Resource*> resources() const override;

private:
    std::map<ResourceName, Resource> resources_;
};

} // namespace restql

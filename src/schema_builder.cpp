// ═══════════════════════════════════════════════════════════════════
//  schema_builder.cpp — Root query assembly
// ═══════════════════════════════════════════════════════════════════

#include "restql/schema_builder.h"
#include "restql/console.h"
#include "restql/paginated_field.h"
#include "restql/resource_field.h"

namespace restql {

std::string SchemaBuilder::formatRootFieldName(const Resource& resource) {
    return resource_field::formatResourceName(resource) + "Resource";
}

BuiltSchema SchemaBuilder::build() const {
    BuiltSchema built;
    std::vector<graphql::Field> rootFields;

    for (const Resource* resource : metadata_->resources()) {
        std::vector<graphql::Field> handlerFields;

        for (auto& handler : resource->handlers) {
            if (handler.kind != HandlerKind::MultiGet && handler.kind != HandlerKind::Finder) {
                continue;
            }
            auto field = paginated_field::build(metadata_, resource->resourceName(), handler.name,
                                                handler, std::nullopt, config_);
            if (field) {
                handlerFields.push_back(field.value().field);
            } else {
                console::warn("Skipping", resource->resourceName().identifier() + "." + handler.name,
                              "-", field.error().message);
                built.errors.push_back(field.error());
            }
        }

        if (handlerFields.empty()) {
            console::debug("No paginated handlers on", resource->resourceName().identifier());
            continue;
        }

        graphql::Field root;
        root.name = formatRootFieldName(*resource);
        root.type = std::make_shared<graphql::ObjectType>(root.name, std::move(handlerFields));
        // An empty parent marks the handler fields below as top-level occurrences
        root.resolve = [](const graphql::ResolveContext&) -> std::any {
            return nlohmann::json::object();
        };
        rootFields.push_back(std::move(root));
    }

    console::info("Built schema with", rootFields.size(), "resource roots and",
                  built.errors.size(), "skipped fields");
    built.schema = std::make_shared<graphql::Schema>(
        std::make_shared<graphql::ObjectType>("Query", std::move(rootFields)));
    return built;
}

} // namespace restql

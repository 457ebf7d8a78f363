// ═══════════════════════════════════════════════════════════════════
//  resource_field.cpp — Element types built from record schemas
// ═══════════════════════════════════════════════════════════════════

#include "restql/resource_field.h"
#include "restql/console.h"
#include "restql/handler_arguments.h"
#include "restql/paginated_field.h"
#include <cctype>

namespace restql::resource_field {

std::string formatResourceName(const Resource& resource) {
    std::string name = resource.name;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name + "V" + std::to_string(resource.version);
}

graphql::OutputTypePtr outputType(const std::string& recordType) {
    if (recordType == "json" || recordType == "record") {
        return graphql::ScalarType::json();
    }
    auto name = inputTypeName(recordType);
    if (name.front() == '[') {
        auto inner = recordType.substr(5, recordType.size() - 6); // list<...>
        return std::make_shared<graphql::ListType>(outputType(inner));
    }
    if (name == "Int") return graphql::ScalarType::integer();
    if (name == "Float") return graphql::ScalarType::floating();
    if (name == "Boolean") return graphql::ScalarType::boolean();
    return graphql::ScalarType::string();
}

namespace {

std::vector<graphql::Field> elementFields(const std::shared_ptr<const SchemaMetadata>& metadata,
                                          const Resource& resource,
                                          const RecordSchema& schema,
                                          const Config& config) {
    std::vector<graphql::Field> fields;

    for (auto& recordField : schema.fields) {
        graphql::Field field;
        field.name = recordField.name;
        field.type = outputType(recordField.type);

        if (recordField.related && field.type->kind() == graphql::TypeKind::List) {
            auto relation = paginated_field::build(metadata, *recordField.related, recordField.name,
                                                   std::nullopt,
                                                   ForwardRelation{*recordField.related}, config);
            if (relation) {
                fields.push_back(relation.value().field);
                continue;
            }
            console::warn("Keeping", resource.resourceName().identifier() + "." + recordField.name,
                          "as a plain list:", relation.error().message);
        }
        fields.push_back(std::move(field));
    }

    for (auto& [fieldName, annotation] : resource.reverseRelations) {
        auto relation = paginated_field::build(metadata, annotation.resourceName, fieldName,
                                               std::nullopt, ReverseRelation{annotation}, config);
        if (relation) {
            fields.push_back(relation.value().field);
        } else {
            console::warn("Dropping reverse relation",
                          resource.resourceName().identifier() + "." + fieldName + ":",
                          relation.error().message);
        }
    }
    return fields;
}

} // namespace

Result<graphql::ObjectTypePtr> getType(std::shared_ptr<const SchemaMetadata> metadata,
                                       const ResourceName& resourceName,
                                       const Config& config) {
    const Resource* resource = metadata->getResource(resourceName);
    if (!resource) {
        return SchemaError::resourceNotFound(resourceName, "");
    }
    if (!metadata->getSchema(*resource)) {
        return SchemaError::schemaMissing(resourceName, "");
    }

    graphql::ObjectTypePtr type = std::make_shared<graphql::ObjectType>(
        formatResourceName(*resource),
        [metadata, resourceName, config]() -> std::vector<graphql::Field> {
            const Resource* resource = metadata->getResource(resourceName);
            const RecordSchema* schema = resource ? metadata->getSchema(*resource) : nullptr;
            if (!schema) {
                console::warn("Schema of", resourceName.identifier(), "disappeared");
                return {};
            }
            return elementFields(metadata, *resource, *schema, config);
        });
    return type;
}

} // namespace restql::resource_field

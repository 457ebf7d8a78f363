// ═══════════════════════════════════════════════════════════════════
//  paginated_field.cpp — Field, connection type, and resolvers
// ═══════════════════════════════════════════════════════════════════

#include "restql/paginated_field.h"
#include "restql/console.h"
#include "restql/handler_arguments.h"
#include "restql/pagination.h"
#include "restql/resolution.h"
#include "restql/resource_field.h"
#include <algorithm>
#include <cctype>

namespace restql::paginated_field {

double cost(int limit, double childScore, double relationCost) {
    return std::max(limit / 10, 1) * relationCost * childScore;
}

std::string formatConnectionName(const Resource& resource) {
    return resource_field::formatResourceName(resource) + "Connection";
}

Result<FieldDescriptor> build(std::shared_ptr<const SchemaMetadata> metadata,
                              const ResourceName& resourceName,
                              const std::string& fieldName,
                              const std::optional<Handler>& handlerOverride,
                              const std::optional<FieldRelation>& relation,
                              const Config& config) {
    const Resource* resource = metadata->getResource(resourceName);
    if (!resource) {
        return SchemaError::resourceNotFound(resourceName, fieldName);
    }
    if (!metadata->getSchema(*resource)) {
        return SchemaError::schemaMissing(resourceName, fieldName);
    }

    auto handler = classify(*resource, fieldName, handlerOverride, relation);
    if (!handler) {
        return handler.error();
    }

    auto bound = boundArgumentNames(relation);
    auto arguments = generateHandlerArguments(handler.value(), true, config.defaultLimit);
    arguments.erase(std::remove_if(arguments.begin(), arguments.end(),
                                   [&](const graphql::ArgumentDescriptor& arg) {
                                       return arg.name == kIdsArgument ||
                                              std::find(bound.begin(), bound.end(), arg.name) != bound.end();
                                   }),
                    arguments.end());

    FieldDescriptor descriptor;
    descriptor.handler = handler.value();
    descriptor.field.name = fieldName;
    descriptor.field.type = getType(metadata, resourceName, fieldName, config);
    descriptor.field.arguments = std::move(arguments);
    descriptor.field.resolve = [](const graphql::ResolveContext& context) -> std::any {
        return ParentContext::from(context);
    };

    // A relation may fan out into `limit` downstream fetches per parent, each
    // an API call rather than a scalar read
    auto defaultLimit = config.defaultLimit;
    auto relationCost = config.relationComplexityCost;
    descriptor.field.complexity = [defaultLimit, relationCost](const nlohmann::json& args,
                                                               double childScore) {
        auto it = args.find(pagination::kLimit);
        int limit = it != args.end() ? clampedInt(*it).value_or(defaultLimit) : defaultLimit;
        return cost(limit, childScore, relationCost);
    };

    console::debug("Built paginated field", fieldName, "->", resourceName.identifier(),
                   "via", descriptor.handler.name);
    return descriptor;
}

graphql::ObjectTypePtr getType(std::shared_ptr<const SchemaMetadata> metadata,
                               const ResourceName& resourceName,
                               const std::string& fieldName,
                               const Config& config) {
    const Resource* resource = metadata->getResource(resourceName);
    if (!resource) {
        throw SchemaGenerationException("Cannot find resource " + resourceName.identifier());
    }
    if (!metadata->getSchema(*resource)) {
        throw SchemaGenerationException("Cannot find schema for " + resourceName.identifier());
    }

    return std::make_shared<graphql::ObjectType>(
        formatConnectionName(*resource),
        [metadata, resourceName, fieldName, config]() -> std::vector<graphql::Field> {
            auto elementType = resource_field::getType(metadata, resourceName, config);
            if (!elementType) {
                console::warn("Connection", resourceName.identifier(), "has no fields:",
                              elementType.error().message);
                return {};
            }

            graphql::Field elements;
            elements.name = "elements";
            elements.type = std::make_shared<graphql::ListType>(elementType.value());
            elements.resolve = elementsResolver(resourceName, fieldName, config.defaultLimit);

            graphql::Field paging;
            paging.name = "paging";
            paging.type = pagination::pagingType();
            paging.resolve = pagination::pagingResolver(resourceName, fieldName, config.defaultLimit);

            return {elements, paging};
        });
}

graphql::Resolver elementsResolver(const ResourceName& resourceName,
                                   const std::string& fieldName,
                                   int defaultLimit) {
    return [resourceName, fieldName, defaultLimit](const graphql::ResolveContext& context) -> std::any {
        auto* parent = std::any_cast<ParentContext>(&context.value);
        if (!parent) {
            throw std::runtime_error("elements must be selected under a relation field");
        }
        auto page = resolvePage(context.ctx, *parent, resourceName, fieldName,
                                parent->limit().value_or(defaultLimit), parent->start());

        std::vector<std::any> out;
        out.reserve(page.size());
        for (auto& element : page) {
            out.emplace_back(std::move(element));
        }
        return out;
    };
}

} // namespace restql::paginated_field

// ═══════════════════════════════════════════════════════════════════
//  relation_classifier.cpp — Handler selection for relation fields
// ═══════════════════════════════════════════════════════════════════

#include "restql/relation_classifier.h"

namespace restql {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Result<Handler> multiGetHandler(const Resource& resource, const std::string& fieldName) {
    if (auto* handler = resource.findHandler(HandlerKind::MultiGet)) {
        return *handler;
    }
    return SchemaError::missingMultiGet(resource.resourceName(), fieldName);
}

Result<Handler> finderHandler(const Resource& resource,
                              const std::string& fieldName,
                              const ReverseRelationAnnotation& annotation) {
    auto q = annotation.arguments.find("q");
    if (q != annotation.arguments.end()) {
        auto* handler = resource.findHandler(q->second);
        if (handler && handler->kind == HandlerKind::Finder) {
            return *handler;
        }
    }
    return SchemaError::missingFinderParameter(resource.resourceName(), fieldName);
}

Result<Handler> reverseRelationHandler(const Resource& resource,
                                       const std::string& fieldName,
                                       const ReverseRelationAnnotation& annotation) {
    switch (annotation.relationType) {
        case RelationType::Finder:
            return finderHandler(resource, fieldName, annotation);
        case RelationType::MultiGet:
            return multiGetHandler(resource, fieldName);
        case RelationType::Get:
        case RelationType::SingleElementFinder:
        case RelationType::Unknown:
            return SchemaError::singleElementRelation(resource.resourceName(), fieldName);
    }
    return SchemaError::singleElementRelation(resource.resourceName(), fieldName);
}

} // namespace

std::vector<std::string> boundArgumentNames(const std::optional<FieldRelation>& relation) {
    std::vector<std::string> names;
    if (!relation) return names;
    std::visit(overloaded{
        [](const ForwardRelation&) {},
        [&](const ReverseRelation& reverse) {
            for (auto& [name, _] : reverse.annotation.arguments) {
                names.push_back(name);
            }
        },
    }, *relation);
    return names;
}

Result<Handler> classify(const Resource& resource,
                         const std::string& fieldName,
                         const std::optional<Handler>& handlerOverride,
                         const std::optional<FieldRelation>& relation) {
    if (handlerOverride) {
        return *handlerOverride;
    }
    if (!relation) {
        return multiGetHandler(resource, fieldName);
    }
    return std::visit(overloaded{
        [&](const ForwardRelation&) -> Result<Handler> {
            return multiGetHandler(resource, fieldName);
        },
        [&](const ReverseRelation& reverse) -> Result<Handler> {
            return reverseRelationHandler(resource, fieldName, reverse.annotation);
        },
    }, *relation);
}

} // namespace restql

// ═══════════════════════════════════════════════════════════════════
//  pagination.cpp — Pagination arguments and paging type
// ═══════════════════════════════════════════════════════════════════

#include "restql/pagination.h"
#include "restql/resolution.h"
#include <stdexcept>

namespace restql::pagination {

graphql::ArgumentDescriptor startArgument() {
    graphql::ArgumentDescriptor arg;
    arg.name = kStart;
    arg.type = "String";
    return arg;
}

graphql::ArgumentDescriptor limitArgument(int defaultLimit) {
    graphql::ArgumentDescriptor arg;
    arg.name = kLimit;
    arg.type = "Int";
    arg.defaultValue = defaultLimit;
    arg.minimum = 1;
    return arg;
}

graphql::ObjectTypePtr pagingType() {
    static const auto type = std::make_shared<graphql::ObjectType>("ResponsePagination", [] {
        graphql::Field next;
        next.name = "next";
        next.type = graphql::ScalarType::string();
        next.resolve = [](const graphql::ResolveContext& context) -> std::any {
            auto& window = std::any_cast<const IdWindow&>(context.value);
            return window.next ? nlohmann::json(*window.next) : nlohmann::json(nullptr);
        };

        graphql::Field total;
        total.name = "total";
        total.type = graphql::ScalarType::integer();
        total.resolve = [](const graphql::ResolveContext& context) -> std::any {
            auto& window = std::any_cast<const IdWindow&>(context.value);
            return window.total ? nlohmann::json(*window.total) : nlohmann::json(nullptr);
        };

        return std::vector<graphql::Field>{next, total};
    });
    return type;
}

graphql::Resolver pagingResolver(const ResourceName& resource,
                                 const std::string& fieldName,
                                 int defaultLimit) {
    return [=](const graphql::ResolveContext& context) -> std::any {
        auto* parent = std::any_cast<ParentContext>(&context.value);
        if (!parent) {
            throw std::runtime_error("paging must be selected under a relation field");
        }
        return selectIds(context.ctx, *parent, resource, fieldName,
                         parent->limit().value_or(defaultLimit), parent->start());
    };
}

} // namespace restql::pagination

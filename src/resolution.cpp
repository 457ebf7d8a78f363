// ═══════════════════════════════════════════════════════════════════
//  resolution.cpp — Page selection over fetched objects
// ═══════════════════════════════════════════════════════════════════

#include "restql/resolution.h"
#include "restql/console.h"
#include "restql/pagination.h"
#include <algorithm>

namespace restql {

ParentContext ParentContext::from(const graphql::ResolveContext& context) {
    ParentContext parent;
    if (auto* json = std::any_cast<nlohmann::json>(&context.value)) {
        if (!json->is_null()) parent.value = *json;
    }
    parent.args = context.args;
    parent.astFields = context.astFields;
    return parent;
}

std::optional<std::string> ParentContext::start() const {
    auto it = args.find(pagination::kStart);
    if (it == args.end() || it->is_null()) return std::nullopt;
    return idToString(*it);
}

std::optional<int> ParentContext::limit() const {
    auto it = args.find(pagination::kLimit);
    if (it == args.end()) return std::nullopt;
    return clampedInt(*it);
}

const TopLevelResponse* findTopLevelResponse(const ExecutionContext& ctx,
                                             const ParentContext& parent,
                                             const ResourceName& resource) {
    if (parent.astFields.empty()) return nullptr;
    auto& ast = parent.astFields.front();
    for (auto& response : ctx.topLevelResponses()) {
        auto& request = response.request;
        if (request.resource == resource &&
            request.selection.alias == ast.alias &&
            request.selection.name == ast.name) {
            return &response;
        }
    }
    return nullptr;
}

namespace {

IdWindow topLevelIds(const ExecutionContext& ctx,
                     const ParentContext& parent,
                     const ResourceName& resource) {
    IdWindow window;
    if (auto* response = findTopLevelResponse(ctx, parent, resource)) {
        window.ids = response->ids;
        window.next = response->pagination.next;
        window.total = response->pagination.total;
    }
    return window;
}

IdWindow nestedIds(const ParentContext& parent,
                   const std::string& fieldName,
                   int limit,
                   const std::optional<std::string>& start) {
    IdWindow window;
    window.total = 0;

    auto alias = parent.alias();
    auto member = parent.value->find(alias.empty() ? fieldName : alias);
    if (member == parent.value->end() || !member->is_array()) return window;

    const nlohmann::json& allIds = *member;
    window.total = static_cast<long long>(allIds.size());

    auto first = allIds.begin();
    if (start) {
        auto match = std::find_if(allIds.begin(), allIds.end(),
                                  [&](const nlohmann::json& id) { return idToString(id) == *start; });
        if (match != allIds.end()) {
            first = match;
        } else {
            // TODO: confirm with product whether an unknown cursor should yield an
            // empty page instead of restarting from the first id.
            console::debug("Cursor", *start, "not found under", fieldName, "- starting from the first id");
        }
    }

    auto remaining = static_cast<std::size_t>(std::distance(first, allIds.end()));
    auto count = std::min(remaining, static_cast<std::size_t>(std::max(limit, 0)));
    window.ids.assign(first, first + static_cast<std::ptrdiff_t>(count));
    if (count < remaining) {
        window.next = idToString(*(first + static_cast<std::ptrdiff_t>(count)));
    }
    return window;
}

} // namespace

IdWindow selectIds(const ExecutionContext& ctx,
                   const ParentContext& parent,
                   const ResourceName& resource,
                   const std::string& fieldName,
                   int limit,
                   const std::optional<std::string>& start) {
    if (parent.isTopLevel()) {
        return topLevelIds(ctx, parent, resource);
    }
    return nestedIds(parent, fieldName, limit, start);
}

std::vector<DataMap> resolvePage(const ExecutionContext& ctx,
                                 const ParentContext& parent,
                                 const ResourceName& resource,
                                 const std::string& fieldName,
                                 int limit,
                                 const std::optional<std::string>& start) {
    std::vector<DataMap> elements;
    auto* objects = ctx.objects(resource);
    if (!objects) return elements;

    auto window = selectIds(ctx, parent, resource, fieldName, limit, start);
    elements.reserve(window.ids.size());
    for (auto& id : window.ids) {
        auto it = objects->find(id);
        if (it != objects->end()) {
            elements.push_back(it->second);
        } else {
            console::debug("No fetched element", idToString(id), "in", resource.identifier());
        }
    }
    return elements;
}

} // namespace restql

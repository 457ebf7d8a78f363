// ═══════════════════════════════════════════════════════════════════
//  execution_context.cpp — In-memory fetched data
// ═══════════════════════════════════════════════════════════════════

#include "restql/execution_context.h"
#include <stdexcept>

namespace restql {

Response& Response::addObject(const ResourceName& resource, nlohmann::json id, DataMap element) {
    data_[resource][std::move(id)] = std::move(element);
    return *this;
}

Response& Response::addObjects(const ResourceName& resource, const std::vector<DataMap>& elements,
                               const std::string& idField) {
    auto& objects = data_[resource];
    for (auto& element : elements) {
        if (!element.is_object() || !element.contains(idField)) {
            throw std::runtime_error("Element of " + resource.identifier() +
                                     " has no '" + idField + "' member");
        }
        objects[element.at(idField)] = element;
    }
    return *this;
}

Response& Response::addTopLevelResponse(TopLevelResponse response) {
    topLevel_.push_back(std::move(response));
    return *this;
}

const ObjectMap* Response::objects(const ResourceName& resource) const {
    auto it = data_.find(resource);
    return it != data_.end() ? &it->second : nullptr;
}

const std::vector<TopLevelResponse>& Response::topLevelResponses() const {
    return topLevel_;
}

namespace {

TopLevelResponse topLevelFromJson(const nlohmann::json& j) {
    TopLevelResponse response;
    response.request.resource = j.at("resource").get<ResourceName>();

    auto& selection = j.at("selection");
    response.request.selection.name = selection.at("name").get<std::string>();
    response.request.selection.alias = selection.value("alias", std::string());
    response.request.selection.arguments = selection.value("arguments", nlohmann::json::object());

    for (auto& id : j.value("ids", nlohmann::json::array())) {
        response.ids.push_back(id);
    }

    if (j.contains("pagination")) {
        auto& paging = j.at("pagination");
        if (paging.contains("next") && !paging.at("next").is_null()) {
            response.pagination.next = idToString(paging.at("next"));
        }
        if (paging.contains("total") && !paging.at("total").is_null()) {
            response.pagination.total = paging.at("total").get<long long>();
        }
    }
    return response;
}

} // namespace

Response Response::fromJson(const nlohmann::json& j) {
    Response response;
    try {
        if (j.contains("data")) {
            for (auto& [identifier, elements] : j.at("data").items()) {
                auto resource = ResourceName::parse(identifier);
                if (elements.is_array()) {
                    response.addObjects(resource, elements.get<std::vector<DataMap>>());
                } else if (elements.is_object()) {
                    // {"<id>": {...}} form; an `id` member overrides the string key
                    for (auto& [key, element] : elements.items()) {
                        nlohmann::json id = key;
                        if (element.is_object() && element.contains("id")) id = element.at("id");
                        response.addObject(resource, std::move(id), element);
                    }
                } else {
                    throw std::runtime_error("Data for " + identifier + " must be an array or object");
                }
            }
        }
        for (auto& entry : j.value("topLevelResponses", nlohmann::json::array())) {
            response.addTopLevelResponse(topLevelFromJson(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid response document: ") + e.what());
    }
    return response;
}

} // namespace restql

// ═══════════════════════════════════════════════════════════════════
//  src/graphql.cpp — GraphQL execution engine implementation
// ═══════════════════════════════════════════════════════════════════

#include "restql/graphql.h"
#include "restql/console.h"
#include "restql/validator.h"
#include <stdexcept>

namespace restql::graphql {

// ── Built-in scalars ──

OutputTypePtr ScalarType::string() {
    static const auto t = std::make_shared<const ScalarType>("String");
    return t;
}

OutputTypePtr ScalarType::integer() {
    static const auto t = std::make_shared<const ScalarType>("Int");
    return t;
}

OutputTypePtr ScalarType::floating() {
    static const auto t = std::make_shared<const ScalarType>("Float");
    return t;
}

OutputTypePtr ScalarType::boolean() {
    static const auto t = std::make_shared<const ScalarType>("Boolean");
    return t;
}

OutputTypePtr ScalarType::id() {
    static const auto t = std::make_shared<const ScalarType>("ID");
    return t;
}

OutputTypePtr ScalarType::json() {
    static const auto t = std::make_shared<const ScalarType>("Json");
    return t;
}

// ═══════════════════════════════════════════
//  Arguments
// ═══════════════════════════════════════════

namespace {

// GraphQL input type -> validator type; unknown names are not checked
std::string ruleType(const std::string& graphqlType) {
    if (graphqlType == "String") return "string";
    if (graphqlType == "Int") return "int32";
    if (graphqlType == "Float") return "number";
    if (graphqlType == "Boolean") return "boolean";
    if (graphqlType == "ID") return "id";
    return "";
}

validator::Rules rulesFor(const Field& field) {
    validator::Rules rules;
    for (auto& arg : field.arguments) {
        auto& rule = rules.field(arg.name);
        if (arg.required && !arg.defaultValue) rule.required();
        if (arg.type.size() > 2 && arg.type.front() == '[' && arg.type.back() == ']') {
            rule.isArrayOf(ruleType(arg.type.substr(1, arg.type.size() - 2)));
        } else {
            rule.ofType(ruleType(arg.type));
        }
        if (arg.minimum) rule.min(*arg.minimum);
    }
    return rules;
}

} // namespace

nlohmann::json coerceArguments(const Field& field, const nlohmann::json& supplied) {
    nlohmann::json args = nlohmann::json::object();
    for (auto& arg : field.arguments) {
        if (arg.defaultValue) args[arg.name] = *arg.defaultValue;
    }
    if (supplied.is_object()) {
        for (auto& [key, value] : supplied.items()) {
            if (!value.is_null()) args[key] = value;
        }
    }
    return args;
}

std::vector<std::string> validateArguments(const Field& field, const nlohmann::json& supplied) {
    std::vector<std::string> problems;
    auto rules = rulesFor(field);
    if (supplied.is_object()) {
        for (auto& [key, _] : supplied.items()) {
            if (!rules.covers(key)) {
                problems.push_back("Unknown argument '" + key + "' on field '" + field.name + "'");
            }
        }
    }
    JsonValue body(supplied.is_object() ? supplied : nlohmann::json::object());
    for (auto& err : rules.validate(body)) {
        problems.push_back(err.message);
    }
    return problems;
}

// ═══════════════════════════════════════════
//  Execution
// ═══════════════════════════════════════════

namespace {

class Executor {
public:
    explicit Executor(const ExecutionContext& ctx) : ctx_(ctx) {}

    nlohmann::json executeSelections(const ObjectType& type,
                                     const std::any& parent,
                                     const std::vector<FieldSelection>& selections,
                                     const nlohmann::json& path) {
        nlohmann::json out = nlohmann::json::object();
        for (auto& sel : selections) {
            auto fieldPath = path;
            fieldPath.push_back(sel.responseKey());

            if (sel.name == "__typename") {
                out[sel.responseKey()] = type.name();
                continue;
            }

            const Field* field = type.field(sel.name);
            if (!field) {
                addError("Cannot query field '" + sel.name + "' on type '" + type.name() + "'",
                         fieldPath);
                continue;
            }

            auto problems = validateArguments(*field, sel.arguments);
            if (!problems.empty()) {
                for (auto& p : problems) addError(p, fieldPath);
                out[sel.responseKey()] = nullptr;
                continue;
            }

            try {
                ResolveContext rc{ctx_, parent, coerceArguments(*field, sel.arguments), {sel}};
                std::any value = field->resolve ? field->resolve(rc) : defaultResolve(*field, parent);
                out[sel.responseKey()] = complete(*field->type, value, sel.selections, fieldPath);
            } catch (const std::exception& e) {
                addError(e.what(), fieldPath);
                out[sel.responseKey()] = nullptr;
            }
        }
        return out;
    }

    nlohmann::json takeErrors() { return std::move(errors_); }

private:
    const ExecutionContext& ctx_;
    nlohmann::json errors_ = nlohmann::json::array();

    void addError(const std::string& message, const nlohmann::json& path) {
        errors_.push_back(nlohmann::json{{"message", message}, {"path", path}});
    }

    static std::any defaultResolve(const Field& field, const std::any& parent) {
        if (auto* obj = std::any_cast<nlohmann::json>(&parent)) {
            if (obj->is_object() && obj->contains(field.name)) {
                return (*obj)[field.name];
            }
        }
        return nlohmann::json(nullptr);
    }

    nlohmann::json complete(const OutputType& type,
                            const std::any& value,
                            const std::vector<FieldSelection>& selections,
                            const nlohmann::json& path) {
        if (!value.has_value()) return nullptr;
        auto* json = std::any_cast<nlohmann::json>(&value);
        if (json && json->is_null()) return nullptr;

        switch (type.kind()) {
            case TypeKind::Scalar:
                if (!json) {
                    throw std::runtime_error("Scalar " + type.name() + " resolved to a non-JSON value");
                }
                return *json;

            case TypeKind::List: {
                auto& ofType = *static_cast<const ListType&>(type).ofType();
                nlohmann::json arr = nlohmann::json::array();
                if (auto* items = std::any_cast<std::vector<std::any>>(&value)) {
                    for (std::size_t i = 0; i < items->size(); i++) {
                        auto itemPath = path;
                        itemPath.push_back(i);
                        arr.push_back(complete(ofType, (*items)[i], selections, itemPath));
                    }
                } else if (json && json->is_array()) {
                    for (std::size_t i = 0; i < json->size(); i++) {
                        auto itemPath = path;
                        itemPath.push_back(i);
                        arr.push_back(complete(ofType, std::any((*json)[i]), selections, itemPath));
                    }
                } else {
                    throw std::runtime_error("List " + type.name() + " resolved to a non-list value");
                }
                return arr;
            }

            case TypeKind::Object: {
                if (selections.empty()) {
                    throw std::runtime_error("Field of type " + type.name() + " needs a selection set");
                }
                return executeSelections(static_cast<const ObjectType&>(type), value, selections, path);
            }
        }
        return nullptr;
    }
};

const ObjectType* objectTypeOf(const OutputType& type) {
    const OutputType* t = &type;
    while (t->kind() == TypeKind::List) {
        t = static_cast<const ListType*>(t)->ofType().get();
    }
    return t->kind() == TypeKind::Object ? static_cast<const ObjectType*>(t) : nullptr;
}

double selectionComplexity(const ObjectType& type, const std::vector<FieldSelection>& selections) {
    double total = 0.0;
    for (auto& sel : selections) {
        const Field* field = type.field(sel.name);
        if (!field) continue;

        double childScore = 0.0;
        if (auto* child = objectTypeOf(*field->type)) {
            childScore = selectionComplexity(*child, sel.selections);
        }

        total += field->complexity
            ? field->complexity(coerceArguments(*field, sel.arguments), childScore)
            : 1.0 + childScore;
    }
    return total;
}

} // namespace

nlohmann::json Schema::execute(const std::string& query,
                               const ExecutionContext& ctx,
                               const nlohmann::json& variables,
                               std::any rootValue) const {
    ParsedQuery parsed;
    try {
        detail::GraphQLParser parser(query, variables);
        parsed = parser.parse();
    } catch (const std::exception& e) {
        console::debug("GraphQL parse failure:", e.what());
        return nlohmann::json{
            {"data", nullptr},
            {"errors", nlohmann::json::array({
                nlohmann::json{{"message", std::string("Parse error: ") + e.what()}}
            })}
        };
    }

    if (parsed.operationType == "mutation") {
        return nlohmann::json{
            {"data", nullptr},
            {"errors", nlohmann::json::array({
                nlohmann::json{{"message", "Mutations are not supported"}}
            })}
        };
    }

    Executor executor(ctx);
    auto data = executor.executeSelections(*queryType_, rootValue, parsed.selections,
                                           nlohmann::json::array());
    auto errors = executor.takeErrors();

    nlohmann::json response = {{"data", data}};
    if (!errors.empty()) {
        response["errors"] = errors;
    }
    return response;
}

double Schema::complexity(const std::string& query, const nlohmann::json& variables) const {
    ParsedQuery parsed;
    try {
        detail::GraphQLParser parser(query, variables);
        parsed = parser.parse();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Parse error: ") + e.what());
    }
    return selectionComplexity(*queryType_, parsed.selections);
}

} // namespace restql::graphql

// ═══════════════════════════════════════════════════════════════════
//  handler_arguments.cpp — Handler parameter to argument mapping
// ═══════════════════════════════════════════════════════════════════

#include "restql/handler_arguments.h"
#include "restql/pagination.h"
#include <algorithm>

namespace restql {

std::string inputTypeName(const std::string& parameterType) {
    static const std::string listPrefix = "list<";
    if (parameterType.size() > listPrefix.size() + 1 &&
        parameterType.compare(0, listPrefix.size(), listPrefix) == 0 &&
        parameterType.back() == '>') {
        auto inner = parameterType.substr(listPrefix.size(),
                                          parameterType.size() - listPrefix.size() - 1);
        return "[" + inputTypeName(inner) + "]";
    }
    if (parameterType == "int" || parameterType == "long") return "Int";
    if (parameterType == "float" || parameterType == "double") return "Float";
    if (parameterType == "boolean") return "Boolean";
    return "String";
}

std::vector<graphql::ArgumentDescriptor> generateHandlerArguments(
    const Handler& handler, bool includePagination, int defaultLimit) {
    std::vector<graphql::ArgumentDescriptor> args;
    args.reserve(handler.parameters.size() + 2);

    for (auto& param : handler.parameters) {
        graphql::ArgumentDescriptor arg;
        arg.name = param.name;
        arg.type = inputTypeName(param.type);
        arg.required = param.required && !param.defaultValue;
        arg.defaultValue = param.defaultValue;
        args.push_back(std::move(arg));
    }

    if (includePagination) {
        auto declared = [&](const std::string& name) {
            return std::any_of(args.begin(), args.end(),
                               [&](const graphql::ArgumentDescriptor& a) { return a.name == name; });
        };
        if (!declared(pagination::kStart)) args.push_back(pagination::startArgument());
        if (!declared(pagination::kLimit)) args.push_back(pagination::limitArgument(defaultLimit));
    }
    return args;
}

} // namespace restql

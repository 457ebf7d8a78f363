#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/graphql.h — GraphQL parser, output types, and executor
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto query = std::make_shared<graphql::ObjectType>("Query", [] {
//        return std::vector<graphql::Field>{ ... };
//    });
//    graphql::Schema schema(query);
//    auto result = schema.execute("{ coursesV1Resource { multiGet { elements { id } } } }",
//                                 response);
//
//  Resolvers receive the parent value as std::any and return std::any.
//  The executor understands nlohmann::json scalars, objects and arrays,
//  and std::vector<std::any> for lists; any other value is opaque and
//  is only handed on to the child fields of an object type.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace restql {
class ExecutionContext;
}

namespace restql::graphql {

// ═══════════════════════════════════════════
//  Query AST
// ═══════════════════════════════════════════

struct FieldSelection {
    std::string name;
    std::string alias;
    nlohmann::json arguments = nlohmann::json::object();
    std::vector<FieldSelection> selections;

    // Key under which this field appears in the result
    const std::string& responseKey() const { return alias.empty() ? name : alias; }
};

struct ParsedQuery {
    std::string operationType; // "query" or "mutation"
    std::string operationName;
    std::vector<FieldSelection> selections;
};

namespace detail {

class GraphQLParser {
public:
    explicit GraphQLParser(const std::string& source,
                           const nlohmann::json& variables = nlohmann::json::object())
        : source_(source), variables_(variables), pos_(0) {}

    ParsedQuery parse() {
        ParsedQuery result;
        skipWhitespace();

        if (peek() == '{') {
            result.operationType = "query";
        } else {
            auto keyword = parseIdentifier();
            if (keyword == "query") {
                result.operationType = "query";
            } else if (keyword == "mutation") {
                result.operationType = "mutation";
            } else {
                throw std::runtime_error("Expected 'query' or 'mutation', got '" + keyword + "'");
            }

            skipWhitespace();

            if (peek() != '{' && peek() != '(') {
                result.operationName = parseIdentifier();
                skipWhitespace();
            }

            // Variable definitions; values come from the variables object
            if (peek() == '(') {
                skipBalanced('(', ')');
                skipWhitespace();
            }
        }

        result.selections = parseSelectionSet();
        skipWhitespace();
        if (pos_ < source_.size()) {
            throw std::runtime_error("Unexpected trailing input at position " + std::to_string(pos_));
        }
        return result;
    }

private:
    std::string source_;
    nlohmann::json variables_;
    std::size_t pos_;

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    char advance() {
        return pos_ < source_.size() ? source_[pos_++] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
                pos_++;
            } else if (c == '#') {
                while (pos_ < source_.size() && source_[pos_] != '\n') pos_++;
            } else {
                break;
            }
        }
    }

    void expect(char c) {
        skipWhitespace();
        if (advance() != c) {
            throw std::runtime_error(
                std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    void skipBalanced(char open, char close) {
        expect(open);
        int depth = 1;
        while (depth > 0 && pos_ < source_.size()) {
            char c = advance();
            if (c == open) depth++;
            if (c == close) depth--;
        }
        if (depth > 0) {
            throw std::runtime_error(std::string("Unbalanced '") + open + "'");
        }
    }

    bool isIdentChar(char c) const {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_';
    }

    std::string parseIdentifier() {
        skipWhitespace();
        std::string result;
        while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
            result += source_[pos_++];
        }
        if (result.empty()) {
            throw std::runtime_error("Expected identifier at position " + std::to_string(pos_));
        }
        return result;
    }

    nlohmann::json parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') {
            return parseString();
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            return parseNumber();
        } else if (c == '$') {
            return parseVariable();
        } else if (c == '{') {
            return parseObjectValue();
        } else if (c == '[') {
            return parseArrayValue();
        } else {
            auto ident = parseIdentifier();
            if (ident == "true") return true;
            if (ident == "false") return false;
            if (ident == "null") return nullptr;
            return nlohmann::json(ident); // enum value
        }
    }

    nlohmann::json parseVariable() {
        advance(); // '$'
        auto name = parseIdentifier();
        if (!variables_.is_object() || !variables_.contains(name)) {
            throw std::runtime_error("Variable '$" + name + "' is not defined");
        }
        return variables_.at(name);
    }

    std::string parseString() {
        expect('"');
        std::string result;
        while (peek() != '"' && peek() != '\0') {
            if (peek() == '\\') {
                advance();
                char esc = advance();
                switch (esc) {
                    case 'n': result += '\n'; break;
                    case 't': result += '\t'; break;
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    default: result += esc; break;
                }
            } else {
                result += advance();
            }
        }
        expect('"');
        return result;
    }

    nlohmann::json parseNumber() {
        skipWhitespace();
        std::string numStr;
        bool isFloat = false;
        if (peek() == '-') numStr += advance();
        while (peek() >= '0' && peek() <= '9') numStr += advance();
        if (peek() == '.') {
            isFloat = true;
            numStr += advance();
            while (peek() >= '0' && peek() <= '9') numStr += advance();
        }
        if (numStr.empty() || numStr == "-") {
            throw std::runtime_error("Malformed number at position " + std::to_string(pos_));
        }
        return isFloat ? nlohmann::json(std::stod(numStr))
                       : nlohmann::json(std::stoll(numStr));
    }

    nlohmann::json parseObjectValue() {
        expect('{');
        nlohmann::json obj = nlohmann::json::object();
        skipWhitespace();
        while (peek() != '}') {
            auto key = parseIdentifier();
            expect(':');
            obj[key] = parseValue();
            skipWhitespace();
        }
        expect('}');
        return obj;
    }

    nlohmann::json parseArrayValue() {
        expect('[');
        nlohmann::json arr = nlohmann::json::array();
        skipWhitespace();
        while (peek() != ']') {
            arr.push_back(parseValue());
            skipWhitespace();
        }
        expect(']');
        return arr;
    }

    nlohmann::json parseArguments() {
        expect('(');
        nlohmann::json args = nlohmann::json::object();
        skipWhitespace();
        while (peek() != ')') {
            auto name = parseIdentifier();
            expect(':');
            args[name] = parseValue();
            skipWhitespace();
        }
        expect(')');
        return args;
    }

    FieldSelection parseField() {
        FieldSelection field;
        auto nameOrAlias = parseIdentifier();
        skipWhitespace();

        if (peek() == ':') {
            advance();
            field.alias = nameOrAlias;
            field.name = parseIdentifier();
            skipWhitespace();
        } else {
            field.name = nameOrAlias;
        }

        if (peek() == '(') {
            field.arguments = parseArguments();
        }

        skipWhitespace();

        if (peek() == '{') {
            field.selections = parseSelectionSet();
        }

        return field;
    }

    std::vector<FieldSelection> parseSelectionSet() {
        expect('{');
        std::vector<FieldSelection> selections;
        skipWhitespace();

        while (peek() != '}' && peek() != '\0') {
            selections.push_back(parseField());
            skipWhitespace();
        }

        expect('}');
        return selections;
    }
};

} // namespace detail

// ═══════════════════════════════════════════
//  Arguments
// ═══════════════════════════════════════════

struct ArgumentDescriptor {
    std::string name;
    std::string type;   // "String", "Int", "[String]", ...
    bool required = false;
    std::optional<nlohmann::json> defaultValue;
    std::optional<double> minimum;
};

// ═══════════════════════════════════════════
//  Output types
// ═══════════════════════════════════════════

enum class TypeKind { Scalar, List, Object };

class OutputType {
public:
    virtual ~OutputType() = default;
    virtual TypeKind kind() const = 0;
    virtual std::string name() const = 0;
};

using OutputTypePtr = std::shared_ptr<const OutputType>;

// ── Everything a resolver can see about the current field occurrence ──
struct ResolveContext {
    const ExecutionContext& ctx;
    std::any value;                         // parent value
    nlohmann::json args;                    // defaults applied
    std::vector<FieldSelection> astFields;  // front() is this occurrence

    const FieldSelection* astField() const {
        return astFields.empty() ? nullptr : &astFields.front();
    }

    template <typename T>
    std::optional<T> arg(const std::string& name) const {
        return JsonValue(args).opt<T>(name);
    }
};

using Resolver     = std::function<std::any(const ResolveContext&)>;
using ComplexityFn = std::function<double(const nlohmann::json& args, double childScore)>;

struct Field {
    std::string name;
    OutputTypePtr type;
    std::vector<ArgumentDescriptor> arguments;
    Resolver resolve;          // empty: read parent[name] from a JSON object
    ComplexityFn complexity;   // empty: 1 + childScore

    const ArgumentDescriptor* argument(const std::string& argName) const {
        for (auto& a : arguments) {
            if (a.name == argName) return &a;
        }
        return nullptr;
    }
};

class ScalarType : public OutputType {
public:
    explicit ScalarType(std::string name) : name_(std::move(name)) {}

    TypeKind kind() const override { return TypeKind::Scalar; }
    std::string name() const override { return name_; }

    static OutputTypePtr string();
    static OutputTypePtr integer();
    static OutputTypePtr floating();
    static OutputTypePtr boolean();
    static OutputTypePtr id();
    static OutputTypePtr json();

private:
    std::string name_;
};

class ListType : public OutputType {
public:
    explicit ListType(OutputTypePtr ofType) : ofType_(std::move(ofType)) {}

    TypeKind kind() const override { return TypeKind::List; }
    std::string name() const override { return "[" + ofType_->name() + "]"; }
    const OutputTypePtr& ofType() const { return ofType_; }

private:
    OutputTypePtr ofType_;
};

// ─────────────────────────────────────────────
//  ObjectType
//  Fields may be supplied as a thunk, evaluated the first time they are
//  requested. Types that reference each other (A -> B -> A) are only
//  expanded as deep as a query or analysis actually walks.
// ─────────────────────────────────────────────
class ObjectType : public OutputType {
public:
    using FieldsFn = std::function<std::vector<Field>()>;

    ObjectType(std::string name, FieldsFn fieldsFn)
        : name_(std::move(name)), fieldsFn_(std::move(fieldsFn)) {}

    ObjectType(std::string name, std::vector<Field> fields)
        : name_(std::move(name)), fieldsFn_([fields] { return fields; }) {}

    TypeKind kind() const override { return TypeKind::Object; }
    std::string name() const override { return name_; }

    // Thread-safe; the thunk runs at most once
    const std::vector<Field>& fields() const {
        std::call_once(once_, [this] { fields_ = fieldsFn_(); });
        return fields_;
    }

    const Field* field(const std::string& fieldName) const {
        for (auto& f : fields()) {
            if (f.name == fieldName) return &f;
        }
        return nullptr;
    }

private:
    std::string name_;
    FieldsFn fieldsFn_;
    mutable std::once_flag once_;
    mutable std::vector<Field> fields_;
};

using ObjectTypePtr = std::shared_ptr<const ObjectType>;

// ═══════════════════════════════════════════
//  class Schema
//  A root query type plus execution and complexity analysis.
// ═══════════════════════════════════════════
class Schema {
public:
    explicit Schema(ObjectTypePtr queryType) : queryType_(std::move(queryType)) {}

    const ObjectType& queryType() const { return *queryType_; }

    // ── {"data": ..., "errors": [...]} ──
    nlohmann::json execute(const std::string& query,
                           const ExecutionContext& ctx,
                           const nlohmann::json& variables = nlohmann::json::object(),
                           std::any rootValue = nlohmann::json::object()) const;

    // ── Estimated cost of a query, from each field's complexity function ──
    // Throws std::runtime_error("Parse error: ...") when the query does not parse.
    double complexity(const std::string& query,
                      const nlohmann::json& variables = nlohmann::json::object()) const;

private:
    ObjectTypePtr queryType_;
};

// Argument values of one occurrence: declared defaults, then supplied values
nlohmann::json coerceArguments(const Field& field, const nlohmann::json& supplied);

// Problems with the supplied arguments, one message each; empty when valid
std::vector<std::string> validateArguments(const Field& field, const nlohmann::json& supplied);

} // namespace restql::graphql

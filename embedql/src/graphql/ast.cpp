#include "graphql/ast.hpp"

namespace embedql::graphql {

auto TypeRef::to_string() const -> std::string {
    switch (kind) {
    case TypeKind::Named:
        return name;
    case TypeKind::List:
        return "[" + (of_type ? of_type->to_string() : std::string()) + "]";
    case TypeKind::NonNull:
        return (of_type ? of_type->to_string() : std::string()) + "!";
    }
    return name;
}

auto operation_type_name(OperationType op) -> const char* {
    switch (op) {
    case OperationType::Query:
        return "query";
    case OperationType::Mutation:
        return "mutation";
    case OperationType::Subscription:
        return "subscription";
    }
    return "query";
}

auto Definition::kind_name() const -> const char* {
    return is_operation() ? "OperationDefinition" : "FragmentDefinition";
}

auto Definition::name() const -> std::optional<std::string> {
    if (const auto* op = std::get_if<OperationDefinition>(&node)) {
        return op->name;
    }
    return std::get<FragmentDefinition>(node).name;
}

auto Definition::loc() const -> const SourceLocation& {
    return std::visit([](const auto& def) -> const SourceLocation& { return def.loc; }, node);
}

auto Document::definition_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(definitions.size());
    for (const auto& def : definitions) {
        names.push_back(def.name().value_or("<anonymous>"));
    }
    return names;
}

} // namespace embedql::graphql

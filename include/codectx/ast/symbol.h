#pragma once

#include <codectx/ast/ast.h>
#include <codectx/core/types.h>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace codectx::ast {

enum class SymbolKind {
    Class,
    Struct,
    Interface,
    Enum,
    Namespace,
    Function,
    Method,
    Constructor,
    Destructor,
    Operator,
    Variable,
    Template,
    Type,
    Import,
    Directive,
    Mixin,
    Extension,
    Typedef,
    Widget,
    StateClass,
    BuildMethod,
    LifecycleMethod
};

constexpr const char* symbolKindToString(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Class: return "class";
        case SymbolKind::Struct: return "struct";
        case SymbolKind::Interface: return "interface";
        case SymbolKind::Enum: return "enum";
        case SymbolKind::Namespace: return "namespace";
        case SymbolKind::Function: return "function";
        case SymbolKind::Method: return "method";
        case SymbolKind::Constructor: return "constructor";
        case SymbolKind::Destructor: return "destructor";
        case SymbolKind::Operator: return "operator";
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Template: return "template";
        case SymbolKind::Type: return "type";
        case SymbolKind::Import: return "import";
        case SymbolKind::Directive: return "directive";
        case SymbolKind::Mixin: return "mixin";
        case SymbolKind::Extension: return "extension";
        case SymbolKind::Typedef: return "typedef";
        case SymbolKind::Widget: return "widget";
        case SymbolKind::StateClass: return "state_class";
        case SymbolKind::BuildMethod: return "build_method";
        case SymbolKind::LifecycleMethod: return "lifecycle_method";
    }
    return "unknown";
}

enum class Visibility { Public, Private, Protected };

constexpr const char* visibilityToString(Visibility v) {
    switch (v) {
        case Visibility::Public: return "public";
        case Visibility::Private: return "private";
        case Visibility::Protected: return "protected";
    }
    return "private";
}

// "public" / "private" / "protected", with or without a trailing colon
std::optional<Visibility> parseVisibility(std::string_view label);

struct Symbol {
    std::string id;
    std::string name;
    SymbolKind kind = SymbolKind::Variable;
    FileLocation location;
    std::string language;
    std::string signature;
    std::optional<Visibility> visibility;
    Hash hash;
    TimePoint lastModified;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Element-wise equality ignoring lastModified
 */
bool sameSymbol(const Symbol& a, const Symbol& b);

// Import record derived from an AST
struct Import {
    std::string path;
    std::string alias;
    int line = 0;

    bool operator==(const Import&) const = default;
};

} // namespace codectx::ast

template <> struct fmt::formatter<codectx::ast::SymbolKind> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(codectx::ast::SymbolKind kind, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", codectx::ast::symbolKindToString(kind));
    }
};

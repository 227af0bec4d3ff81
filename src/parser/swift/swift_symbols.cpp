#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/swift/swift_parser.h>

#include <array>
#include <cctype>
#include <optional>

#include <fmt/format.h>

namespace codectx::parser::swift {

namespace {

struct SymbolMapping {
    std::string_view nodeType;
    ast::SymbolKind kind;
    std::string_view idPrefix;
};

constexpr std::array<SymbolMapping, 16> kMappings = {{
    {"class_declaration", ast::SymbolKind::Class, "class"},
    {"struct_declaration", ast::SymbolKind::Struct, "struct"},
    {"protocol_declaration", ast::SymbolKind::Interface, "protocol"},
    {"enum_declaration", ast::SymbolKind::Enum, "enum"},
    {"actor_declaration", ast::SymbolKind::Class, "actor"},
    {"extension_declaration", ast::SymbolKind::Namespace, "extension"},
    {"typealias_declaration", ast::SymbolKind::Type, "typealias"},
    {"associatedtype_declaration", ast::SymbolKind::Type, "associatedtype"},
    {"function_declaration", ast::SymbolKind::Function, "func"},
    {"init_declaration", ast::SymbolKind::Constructor, "init"},
    {"deinit_declaration", ast::SymbolKind::Destructor, "deinit"},
    {"property_declaration", ast::SymbolKind::Variable, "property"},
    {"subscript_declaration", ast::SymbolKind::Operator, "subscript"},
    {"operator_function_declaration", ast::SymbolKind::Operator, "operator-func"},
    {"operator_declaration", ast::SymbolKind::Operator, "operator-decl"},
    {"import_declaration", ast::SymbolKind::Import, "import"},
}};

const SymbolMapping* findMapping(std::string_view nodeType) {
    for (const auto& mapping : kMappings) {
        if (mapping.nodeType == nodeType) {
            return &mapping;
        }
    }
    return nullptr;
}

std::optional<ast::Visibility> visibilityOf(const nlohmann::json& metadata) {
    auto access = metadata.value("access_level", std::string{});
    if (access == "public" || access == "open") {
        return ast::Visibility::Public;
    }
    if (access == "private" || access == "fileprivate") {
        return ast::Visibility::Private;
    }
    return std::nullopt;
}

// Declaration text with whitespace collapsed and the body opener dropped
std::string signatureOf(std::string_view decl) {
    std::string out;
    bool pendingSpace = false;
    for (char c : core::trimView(decl)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) {
            out += ' ';
        }
        pendingSpace = false;
        out += c;
    }
    while (!out.empty() && (out.back() == '{' || out.back() == '=' || out.back() == ';' ||
                            out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

} // namespace

std::vector<ast::Symbol> swiftSymbols(const ast::AST& tree) {
    std::vector<ast::Symbol> symbols;
    if (!tree.root) {
        return symbols;
    }

    for (const auto& node : tree.root->children) {
        const SymbolMapping* mapping = findMapping(node.type);
        if (!mapping || node.children.empty()) {
            continue;
        }

        ast::Symbol symbol;
        symbol.name = node.children.front().value;
        symbol.kind = mapping->kind;
        std::string_view prefix = mapping->idPrefix;
        if (mapping->kind == ast::SymbolKind::Function && node.metadata.value("is_method", false)) {
            symbol.kind = ast::SymbolKind::Method;
            prefix = "method";
        }
        symbol.id = fmt::format("{}-{}-{}", prefix, tree.filePath, node.location.line);
        symbol.location = node.location;
        symbol.location.filePath = tree.filePath;
        symbol.language = "swift";
        if (mapping->kind != ast::SymbolKind::Import) {
            symbol.signature = signatureOf(node.value);
            symbol.visibility = visibilityOf(node.metadata);
        }
        symbol.hash = crypto::SHA256Hasher::hashText(node.value);
        symbol.lastModified = tree.parsedAt;
        symbol.metadata = node.metadata;
        symbols.push_back(std::move(symbol));
    }
    return symbols;
}

} // namespace codectx::parser::swift

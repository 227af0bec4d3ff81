#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/dart/dart_parser.h>

#include <array>
#include <cctype>

#include <fmt/format.h>

namespace codectx::parser::dart {

namespace {

enum class SignatureStyle { None, Declaration, Typedef, Build, Lifecycle };

struct SymbolMapping {
    std::string_view nodeType;
    ast::SymbolKind kind;
    std::string_view idPrefix;
    SignatureStyle signature;
};

constexpr std::array<SymbolMapping, 20> kMappings = {{
    {"class_declaration", ast::SymbolKind::Class, "class", SignatureStyle::None},
    {"state_class_declaration", ast::SymbolKind::StateClass, "state-class", SignatureStyle::None},
    {"mixin_declaration", ast::SymbolKind::Mixin, "mixin", SignatureStyle::None},
    {"extension_declaration", ast::SymbolKind::Extension, "extension", SignatureStyle::None},
    {"enum_declaration", ast::SymbolKind::Enum, "enum", SignatureStyle::None},
    {"typedef_declaration", ast::SymbolKind::Typedef, "typedef", SignatureStyle::Typedef},
    {"function_typedef", ast::SymbolKind::Typedef, "function-typedef", SignatureStyle::Typedef},
    {"function_declaration", ast::SymbolKind::Function, "function", SignatureStyle::Declaration},
    {"method_declaration", ast::SymbolKind::Method, "method", SignatureStyle::Declaration},
    {"build_method", ast::SymbolKind::BuildMethod, "build", SignatureStyle::Build},
    {"lifecycle_method", ast::SymbolKind::LifecycleMethod, "lifecycle", SignatureStyle::Lifecycle},
    {"variable_declaration", ast::SymbolKind::Variable, "variable", SignatureStyle::None},
    {"import_statement", ast::SymbolKind::Import, "import", SignatureStyle::None},
    {"part_directive", ast::SymbolKind::Directive, "part-directive", SignatureStyle::None},
    {"part_of_directive", ast::SymbolKind::Directive, "part-of-directive", SignatureStyle::None},
    {"async_generator", ast::SymbolKind::Function, "async-generator", SignatureStyle::Declaration},
    {"async_function", ast::SymbolKind::Function, "async-function", SignatureStyle::Declaration},
    {"async_method", ast::SymbolKind::Method, "async-method", SignatureStyle::Declaration},
    {"higher_order_method", ast::SymbolKind::Method, "higher-order-method",
     SignatureStyle::Declaration},
    {"closure_factory", ast::SymbolKind::Method, "closure-factory", SignatureStyle::Declaration},
}};

const SymbolMapping* findMapping(std::string_view nodeType) {
    for (const auto& mapping : kMappings) {
        if (mapping.nodeType == nodeType) {
            return &mapping;
        }
    }
    return nullptr;
}

bool isWidgetKind(const nlohmann::json& metadata) {
    auto kind = metadata.value("widget_type", std::string{});
    return kind == "stateless" || kind == "stateful" || kind == "consumer" || kind == "hook";
}

// Declaration text up to its body, annotations dropped and whitespace collapsed
std::string declarationSignature(std::string_view text) {
    text = core::trimView(text);
    while (!text.empty() && text.front() == '@') {
        size_t i = 1;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        text = core::trimView(text.substr(i));
    }
    size_t cut = std::min(text.find('{'), text.find("=>"));
    if (cut != std::string_view::npos) {
        text = text.substr(0, cut);
    }

    std::string out;
    bool pendingSpace = false;
    for (char c : core::trimView(text)) {
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
    return out;
}

std::string signatureFor(const ast::ASTNode& node, const std::string& name, SignatureStyle style) {
    switch (style) {
        case SignatureStyle::None: return {};
        case SignatureStyle::Declaration: return declarationSignature(node.value);
        case SignatureStyle::Typedef: return node.metadata.value("target_type", std::string{});
        case SignatureStyle::Build: return "Widget build(BuildContext context)";
        case SignatureStyle::Lifecycle: return fmt::format("void {}()", name);
    }
    return {};
}

} // namespace

std::vector<ast::Symbol> dartSymbols(const ast::AST& tree) {
    std::vector<ast::Symbol> symbols;
    if (!tree.root) {
        return symbols;
    }

    auto visit = [&](const ast::ASTNode& node, size_t depth) {
        if (depth == 0) {
            return;
        }
        const SymbolMapping* mapping = findMapping(node.type);
        if (!mapping || node.children.empty()) {
            return;
        }

        ast::Symbol symbol;
        symbol.name = node.children.front().value;
        symbol.kind = mapping->kind;
        if (mapping->kind == ast::SymbolKind::Class && isWidgetKind(node.metadata)) {
            symbol.kind = ast::SymbolKind::Widget;
        }
        if (mapping->signature == SignatureStyle::Build) {
            symbol.name = "build";
        }
        symbol.id = fmt::format("{}-{}-{}", mapping->idPrefix, tree.filePath, node.location.line);
        symbol.location = node.location;
        symbol.location.filePath = tree.filePath;
        symbol.language = "dart";
        symbol.signature = signatureFor(node, symbol.name, mapping->signature);
        if (mapping->kind != ast::SymbolKind::Import &&
            mapping->kind != ast::SymbolKind::Directive) {
            symbol.visibility = core::startsWith(symbol.name, "_") ? ast::Visibility::Private
                                                                   : ast::Visibility::Public;
        }
        symbol.hash = crypto::SHA256Hasher::hashText(node.value);
        symbol.lastModified = tree.parsedAt;
        symbol.metadata = node.metadata;
        symbols.push_back(std::move(symbol));
    };
    ast::visitPreOrder(*tree.root, visit);
    return symbols;
}

} // namespace codectx::parser::dart

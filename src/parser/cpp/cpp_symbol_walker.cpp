#include <codectx/core/text.h>
#include <codectx/crypto/hasher.h>
#include <codectx/parser/cpp/cpp_symbol_walker.h>

#include <cctype>
#include <chrono>

#include <fmt/format.h>

namespace codectx::parser::cpp {

using ast::ASTNode;
using ast::SymbolKind;
using ast::Visibility;

namespace {

std::string trimmed(std::string_view s) {
    return std::string(core::trimView(s));
}

const ASTNode* childOfType(const ASTNode& node, std::string_view type) {
    for (const auto& child : node.children) {
        if (child.type == type) {
            return &child;
        }
    }
    return nullptr;
}

// Text before the first '<', or the whole text
std::string baseTemplateName(std::string_view text) {
    auto t = core::trimView(text);
    auto idx = t.find('<');
    if (idx != std::string_view::npos && idx > 0) {
        return std::string(t.substr(0, idx));
    }
    return std::string(t);
}

std::string templateFunctionName(const ASTNode& node) {
    if (const auto* id = childOfType(node, "identifier")) {
        return trimmed(id->value);
    }
    return baseTemplateName(node.value);
}

// Rightmost name of a possibly nested qualified_identifier
std::string qualifiedLastName(const ASTNode& node) {
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
        const auto& child = *it;
        if (child.type == "identifier" || child.type == "field_identifier" ||
            child.type == "destructor_name" || child.type == "operator_name" ||
            child.type == "type_identifier") {
            return trimmed(child.value);
        }
        if (child.type == "template_function") {
            return templateFunctionName(child);
        }
        if (child.type == "qualified_identifier") {
            return qualifiedLastName(child);
        }
    }
    return {};
}

// "A::B::method" -> "B"
std::string qualifiedScope(std::string_view qualified) {
    auto text = core::trimView(qualified);
    auto last = text.rfind("::");
    if (last == std::string_view::npos) {
        return {};
    }
    auto scope = text.substr(0, last);
    auto prev = scope.rfind("::");
    if (prev != std::string_view::npos) {
        scope = scope.substr(prev + 2);
    }
    return baseTemplateName(scope);
}

const std::string* findFieldIdentifier(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "field_identifier") {
            return &child.value;
        }
        if (child.type == "pointer_declarator" || child.type == "reference_declarator" ||
            child.type == "array_declarator") {
            if (const auto* nested = findFieldIdentifier(child)) {
                return nested;
            }
        }
    }
    return nullptr;
}

bool isFunctionLike(const ASTNode& node) {
    return node.type == "function_definition" || node.type == "function_declaration";
}

bool hasVirtualKeyword(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "virtual" || child.type == "virtual_function_specifier") {
            return true;
        }
    }
    return false;
}

bool hasVirtualSpecifier(const ASTNode* declarator, std::string_view specifier) {
    if (!declarator) {
        return false;
    }
    for (const auto& child : declarator->children) {
        if (child.type != "virtual_specifier") {
            continue;
        }
        for (const auto& token : child.children) {
            if (token.type == specifier) {
                return true;
            }
        }
        if (core::trimView(child.value) == specifier) {
            return true;
        }
    }
    return false;
}

bool isPureVirtual(const ASTNode& node) {
    for (size_t i = 0; i + 1 < node.children.size(); ++i) {
        if (node.children[i].type == "=" && node.children[i + 1].type == "number_literal" &&
            core::trimView(node.children[i + 1].value) == "0") {
            return true;
        }
    }
    return false;
}

} // namespace

const ASTNode* CppSymbolWalker::findFunctionDeclarator(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "function_declarator") {
            return &child;
        }
        if (child.type == "pointer_declarator" || child.type == "reference_declarator") {
            if (const auto* nested = findFunctionDeclarator(child)) {
                return nested;
            }
        }
    }
    return nullptr;
}

std::string CppSymbolWalker::genericName(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "identifier" || child.type == "field_identifier" ||
            child.type == "type_identifier") {
            return trimmed(child.value);
        }
    }

    // First identifier-like word of the text
    std::string_view text = node.value;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        size_t end = pos;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        std::string_view word = text.substr(pos, end - pos);
        pos = end;
        if (word.empty()) {
            continue;
        }
        char first = word.front();
        if (std::isalpha(static_cast<unsigned char>(first)) || first == '_') {
            constexpr std::string_view punct = "(){}[];,<>";
            while (!word.empty() && punct.find(word.front()) != std::string_view::npos) {
                word.remove_prefix(1);
            }
            while (!word.empty() && punct.find(word.back()) != std::string_view::npos) {
                word.remove_suffix(1);
            }
            if (!word.empty()) {
                return std::string(word);
            }
        }
    }
    return "unknown";
}

std::string CppSymbolWalker::functionName(const ASTNode& node) {
    if (const auto* declarator = findFunctionDeclarator(node)) {
        for (const auto& child : declarator->children) {
            if (child.type == "field_identifier" || child.type == "identifier" ||
                child.type == "operator_name" || child.type == "destructor_name") {
                return trimmed(child.value);
            }
            if (child.type == "template_function") {
                return templateFunctionName(child);
            }
            if (child.type == "qualified_identifier") {
                auto name = qualifiedLastName(child);
                if (!name.empty()) {
                    return name;
                }
            }
        }
    }
    return genericName(node);
}

std::string CppSymbolWalker::className(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "type_identifier") {
            return trimmed(child.value);
        }
        if (child.type == "template_type") {
            if (const auto* id = childOfType(child, "type_identifier")) {
                return trimmed(id->value);
            }
            return baseTemplateName(child.value);
        }
        if (child.type == "qualified_identifier") {
            auto name = qualifiedLastName(child);
            if (!name.empty()) {
                return name;
            }
        }
    }
    return genericName(node);
}

std::string CppSymbolWalker::namespaceName(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "namespace_identifier" || child.type == "identifier" ||
            child.type == "nested_namespace_specifier") {
            return trimmed(child.value);
        }
        if (child.type == "declaration_list") {
            // Unnamed namespace
            return "(anonymous)";
        }
    }
    return genericName(node);
}

std::string CppSymbolWalker::fieldName(const ASTNode& node) {
    if (const auto* name = findFieldIdentifier(node)) {
        return trimmed(*name);
    }
    return {};
}

std::string CppSymbolWalker::templateName(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "class_specifier" || child.type == "struct_specifier") {
            for (const auto& grandchild : child.children) {
                if (grandchild.type == "type_identifier") {
                    return trimmed(grandchild.value);
                }
                if (grandchild.type == "template_type") {
                    if (const auto* id = childOfType(grandchild, "type_identifier")) {
                        return trimmed(id->value);
                    }
                    return baseTemplateName(grandchild.value);
                }
            }
            return genericName(child);
        }
        if (isFunctionLike(child) ||
            (child.type == "declaration" && findFunctionDeclarator(child))) {
            return functionName(child);
        }
    }
    return "template";
}

std::string CppSymbolWalker::templateSignature(const ASTNode& node) {
    std::string signature;
    std::string specialization;

    for (const auto& child : node.children) {
        if (child.type == "template_parameter_list") {
            signature = trimmed(child.value);
        }
        if (child.type == "class_specifier" || child.type == "struct_specifier") {
            if (const auto* spec = childOfType(child, "template_type")) {
                specialization = " (specialization: " + trimmed(spec->value) + ")";
            }
        }
        if (isFunctionLike(child)) {
            if (const auto* declarator = findFunctionDeclarator(child)) {
                if (const auto* spec = childOfType(*declarator, "template_function")) {
                    specialization = " (specialization: " + trimmed(spec->value) + ")";
                }
            }
        }
    }
    return signature + specialization;
}

std::string CppSymbolWalker::includeName(const ASTNode& node) {
    for (const auto& child : node.children) {
        if (child.type == "string_literal" || child.type == "system_lib_string") {
            return trimmed(child.value);
        }
    }
    return trimmed(node.value);
}

std::string CppSymbolWalker::functionSignature(const ASTNode& node) const {
    std::string signature;
    const auto* declarator = findFunctionDeclarator(node);
    if (declarator) {
        signature = trimmed(declarator->value);
    } else {
        auto text = std::string_view(node.value);
        signature = trimmed(text.substr(0, text.find('\n')));
    }

    if (!enableVirtualDetection_) {
        return signature;
    }

    std::vector<std::string_view> qualifiers;
    if (hasVirtualKeyword(node)) {
        qualifiers.push_back("virtual");
    }
    if (hasVirtualSpecifier(declarator, "override")) {
        qualifiers.push_back("override");
    }
    if (hasVirtualSpecifier(declarator, "final")) {
        qualifiers.push_back("final");
    }
    if (isPureVirtual(node)) {
        qualifiers.push_back("pure virtual");
    }
    if (!qualifiers.empty()) {
        signature += " [";
        for (size_t i = 0; i < qualifiers.size(); ++i) {
            if (i > 0) {
                signature += ", ";
            }
            signature += qualifiers[i];
        }
        signature += "]";
    }
    return signature;
}

std::vector<ast::Symbol> CppSymbolWalker::walk() {
    symbols_.clear();
    if (tree_.root) {
        walkNode(*tree_.root, ParentContext{});
    }
    return std::move(symbols_);
}

ParentContext CppSymbolWalker::enter(const ASTNode& node, const ParentContext& ctx) const {
    ParentContext next = ctx;
    if (node.type == "class_specifier" || node.type == "struct_specifier") {
        next.inClass = true;
        next.className = className(node);
        next.currentAccess =
            node.type == "struct_specifier" ? Visibility::Public : Visibility::Private;
    } else if (node.type == "namespace_definition") {
        next.inNamespace = true;
        next.namespaceName = namespaceName(node);
    } else if (node.type == "template_declaration") {
        ++next.templateDepth;
    } else if (node.type == "access_specifier") {
        if (auto access = ast::parseVisibility(node.value)) {
            next.currentAccess = *access;
        }
    } else if (ctx.inClass) {
        auto text = core::trimView(node.value);
        if (text == "private:" || text == "public:" || text == "protected:") {
            next.currentAccess = *ast::parseVisibility(text);
        }
    }
    return next;
}

void CppSymbolWalker::walkNode(const ASTNode& node, const ParentContext& ctx) {
    ParentContext scope = enter(node, ctx);

    if (node.type == "field_declaration_list") {
        walkClassBody(node, scope);
        return;
    }

    if (node.type != "access_specifier") {
        if (auto symbol = toSymbol(node, scope)) {
            symbols_.push_back(std::move(*symbol));
        }
    }

    for (const auto& child : node.children) {
        walkNode(child, scope);
    }
}

void CppSymbolWalker::walkClassBody(const ASTNode& body, const ParentContext& ctx) {
    Visibility currentAccess = ctx.currentAccess;

    for (const auto& child : body.children) {
        if (child.type == "access_specifier") {
            if (auto access = ast::parseVisibility(child.value)) {
                currentAccess = *access;
            }
            continue;
        }

        ParentContext member = ctx;
        member.currentAccess = currentAccess;

        if (child.type == "field_declaration" || child.type == "function_definition" ||
            child.type == "function_declaration" || child.type == "template_declaration") {
            if (auto symbol = toSymbol(child, member)) {
                symbols_.push_back(std::move(*symbol));
            }
            for (const auto& grandchild : child.children) {
                walkNode(grandchild, member);
            }
        } else {
            walkNode(child, member);
        }
    }
}

ast::Symbol CppSymbolWalker::makeSymbol(const ASTNode& node, std::string_view prefix,
                                        std::string name, SymbolKind kind) const {
    ast::Symbol symbol;
    symbol.id = fmt::format("{}-{}-{}", prefix, tree_.filePath, node.location.line);
    symbol.name = std::move(name);
    symbol.kind = kind;
    symbol.location = node.location;
    symbol.location.filePath = tree_.filePath;
    symbol.language = "cpp";
    symbol.hash = crypto::SHA256Hasher::hashText(node.value);
    symbol.lastModified = std::chrono::system_clock::now();
    return symbol;
}

void CppSymbolWalker::classifyFunction(const ASTNode& node, const ParentContext& ctx,
                                       ast::Symbol& symbol) const {
    if (!ctx.inClass) {
        symbol.kind = SymbolKind::Function;
        symbol.visibility = Visibility::Public;
        // Out-of-class member definition: Owner::name keeps its owner as metadata only
        if (const auto* declarator = findFunctionDeclarator(node)) {
            if (const auto* qualified = childOfType(*declarator, "qualified_identifier")) {
                if (auto owner = qualifiedScope(qualified->value); !owner.empty()) {
                    symbol.metadata["parent_class"] = owner;
                }
            }
        }
        return;
    }

    const std::string& owner = ctx.className;

    if (symbol.name == owner) {
        symbol.kind = SymbolKind::Constructor;
    } else if (core::startsWith(symbol.name, "~")) {
        symbol.kind = SymbolKind::Destructor;
    } else if (core::contains(symbol.name, "operator")) {
        symbol.kind = SymbolKind::Operator;
    } else {
        symbol.kind = SymbolKind::Method;
    }
    symbol.visibility = ctx.currentAccess;
    symbol.metadata["parent_class"] = owner;
}

std::optional<ast::Symbol> CppSymbolWalker::toSymbol(const ASTNode& node,
                                                     const ParentContext& ctx) const {
    std::optional<ast::Symbol> out;

    if (node.type == "class_specifier") {
        // ctx already holds the class's own default access
        out = makeSymbol(node, "class", className(node), SymbolKind::Class);
        out->visibility = ctx.currentAccess;
    } else if (node.type == "struct_specifier") {
        out = makeSymbol(node, "struct", className(node), SymbolKind::Class);
        out->visibility = Visibility::Public;
    } else if (isFunctionLike(node) || node.type == "declaration") {
        if (node.type == "declaration" && !findFunctionDeclarator(node)) {
            return std::nullopt;
        }
        out = makeSymbol(node, "func", functionName(node), SymbolKind::Function);
        out->signature = functionSignature(node);
        classifyFunction(node, ctx, *out);
    } else if (node.type == "namespace_definition") {
        out = makeSymbol(node, "namespace", namespaceName(node), SymbolKind::Namespace);
    } else if (node.type == "field_declaration") {
        if (findFunctionDeclarator(node)) {
            out = makeSymbol(node, "func", functionName(node), SymbolKind::Function);
            out->signature = functionSignature(node);
            classifyFunction(node, ctx, *out);
        } else {
            auto name = fieldName(node);
            if (name.empty()) {
                return std::nullopt;
            }
            out = makeSymbol(node, "field", std::move(name), SymbolKind::Variable);
            out->visibility = ctx.inClass ? ctx.currentAccess : Visibility::Public;
        }
    } else if (node.type == "template_declaration") {
        out = makeSymbol(node, "template", templateName(node), SymbolKind::Template);
        out->signature = templateSignature(node);
    } else if (node.type == "preproc_include") {
        out = makeSymbol(node, "include", includeName(node), SymbolKind::Import);
    } else {
        return std::nullopt;
    }

    if (ctx.inNamespace && !ctx.namespaceName.empty()) {
        out->metadata["namespace"] = ctx.namespaceName;
    }
    if (ctx.templateDepth > 0) {
        out->metadata["template_depth"] = ctx.templateDepth;
    }
    return out;
}

} // namespace codectx::parser::cpp

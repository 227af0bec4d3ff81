#include <codectx/parser/regex_util.h>
#include <codectx/parser/swift/swift_extractor.h>
#include <codectx/parser/swift/swift_patterns.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <set>

#include <fmt/format.h>

namespace codectx::parser::swift {

namespace {

constexpr std::array<std::string_view, 17> kBlockKeywords = {
    "if",  "else", "guard", "while",   "for",    "switch", "catch",  "do",   "repeat",
    "defer", "get", "set",  "willSet", "didSet", "init",   "deinit", "where"};

constexpr std::array<std::string_view, 16> kDeclarationTokens = {
    "func",     "init",  "deinit", "subscript", "class", "struct", "enum",  "protocol",
    "extension", "actor", "if",    "guard",     "while", "for",    "switch", "catch"};

template <size_t N>
bool oneOf(std::string_view word, const std::array<std::string_view, N>& words) {
    return std::find(words.begin(), words.end(), word) != words.end();
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::vector<std::string_view> words(std::string_view text) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isIdentChar(text[i])) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && isIdentChar(text[i])) {
            ++i;
        }
        if (i > start) {
            out.push_back(text.substr(start, i - start));
        }
    }
    return out;
}

bool hasWord(std::string_view text, std::string_view word) {
    for (auto w : words(text)) {
        if (w == word) {
            return true;
        }
    }
    return false;
}

// Declared access level; private(set) only narrows the setter and is ignored
std::string accessLevel(std::string_view modifiers) {
    for (auto keyword : {"public", "open", "package", "internal", "fileprivate", "private"}) {
        size_t at = 0;
        std::string_view kw(keyword);
        while ((at = modifiers.find(kw, at)) != std::string_view::npos) {
            size_t end = at + kw.size();
            bool startOk = at == 0 || !isIdentChar(modifiers[at - 1]);
            bool endOk = end >= modifiers.size() || !isIdentChar(modifiers[end]);
            bool setterOnly = modifiers.substr(end, 5) == "(set)";
            if (startOk && endOk && !setterOnly && (at == 0 || modifiers[at - 1] != '@')) {
                return std::string(kw);
            }
            at = end;
        }
    }
    return {};
}

std::vector<std::string> splitTypeList(std::string_view list) {
    std::vector<std::string> out;
    int angle = 0;
    size_t start = 0;
    for (size_t i = 0; i <= list.size(); ++i) {
        char c = i < list.size() ? list[i] : ',';
        if (c == '<' || c == '[' || c == '(') {
            ++angle;
        } else if (c == '>' || c == ']' || c == ')') {
            --angle;
        } else if (c == ',' && angle <= 0) {
            auto item = core::trimView(list.substr(start, i - start));
            if (!item.empty()) {
                out.emplace_back(item);
            }
            start = i + 1;
        }
    }
    return out;
}

void setAccess(nlohmann::json& md, std::string_view modifiers) {
    if (auto access = accessLevel(modifiers); !access.empty()) {
        md["access_level"] = access;
    }
}

} // namespace

SwiftSource::SwiftSource(std::string_view content) : code_(content), lines_(content) {
    enum class State { Code, LineComment, BlockComment, String, MultilineString };

    State state = State::Code;
    int commentDepth = 0;
    int interpolation = 0;
    const size_t n = content.size();
    auto blank = [&](size_t i) {
        if (i < n && code_[i] != '\n') {
            code_[i] = ' ';
        }
    };

    for (size_t i = 0; i < n; ++i) {
        char c = content[i];
        char next = i + 1 < n ? content[i + 1] : '\0';
        switch (state) {
            case State::Code:
                if (c == '/' && next == '/') {
                    state = State::LineComment;
                    blank(i);
                    blank(++i);
                } else if (c == '/' && next == '*') {
                    state = State::BlockComment;
                    commentDepth = 1;
                    blank(i);
                    blank(++i);
                } else if (c == '"') {
                    if (content.substr(i, 3) == R"(""")") {
                        state = State::MultilineString;
                        i += 2;
                    } else {
                        state = State::String;
                    }
                }
                break;
            case State::LineComment:
                if (c == '\n') {
                    state = State::Code;
                } else {
                    blank(i);
                }
                break;
            case State::BlockComment:
                if (c == '/' && next == '*') {
                    ++commentDepth;
                    blank(i);
                    blank(++i);
                } else if (c == '*' && next == '/') {
                    blank(i);
                    blank(++i);
                    if (--commentDepth == 0) {
                        state = State::Code;
                    }
                } else {
                    blank(i);
                }
                break;
            case State::String:
            case State::MultilineString:
                if (interpolation > 0) {
                    if (c == '(') {
                        ++interpolation;
                    } else if (c == ')') {
                        --interpolation;
                    }
                    blank(i);
                } else if (c == '\\') {
                    blank(i);
                    if (next == '(') {
                        interpolation = 1;
                        blank(++i);
                    } else if (next != '\n' && next != '\0') {
                        blank(++i);
                    }
                } else if (state == State::String && (c == '"' || c == '\n')) {
                    state = State::Code;
                } else if (state == State::MultilineString &&
                           content.substr(i, 3) == R"(""")") {
                    state = State::Code;
                    i += 2;
                } else {
                    blank(i);
                }
                break;
        }
    }

    int depth = 0;
    std::vector<size_t> open;
    for (size_t i = 0; i < code_.size(); ++i) {
        if (code_[i] == '{') {
            open.push_back(bracePositions_.size());
            bracePositions_.push_back(i);
            depthAfter_.push_back(++depth);
            matching_.push_back(std::string::npos);
        } else if (code_[i] == '}') {
            depth = std::max(0, depth - 1);
            bracePositions_.push_back(i);
            depthAfter_.push_back(depth);
            matching_.push_back(std::string::npos);
            if (!open.empty()) {
                matching_[open.back()] = i;
                open.pop_back();
            }
        }
    }
}

int SwiftSource::depthAt(size_t offset) const {
    auto it = std::lower_bound(bracePositions_.begin(), bracePositions_.end(), offset);
    if (it == bracePositions_.begin()) {
        return 0;
    }
    return depthAfter_[static_cast<size_t>(it - bracePositions_.begin()) - 1];
}

size_t SwiftSource::closingBrace(size_t open) const {
    auto it = std::lower_bound(bracePositions_.begin(), bracePositions_.end(), open);
    if (it == bracePositions_.end() || *it != open) {
        return std::string::npos;
    }
    return matching_[static_cast<size_t>(it - bracePositions_.begin())];
}

SwiftExtractor::SwiftExtractor(std::string_view content, std::string filePath)
    : content_(content), filePath_(std::move(filePath)), source_(content) {}

size_t SwiftExtractor::offsetOf(const boost::cmatch& m, int group) const {
    return groupOffset(m, group, source_.code().data());
}

ast::ASTNode SwiftExtractor::makeNode(std::string id, std::string type, const boost::cmatch& m,
                                      size_t nameAt) const {
    size_t start = offsetOf(m, 0);
    size_t end = start + static_cast<size_t>(m.length(0));
    while (start < end && (content_[start] == ' ' || content_[start] == '\t')) {
        ++start;
    }

    ast::ASTNode node;
    node.id = std::move(id);
    node.type = std::move(type);
    node.value = std::string(core::trimView(content_.substr(start, end - start)));
    node.location = ast::FileLocation{filePath_,
                                      source_.lineAt(nameAt),
                                      core::columnAtOffset(content_, start),
                                      source_.lineAt(end),
                                      core::columnAtOffset(content_, end)};
    return node;
}

void SwiftExtractor::addNode(ast::ASTNode node, std::string_view prefix, const std::string& name,
                             size_t nameAt) {
    ast::ASTNode ident;
    ident.id = fmt::format("{}-name-{}", prefix, name);
    ident.type = "identifier";
    ident.value = name;
    int line = source_.lineAt(nameAt);
    int column = core::columnAtOffset(content_, nameAt);
    ident.location = ast::FileLocation{filePath_, line, column, line,
                                       column + static_cast<int>(name.size())};
    node.children.insert(node.children.begin(), std::move(ident));
    nodes_.emplace_back(nameAt, std::move(node));
}

void SwiftExtractor::pushScope(const boost::cmatch& m, bool isType, std::string owner) {
    std::string_view code = source_.code();
    size_t end = offsetOf(m, 0) + static_cast<size_t>(m.length(0));
    size_t open = std::string::npos;
    if (end > 0 && code[end - 1] == '{') {
        open = end - 1;
    } else {
        size_t i = end;
        while (i < code.size() && std::isspace(static_cast<unsigned char>(code[i]))) {
            ++i;
        }
        if (i < code.size() && code[i] == '{') {
            open = i;
        }
    }
    if (open == std::string::npos) {
        return;
    }
    size_t close = source_.closingBrace(open);
    scopes_.push_back(
        Scope{open, close == std::string::npos ? code.size() : close, isType, std::move(owner)});
}

const SwiftExtractor::Scope* SwiftExtractor::innermostScope(size_t offset) const {
    const Scope* best = nullptr;
    for (const auto& scope : scopes_) {
        if (scope.open < offset && offset < scope.close && (!best || scope.open > best->open)) {
            best = &scope;
        }
    }
    return best;
}

void SwiftExtractor::extractImports() {
    forEachMatch(source_.code(), swiftPatterns().importDecl, [&](const boost::cmatch& m) {
        std::string path = group(m, 2);
        size_t at = offsetOf(m, 2);
        std::string module = path.substr(0, path.find('.'));
        int line = source_.lineAt(at);

        auto node = makeNode(fmt::format("import-{}-{}", module, line), "import_declaration", m, at);
        node.metadata["module"] = module;
        if (auto kind = group(m, 1); !kind.empty()) {
            node.metadata["import_kind"] = kind;
        }
        addNode(std::move(node), "import", path, at);
        return true;
    });
}

void SwiftExtractor::extractTypes() {
    forEachMatch(source_.code(), swiftPatterns().typeDecl, [&](const boost::cmatch& m) {
        std::string keyword = group(m, 2);
        std::string name = group(m, 3);
        std::string modifiers = group(m, 1);
        size_t at = offsetOf(m, 3);
        int line = source_.lineAt(at);

        auto node = makeNode(fmt::format("{}-{}-{}", keyword, name, line),
                             keyword + "_declaration", m, at);
        auto& md = node.metadata;
        setAccess(md, modifiers);
        md["is_final"] = hasWord(modifiers, "final");
        md["is_generic"] = m[4].matched;
        if (keyword == "actor") {
            md["is_actor"] = true;
        }
        if (keyword == "extension") {
            md["extended_type"] = name;
        }

        std::string clause = group(m, 5);
        std::string_view tail = core::trimView(clause);
        if (core::startsWith(tail, ":")) {
            tail.remove_prefix(1);
            size_t where = tail.find(" where ");
            if (where != std::string_view::npos) {
                md["where_clause"] = std::string(core::trimView(tail.substr(where + 7)));
                tail = tail.substr(0, where);
            }
            md["inherits"] = splitTypeList(tail);
        } else if (core::startsWith(tail, "where ")) {
            md["where_clause"] = std::string(core::trimView(tail.substr(6)));
        }

        pushScope(m, true, name);
        node.location.endLine = source_.lineAt(scopes_.empty() ? at : scopes_.back().close);
        addNode(std::move(node), keyword, name, at);
        return true;
    });
}

void SwiftExtractor::extractTypeAliases() {
    forEachMatch(source_.code(), swiftPatterns().typeAlias, [&](const boost::cmatch& m) {
        std::string name = group(m, 2);
        size_t at = offsetOf(m, 2);
        auto node = makeNode(fmt::format("typealias-{}-{}", name, source_.lineAt(at)),
                             "typealias_declaration", m, at);
        setAccess(node.metadata, group(m, 1));
        node.metadata["target_type"] = std::string(core::trimView(
            content_.substr(offsetOf(m, 4), static_cast<size_t>(m.length(4)))));
        node.metadata["is_generic"] = m[3].matched;
        addNode(std::move(node), "typealias", name, at);
        return true;
    });
}

void SwiftExtractor::extractAssociatedTypes() {
    forEachMatch(source_.code(), swiftPatterns().associatedType, [&](const boost::cmatch& m) {
        std::string name = group(m, 1);
        size_t at = offsetOf(m, 1);
        auto node = makeNode(fmt::format("associatedtype-{}-{}", name, source_.lineAt(at)),
                             "associatedtype_declaration", m, at);
        if (auto constraint = group(m, 2); !constraint.empty()) {
            node.metadata["constraint"] = std::string(core::trimView(constraint));
        }
        if (auto fallback = group(m, 3); !fallback.empty()) {
            node.metadata["default_type"] = std::string(core::trimView(fallback));
        }
        if (const Scope* scope = innermostScope(at)) {
            node.metadata["parent"] = scope->owner;
        }
        addNode(std::move(node), "associatedtype", name, at);
        return true;
    });
}

void SwiftExtractor::extractFunctions() {
    forEachMatch(source_.code(), swiftPatterns().function, [&](const boost::cmatch& m) {
        std::string name = group(m, 2);
        std::string modifiers = group(m, 1);
        std::string effects = group(m, 4);
        size_t at = offsetOf(m, 2);
        int line = source_.lineAt(at);

        const Scope* scope = innermostScope(offsetOf(m, 0));
        bool isMethod = scope ? scope->isType : source_.depthAt(offsetOf(m, 0)) > 0;
        bool isOperator = !name.empty() && !isIdentChar(name.front());

        auto node = isOperator
                        ? makeNode(fmt::format("operator-func-{}-{}", name, line),
                                   "operator_function_declaration", m, at)
                        : makeNode(fmt::format("func-{}-{}", name, line), "function_declaration",
                                   m, at);
        auto& md = node.metadata;
        setAccess(md, modifiers);
        md["is_method"] = isMethod;
        md["is_static"] = hasWord(modifiers, "static") || hasWord(modifiers, "class");
        md["is_async"] = hasWord(effects, "async");
        md["is_throwing"] = hasWord(effects, "throws") || hasWord(effects, "rethrows");
        if (hasWord(modifiers, "override")) {
            md["is_override"] = true;
        }
        if (hasWord(modifiers, "mutating")) {
            md["is_mutating"] = true;
        }
        if (auto returns = group(m, 5); !returns.empty()) {
            md["return_type"] = std::string(core::trimView(returns));
        }
        if (isOperator) {
            md["operator_symbol"] = name;
        }
        if (scope && scope->isType) {
            md["parent"] = scope->owner;
        }

        pushScope(m, false, name);
        addNode(std::move(node), isOperator ? "operator-func" : "func", name, at);
        return true;
    });
}

void SwiftExtractor::extractInitializers() {
    const auto& p = swiftPatterns();
    forEachMatch(source_.code(), p.initializer, [&](const boost::cmatch& m) {
        std::string modifiers = group(m, 1);
        std::string effects = group(m, 4);
        size_t at = offsetOf(m, 1) + static_cast<size_t>(m.length(1));
        auto node = makeNode(fmt::format("init-{}", source_.lineAt(at)), "init_declaration", m, at);
        auto& md = node.metadata;
        setAccess(md, modifiers);
        md["is_failable"] = m[2].matched;
        md["is_convenience"] = hasWord(modifiers, "convenience");
        md["is_required"] = hasWord(modifiers, "required");
        md["is_async"] = hasWord(effects, "async");
        md["is_throwing"] = hasWord(effects, "throws") || hasWord(effects, "rethrows");
        if (const Scope* scope = innermostScope(offsetOf(m, 0)); scope && scope->isType) {
            md["parent"] = scope->owner;
        }
        pushScope(m, false, "init");
        addNode(std::move(node), "init", "init", at);
        return true;
    });

    forEachMatch(source_.code(), p.deinitializer, [&](const boost::cmatch& m) {
        size_t at = offsetOf(m, 0) + static_cast<size_t>(m.str(0).find("deinit"));
        auto node =
            makeNode(fmt::format("deinit-{}", source_.lineAt(at)), "deinit_declaration", m, at);
        if (const Scope* scope = innermostScope(at); scope && scope->isType) {
            node.metadata["parent"] = scope->owner;
        }
        pushScope(m, false, "deinit");
        addNode(std::move(node), "deinit", "deinit", at);
        return true;
    });
}

void SwiftExtractor::extractSubscripts() {
    int index = 0;
    forEachMatch(source_.code(), swiftPatterns().subscript, [&](const boost::cmatch& m) {
        std::string modifiers = group(m, 1);
        size_t at = offsetOf(m, 1) + static_cast<size_t>(m.length(1));
        auto node = makeNode(fmt::format("subscript-{}-{}", index++, source_.lineAt(at)),
                             "subscript_declaration", m, at);
        auto& md = node.metadata;
        setAccess(md, modifiers);
        md["is_static"] = hasWord(modifiers, "static");
        md["return_type"] = std::string(core::trimView(group(m, 3)));
        if (const Scope* scope = innermostScope(at); scope && scope->isType) {
            md["parent"] = scope->owner;
        }
        pushScope(m, false, "subscript");
        addNode(std::move(node), "subscript", "subscript", at);
        return true;
    });
}

void SwiftExtractor::extractOperators() {
    forEachMatch(source_.code(), swiftPatterns().operatorDecl, [&](const boost::cmatch& m) {
        std::string op = group(m, 2);
        size_t at = offsetOf(m, 2);
        auto node = makeNode(fmt::format("operator-decl-{}-{}", op, source_.lineAt(at)),
                             "operator_declaration", m, at);
        node.metadata["fixity"] = group(m, 1);
        node.metadata["operator_symbol"] = op;
        if (auto precedence = group(m, 3); !precedence.empty()) {
            node.metadata["precedence_group"] = precedence;
        }
        addNode(std::move(node), "operator-decl", op, at);
        return true;
    });
}

void SwiftExtractor::extractProperties() {
    const auto& p = swiftPatterns();
    std::set<std::pair<std::string, int>> seen;
    forEachMatch(source_.code(), p.property, [&](const boost::cmatch& m) {
        std::string name = group(m, 3);
        std::string modifiers = group(m, 1);
        std::string declaredType(core::trimView(group(m, 4)));
        std::string terminator = group(m, 5);
        size_t at = offsetOf(m, 3);
        int line = source_.lineAt(at);

        const Scope* scope = innermostScope(at);
        if (scope && !scope->isType) {
            return true;
        }
        if (declaredType.empty() && terminator != "=") {
            return true;
        }
        if (!seen.emplace(name, line).second) {
            return true;
        }

        auto node = makeNode(fmt::format("property-{}-{}", name, line), "property_declaration",
                             m, at);
        auto& md = node.metadata;
        forEachMatch(modifiers, p.attribute, [&](const boost::cmatch& attr) {
            if (isPlainAttribute(group(attr, 1))) {
                return true;
            }
            md["wrapper"] = attr.str(0);
            md["is_wrapped"] = true;
            md["has_wrapper_args"] = attr[2].matched;
            return false;
        });
        if (terminator == "{") {
            md["is_computed"] = true;
        } else if (terminator == "=") {
            md["is_stored"] = true;
        }
        md["is_constant"] = group(m, 2) == "let";
        setAccess(md, modifiers);
        if (!declaredType.empty()) {
            md["declared_type"] = declaredType;
        }
        if (hasWord(modifiers, "static") || hasWord(modifiers, "class")) {
            md["is_static"] = true;
        }
        if (hasWord(modifiers, "lazy")) {
            md["is_lazy"] = true;
        }
        if (hasWord(modifiers, "weak")) {
            md["is_weak"] = true;
        }
        if (scope) {
            md["parent"] = scope->owner;
        }

        if (terminator == "{") {
            pushScope(m, false, name);
        }
        addNode(std::move(node), "property", name, at);
        return true;
    });
}

void SwiftExtractor::extractControlFlow() {
    const auto& p = swiftPatterns();
    auto emit = [&](const boost::regex& re, const char* prefix, const char* type) {
        int index = 0;
        forEachMatch(source_.code(), re, [&](const boost::cmatch& m) {
            size_t at = offsetOf(m, 0);
            auto node = makeNode(fmt::format("{}-{}-{}", prefix, index++, source_.lineAt(at)),
                                 type, m, at);
            nodes_.emplace_back(at, std::move(node));
            return true;
        });
    };
    emit(p.guardStatement, "guard", "guard_statement");
    emit(p.deferStatement, "defer", "defer_statement");
}

void SwiftExtractor::extractResultBuilders() {
    const auto& p = swiftPatterns();
    auto emit = [&](const boost::regex& re, const char* kind) {
        forEachMatch(source_.code(), re, [&](const boost::cmatch& m) {
            std::string name = group(m, 1);
            size_t at = offsetOf(m, 1);
            auto node = makeNode(fmt::format("result-builder-{}-{}", name, source_.lineAt(at)),
                                 "result_builder_declaration", m, at);
            node.metadata["builder_kind"] = kind;
            addNode(std::move(node), "result-builder", name, at);
            return true;
        });
    };
    emit(p.resultBuilder, "result_builder");
    emit(p.functionBuilder, "function_builder");
}

void SwiftExtractor::extractMacros() {
    forEachMatch(source_.code(), swiftPatterns().macroDecl, [&](const boost::cmatch& m) {
        std::string name = group(m, 1);
        size_t at = offsetOf(m, 1);
        auto node = makeNode(fmt::format("macro-{}-{}", name, source_.lineAt(at)),
                             "macro_declaration", m, at);
        node.metadata["is_attached"] = core::contains(m.str(0), "@attached");
        addNode(std::move(node), "macro", name, at);
        return true;
    });
}

int SwiftExtractor::countFeature(const boost::regex& re) const {
    return static_cast<int>(countMatches(source_.code(), re));
}

int SwiftExtractor::countTrailingClosures() const {
    std::string_view code = source_.code();
    int count = 0;
    forEachMatch(code, swiftPatterns().trailingClosure, [&](const boost::cmatch& m) {
        std::string name = m[1].matched ? group(m, 1) : group(m, 2);
        if (oneOf(name, kBlockKeywords)) {
            return true;
        }
        size_t start = offsetOf(m, 0);
        size_t lineStart = start == 0 ? std::string_view::npos : code.rfind('\n', start - 1);
        lineStart = lineStart == std::string_view::npos ? 0 : lineStart + 1;
        std::string_view prefix = code.substr(lineStart, start - lineStart);
        for (auto word : words(prefix)) {
            if (oneOf(word, kDeclarationTokens)) {
                return true;
            }
        }
        // "var body: some View {" is a computed property, not a call
        if (core::contains(prefix, ":") && !core::contains(prefix, "=")) {
            return true;
        }
        ++count;
        return true;
    });
    return count;
}

int SwiftExtractor::countNodes(std::string_view type) const {
    return static_cast<int>(std::count_if(nodes_.begin(), nodes_.end(), [&](const auto& entry) {
        return entry.second.type == type;
    }));
}

int SwiftExtractor::countByFlag(std::string_view type, const char* flag) const {
    return static_cast<int>(std::count_if(nodes_.begin(), nodes_.end(), [&](const auto& entry) {
        return entry.second.type == type && entry.second.metadata.value(flag, false);
    }));
}

void SwiftExtractor::analyzeClosures(nlohmann::json& md) const {
    const auto& p = swiftPatterns();
    int closures = countFeature(p.closure);
    int trailing = countTrailingClosures();
    int escaping = countFeature(p.escapingClosure);
    if (closures > 0 || trailing > 0 || escaping > 0) {
        md["has_closures"] = true;
        md["closure_count"] = closures;
        md["trailing_closure_count"] = trailing;
        md["escaping_closure_count"] = escaping;
    }
}

void SwiftExtractor::analyzeConcurrency(nlohmann::json& md) const {
    const auto& p = swiftPatterns();
    int asyncFunctions = countByFlag("function_declaration", "is_async") +
                         countByFlag("init_declaration", "is_async");
    int asyncProperties = countFeature(p.asyncProperty);
    int awaits = countFeature(p.awaitCall);
    if (asyncFunctions > 0 || asyncProperties > 0 || awaits > 0) {
        md["has_async_await"] = true;
        md["async_function_count"] = asyncFunctions;
        md["async_property_count"] = asyncProperties;
        md["await_call_count"] = awaits;
    }

    int sequences = countFeature(p.asyncSequence);
    int iterators = countFeature(p.asyncIterator);
    if (sequences > 0 || iterators > 0) {
        md["has_async_sequences"] = true;
        md["async_sequence_count"] = sequences;
        md["async_iterator_count"] = iterators;
    }
}

void SwiftExtractor::analyzeOptionals(nlohmann::json& md) const {
    const auto& p = swiftPatterns();
    int chaining = countFeature(p.optionalChaining);
    int binding = countFeature(p.optionalBinding);
    int coalescing = countFeature(p.nilCoalescing);
    int unwraps = countFeature(p.forceUnwrap);
    if (chaining > 0 || binding > 0 || coalescing > 0 || unwraps > 0) {
        md["has_optionals"] = true;
        md["optional_chaining_count"] = chaining;
        md["optional_binding_count"] = binding;
        md["nil_coalescing_count"] = coalescing;
        md["force_unwrap_count"] = unwraps;
    }
}

void SwiftExtractor::analyzeDeclarations(nlohmann::json& md) const {
    const auto& p = swiftPatterns();

    int guards = countNodes("guard_statement");
    int defers = countNodes("defer_statement");
    if (guards > 0 || defers > 0) {
        md["has_control_flow"] = true;
        md["guard_statement_count"] = guards;
        md["defer_statement_count"] = defers;
    }

    if (int subscripts = countNodes("subscript_declaration"); subscripts > 0) {
        md["has_subscripts"] = true;
        md["subscript_count"] = subscripts;
    }

    int operatorFunctions = countNodes("operator_function_declaration");
    int operatorDecls = countNodes("operator_declaration");
    if (operatorFunctions > 0 || operatorDecls > 0) {
        md["has_operators"] = true;
        md["operator_function_count"] = operatorFunctions;
        md["operator_declaration_count"] = operatorDecls;
    }

    int resultBuilders = countFeature(p.resultBuilder);
    int viewBuilders = countFeature(p.viewBuilder);
    int functionBuilders = countFeature(p.functionBuilder);
    if (resultBuilders > 0 || viewBuilders > 0 || functionBuilders > 0) {
        md["has_result_builders"] = true;
        md["result_builder_count"] = resultBuilders;
        md["view_builder_count"] = viewBuilders;
        md["function_builder_count"] = functionBuilders;
    }

    int macroDecls = countNodes("macro_declaration");
    int macroUsages = 0;
    forEachMatch(source_.code(), p.macroUsage, [&](const boost::cmatch& m) {
        if (!isDirectiveKeyword(group(m, 1))) {
            ++macroUsages;
        }
        return true;
    });
    if (macroDecls > 0 || macroUsages > 0) {
        md["has_macros"] = true;
        md["macro_declaration_count"] = macroDecls;
        md["macro_usage_count"] = macroUsages;
    }
}

void SwiftExtractor::detectFrameworks(nlohmann::json& md) const {
    std::set<std::string> modules;
    for (const auto& [offset, node] : nodes_) {
        if (node.type == "import_declaration") {
            modules.insert(node.metadata.value("module", std::string{}));
        }
    }
    auto imported = [&](const char* module) { return modules.count(module) > 0; };

    bool swiftUI = imported("SwiftUI");
    bool swiftData = imported("SwiftData");
    bool tca = imported("ComposableArchitecture") || imported("TCA");
    md["has_swiftui"] = swiftUI;
    md["has_uikit"] = imported("UIKit");
    md["has_vapor"] = imported("Vapor");
    md["has_combine"] = imported("Combine");
    md["has_swiftdata"] = swiftData;
    md["has_swift_testing"] = imported("Testing");
    md["has_tca"] = tca;
    // SwiftUI and SwiftData re-export Foundation
    md["has_foundation"] = imported("Foundation") || swiftUI || swiftData;

    constexpr std::array<std::pair<const char*, const char*>, 7> priority = {{
        {"has_swiftdata", "swiftdata"},
        {"has_swiftui", "swiftui"},
        {"has_tca", "tca"},
        {"has_vapor", "vapor"},
        {"has_uikit", "uikit"},
        {"has_swift_testing", "swift_testing"},
        {"has_combine", "combine"},
    }};
    md["primary_framework"] = "none";
    for (const auto& [flag, framework] : priority) {
        if (md.value(flag, false)) {
            md["primary_framework"] = framework;
            break;
        }
    }
}

std::vector<ast::ASTNode> SwiftExtractor::takeNodes() {
    std::stable_sort(nodes_.begin(), nodes_.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<ast::ASTNode> out;
    out.reserve(nodes_.size());
    for (auto& entry : nodes_) {
        out.push_back(std::move(entry.second));
    }
    nodes_.clear();
    return out;
}

} // namespace codectx::parser::swift

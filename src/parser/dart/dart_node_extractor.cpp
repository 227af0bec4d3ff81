#include <codectx/parser/dart/dart_node_extractor.h>
#include <codectx/parser/dart/dart_patterns.h>
#include <codectx/parser/dart/flutter_analyzer.h>
#include <codectx/parser/regex_util.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

#include <fmt/format.h>

namespace codectx::parser::dart {

namespace {

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

const std::string& nodeName(const ast::ASTNode& node) {
    static const std::string empty;
    return node.children.empty() ? empty : node.children.front().value;
}

/**
 * @brief Append node, or replace a node of a replaceable type declaring the same
 * name on the same line. Returns true when the node was appended.
 */
bool addOrReplace(std::vector<ast::ASTNode>& nodes, ast::ASTNode node,
                  std::initializer_list<std::string_view> replaceable) {
    for (auto& existing : nodes) {
        if (existing.location.line != node.location.line || nodeName(existing) != nodeName(node)) {
            continue;
        }
        if (std::find(replaceable.begin(), replaceable.end(), existing.type) != replaceable.end()) {
            existing = std::move(node);
            return false;
        }
    }
    nodes.push_back(std::move(node));
    return true;
}

// Parameter lists open before the captured name mean the '=' is a default value
bool insideParameterList(const boost::cmatch& m, int nameGroup) {
    std::string_view prefix(m[0].first, static_cast<size_t>(m[nameGroup].first - m[0].first));
    int depth = 0;
    for (char c : prefix) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }
    }
    return depth > 0;
}

std::string baseName(std::string name) {
    auto lt = name.find('<');
    if (lt != std::string::npos) {
        name.erase(lt);
    }
    return name;
}

std::vector<std::string> splitList(std::string_view list) {
    std::vector<std::string> out;
    int angle = 0;
    size_t start = 0;
    for (size_t i = 0; i <= list.size(); ++i) {
        char c = i < list.size() ? list[i] : ',';
        if (c == '<') {
            ++angle;
        } else if (c == '>') {
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

const char* lifecycleStage(std::string_view name) {
    if (name == "initState" || name == "didChangeDependencies") {
        return "initialization";
    }
    if (name == "didUpdateWidget") {
        return "update";
    }
    if (name == "dispose") {
        return "disposal";
    }
    return "unknown";
}

// Fills class metadata from the declaration text; true for State<T> subclasses
bool classMetadata(const std::string& decl, nlohmann::json& md) {
    const auto& p = dartPatterns();
    boost::smatch cm;
    if (boost::regex_search(decl, cm, p.classModifier)) {
        md["modifier"] = cm[1].str();
    }
    md["is_abstract"] = boost::regex_search(decl, p.abstractClass);
    if (boost::regex_search(decl, cm, p.extendsClause)) {
        md["extends"] = cm[1].str();
    }
    md["mixins"] = nlohmann::json::array();
    if (boost::regex_search(decl, cm, p.withClause)) {
        md["mixins"] = splitList(cm[1].str());
    }

    bool isState = boost::regex_search(decl, p.stateClass);
    if (isState) {
        md["flutter_type"] = "state_class";
        return true;
    }
    auto kind = FlutterAnalyzer::widgetKind(decl);
    if (!kind.empty()) {
        md["widget_type"] = kind;
        md["flutter_type"] = "widget";
    }
    return false;
}

bool hasChildOfType(const ast::ASTNode& node, std::string_view type) {
    return std::any_of(node.children.begin(), node.children.end(),
                       [&](const ast::ASTNode& c) { return c.type == type; });
}

} // namespace

BraceDepths::BraceDepths(std::string_view text) : index_(text) {
    int depth = 0;
    depths_.reserve(static_cast<size_t>(index_.lineCount()));
    depths_.push_back(0);
    for (char c : text) {
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
        } else if (c == '\n') {
            depths_.push_back(depth);
        }
    }
}

int BraceDepths::depthAt(size_t offset) const {
    auto line = static_cast<size_t>(index_.lineAt(offset));
    return line == 0 || line > depths_.size() ? 0 : depths_[line - 1];
}

DartNodeExtractor::DartNodeExtractor(std::string_view content, std::string filePath,
                                     bool asyncAnalysis, int baseLine, size_t baseOffset)
    : content_(content), filePath_(std::move(filePath)), asyncAnalysis_(asyncAnalysis),
      baseLine_(baseLine), baseOffset_(baseOffset), scan_(content) {}

size_t DartNodeExtractor::offsetOf(const boost::cmatch& m, int group) const {
    return groupOffset(m, group, content_.data());
}

ast::ASTNode DartNodeExtractor::makeNode(std::string id, std::string type, const boost::cmatch& m,
                                         int line) const {
    ast::ASTNode node;
    node.id = std::move(id);
    node.type = std::move(type);
    node.value = m.str(0);
    node.location = ast::FileLocation{filePath_, line, 1, line,
                                      static_cast<int>(node.value.size()) + 1};
    return node;
}

ast::ASTNode DartNodeExtractor::makeLeaf(std::string id, std::string type, std::string value,
                                         int line) const {
    ast::ASTNode node;
    node.id = std::move(id);
    node.type = std::move(type);
    node.location = ast::FileLocation{filePath_, line, 1, line,
                                      static_cast<int>(value.size()) + 1};
    node.value = std::move(value);
    return node;
}

std::string_view DartNodeExtractor::bodyAfter(const boost::cmatch& m, int* endLine) const {
    size_t open = offsetOf(m, 0) + static_cast<size_t>(m.length(0)) - 1;
    if (open >= content_.size() || content_[open] != '{') {
        *endLine = lineOf(offsetOf(m, 0));
        return {};
    }
    size_t close = core::findMatchingBrace(content_, open);
    if (close == std::string_view::npos) {
        *endLine = lineOf(content_.size());
        return content_.substr(open + 1);
    }
    *endLine = lineOf(close);
    return content_.substr(open + 1, close - open - 1);
}

void DartNodeExtractor::extractImports() {
    forEachMatch(content_, dartPatterns().importDirective, [&](const boost::cmatch& m) {
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("import-{}", line), "import_statement", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("import-path-{}", line), "string_literal", group(m, 1), line));
        if (auto alias = group(m, 2); !alias.empty()) {
            node.metadata["alias"] = alias;
        }
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractClasses() {
    forEachMatch(content_, dartPatterns().classDecl, [&](const boost::cmatch& m) {
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        nlohmann::json md = nlohmann::json::object();
        bool isState = classMetadata(m.str(0), md);

        auto node = makeNode(fmt::format("class-{}-{}", name, line),
                             isState ? "state_class_declaration" : "class_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("class-name-{}", name), "identifier", name, line));

        int endLine = line;
        auto members = extractMembers(bodyAfter(m, &endLine), name);
        node.location.endLine = endLine;
        for (auto& member : members) {
            node.children.push_back(std::move(member));
        }

        md["has_build_method"] = hasChildOfType(node, "build_method");
        if (isState) {
            md["has_lifecycle_methods"] = hasChildOfType(node, "lifecycle_method");
        }
        node.metadata = std::move(md);
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractMixins() {
    const auto& p = dartPatterns();
    forEachMatch(content_, p.mixin, [&](const boost::cmatch& m) {
        std::string name = baseName(group(m, 1));
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("mixin-{}-{}", name, line), "mixin_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("mixin-name-{}", name), "identifier", name, line));

        std::string decl = m.str(0);
        boost::smatch cm;
        bool constrained = boost::regex_search(decl, cm, p.mixinConstraint);
        node.metadata["has_constraint"] = constrained;
        node.metadata["constraint_type"] = constrained ? std::string(core::trimView(cm.str(1)))
                                                       : std::string{};

        int endLine = line;
        for (auto& member : extractMembers(bodyAfter(m, &endLine), name)) {
            node.children.push_back(std::move(member));
        }
        node.location.endLine = endLine;
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractExtensions() {
    forEachMatch(content_, dartPatterns().extension, [&](const boost::cmatch& m) {
        std::string name = baseName(group(m, 1));
        int line = lineOf(offsetOf(m, 2));
        bool unnamed = name.empty();
        if (unnamed) {
            name = fmt::format("Extension{}", line);
        } else {
            line = lineOf(offsetOf(m, 1));
        }
        std::string target(core::trimView(group(m, 2)));

        auto node = makeNode(fmt::format("extension-{}-{}", name, line), "extension_declaration",
                             m, line);
        node.children.push_back(
            makeLeaf(fmt::format("extension-name-{}", name), "identifier", name, line));
        node.children.push_back(
            makeLeaf(fmt::format("extension-target-{}", target), "type_identifier", target, line));
        node.metadata["extends_type"] = target;
        node.metadata["is_unnamed"] = unnamed;

        int endLine = line;
        for (auto& member : extractMembers(bodyAfter(m, &endLine), name)) {
            node.children.push_back(std::move(member));
        }
        node.location.endLine = endLine;
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractEnums() {
    forEachMatch(content_, dartPatterns().enumDecl, [&](const boost::cmatch& m) {
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("enum-{}-{}", name, line), "enum_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("enum-name-{}", name), "identifier", name, line));

        int endLine = line;
        std::string_view body = bodyAfter(m, &endLine);
        node.location.endLine = endLine;

        size_t membersStart = std::string_view::npos;
        auto values = extractEnumValues(body, &membersStart);
        bool valuesHaveArgs = std::any_of(values.begin(), values.end(), [](const auto& v) {
            return v.value.find('(') != std::string::npos;
        });
        int valueCount = static_cast<int>(values.size());
        for (auto& value : values) {
            node.children.push_back(std::move(value));
        }

        bool hasMethods = false;
        if (membersStart != std::string_view::npos) {
            for (auto& member : extractMembers(body.substr(membersStart), name)) {
                hasMethods = hasMethods || member.type != "variable_declaration";
                node.children.push_back(std::move(member));
            }
        }

        std::string decl = m.str(0);
        node.metadata["is_enhanced"] = membersStart != std::string_view::npos || valuesHaveArgs ||
                                       core::contains(decl, "implements") ||
                                       core::contains(decl, " with ");
        node.metadata["value_count"] = valueCount;
        node.metadata["has_methods"] = hasMethods;
        nodes_.push_back(std::move(node));
        return true;
    });
}

std::vector<ast::ASTNode> DartNodeExtractor::extractEnumValues(std::string_view body,
                                                               size_t* membersStart) {
    std::vector<ast::ASTNode> values;
    size_t bodyBase = static_cast<size_t>(body.data() - content_.data());

    auto emitEntry = [&](size_t begin, size_t end) {
        size_t i = begin;
        while (i < end) {
            char c = body[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
            } else if (body.substr(i, 2) == "//") {
                size_t nl = body.find('\n', i);
                i = nl == std::string_view::npos || nl > end ? end : nl + 1;
            } else if (body.substr(i, 2) == "/*") {
                size_t close = body.find("*/", i + 2);
                i = close == std::string_view::npos || close > end ? end : close + 2;
            } else if (c == '@') {
                ++i;
                while (i < end && isIdentChar(body[i])) {
                    ++i;
                }
            } else {
                break;
            }
        }
        size_t nameEnd = i;
        while (nameEnd < end && isIdentChar(body[nameEnd])) {
            ++nameEnd;
        }
        if (nameEnd == i) {
            return;
        }
        std::string valueName(body.substr(i, nameEnd - i));
        int line = lineOf(bodyBase + i);
        auto node = makeLeaf(fmt::format("enum-value-{}-{}", valueName, line), "enum_value",
                             std::string(core::trimView(body.substr(i, end - i))), line);
        node.children.push_back(
            makeLeaf(fmt::format("enum-value-name-{}", valueName), "identifier", valueName, line));
        values.push_back(std::move(node));
    };

    int parens = 0;
    int braces = 0;
    size_t entryStart = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '(' || c == '[') {
            ++parens;
        } else if (c == ')' || c == ']') {
            --parens;
        } else if (c == '{') {
            ++braces;
        } else if (c == '}') {
            --braces;
        } else if (parens == 0 && braces == 0 && (c == ',' || c == ';')) {
            emitEntry(entryStart, i);
            entryStart = i + 1;
            if (c == ';') {
                *membersStart = i + 1;
                return values;
            }
        }
    }
    emitEntry(entryStart, body.size());
    return values;
}

void DartNodeExtractor::extractTypedefs() {
    const auto& p = dartPatterns();
    forEachMatch(content_, p.typedefDecl, [&](const boost::cmatch& m) {
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        std::string target(core::trimView(group(m, 2)));
        bool functionType = boost::regex_search(m[0].first, m[0].second, p.functionTypedef);

        auto node = makeNode(fmt::format("typedef-{}-{}", name, line),
                             functionType ? "function_typedef" : "typedef_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("typedef-name-{}", name), "identifier", name, line));
        node.children.push_back(
            makeLeaf(fmt::format("typedef-target-{}", line), "type_identifier", target, line));
        node.metadata["target_type"] = target;
        node.metadata["is_function_type"] =
            core::contains(target, "Function") || core::contains(target, "(");
        node.metadata["is_generic"] = core::contains(node.value, "<");
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractFunctions() {
    forEachMatch(content_, dartPatterns().function, [&](const boost::cmatch& m) {
        if (scan_.depthAt(offsetOf(m, 0)) != 0) {
            return true;
        }
        std::string name = group(m, 1);
        if (isControlFlowKeyword(name)) {
            return true;
        }
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("function-{}-{}", name, line), "function_declaration", m,
                             line);
        node.children.push_back(
            makeLeaf(fmt::format("function-name-{}", name), "identifier", name, line));
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractAsyncFunctions() {
    if (!asyncAnalysis_) {
        return;
    }
    const auto& p = dartPatterns();
    auto collect = [&](const boost::regex& re, const char* idPrefix, const char* type,
                       const char* asyncType) {
        forEachMatch(content_, re, [&](const boost::cmatch& m) {
            if (scan_.depthAt(offsetOf(m, 0)) != 0) {
                return true;
            }
            std::string name = group(m, 1);
            if (isControlFlowKeyword(name)) {
                return true;
            }
            int line = lineOf(offsetOf(m, 1));
            auto node = makeNode(fmt::format("{}-{}-{}", idPrefix, name, line), type, m, line);
            node.children.push_back(
                makeLeaf(fmt::format("{}-name-{}", idPrefix, name), "identifier", name, line));
            node.metadata["async_type"] = asyncType;
            addOrReplace(nodes_, std::move(node), {"function_declaration"});
            return true;
        });
    };
    collect(p.asyncGenerator, "async-generator", "async_generator", "Generator");
    collect(p.asyncFunction, "async-function", "async_function", "Function");
}

void DartNodeExtractor::extractVariables() {
    forEachMatch(content_, dartPatterns().variable, [&](const boost::cmatch& m) {
        if (scan_.depthAt(offsetOf(m, 0)) != 0 || insideParameterList(m, 1)) {
            return true;
        }
        std::string name = group(m, 1);
        if (isControlFlowKeyword(name)) {
            return true;
        }
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("variable-{}-{}", name, line), "variable_declaration", m,
                             line);
        node.children.push_back(
            makeLeaf(fmt::format("variable-name-{}", name), "identifier", name, line));
        nodes_.push_back(std::move(node));
        return true;
    });
}

void DartNodeExtractor::extractPartDirectives() {
    const auto& p = dartPatterns();
    forEachMatch(content_, p.partDirective, [&](const boost::cmatch& m) {
        std::string file = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("part-{}-{}", file, line), "part_directive", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("part-file-{}", file), "string_literal", file, line));
        nodes_.push_back(std::move(node));
        return true;
    });
    forEachMatch(content_, p.partOfDirective, [&](const boost::cmatch& m) {
        int targetGroup = m[1].matched ? 1 : 2;
        std::string target = group(m, targetGroup);
        if (target.empty()) {
            return true;
        }
        int line = lineOf(offsetOf(m, targetGroup));
        auto node = makeNode(fmt::format("part-of-{}-{}", target, line), "part_of_directive", m,
                             line);
        node.children.push_back(
            makeLeaf(fmt::format("part-of-target-{}", target), "identifier", target, line));
        nodes_.push_back(std::move(node));
        return true;
    });
}

std::vector<ast::ASTNode> DartNodeExtractor::extractMembers(std::string_view body,
                                                            const std::string& owner) {
    std::vector<ast::ASTNode> members;
    if (body.empty()) {
        return members;
    }
    const auto& p = dartPatterns();
    BraceDepths local(body);
    auto atTopOfBody = [&](const boost::cmatch& m) {
        return local.depthAt(static_cast<size_t>(m[0].first - body.data())) == 0;
    };

    forEachMatch(body, p.method, [&](const boost::cmatch& m) {
        if (!atTopOfBody(m)) {
            return true;
        }
        std::string name = group(m, 1);
        if (name == owner || isControlFlowKeyword(name)) {
            return true;
        }
        std::string text = m.str(0);
        if (std::isupper(static_cast<unsigned char>(name.front())) &&
            core::contains(text, name + "(")) {
            return true;
        }
        int line = lineOf(offsetOf(m, 1));
        bool isBuild = name == "build" && boost::regex_search(text, p.buildMethod);
        auto node = makeNode(fmt::format("method-{}-{}", name, line),
                             isBuild ? "build_method" : "method_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("method-name-{}", name), "identifier", name, line));
        if (isBuild) {
            node.metadata["flutter_type"] = "build_method";
            node.metadata["has_override"] = core::contains(text, "@override");
        }
        members.push_back(std::move(node));
        return true;
    });

    forEachMatch(body, p.lifecycleMethod, [&](const boost::cmatch& m) {
        if (!atTopOfBody(m)) {
            return true;
        }
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("lifecycle-{}-{}", name, line), "lifecycle_method", m,
                             line);
        node.children.push_back(
            makeLeaf(fmt::format("lifecycle-name-{}", name), "identifier", name, line));
        node.metadata["flutter_type"] = "lifecycle_method";
        node.metadata["lifecycle_stage"] = name;
        node.metadata["has_override"] = true;
        node.metadata["widget_lifecycle"] = lifecycleStage(name);
        addOrReplace(members, std::move(node), {"method_declaration"});
        return true;
    });

    if (asyncAnalysis_) {
        forEachMatch(body, p.asyncMethod, [&](const boost::cmatch& m) {
            if (!atTopOfBody(m)) {
                return true;
            }
            std::string name = group(m, 1);
            if (name == owner || isControlFlowKeyword(name)) {
                return true;
            }
            int line = lineOf(offsetOf(m, 1));
            auto node = makeNode(fmt::format("async-method-{}-{}", name, line), "async_method", m,
                                 line);
            node.children.push_back(
                makeLeaf(fmt::format("async-method-name-{}", name), "identifier", name, line));
            node.metadata["async_type"] = "method";
            node.metadata["return_type"] = "Future";
            addOrReplace(members, std::move(node), {"method_declaration"});
            return true;
        });
    }

    forEachMatch(body, p.higherOrderFunction, [&](const boost::cmatch& m) {
        if (!atTopOfBody(m)) {
            return true;
        }
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("higher-order-method-{}-{}", name, line),
                             "higher_order_method", m, line);
        node.children.push_back(makeLeaf(fmt::format("higher-order-method-name-{}", name),
                                         "identifier", name, line));
        node.metadata["functional_type"] = "higher_order";
        node.metadata["pattern_name"] = name;
        addOrReplace(members, std::move(node), {"method_declaration", "async_method"});
        return true;
    });

    forEachMatch(body, p.closureFactory, [&](const boost::cmatch& m) {
        if (!atTopOfBody(m)) {
            return true;
        }
        std::string name = group(m, 1);
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("closure-factory-{}-{}", name, line), "closure_factory",
                             m, line);
        node.children.push_back(
            makeLeaf(fmt::format("closure-factory-name-{}", name), "identifier", name, line));
        node.metadata["functional_type"] = "closure_factory";
        addOrReplace(members, std::move(node), {"method_declaration"});
        return true;
    });

    forEachMatch(body, p.variable, [&](const boost::cmatch& m) {
        if (!atTopOfBody(m) || insideParameterList(m, 1)) {
            return true;
        }
        std::string name = group(m, 1);
        if (isControlFlowKeyword(name)) {
            return true;
        }
        int line = lineOf(offsetOf(m, 1));
        auto node = makeNode(fmt::format("class-variable-{}-{}", name, line),
                             "variable_declaration", m, line);
        node.children.push_back(
            makeLeaf(fmt::format("class-variable-name-{}", name), "identifier", name, line));
        members.push_back(std::move(node));
        return true;
    });

    return members;
}

size_t DartNodeExtractor::extractPattern(std::string_view patternName, size_t limit, size_t cap,
                                         bool idByOffset) {
    const boost::regex* re = patternByName(patternName);
    if (!re) {
        return 0;
    }
    bool topLevelOnly = patternName == "function" || patternName == "asyncFunction" ||
                        patternName == "asyncGenerator";
    bool isAsync = patternName == "asyncFunction" || patternName == "asyncGenerator";
    std::string nodeType(nodeTypeForPattern(patternName));

    size_t added = 0;
    forEachMatch(content_, *re, [&](const boost::cmatch& m) {
        if (added >= limit || nodes_.size() >= cap) {
            return false;
        }
        size_t start = offsetOf(m, 0);
        if (topLevelOnly && scan_.depthAt(start) != 0) {
            return true;
        }
        std::string name = group(m, 1);
        if (patternName == "mixin" || patternName == "extension") {
            name = baseName(std::move(name));
        }
        int line = lineOf(offsetOf(m, name.empty() ? 0 : 1));
        if (name.empty()) {
            if (patternName != "extension") {
                return true;
            }
            name = fmt::format("Extension{}", line);
        }
        if (topLevelOnly && isControlFlowKeyword(name)) {
            return true;
        }

        std::string id = idByOffset
                             ? fmt::format("{}-{}-{}", patternName, name, baseOffset_ + start)
                             : fmt::format("{}-{}-{}", patternName, name, line);
        auto node = makeNode(std::move(id), nodeType, m, line);
        if (patternName == "class" && classMetadata(node.value, node.metadata)) {
            node.type = "state_class_declaration";
        }
        node.children.push_back(makeLeaf(fmt::format("{}-name-{}", patternName, name),
                                         patternName == "import" ? "string_literal" : "identifier",
                                         name, line));
        if (isAsync) {
            node.metadata["async_type"] = patternName == "asyncFunction" ? "Function" : "Generator";
            if (addOrReplace(nodes_, std::move(node), {"function_declaration"})) {
                ++added;
            }
        } else {
            nodes_.push_back(std::move(node));
            ++added;
        }
        return true;
    });
    return added;
}

void DartNodeExtractor::annotateRoot(nlohmann::json& metadata, std::string_view content,
                                     bool asyncAnalysis) {
    const auto& p = dartPatterns();

    auto tries = countMatches(content, p.tryBlock);
    auto catches = countMatches(content, p.catchBlock);
    auto finallies = countMatches(content, p.finallyBlock);
    auto throws = countMatches(content, p.throwStatement);
    auto rethrows = countMatches(content, p.rethrowStatement);
    metadata["has_error_handling"] = tries + catches + finallies + throws + rethrows > 0;
    metadata["try_count"] = tries;
    metadata["catch_count"] = catches;
    metadata["finally_count"] = finallies;
    metadata["throw_count"] = throws;
    metadata["rethrow_count"] = rethrows;

    auto switches = countMatches(content, p.switchBlock);
    auto cases = countMatches(content, p.casePattern);
    metadata["has_pattern_matching"] = switches + cases > 0;
    metadata["switch_count"] = switches;
    metadata["case_pattern_count"] = cases;

    auto records = countMatches(content, p.recordType) + countMatches(content, p.namedRecord);
    metadata["has_records"] = records > 0;
    metadata["record_count"] = records;

    if (!asyncAnalysis) {
        return;
    }
    auto asyncFunctions =
        countMatches(content, p.asyncFunction) + countMatches(content, p.asyncMethod);
    auto generators = countMatches(content, p.asyncGenerator);
    auto awaits = countMatches(content, p.awaitKeyword);
    auto streams = countMatches(content, p.stream);
    metadata["has_async"] = asyncFunctions + generators + awaits + streams > 0;
    metadata["async_function_count"] = asyncFunctions;
    metadata["async_generator_count"] = generators;
    metadata["await_count"] = awaits;
    metadata["stream_count"] = streams;
}

} // namespace codectx::parser::dart

#include <codectx/core/text.h>
#include <codectx/parser/cpp/cpp_features.h>

#include <array>
#include <utility>

namespace codectx::parser::cpp {

using core::contains;

namespace {

constexpr std::array<std::string_view, 8> kCoreFeatures = {
    "has_classes",      "has_structs",     "has_functions",   "has_namespaces",
    "has_constructors", "has_destructors", "has_inheritance", "has_includes"};

constexpr std::array<std::string_view, 7> kP1Features = {
    "has_templates",      "has_auto_keyword", "has_lambdas",          "has_range_for",
    "has_smart_pointers", "has_constexpr",    "has_operator_overload"};

constexpr std::array<std::string_view, 5> kP2Features = {
    "has_concepts", "has_structured_binding", "has_if_constexpr", "has_coroutines",
    "has_modules"};

constexpr std::array<std::string_view, 5> kFrameworkFeatures = {
    "has_qt", "has_boost", "has_opencv", "has_unreal", "has_stl"};

struct NodeKindFlag {
    std::string_view nodeType;
    std::string_view flag;
};

constexpr std::array<NodeKindFlag, 6> kNodeKindFlags = {{
    {"class_specifier", "has_classes"},
    {"struct_specifier", "has_structs"},
    {"function_definition", "has_functions"},
    {"namespace_definition", "has_namespaces"},
    {"preproc_include", "has_includes"},
    {"template_declaration", "has_templates"},
}};

template <size_t N>
bool containsAny(std::string_view content, const std::array<std::string_view, N>& tokens) {
    for (auto token : tokens) {
        if (contains(content, token)) {
            return true;
        }
    }
    return false;
}

// Iterative pre-order walk; deep trees never recurse
void detectFromTree(TSNode root, nlohmann::json& features) {
    if (ts_node_is_null(root)) {
        return;
    }
    TSTreeCursor cursor = ts_tree_cursor_new(root);
    bool descending = true;
    while (true) {
        if (descending) {
            std::string_view type = ts_node_type(ts_tree_cursor_current_node(&cursor));
            for (const auto& entry : kNodeKindFlags) {
                if (type == entry.nodeType) {
                    features[std::string(entry.flag)] = true;
                }
            }
            if (ts_tree_cursor_goto_first_child(&cursor)) {
                continue;
            }
        }
        if (ts_tree_cursor_goto_next_sibling(&cursor)) {
            descending = true;
            continue;
        }
        if (!ts_tree_cursor_goto_parent(&cursor)) {
            break;
        }
        descending = false;
    }
    ts_tree_cursor_delete(&cursor);
}

bool detectInheritance(std::string_view content) {
    return contains(content, " : ") && (contains(content, "class ") || contains(content, "struct "));
}

bool detectLambdas(std::string_view content) {
    return contains(content, "[") && contains(content, "](") &&
           (contains(content, "{") || contains(content, "->"));
}

bool detectRangeBasedFor(std::string_view content) {
    return contains(content, "for (") && contains(content, " : ") && !contains(content, "for (;;");
}

bool detectSmartPointers(std::string_view content) {
    constexpr std::array<std::string_view, 5> pointers = {"unique_ptr", "shared_ptr", "weak_ptr",
                                                          "make_unique", "make_shared"};
    return containsAny(content, pointers);
}

bool detectConcepts(std::string_view content) {
    return contains(content, "concept ") &&
           (contains(content, "requires") || contains(content, "std::integral") ||
            contains(content, "std::floating_point") || contains(content, "= "));
}

bool detectStructuredBinding(std::string_view content) {
    return contains(content, "auto [") && contains(content, "] =");
}

bool detectCoroutines(std::string_view content) {
    constexpr std::array<std::string_view, 3> keywords = {"co_await", "co_return", "co_yield"};
    return containsAny(content, keywords);
}

bool detectModules(std::string_view content) {
    return (contains(content, "import ") && !contains(content, "#include")) ||
           contains(content, "module ");
}

} // namespace

bool PatternValidator::isValidDeclaration(std::string_view line) const {
    line = core::trimView(line);
    if (core::startsWith(line, "//") || core::startsWith(line, "#")) {
        return false;
    }
    for (auto pattern : exclude_) {
        if (contains(line, pattern)) {
            return false;
        }
    }
    for (auto pattern : include_) {
        if (contains(line, pattern)) {
            return true;
        }
    }
    return false;
}

bool PatternValidator::validateDeclarationLines(std::string_view content) const {
    for (auto line : core::splitLines(content)) {
        if (isValidDeclaration(line)) {
            return true;
        }
    }
    return false;
}

bool detectConstructors(std::string_view content) {
    static const PatternValidator validator(
        {"return ", "if (", "while (", "for (", "switch (", "sizeof(", "typeof(", "decltype(",
         "#define", "#include"},
        {" : ", "{}", "= default", "= delete", "explicit ", "constexpr ", "noexcept", "[["});
    return validator.validateDeclarationLines(content);
}

bool detectDestructors(std::string_view content) {
    if (!contains(content, "~")) {
        return false;
    }
    static const PatternValidator validator(
        {"return ", "if (", "while (", "for (", "switch (", "& ~", "| ~", "^ ~", "= ~", "( ~"},
        {"virtual ~", "~", "= default", "= delete", "noexcept"});
    return validator.validateDeclarationLines(content);
}

nlohmann::json detectSpecialMemberFunctions(std::string_view content) {
    nlohmann::json features = {
        {"has_copy_constructor", false},    {"has_move_constructor", false},
        {"has_copy_assignment", false},     {"has_move_assignment", false},
        {"has_default_constructor", false}, {"has_explicit_constructor", false},
        {"has_constexpr_constructor", false},
    };

    for (auto raw : core::splitLines(content)) {
        auto line = core::trimView(raw);
        if (core::startsWith(line, "//") || core::startsWith(line, "#")) {
            continue;
        }

        if ((contains(line, "(const ") && contains(line, "&")) || contains(line, "= default")) {
            features["has_copy_constructor"] = true;
        }
        if (contains(line, "&&") && contains(line, "(")) {
            features["has_move_constructor"] = true;
        }
        if (contains(line, "operator=")) {
            if (contains(line, "&&")) {
                features["has_move_assignment"] = true;
            } else if (contains(line, "&")) {
                features["has_copy_assignment"] = true;
            }
        }
        if (contains(line, "= default") && contains(line, "(")) {
            features["has_default_constructor"] = true;
        }
        if (contains(line, "explicit ")) {
            features["has_explicit_constructor"] = true;
        }
        if (contains(line, "constexpr ") && contains(line, "(")) {
            features["has_constexpr_constructor"] = true;
        }
    }
    return features;
}

void detectFrameworks(std::string_view content, nlohmann::json& features) {
    constexpr std::array<std::string_view, 5> qt = {"#include <Q", "QObject", "Q_OBJECT", "SIGNAL",
                                                    "SLOT"};
    constexpr std::array<std::string_view, 3> boost = {"#include <boost/", "boost::", "BOOST_"};
    constexpr std::array<std::string_view, 3> opencv = {"#include <opencv2/", "cv::", "cv::Mat"};
    constexpr std::array<std::string_view, 4> unreal = {"UCLASS", "UFUNCTION", "UPROPERTY",
                                                        "#include \"CoreMinimal.h\""};
    constexpr std::array<std::string_view, 4> stl = {"std::", "#include <vector>",
                                                     "#include <string>", "#include <memory>"};

    if (containsAny(content, qt)) {
        features["has_qt"] = true;
    }
    if (containsAny(content, boost)) {
        features["has_boost"] = true;
    }
    if (containsAny(content, opencv)) {
        features["has_opencv"] = true;
    }
    if (containsAny(content, unreal)) {
        features["has_unreal"] = true;
    }
    if (containsAny(content, stl)) {
        features["has_stl"] = true;
    }
}

nlohmann::json detectCppFeatures(TSNode root, std::string_view content) {
    nlohmann::json features = nlohmann::json::object();
    for (auto flag : kCoreFeatures) {
        features[std::string(flag)] = false;
    }
    for (auto flag : kP1Features) {
        features[std::string(flag)] = false;
    }
    for (auto flag : kP2Features) {
        features[std::string(flag)] = false;
    }
    for (auto flag : kFrameworkFeatures) {
        features[std::string(flag)] = false;
    }

    detectFromTree(root, features);

    if (contains(content, "auto ")) {
        features["has_auto_keyword"] = true;
    }
    if (contains(content, "constexpr")) {
        features["has_constexpr"] = true;
    }
    if (contains(content, "operator")) {
        features["has_operator_overload"] = true;
    }

    if (detectConstructors(content)) {
        features["has_constructors"] = true;
    }
    if (detectDestructors(content)) {
        features["has_destructors"] = true;
    }
    auto special = detectSpecialMemberFunctions(content);
    for (auto& [key, value] : special.items()) {
        features[key] = value;
    }
    if (detectInheritance(content)) {
        features["has_inheritance"] = true;
    }
    if (detectLambdas(content)) {
        features["has_lambdas"] = true;
    }
    if (detectRangeBasedFor(content)) {
        features["has_range_for"] = true;
    }
    if (detectSmartPointers(content)) {
        features["has_smart_pointers"] = true;
    }
    if (detectConcepts(content)) {
        features["has_concepts"] = true;
    }
    if (detectStructuredBinding(content)) {
        features["has_structured_binding"] = true;
    }
    if (contains(content, "if constexpr")) {
        features["has_if_constexpr"] = true;
    }
    if (detectCoroutines(content)) {
        features["has_coroutines"] = true;
    }
    if (detectModules(content)) {
        features["has_modules"] = true;
    }
    detectFrameworks(content, features);
    return features;
}

} // namespace codectx::parser::cpp

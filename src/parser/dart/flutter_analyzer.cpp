#include <codectx/core/text.h>
#include <codectx/parser/dart/flutter_analyzer.h>
#include <codectx/parser/regex_util.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace codectx::parser::dart {

namespace {

struct WidgetPattern {
    const char* kind;
    boost::regex re;
    bool checksBuild;
};

constexpr std::array<std::string_view, 5> kFeatureWidgets = {
    "MaterialApp", "CupertinoApp", "Scaffold", "AppBar", "FloatingActionButton"};

constexpr std::array<std::string_view, 4> kLifecycleMethods = {
    "initState", "dispose", "didUpdateWidget", "didChangeDependencies"};

struct NamedPattern {
    std::string_view name;
    boost::regex re;
};

template <size_t N>
std::vector<NamedPattern> compileNamed(const std::array<std::string_view, N>& names,
                                       std::string_view shape) {
    std::vector<NamedPattern> out;
    out.reserve(N);
    for (auto name : names) {
        out.push_back({name, compilePattern(fmt::format(fmt::runtime(shape), name))});
    }
    return out;
}

struct FlutterPatterns {
    boost::regex flutterImport = compilePattern(R"(import\s+['"]package:flutter/)");
    boost::regex materialImport =
        compilePattern(R"(import\s+['"]package:flutter/material\.dart['"])");
    boost::regex cupertinoImport =
        compilePattern(R"(import\s+['"]package:flutter/cupertino\.dart['"])");
    boost::regex widgetsImport =
        compilePattern(R"(import\s+['"]package:flutter/widgets\.dart['"])");

    std::array<WidgetPattern, 6> widgets = {{
        {"stateless", compilePattern(R"(class\s+(\w+)\s+extends\s+StatelessWidget\b)"), true},
        {"consumer", compilePattern(R"(class\s+(\w+)\s+extends\s+ConsumerWidget\b)"), true},
        {"hook", compilePattern(R"(class\s+(\w+)\s+extends\s+HookWidget\b)"), true},
        {"inherited", compilePattern(R"(class\s+(\w+)\s+extends\s+InheritedWidget\b)"), true},
        {"stateful", compilePattern(R"(class\s+(\w+)\s+extends\s+StatefulWidget\b)"), false},
        {"state", compilePattern(R"(class\s+(\w+)\s+extends\s+State<)"), true},
    }};

    boost::regex buildMethod = compilePattern(R"(Widget\s+build\s*\(\s*BuildContext\s+\w+\s*\))");
    boost::regex buildHelper = compilePattern(R"(Widget\s+(_\w+)\s*\([^)]*\)\s*(?:\{|=>))");
    boost::regex overrideAnnotation = compilePattern(R"(@override\b)");

    boost::regex riverpodImport =
        compilePattern(R"(import\s+['"]package:(?:flutter_riverpod|hooks_riverpod|riverpod)/)");
    boost::regex blocImport = compilePattern(R"(import\s+['"]package:(?:flutter_bloc|bloc)/)");
    boost::regex providerImport = compilePattern(R"(import\s+['"]package:provider/)");
    boost::regex getxImport = compilePattern(R"(import\s+['"]package:get/)");
    boost::regex stateClass = compilePattern(R"(extends\s+State<)");

    boost::regex navigator = compilePattern(R"(Navigator\.\w+)");
    boost::regex namedRoute = compilePattern(R"(pushNamed\s*\()");
    std::vector<NamedPattern> lifecycle =
        compileNamed(kLifecycleMethods, R"(@override\s+void\s+{}\s*\()");
    std::vector<NamedPattern> features = compileNamed(kFeatureWidgets, R"(\b{}\s*\()");
};

const FlutterPatterns& patterns() {
    static const FlutterPatterns instance;
    return instance;
}

// Searches the class body that follows a declaration match
bool classHasBuildMethod(std::string_view content, size_t declarationEnd) {
    size_t open = content.find('{', declarationEnd);
    if (open == std::string_view::npos) {
        return false;
    }
    size_t close = core::findMatchingBrace(content, open);
    std::string_view body = close == std::string_view::npos
                                ? content.substr(open)
                                : content.substr(open, close - open + 1);
    return containsMatch(body, patterns().buildMethod);
}

} // namespace

nlohmann::json FlutterAnalysis::toJson() const {
    nlohmann::json widgetList = nlohmann::json::array();
    for (const auto& w : widgets) {
        widgetList.push_back(
            {{"name", w.name}, {"type", w.kind}, {"has_build_method", w.hasBuildMethod}});
    }
    return {{"is_flutter", isFlutter},
            {"framework", framework},
            {"ui_framework", uiFramework},
            {"widgets", std::move(widgetList)},
            {"state_management", stateManagement},
            {"features", features},
            {"has_navigation", hasNavigation},
            {"lifecycle_methods", lifecycleMethods},
            {"composition_depth", compositionDepth},
            {"build_helpers", buildHelpers},
            {"has_override", hasOverride}};
}

FlutterAnalysis FlutterAnalyzer::analyze(std::string_view content) const {
    const auto& p = patterns();
    FlutterAnalysis analysis;
    if (!containsMatch(content, p.flutterImport)) {
        return analysis;
    }

    analysis.isFlutter = true;
    analysis.framework = "flutter";
    if (containsMatch(content, p.materialImport)) {
        analysis.uiFramework = "material";
    } else if (containsMatch(content, p.cupertinoImport)) {
        analysis.uiFramework = "cupertino";
    } else if (containsMatch(content, p.widgetsImport)) {
        analysis.uiFramework = "widgets";
    }

    analysis.widgets = findWidgets(content);
    analysis.stateManagement = detectStateManagement(content);
    analysis.hasNavigation =
        containsMatch(content, p.navigator) || containsMatch(content, p.namedRoute);

    for (const auto& method : p.lifecycle) {
        if (containsMatch(content, method.re)) {
            analysis.lifecycleMethods.emplace_back(method.name);
        }
    }
    for (const auto& feature : p.features) {
        if (containsMatch(content, feature.re)) {
            analysis.features.emplace_back(feature.name);
        }
    }

    forEachMatch(content, p.buildHelper, [&](const boost::cmatch& m) {
        analysis.buildHelpers.push_back(group(m, 1));
        return true;
    });
    analysis.hasOverride = containsMatch(content, p.overrideAnnotation);

    int widgetCount = static_cast<int>(analysis.widgets.size());
    if (widgetCount > 0) {
        analysis.compositionDepth = std::max(1, (widgetCount + 2) / 3);
    }
    return analysis;
}

std::vector<FlutterWidget> FlutterAnalyzer::findWidgets(std::string_view content) const {
    std::vector<FlutterWidget> widgets;
    for (const auto& pattern : patterns().widgets) {
        forEachMatch(content, pattern.re, [&](const boost::cmatch& m) {
            size_t end = groupOffset(m, 0, content.data()) + static_cast<size_t>(m.length(0));
            widgets.push_back(FlutterWidget{
                group(m, 1), pattern.kind,
                pattern.checksBuild && classHasBuildMethod(content, end)});
            return true;
        });
    }
    return widgets;
}

std::string FlutterAnalyzer::detectStateManagement(std::string_view content) const {
    const auto& p = patterns();
    if (containsMatch(content, p.riverpodImport)) {
        return "riverpod";
    }
    if (containsMatch(content, p.blocImport)) {
        return "bloc";
    }
    if (containsMatch(content, p.providerImport)) {
        return "provider";
    }
    if (containsMatch(content, p.getxImport)) {
        return "getx";
    }
    // State<T> subclasses count as setState
    if (core::contains(content, "setState") || containsMatch(content, p.stateClass)) {
        return "setState";
    }
    return "none";
}

std::string FlutterAnalyzer::widgetKind(std::string_view declaration) {
    for (const auto& pattern : patterns().widgets) {
        if (containsMatch(declaration, pattern.re)) {
            return pattern.kind;
        }
    }
    return {};
}

void FlutterAnalyzer::integrate(ast::ASTNode& root, const FlutterAnalysis& analysis) {
    if (!analysis.isFlutter) {
        return;
    }
    root.metadata["flutter_analysis"] = analysis.toJson();
    root.metadata["has_flutter"] = true;
    root.metadata["flutter_framework"] = analysis.uiFramework;
    root.metadata["state_management"] = analysis.stateManagement;
    root.metadata["has_navigation"] = analysis.hasNavigation;
}

} // namespace codectx::parser::dart

#pragma once

#include <codectx/ast/ast.h>

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace codectx::parser::dart {

struct FlutterWidget {
    std::string name;
    std::string kind; // stateless | stateful | state | consumer | hook | inherited
    bool hasBuildMethod = false;
};

/**
 * @brief Flutter facts found in one Dart source file
 */
struct FlutterAnalysis {
    bool isFlutter = false;
    std::string framework = "none";   // flutter | none
    std::string uiFramework = "none"; // material | cupertino | widgets | none
    std::vector<FlutterWidget> widgets;
    std::string stateManagement = "none"; // riverpod | bloc | provider | getx | setState | none
    std::vector<std::string> features;
    bool hasNavigation = false;
    std::vector<std::string> lifecycleMethods;
    int compositionDepth = 0;
    std::vector<std::string> buildHelpers;
    bool hasOverride = false;

    nlohmann::json toJson() const;
};

/**
 * @brief Pattern-based Flutter detection.
 *
 * analyze() is a pure function of the content. Only files importing a
 * package:flutter/ library are analysed further; others yield isFlutter == false.
 */
class FlutterAnalyzer {
public:
    FlutterAnalysis analyze(std::string_view content) const;

    /**
     * @brief Write the analysis onto a root node.
     *
     * Sets flutter_analysis, has_flutter, flutter_framework, state_management and
     * has_navigation. Does nothing for non-Flutter content.
     */
    static void integrate(ast::ASTNode& root, const FlutterAnalysis& analysis);

    // Widget kind for a class declaration text, empty when it is not a widget
    static std::string widgetKind(std::string_view declaration);

private:
    std::vector<FlutterWidget> findWidgets(std::string_view content) const;
    std::string detectStateManagement(std::string_view content) const;
};

} // namespace codectx::parser::dart

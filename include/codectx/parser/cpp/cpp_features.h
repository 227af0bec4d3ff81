#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codectx::parser::cpp {

/**
 * @brief Line filter for declaration-like source lines.
 *
 * A line is accepted when, after trimming, it is not a comment or preprocessor
 * line, contains none of the exclude substrings and at least one include substring.
 */
class PatternValidator {
public:
    PatternValidator(std::vector<std::string_view> excludePatterns,
                     std::vector<std::string_view> includePatterns)
        : exclude_(std::move(excludePatterns)), include_(std::move(includePatterns)) {}

    bool isValidDeclaration(std::string_view line) const;

    // True if any line of content is a valid declaration
    bool validateDeclarationLines(std::string_view content) const;

private:
    std::vector<std::string_view> exclude_;
    std::vector<std::string_view> include_;
};

/**
 * @brief Feature flags for a C++ translation unit.
 *
 * Node-kind flags come from walking the tree; the rest from a pattern pass over
 * content. Every flag is present in the result, false when not detected.
 */
nlohmann::json detectCppFeatures(TSNode root, std::string_view content);

// Individual pattern detectors, exposed for tests
bool detectConstructors(std::string_view content);
bool detectDestructors(std::string_view content);
nlohmann::json detectSpecialMemberFunctions(std::string_view content);
void detectFrameworks(std::string_view content, nlohmann::json& features);

} // namespace codectx::parser::cpp

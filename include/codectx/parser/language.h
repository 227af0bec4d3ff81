#pragma once

#include <codectx/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace codectx::parser {

struct LanguageDescriptor {
    std::string name;
    std::string displayName;
    std::vector<std::string> extensions;
};

struct FileClassification {
    LanguageDescriptor language;
    std::string fileType; // "source" or "header"
    bool isGenerated = false;
    bool isTest = false;
};

// Built-in descriptors for cpp, dart and swift
const std::vector<LanguageDescriptor>& builtinLanguages();

/**
 * @brief Classify a path by its final extension.
 *
 * Pure; fails with UnsupportedLanguage when no descriptor claims the extension.
 */
Result<FileClassification> classifyPath(std::string_view path,
                                        const std::vector<LanguageDescriptor>& languages);

} // namespace codectx::parser

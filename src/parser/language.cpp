#include <codectx/parser/language.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace codectx::parser {

namespace {

constexpr std::array<std::string_view, 5> kHeaderExtensions = {".h", ".hpp", ".hh", ".hxx",
                                                               ".h++"};

constexpr std::array<std::string_view, 4> kTestMarkers = {"_test.", "Test.", "Tests.", "_spec."};

constexpr std::array<std::string_view, 6> kGeneratedMarkers = {
    ".g.dart", ".freezed.dart", ".pb.h", ".pb.cc", ".generated.", ".mocks.dart"};

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool inTestDirectory(std::string_view path) {
    for (std::string_view dir : {"test/", "tests/", "Tests/"}) {
        auto pos = path.find(dir);
        if (pos != std::string_view::npos && (pos == 0 || path[pos - 1] == '/')) {
            return true;
        }
    }
    return false;
}

} // namespace

const std::vector<LanguageDescriptor>& builtinLanguages() {
    static const std::vector<LanguageDescriptor> languages = {
        {"cpp", "C++", {".cpp", ".cc", ".cxx", ".c++", ".hpp", ".hh", ".hxx", ".h++", ".h"}},
        {"dart", "Dart", {".dart"}},
        {"swift", "Swift", {".swift"}},
    };
    return languages;
}

Result<FileClassification> classifyPath(std::string_view path,
                                        const std::vector<LanguageDescriptor>& languages) {
    std::filesystem::path p{std::string(path)};
    std::string ext = lowercase(p.extension().string());
    if (ext.empty()) {
        return Error{ErrorCode::UnsupportedLanguage,
                     fmt::format("no extension on '{}'", std::string(path))};
    }

    for (const auto& lang : languages) {
        if (std::find(lang.extensions.begin(), lang.extensions.end(), ext) ==
            lang.extensions.end()) {
            continue;
        }
        FileClassification out;
        out.language = lang;
        out.fileType = std::find(kHeaderExtensions.begin(), kHeaderExtensions.end(), ext) !=
                               kHeaderExtensions.end()
                           ? "header"
                           : "source";

        std::string fileName = p.filename().string();
        out.isTest = inTestDirectory(path) ||
                     std::any_of(kTestMarkers.begin(), kTestMarkers.end(), [&](auto marker) {
                         return fileName.find(marker) != std::string::npos;
                     });
        out.isGenerated =
            std::any_of(kGeneratedMarkers.begin(), kGeneratedMarkers.end(),
                        [&](auto marker) { return fileName.find(marker) != std::string::npos; });
        return out;
    }

    return Error{ErrorCode::UnsupportedLanguage,
                 fmt::format("unsupported language for extension '{}'", ext)};
}

} // namespace codectx::parser

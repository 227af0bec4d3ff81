#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

struct TSLanguage;

namespace codectx::parser::cpp {

struct GrammarLoadError {
    enum Type { NOT_FOUND, LOAD_FAILED, INVALID_SYMBOL };
    Type type;
    std::string message;
};

/**
 * @brief Locates and loads tree-sitter grammar libraries at runtime.
 *
 * Search order for a language:
 * - the language's environment variable (CODECTX_TS_CPP_LIB for C++), a library file
 * - the library path found when the project was configured, if any
 * - XDG_DATA_HOME/codectx/grammars, then ~/.local/share/codectx/grammars
 * - /usr/local/lib, /usr/lib/x86_64-linux-gnu, /usr/lib
 *
 * Loaded libraries stay open for the lifetime of the process; trees reference them.
 * The loader does not log; a failed load lists every candidate tried and why.
 */
class GrammarLoader {
public:
    using GrammarHandle = std::pair<void*, const TSLanguage*>;

    GrammarLoader() = default;

    tl::expected<GrammarHandle, GrammarLoadError> loadGrammar(std::string_view language);

    std::vector<std::filesystem::path> getGrammarSearchPaths() const;

    /**
     * @brief Process-wide loader; successful loads are memoized per language
     */
    static GrammarLoader& instance();

private:
    struct GrammarSpec {
        std::string_view key;
        std::string_view env_var;
        std::string_view symbol;
        std::string_view default_so;
    };

    static constexpr GrammarSpec kSpecs[] = {
        {"cpp", "CODECTX_TS_CPP_LIB", "tree_sitter_cpp", "libtree-sitter-cpp.so"},
        {"c++", "CODECTX_TS_CPP_LIB", "tree_sitter_cpp", "libtree-sitter-cpp.so"},
    };

    const GrammarSpec* findSpec(std::string_view language) const;
    std::vector<std::string> getLibraryCandidates(const GrammarSpec& spec) const;

    std::mutex mutex_;
    std::unordered_map<std::string, GrammarHandle> loaded_;
};

} // namespace codectx::parser::cpp

#include <codectx/config/config_helpers.h>
#include <codectx/parser/cpp/grammar_loader.h>

#include <dlfcn.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

extern "C" {
#include <tree_sitter/api.h>
}

namespace codectx::parser::cpp {

GrammarLoader& GrammarLoader::instance() {
    static GrammarLoader loader;
    return loader;
}

const GrammarLoader::GrammarSpec* GrammarLoader::findSpec(std::string_view language) const {
    std::string lang_lower(language);
    std::transform(lang_lower.begin(), lang_lower.end(), lang_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& spec : kSpecs) {
        if (lang_lower == spec.key) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::filesystem::path> GrammarLoader::getGrammarSearchPaths() const {
    std::vector<std::filesystem::path> paths;
    paths.push_back(config::get_data_dir() / "grammars");
    if (const char* home = std::getenv("HOME"); home && *home) {
        auto fallback = std::filesystem::path(home) / ".local" / "share" / "codectx" / "grammars";
        if (fallback != paths.front()) {
            paths.push_back(std::move(fallback));
        }
    }
    paths.emplace_back("/usr/local/lib");
    paths.emplace_back("/usr/lib/x86_64-linux-gnu");
    paths.emplace_back("/usr/lib");
    return paths;
}

std::vector<std::string> GrammarLoader::getLibraryCandidates(const GrammarSpec& spec) const {
    std::vector<std::string> candidates;

    if (const char* env_path = std::getenv(std::string(spec.env_var).c_str())) {
        if (*env_path) {
            candidates.emplace_back(env_path);
        }
    }

#ifdef CODECTX_TS_CPP_DEFAULT_LIB
    if (spec.symbol == "tree_sitter_cpp") {
        candidates.emplace_back(CODECTX_TS_CPP_DEFAULT_LIB);
    }
#endif

    std::string core_name(spec.default_so);
    auto dot_pos = core_name.rfind('.');
    if (dot_pos != std::string::npos) {
        core_name = core_name.substr(0, dot_pos);
    }
    if (core_name.rfind("lib", 0) == 0) {
        core_name = core_name.substr(3);
    }
    std::string underscore_name = core_name;
    std::replace(underscore_name.begin(), underscore_name.end(), '-', '_');

    const std::vector<std::string> lib_names = {"lib" + core_name + ".so", core_name + ".so",
                                                "lib" + underscore_name + ".so",
                                                "lib" + core_name + ".so.0"};

    for (const auto& base_path : getGrammarSearchPaths()) {
        std::error_code ec;
        if (!std::filesystem::exists(base_path, ec)) {
            continue;
        }
        for (const auto& lib_name : lib_names) {
            candidates.push_back((base_path / lib_name).string());
        }
    }
    return candidates;
}

tl::expected<GrammarLoader::GrammarHandle, GrammarLoadError>
GrammarLoader::loadGrammar(std::string_view language) {
    const auto* spec = findSpec(language);
    if (!spec) {
        return tl::unexpected(GrammarLoadError{
            GrammarLoadError::NOT_FOUND, fmt::format("Language '{}' not supported", language)});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = loaded_.find(std::string(spec->symbol)); it != loaded_.end()) {
        return it->second;
    }

    auto candidates = getLibraryCandidates(*spec);
    if (candidates.empty()) {
        return tl::unexpected(
            GrammarLoadError{GrammarLoadError::NOT_FOUND,
                             fmt::format("No library candidates for language '{}'", language)});
    }

    std::vector<std::string> tried_paths;
    bool symbol_missing = false;
    for (const auto& candidate : candidates) {
        void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
        if (!handle) {
            const char* reason = dlerror();
            tried_paths.push_back(fmt::format("{} ({})", candidate, reason ? reason : "not loadable"));
            continue;
        }

        auto* factory_fn =
            reinterpret_cast<const TSLanguage* (*)()>(dlsym(handle, std::string(spec->symbol).c_str()));
        if (factory_fn) {
            const TSLanguage* lang = factory_fn();
            if (lang) {
                GrammarHandle loaded{handle, lang};
                loaded_.emplace(std::string(spec->symbol), loaded);
                return loaded;
            }
        } else {
            symbol_missing = true;
        }
        tried_paths.push_back(fmt::format("{} (no usable {})", candidate, spec->symbol));
        dlclose(handle);
    }

    std::string tried_join;
    for (size_t i = 0; i < tried_paths.size(); ++i) {
        tried_join += tried_paths[i];
        if (i + 1 < tried_paths.size()) {
            tried_join += ", ";
        }
    }
    return tl::unexpected(GrammarLoadError{
        symbol_missing ? GrammarLoadError::INVALID_SYMBOL : GrammarLoadError::LOAD_FAILED,
        fmt::format("Failed to load grammar for '{}'. Tried: {}", language, tried_join)});
}

} // namespace codectx::parser::cpp

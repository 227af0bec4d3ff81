#include <codectx/config/config_helpers.h>
#include <codectx/config/parser_config.h>

#include <functional>
#include <type_traits>
#include <unordered_map>

namespace codectx::config {

namespace {

using Setter = std::function<Result<void>(ParserConfig&, const std::string&)>;

template <typename T> Setter intSetter(T ParserConfig::*group, auto member) {
    return [group, member](ParserConfig& cfg, const std::string& raw) -> Result<void> {
        auto v = parse_int(raw);
        if (!v) {
            return v.error();
        }
        using Field = std::remove_reference_t<decltype((cfg.*group).*member)>;
        (cfg.*group).*member = static_cast<Field>(v.value());
        return Result<void>();
    };
}

template <typename T> Setter boolSetter(T ParserConfig::*group, bool T::*member) {
    return [group, member](ParserConfig& cfg, const std::string& raw) -> Result<void> {
        auto v = parse_bool(raw);
        if (!v) {
            return v.error();
        }
        (cfg.*group).*member = v.value();
        return Result<void>();
    };
}

template <typename T, typename D> Setter durationSetter(T ParserConfig::*group, D T::*member,
                                                        int64_t unitMicros) {
    return [group, member, unitMicros](ParserConfig& cfg, const std::string& raw) -> Result<void> {
        auto v = parse_int(raw);
        if (!v) {
            return v.error();
        }
        (cfg.*group).*member =
            std::chrono::duration_cast<D>(std::chrono::microseconds(v.value() * unitMicros));
        return Result<void>();
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    using PC = ParserConfig;
    static const std::unordered_map<std::string, Setter> table = {
        {"cache.max_size", intSetter(&PC::cache, &PC::Cache::maxSize)},
        {"cache.ttl_seconds", durationSetter(&PC::cache, &PC::Cache::ttl, 1000000)},
        {"cache.ttl_ms", durationSetter(&PC::cache, &PC::Cache::ttl, 1000)},
        {"cache.enabled", boolSetter(&PC::cache, &PC::Cache::enabled)},
        {"performance.streaming_threshold",
         intSetter(&PC::performance, &PC::Performance::streamingThreshold)},
        {"performance.limited_threshold",
         intSetter(&PC::performance, &PC::Performance::limitedThreshold)},
        {"performance.max_symbols", intSetter(&PC::performance, &PC::Performance::maxSymbols)},
        {"performance.enable_caching",
         boolSetter(&PC::performance, &PC::Performance::enableCaching)},
        {"cpp.max_nesting_depth", intSetter(&PC::cpp, &PC::Cpp::maxNestingDepth)},
        {"cpp.max_template_depth", intSetter(&PC::cpp, &PC::Cpp::maxTemplateDepth)},
        {"cpp.max_classes_per_file", intSetter(&PC::cpp, &PC::Cpp::maxClassesPerFile)},
        {"cpp.max_methods_per_class", intSetter(&PC::cpp, &PC::Cpp::maxMethodsPerClass)},
        {"cpp.max_file_size", intSetter(&PC::cpp, &PC::Cpp::maxFileSize)},
        {"cpp.enable_virtual_detection", boolSetter(&PC::cpp, &PC::Cpp::enableVirtualDetection)},
        {"cpp.parse_timeout_ms", durationSetter(&PC::cpp, &PC::Cpp::parseTimeout, 1000)},
        {"cpp.parse_timeout_us", durationSetter(&PC::cpp, &PC::Cpp::parseTimeout, 1)},
        {"cpp.strict_timeout_enforcement",
         boolSetter(&PC::cpp, &PC::Cpp::strictTimeoutEnforcement)},
        {"dart.enable_flutter_detection", boolSetter(&PC::dart, &PC::Dart::enableFlutterDetection)},
        {"dart.max_file_size", intSetter(&PC::dart, &PC::Dart::maxFileSize)},
        {"dart.enable_async_analysis", boolSetter(&PC::dart, &PC::Dart::enableAsyncAnalysis)},
        {"logging.level",
         [](PC& cfg, const std::string& raw) -> Result<void> {
             cfg.logging.level = unquote(raw);
             return Result<void>();
         }},
        {"logging.enable_metrics", boolSetter(&PC::logging, &PC::Logging::enableMetrics)},
        {"logging.enable_profiling", boolSetter(&PC::logging, &PC::Logging::enableProfiling)},
    };
    return table;
}

} // namespace

void ParserConfig::validate() {
    if (cache.maxSize <= 0) {
        cache.maxSize = kDefaultCacheMaxSize;
    }
    if (cache.ttl.count() <= 0) {
        cache.ttl = kDefaultCacheTTL;
    }
    if (performance.streamingThreshold <= performance.limitedThreshold) {
        performance.streamingThreshold = kStreamingThresholdBytes;
        performance.limitedThreshold = kLimitedThresholdBytes;
    }
    if (performance.maxSymbols <= 0) {
        performance.maxSymbols = kMaxSymbolsPerFile;
    }
    if (cpp.maxNestingDepth <= 0) {
        cpp.maxNestingDepth = kMaxNestingDepth;
    }
    if (cpp.maxFileSize == 0) {
        cpp.maxFileSize = kMaxFileSize;
    }
    if (cpp.parseTimeout.count() <= 0) {
        cpp.parseTimeout = kDefaultParseTimeout;
    }
    if (dart.maxFileSize == 0) {
        dart.maxFileSize = kMaxFileSize;
    }
}

ParserConfig ParserConfig::forProduction() {
    ParserConfig cfg;
    cfg.cache.maxSize = 5000;
    cfg.cache.ttl = std::chrono::hours(2);
    cfg.logging.level = "warn";
    return cfg;
}

ParserConfig ParserConfig::forDevelopment() {
    ParserConfig cfg;
    cfg.cache.maxSize = 1000;
    cfg.cache.ttl = std::chrono::minutes(30);
    cfg.logging.level = "debug";
    cfg.logging.enableProfiling = true;
    return cfg;
}

ParserConfig ParserConfig::forTesting() {
    ParserConfig cfg;
    cfg.cache.maxSize = 100;
    cfg.cache.ttl = std::chrono::minutes(1);
    cfg.cache.enabled = false;
    cfg.performance.maxSymbols = 1000;
    cfg.performance.enableCaching = false;
    cfg.dart.enableAsyncAnalysis = false;
    return cfg;
}

Result<ParserConfig> ParserConfig::fromSettings(const std::map<std::string, std::string>& settings) {
    ParserConfig cfg;
    const auto& table = setters();
    for (const auto& [key, raw] : settings) {
        auto it = table.find(key);
        if (it == table.end()) {
            continue;
        }
        auto applied = it->second(cfg, raw);
        if (!applied) {
            Error err{ErrorCode::Config, fmt::format("invalid value for '{}'", key)};
            return std::move(err).causedBy(applied.error());
        }
    }
    cfg.validate();
    return cfg;
}

Result<ParserConfig> ParserConfig::loadFromFile(const std::filesystem::path& path) {
    auto values = parse_config_file(path);
    if (!values) {
        return values.error();
    }
    return fromSettings(values.value());
}

} // namespace codectx::config

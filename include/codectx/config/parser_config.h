#pragma once

#include <codectx/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace codectx::config {

inline constexpr size_t kStreamingThresholdBytes = 200 * 1024;
inline constexpr size_t kLimitedThresholdBytes = 50 * 1024;
inline constexpr int kMaxSymbolsPerFile = 10000;
inline constexpr int kMaxNestingDepth = 100;
inline constexpr int kHardNestingDepth = 1000;
inline constexpr size_t kMaxFileSize = 10 * 1024 * 1024;
inline constexpr int kDefaultCacheMaxSize = 1000;
inline constexpr std::chrono::seconds kDefaultCacheTTL{3600};
inline constexpr std::chrono::milliseconds kDefaultParseTimeout{30000};
inline constexpr int kMaxClassesPerFile = 1000;
inline constexpr int kMaxMethodsPerClass = 500;

/**
 * @brief Per-run settings for the parsing pipeline.
 *
 * Values are plain data; call validate() after editing to restore defaults for
 * out-of-range settings.
 */
struct ParserConfig {
    struct Cache {
        int maxSize = kDefaultCacheMaxSize;
        std::chrono::milliseconds ttl = kDefaultCacheTTL;
        bool enabled = true;
    } cache;

    struct Performance {
        size_t streamingThreshold = kStreamingThresholdBytes;
        size_t limitedThreshold = kLimitedThresholdBytes;
        int maxSymbols = kMaxSymbolsPerFile;
        bool enableCaching = true;
    } performance;

    struct Cpp {
        int maxNestingDepth = kMaxNestingDepth;
        int maxTemplateDepth = 20;
        int maxClassesPerFile = kMaxClassesPerFile;
        int maxMethodsPerClass = kMaxMethodsPerClass;
        size_t maxFileSize = kMaxFileSize;
        bool enableVirtualDetection = true;
        std::chrono::microseconds parseTimeout = kDefaultParseTimeout;
        bool strictTimeoutEnforcement = false;
    } cpp;

    struct Dart {
        bool enableFlutterDetection = true;
        size_t maxFileSize = kMaxFileSize;
        bool enableAsyncAnalysis = true;
    } dart;

    struct Logging {
        std::string level = "info";
        bool enableMetrics = true;
        bool enableProfiling = false;
    } logging;

    // Resets out-of-range values to their defaults
    void validate();

    bool cachingEnabled() const { return cache.enabled && performance.enableCaching; }

    static ParserConfig defaults() { return ParserConfig{}; }
    static ParserConfig forProduction();
    static ParserConfig forDevelopment();
    static ParserConfig forTesting();

    /**
     * @brief Build a validated config from dotted keys ("cache.max_size", "cpp.parse_timeout_ms").
     *
     * Unknown keys are ignored; malformed values fail with ErrorCode::Config.
     */
    static Result<ParserConfig> fromSettings(const std::map<std::string, std::string>& settings);

    // Reads a TOML-style file with [cache], [performance], [cpp], [dart], [logging] sections
    static Result<ParserConfig> loadFromFile(const std::filesystem::path& path);
};

} // namespace codectx::config

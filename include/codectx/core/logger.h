#pragma once

#include <codectx/core/types.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace spdlog {
class logger;
}

namespace codectx::core {

struct LogField {
    std::string key;
    nlohmann::json value;
};

using LogFields = std::vector<LogField>;

/**
 * @brief Narrow structured logger used by the parsing pipeline
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void debug(std::string_view msg, const LogFields& fields = {}) = 0;
    virtual void info(std::string_view msg, const LogFields& fields = {}) = 0;
    virtual void warn(std::string_view msg, const LogFields& fields = {}) = 0;
    virtual void error(std::string_view msg, const std::optional<Error>& err,
                       const LogFields& fields = {}) = 0;
};

// Discards everything; used when no sink is supplied
class NullLogger final : public ILogger {
public:
    void debug(std::string_view, const LogFields&) override {}
    void info(std::string_view, const LogFields&) override {}
    void warn(std::string_view, const LogFields&) override {}
    void error(std::string_view, const std::optional<Error>&, const LogFields&) override {}
};

/**
 * @brief Forwards to an spdlog logger, rendering fields as key=value pairs
 */
class SpdlogLogger final : public ILogger {
public:
    // Uses spdlog's default logger when none is given
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

    // Accepts trace|debug|info|warn|error|off; unknown names leave the level unchanged
    void setLevel(std::string_view level);

    void debug(std::string_view msg, const LogFields& fields = {}) override;
    void info(std::string_view msg, const LogFields& fields = {}) override;
    void warn(std::string_view msg, const LogFields& fields = {}) override;
    void error(std::string_view msg, const std::optional<Error>& err,
               const LogFields& fields = {}) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

std::string formatFields(const LogFields& fields);

std::shared_ptr<ILogger> makeNullLogger();

} // namespace codectx::core

#include <codectx/core/logger.h>

#include <spdlog/spdlog.h>

namespace codectx::core {

std::string formatFields(const LogFields& fields) {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty()) {
            out += ' ';
        }
        if (field.value.is_string()) {
            out += fmt::format("{}={}", field.key, field.value.get<std::string>());
        } else {
            out += fmt::format("{}={}", field.key, field.value.dump());
        }
    }
    return out;
}

std::shared_ptr<ILogger> makeNullLogger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void SpdlogLogger::setLevel(std::string_view level) {
    // from_str maps unrecognized names to off; those leave the level alone
    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        return;
    }
    logger_->set_level(parsed);
}

void SpdlogLogger::debug(std::string_view msg, const LogFields& fields) {
    if (fields.empty()) {
        logger_->debug("{}", msg);
    } else {
        logger_->debug("{} {}", msg, formatFields(fields));
    }
}

void SpdlogLogger::info(std::string_view msg, const LogFields& fields) {
    if (fields.empty()) {
        logger_->info("{}", msg);
    } else {
        logger_->info("{} {}", msg, formatFields(fields));
    }
}

void SpdlogLogger::warn(std::string_view msg, const LogFields& fields) {
    if (fields.empty()) {
        logger_->warn("{}", msg);
    } else {
        logger_->warn("{} {}", msg, formatFields(fields));
    }
}

void SpdlogLogger::error(std::string_view msg, const std::optional<Error>& err,
                         const LogFields& fields) {
    std::string suffix = formatFields(fields);
    if (err) {
        logger_->error("{}: {} {}", msg, err->toString(), suffix);
    } else {
        logger_->error("{} {}", msg, suffix);
    }
}

} // namespace codectx::core

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace codectx {

// Type aliases
using Hash = std::string;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error kinds surfaced by the parsing pipeline
enum class ErrorCode {
    Success = 0,
    Initialization,
    Validation,
    InvalidFilePath,
    Parsing,
    UnsupportedLanguage,
    Cache,
    Ast,
    PanicRecovered,
    NotFound,
    Config,
    Unknown
};

// Stable tag for an error kind
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "success";
        case ErrorCode::Initialization: return "initialization";
        case ErrorCode::Validation: return "validation";
        case ErrorCode::InvalidFilePath: return "invalid_file_path";
        case ErrorCode::Parsing: return "parsing";
        case ErrorCode::UnsupportedLanguage: return "unsupported_language";
        case ErrorCode::Cache: return "cache";
        case ErrorCode::Ast: return "ast";
        case ErrorCode::PanicRecovered: return "panic_recovered";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Config: return "config";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    std::string operation;
    std::string filePath;
    std::string language;
    std::string stack;
    std::shared_ptr<const Error> cause;

    Error() : code(ErrorCode::Success) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    Error& withOperation(std::string op) & {
        operation = std::move(op);
        return *this;
    }
    Error&& withOperation(std::string op) && {
        operation = std::move(op);
        return std::move(*this);
    }

    Error&& withFile(std::string path, std::string lang = {}) && {
        filePath = std::move(path);
        language = std::move(lang);
        return std::move(*this);
    }

    Error&& causedBy(Error inner) && {
        cause = std::make_shared<const Error>(std::move(inner));
        return std::move(*this);
    }

    /**
     * @brief Innermost error of the cause chain (this error when there is none)
     */
    const Error& rootCause() const {
        const Error* current = this;
        while (current->cause) {
            current = current->cause.get();
        }
        return *current;
    }

    /**
     * @brief Render as "op: kind: message (path=..., language=...): <cause>"
     */
    std::string toString() const {
        std::string out;
        if (!operation.empty()) {
            out += operation;
            out += ": ";
        }
        out += errorToString(code);
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        if (!filePath.empty() || !language.empty()) {
            out += fmt::format(" (path={}, language={})", filePath, language);
        }
        if (cause) {
            out += ": ";
            out += cause->toString();
        }
        return out;
    }

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).toString());
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).toString());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).toString());
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.toString());
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace codectx

template <> struct fmt::formatter<codectx::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(codectx::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", codectx::errorToString(error));
    }
};

template <> struct fmt::formatter<codectx::Error> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const codectx::Error& error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", error.toString());
    }
};

#pragma once

#include <codectx/core/context.h>
#include <codectx/core/logger.h>
#include <codectx/core/types.h>

#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace codectx::core {

// Current call stack, one frame per line
std::string captureStack(int maxFrames = 64);

/**
 * @brief Converts exceptions escaping a unit of work into PanicRecovered errors.
 *
 * The resulting error carries the operation name, the file path and language
 * found on the context, and a stack snapshot taken at the point of recovery.
 */
class PanicHandler {
public:
    explicit PanicHandler(std::shared_ptr<ILogger> logger) : logger_(std::move(logger)) {
        if (!logger_) {
            logger_ = makeNullLogger();
        }
    }

    template <typename Fn>
    Result<void> guard(const ParseContext& ctx, std::string_view op, Fn&& fn) {
        try {
            fn();
            return Result<void>();
        } catch (const std::exception& e) {
            return recovered(ctx, op, e.what());
        } catch (...) {
            return recovered(ctx, op, "unknown exception");
        }
    }

    template <typename T, typename Fn>
    Result<T> guardResult(const ParseContext& ctx, std::string_view op, Fn&& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            return recovered(ctx, op, e.what());
        } catch (...) {
            return recovered(ctx, op, "unknown exception");
        }
    }

    Error recovered(const ParseContext& ctx, std::string_view op, std::string_view what);

private:
    std::shared_ptr<ILogger> logger_;
};

} // namespace codectx::core

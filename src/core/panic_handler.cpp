#include <codectx/core/panic_handler.h>

#include <execinfo.h>
#include <cstdlib>
#include <vector>

namespace codectx::core {

std::string captureStack(int maxFrames) {
    if (maxFrames <= 0) {
        return {};
    }
    std::vector<void*> frames(static_cast<size_t>(maxFrames));
    int n = backtrace(frames.data(), maxFrames);
    char** syms = backtrace_symbols(frames.data(), n);
    if (!syms) {
        return {};
    }
    std::string out;
    // Skip this frame
    for (int i = 1; i < n; ++i) {
        out += fmt::format("#{} {}\n", i - 1, syms[i]);
    }
    free(syms);
    return out;
}

Error PanicHandler::recovered(const ParseContext& ctx, std::string_view op,
                              std::string_view what) {
    Error err{ErrorCode::PanicRecovered, fmt::format("recovered from panic: {}", what)};
    err.operation = std::string(op);
    err.filePath = ctx.filePath().value_or("");
    err.language = ctx.language().value_or("");
    err.stack = captureStack();

    LogFields fields{{"operation", err.operation}};
    if (!err.filePath.empty()) {
        fields.push_back({"file_path", err.filePath});
    }
    if (!err.language.empty()) {
        fields.push_back({"language", err.language});
    }
    if (ctx.requestId()) {
        fields.push_back({"request_id", *ctx.requestId()});
    }
    logger_->error("panic recovered", err, fields);
    return err;
}

} // namespace codectx::core

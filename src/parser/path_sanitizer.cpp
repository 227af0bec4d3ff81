#include <codectx/parser/path_sanitizer.h>

#include <filesystem>

namespace codectx::parser {

Result<std::string> sanitizePath(std::string_view path) {
    if (path.empty()) {
        return std::string{};
    }
    if (path.find('\0') != std::string_view::npos) {
        return Error{ErrorCode::InvalidFilePath, "null bytes"};
    }
    if (path.size() > kMaxPathLength) {
        return Error{ErrorCode::InvalidFilePath, "too long"};
    }

    auto cleaned = std::filesystem::path(std::string(path)).lexically_normal();
    for (const auto& segment : cleaned) {
        if (segment == "..") {
            return Error{ErrorCode::InvalidFilePath, "path traversal detected"};
        }
    }

    std::string out = cleaned.string();
    // lexically_normal keeps a trailing separator as an empty element
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out.empty() ? std::string(".") : out;
}

} // namespace codectx::parser

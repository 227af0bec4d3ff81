#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace codectx::core {

/**
 * @brief Request-scoped values carried through a parse.
 *
 * Every key is optional. Regex parsers ignore cancellation; the C++ parser
 * checks it once before handing content to tree-sitter.
 */
class ParseContext {
public:
    using Clock = std::chrono::steady_clock;

    ParseContext() = default;

    ParseContext withStopToken(std::stop_token token) const {
        ParseContext copy = *this;
        copy.stopToken_ = std::move(token);
        return copy;
    }

    ParseContext withDeadline(Clock::time_point deadline) const {
        ParseContext copy = *this;
        copy.deadline_ = deadline;
        return copy;
    }

    ParseContext withRequestId(std::string id) const {
        ParseContext copy = *this;
        copy.requestId_ = std::move(id);
        return copy;
    }

    ParseContext withFile(std::string path, std::string language) const {
        ParseContext copy = *this;
        copy.filePath_ = std::move(path);
        copy.language_ = std::move(language);
        return copy;
    }

    bool isCancelled() const {
        if (stopToken_ && stopToken_->stop_requested()) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    const std::optional<std::string>& requestId() const { return requestId_; }
    const std::optional<std::string>& filePath() const { return filePath_; }
    const std::optional<std::string>& language() const { return language_; }
    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

private:
    std::optional<std::stop_token> stopToken_;
    std::optional<Clock::time_point> deadline_;
    std::optional<std::string> requestId_;
    std::optional<std::string> filePath_;
    std::optional<std::string> language_;
};

} // namespace codectx::core

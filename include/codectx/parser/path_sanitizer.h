#pragma once

#include <codectx/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace codectx::parser {

inline constexpr size_t kMaxPathLength = 4096;

/**
 * @brief Validate and lexically clean a file path.
 *
 * Empty paths are accepted unchanged. Fails with InvalidFilePath on NUL bytes,
 * paths longer than kMaxPathLength, or ".." segments that survive cleaning.
 */
Result<std::string> sanitizePath(std::string_view path);

} // namespace codectx::parser

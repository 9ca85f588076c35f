/**
 * @file LinkStatus.hpp
 * @brief Display status of a link, derived from its resolution state.
 */

#pragma once

#include <optional>
#include <string>

namespace zlinker::domain {

enum class LinkStatus {
    Creating, ///< No short URL yet.
    Updating, ///< Placeholder URL exists, final content not written.
    Done      ///< Final content written.
};

LinkStatus StatusOf(const std::optional<std::string>& url, bool resolved);

const char* ToString(LinkStatus status);

} // namespace zlinker::domain

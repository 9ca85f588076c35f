/**
 * @file AppTarget.hpp
 * @brief Destination applications a link can be published to.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace zlinker::domain {

/**
 * @struct AppTarget
 * @brief One destination web application.
 *
 * A fragment header in the data file is the separator repeated five times,
 * which is how a fragment selects its target.
 */
struct AppTarget {
    std::string uri;       ///< Base URI of the application.
    char separator = '\0'; ///< Header character ('\0' when not selectable from input).
    std::string color;     ///< Hex color used by the preview graph.

    /** @brief Builds the long URL carrying an encoded payload. */
    std::string buildUrl(const std::string& payload) const;

    bool operator==(const AppTarget& other) const {
        return uri == other.uri && separator == other.separator && color == other.color;
    }
};

/**
 * @class AppTargetTable
 * @brief Immutable separator -> target table, built once at startup.
 *
 * Invariant: separators and uris are unique.
 */
class AppTargetTable {
public:
    explicit AppTargetTable(std::vector<AppTarget> targets);

    /** @brief The deployment table of the fortuna-events applications. */
    static AppTargetTable Default();

    /** @brief Target of the synthetic debug fragment. Never selected by a separator. */
    static const AppTarget& DebugTarget();

    const AppTarget* findBySeparator(char separator) const;
    std::optional<size_t> indexOf(const std::string& uri) const;

    /** @brief All separator characters, in table order. */
    std::string separators() const;

    const std::vector<AppTarget>& targets() const { return m_targets; }

private:
    std::vector<AppTarget> m_targets;
};

} // namespace zlinker::domain

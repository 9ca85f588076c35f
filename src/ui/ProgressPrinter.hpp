/**
 * @file ProgressPrinter.hpp
 * @brief Colored, in-place terminal progress for link resolution.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "domain/AppTarget.hpp"
#include "domain/LinkNode.hpp"

namespace zlinker::ui {

/**
 * @class ProgressPrinter
 * @brief Draws one status line per link and a progress bar, redrawing over the previous block.
 *
 * Reads only the status projection of each node.
 */
class ProgressPrinter {
public:
    static constexpr int kBarSize = 30;

    ProgressPrinter(std::ostream& out, domain::AppTargetTable targets, bool quiet = false);

    /** @brief Draws the block; every call after the first replaces the previous one. */
    void print(const std::vector<domain::LinkNode>& nodes);

    /** @brief ANSI color sequence of a target (31 + table index, bold). */
    std::string colorOf(const domain::AppTarget& target) const;

    /** @brief Colored status text of a node. */
    static std::string StatusLine(const domain::LinkNode& node);

    /** @brief Progress bar line. */
    static std::string BarLine(const std::vector<domain::LinkNode>& nodes);

private:
    std::ostream& m_out;
    domain::AppTargetTable m_targets;
    bool m_quiet;
    size_t m_linesDrawn = 0; ///< Lines of the previous block, erased on redraw.
};

} // namespace zlinker::ui

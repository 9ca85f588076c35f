/**
 * @file DocumentParser.hpp
 * @brief Splits a data file into LinkNodes.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AppTarget.hpp"
#include "domain/LinkError.hpp"
#include "domain/LinkNode.hpp"

namespace zlinker::application {

/**
 * @class DocumentParser
 * @brief Parses the data file grammar.
 *
 * A header line is a separator character repeated five times, optional
 * whitespace, then a word naming the fragment. The following lines, up to the
 * next header, are the fragment text.
 */
class DocumentParser {
public:
    /** @brief Name of the synthetic debug fragment. */
    static constexpr const char* kDebugName = "DEBUG";

    /** @brief Number of separator repetitions forming a header. */
    static constexpr int kSeparatorCount = 5;

    struct Result {
        std::vector<domain::LinkNode> nodes;
        std::optional<domain::LinkError> error;
    };

    explicit DocumentParser(domain::AppTargetTable targets);

    /**
     * @brief Parses a whole document.
     * @param content File content.
     * @param addDebug Appends a debug fragment listing every symbolic name.
     *
     * Link names are ASCII words; a header whose name holds other characters is a parse error.
     */
    Result Parse(const std::string& content, bool addDebug) const;

    /** @brief Text of the debug fragment for the given nodes. */
    static std::string BuildDebugText(const std::vector<domain::LinkNode>& nodes);

private:
    domain::AppTargetTable m_targets;
};

} // namespace zlinker::application

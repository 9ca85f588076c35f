/**
 * @file LinkNode.hpp
 * @brief Domain entity representing one text fragment and its resolution state.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppTarget.hpp"

namespace zlinker::domain {

/**
 * @class LinkNode
 * @brief A fragment destined for one AppTarget, identified by a unique symbolic name.
 *
 * Dependencies are indices into the node set the node belongs to. They are set
 * once by the linking pass and never change afterwards.
 */
class LinkNode {
public:
    /**
     * @brief Constructor for LinkNode.
     * @param target Destination application.
     * @param name Symbolic name, searched for in other nodes' text.
     * @param rawText Fragment content as written in the data file.
     * @param previewed Whether the node is drawn in the preview graph.
     */
    LinkNode(AppTarget target, std::string name, std::string rawText, bool previewed = true)
        : m_target(std::move(target)), m_name(std::move(name)), m_rawText(std::move(rawText)), m_previewed(previewed) {
        if (m_name.empty()) {
            throw std::invalid_argument("LinkNode: symbolic name cannot be empty.");
        }
    }

    const AppTarget& getTarget() const { return m_target; }
    const std::string& getName() const { return m_name; }
    const std::string& getRawText() const { return m_rawText; }
    const std::vector<size_t>& getDependencies() const { return m_dependencies; }
    const std::optional<std::string>& getUrl() const { return m_url; }
    bool isResolved() const { return m_resolved; }
    bool isLinked() const { return m_linked; }
    bool isPreviewed() const { return m_previewed; }

    /**
     * @brief Records the nodes whose name occurs in the raw text.
     * @throws std::logic_error if the node was already linked.
     */
    void setDependencies(std::vector<size_t> dependencies) {
        if (m_linked) {
            throw std::logic_error("LinkNode: " + m_name + " is already linked.");
        }
        m_dependencies = std::move(dependencies);
        m_linked = true;
    }

    /** @brief Stores the short URL (placeholder or final). */
    void assignUrl(const std::string& url) { m_url = url; }

    /** @brief Marks the final content as published. Never reset. */
    void markResolved() { m_resolved = true; }

private:
    AppTarget m_target;
    std::string m_name;
    std::string m_rawText;
    std::vector<size_t> m_dependencies;
    std::optional<std::string> m_url;
    bool m_resolved = false;
    bool m_linked = false;
    bool m_previewed = true;
};

} // namespace zlinker::domain

/**
 * @file PreviewExportService.hpp
 * @brief Exports the dependency graph as a Graphviz document.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/DependencyGraph.hpp"
#include "domain/LinkNode.hpp"

namespace zlinker::application {

class PreviewExportService {
public:
    /** @brief DOT source written next to the image. */
    static constexpr const char* kSourceFilename = "preview.dot";
    /** @brief Rendered preview image. */
    static constexpr const char* kImageFilename = "preview.png";

    /**
     * @brief Renders previewed nodes and the edges between them as a strict DOT digraph.
     * Nodes are filled with the color of their target.
     */
    static std::string toDot(const std::vector<domain::LinkNode>& nodes, const domain::DependencyGraph& graph);
};

} // namespace zlinker::application

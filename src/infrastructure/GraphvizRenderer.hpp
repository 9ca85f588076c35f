/**
 * @file GraphvizRenderer.hpp
 * @brief GraphRenderer backed by the Graphviz libraries (libgvc, libcgraph).
 */

#pragma once
#include "domain/GraphRenderer.hpp"
#include <string>

namespace zlinker::infrastructure {

/**
 * @class GraphvizRenderer
 * @brief Renders with the sfdp layout engine and the png output plugin.
 */
class GraphvizRenderer : public domain::GraphRenderer {
public:
    static constexpr const char* kLayoutEngine = "sfdp";

    std::optional<domain::LinkError> renderPng(const std::string& dotSource, const std::string& outputPath) override;
};

} // namespace zlinker::infrastructure

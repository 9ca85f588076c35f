/**
 * @file GraphRenderer.hpp
 * @brief Interface for turning a Graphviz document into an image.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/LinkError.hpp"

namespace zlinker::domain {

/**
 * @class GraphRenderer
 * @brief Lays out a DOT document and writes it as a PNG image.
 */
class GraphRenderer {
public:
    virtual ~GraphRenderer() = default;

    /**
     * @param dotSource Complete DOT document.
     * @param outputPath Image file to create or replace.
     * @return The failure, or nullopt once the image is written.
     */
    virtual std::optional<LinkError> renderPng(const std::string& dotSource, const std::string& outputPath) = 0;
};

} // namespace zlinker::domain

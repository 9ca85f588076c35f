#include "infrastructure/GraphvizRenderer.hpp"
#include <gvc.h>
#include <iostream>
#include <memory>

namespace zlinker::infrastructure {

using domain::LinkError;
using domain::LinkErrorKind;

namespace {

struct ContextDeleter {
    void operator()(GVC_t* gvc) const { gvFreeContext(gvc); }
};

struct GraphDeleter {
    void operator()(Agraph_t* graph) const { agclose(graph); }
};

LinkError RenderFailure(const std::string& message) {
    std::cerr << "[GraphvizRenderer] " << message << std::endl;
    return LinkError{LinkErrorKind::Output, message};
}

} // namespace

std::optional<LinkError> GraphvizRenderer::renderPng(const std::string& dotSource, const std::string& outputPath) {
    std::unique_ptr<GVC_t, ContextDeleter> gvc(gvContext());
    if (!gvc) {
        return RenderFailure("Cannot create a Graphviz context");
    }

    std::unique_ptr<Agraph_t, GraphDeleter> graph(agmemread(dotSource.c_str()));
    if (!graph) {
        return RenderFailure("Graphviz rejected the preview document");
    }

    if (gvLayout(gvc.get(), graph.get(), kLayoutEngine) != 0) {
        return RenderFailure(std::string("Layout engine '") + kLayoutEngine + "' failed");
    }
    int rendered = gvRenderFilename(gvc.get(), graph.get(), "png", outputPath.c_str());
    gvFreeLayout(gvc.get(), graph.get());
    if (rendered != 0) {
        return RenderFailure("Cannot render " + outputPath);
    }
    return std::nullopt;
}

} // namespace zlinker::infrastructure

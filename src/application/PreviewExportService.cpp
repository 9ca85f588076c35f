#include "application/PreviewExportService.hpp"
#include <sstream>

namespace zlinker::application {

namespace {

std::string Quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string PreviewExportService::toDot(const std::vector<domain::LinkNode>& nodes, const domain::DependencyGraph& graph) {
    std::stringstream ss;
    ss << "strict digraph preview {\n";
    ss << "    layout=sfdp;\n";
    ss << "    node [style=filled];\n";

    for (const auto& node : nodes) {
        if (!node.isPreviewed()) continue;
        ss << "    " << Quote(node.getName())
           << " [label=" << Quote(node.getName())
           << ", fillcolor=" << Quote(node.getTarget().color) << "];\n";
    }

    for (const auto& edge : graph.edges) {
        const auto& from = nodes.at(edge.from);
        const auto& to = nodes.at(edge.to);
        if (!from.isPreviewed() || !to.isPreviewed()) continue;
        ss << "    " << Quote(from.getName()) << " -> " << Quote(to.getName()) << ";\n";
    }

    ss << "}\n";
    return ss.str();
}

} // namespace zlinker::application

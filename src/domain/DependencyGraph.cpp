#include "domain/DependencyGraph.hpp"

namespace zlinker::domain {

DependencyGraph DependencyGraphBuilder::Link(std::vector<LinkNode>& nodes) {
    DependencyGraph graph;

    for (size_t from = 0; from < nodes.size(); ++from) {
        const std::string& text = nodes[from].getRawText();
        std::vector<size_t> dependencies;
        for (size_t to = 0; to < nodes.size(); ++to) {
            if (text.find(nodes[to].getName()) != std::string::npos) {
                dependencies.push_back(to);
                graph.edges.push_back({from, to});
            }
        }
        nodes[from].setDependencies(std::move(dependencies));
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = 0; j < nodes.size(); ++j) {
            if (i == j) continue;
            const std::string& inner = nodes[i].getName();
            const std::string& outer = nodes[j].getName();
            if (inner.size() < outer.size() && outer.find(inner) != std::string::npos) {
                graph.overlaps.push_back({i, j});
            }
        }
    }

    return graph;
}

} // namespace zlinker::domain

/**
 * @file DependencyGraph.hpp
 * @brief Linking pass computing reference edges between LinkNodes.
 */

#pragma once

#include <vector>
#include "LinkNode.hpp"

namespace zlinker::domain {

/**
 * @struct DependencyEdge
 * @brief from -> to means the text of `from` contains the symbolic name of `to`.
 */
struct DependencyEdge {
    size_t from; ///< Index of the depending node.
    size_t to;   ///< Index of the node it references.

    bool operator==(const DependencyEdge& other) const {
        return from == other.from && to == other.to;
    }
};

/**
 * @struct NameOverlap
 * @brief Two symbolic names where one occurs inside the other.
 *
 * Substituting the shorter name can corrupt occurrences of the longer one.
 */
struct NameOverlap {
    size_t inner; ///< Node whose name is contained.
    size_t outer; ///< Node whose name contains it.
};

struct DependencyGraph {
    std::vector<DependencyEdge> edges;
    std::vector<NameOverlap> overlaps;
};

class DependencyGraphBuilder {
public:
    /**
     * @brief Links every node of the set, in node order.
     *
     * Runs once, after all nodes exist. An edge A -> B is added iff B's name
     * occurs in A's raw text; this includes A -> A. Cycles are not detected here.
     *
     * @param nodes The full node set. Each node's dependency list is set.
     * @return Edges in insertion order and the detected name overlaps.
     * @throws std::logic_error if a node was already linked.
     */
    static DependencyGraph Link(std::vector<LinkNode>& nodes);
};

} // namespace zlinker::domain

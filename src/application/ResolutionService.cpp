/**
 * @file ResolutionService.cpp
 * @brief Implementation of the two-phase and fast resolution algorithms.
 */

#include "application/ResolutionService.hpp"

#include <stdexcept>

namespace zlinker::application {

using domain::LinkError;
using domain::LinkErrorKind;
using domain::LinkNode;

ResolutionService::ResolutionService(std::shared_ptr<domain::LinkRegistry> registry,
                                     std::shared_ptr<domain::PayloadEncoder> encoder)
    : m_registry(std::move(registry)), m_encoder(std::move(encoder)) {
    if (!m_registry || !m_encoder) {
        throw std::invalid_argument("ResolutionService: registry and encoder are required.");
    }
}

std::optional<LinkError> ResolutionService::resolveAll(std::vector<LinkNode>& nodes,
                                                       ResolutionMode mode,
                                                       StepCallback onStep) {
    for (const auto& node : nodes) {
        if (!node.isLinked()) {
            throw std::logic_error("ResolutionService: " + node.getName() + " was not linked.");
        }
    }

    if (mode == ResolutionMode::Fast) {
        return resolveFast(nodes, onStep);
    }
    return resolveTwoPhase(nodes, onStep);
}

std::string ResolutionService::SubstituteDependencies(const LinkNode& node, const std::vector<LinkNode>& nodes) {
    std::vector<const LinkNode*> candidates;
    for (size_t index : node.getDependencies()) {
        const LinkNode& dependency = nodes.at(index);
        if (dependency.getUrl()) {
            candidates.push_back(&dependency);
        }
    }

    // Single left-to-right pass over the raw text: inserted URLs are never rescanned,
    // and the longest name starting at a position wins.
    const std::string& raw = node.getRawText();
    std::string text;
    text.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        const LinkNode* match = nullptr;
        for (const LinkNode* candidate : candidates) {
            const std::string& name = candidate->getName();
            if (raw.compare(pos, name.size(), name) == 0 &&
                (!match || name.size() > match->getName().size())) {
                match = candidate;
            }
        }
        if (match) {
            text += *match->getUrl();
            pos += match->getName().size();
        } else {
            text += raw[pos++];
        }
    }
    return text;
}

std::optional<size_t> ResolutionService::FindReady(const std::vector<LinkNode>& nodes) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].isResolved()) continue;

        bool ready = true;
        for (size_t index : nodes[i].getDependencies()) {
            if (!nodes.at(index).isResolved()) {
                ready = false;
                break;
            }
        }
        if (ready) return i;
    }
    return std::nullopt;
}

std::optional<LinkError> ResolutionService::resolveTwoPhase(std::vector<LinkNode>& nodes, const StepCallback& onStep) {
    // Phase 1: every node gets a URL over its unsubstituted text.
    for (auto& node : nodes) {
        if (!node.getUrl()) {
            auto result = m_registry->createOrFind(longUrlFor(node, node.getRawText()), true);
            if (!result.success) {
                return LinkError{LinkErrorKind::Registry,
                                 "Could not shorten URL for " + node.getName() + ": " + result.errorMessage};
            }
            node.assignUrl(result.shortUrl);
        }
        if (onStep) onStep(nodes);
    }

    // Phase 2: every URL exists now, rewrite each node with its final content.
    for (auto& node : nodes) {
        std::string text = SubstituteDependencies(node, nodes);
        auto result = m_registry->update(*node.getUrl(), longUrlFor(node, text));
        if (!result.success) {
            return LinkError{LinkErrorKind::Registry,
                             "Could not update short URL " + *node.getUrl() + ": " + result.errorMessage};
        }
        node.markResolved();
        if (onStep) onStep(nodes);
    }

    return std::nullopt;
}

std::optional<LinkError> ResolutionService::resolveFast(std::vector<LinkNode>& nodes, const StepCallback& onStep) {
    size_t remaining = 0;
    for (const auto& node : nodes) {
        if (!node.isResolved()) ++remaining;
    }

    while (remaining > 0) {
        auto ready = FindReady(nodes);
        if (!ready) {
            std::string stalled;
            for (const auto& node : nodes) {
                if (node.isResolved()) continue;
                if (!stalled.empty()) stalled += ", ";
                stalled += node.getName();
            }
            return LinkError{LinkErrorKind::Cycle,
                             "Cannot resolve fast with cycling dependencies (unresolved: " + stalled + ")"};
        }

        LinkNode& node = nodes[*ready];
        std::string text = SubstituteDependencies(node, nodes);
        auto result = m_registry->createOrFind(longUrlFor(node, text), false);
        if (!result.success) {
            return LinkError{LinkErrorKind::Registry,
                             "Could not shorten URL for " + node.getName() + ": " + result.errorMessage};
        }
        node.assignUrl(result.shortUrl);
        node.markResolved();
        --remaining;
        if (onStep) onStep(nodes);
    }

    return std::nullopt;
}

std::string ResolutionService::longUrlFor(const LinkNode& node, const std::string& text) const {
    return node.getTarget().buildUrl(m_encoder->encode(text));
}

} // namespace zlinker::application

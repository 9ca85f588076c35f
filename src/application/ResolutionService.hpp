/**
 * @file ResolutionService.hpp
 * @brief Replaces symbolic names with short URLs and publishes every link.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/LinkError.hpp"
#include "domain/LinkNode.hpp"
#include "domain/LinkRegistry.hpp"
#include "domain/PayloadEncoder.hpp"

namespace zlinker::application {

/**
 * @enum ResolutionMode
 * @brief Strategy used to finalize the node set.
 */
enum class ResolutionMode {
    TwoPhase, ///< Placeholder then finalize. Tolerates cycles, 2xN registry calls.
    Fast      ///< Dependency order. Fails on cycles, N registry calls.
};

/**
 * @class ResolutionService
 * @brief Drives the registry and the encoder to finalize linked nodes.
 *
 * Strictly sequential: each registry call completes before the next is issued.
 * All Phase 1 writes complete before any Phase 2 substitution reads a URL.
 */
class ResolutionService {
public:
    /** @brief Called after every resolution step, for progress display. */
    using StepCallback = std::function<void(const std::vector<domain::LinkNode>&)>;

    ResolutionService(std::shared_ptr<domain::LinkRegistry> registry,
                      std::shared_ptr<domain::PayloadEncoder> encoder);

    /**
     * @brief Resolves every node of an already linked set.
     * @param nodes Node set; dependencies are indices into it.
     * @param mode Resolution strategy.
     * @param onStep Optional progress hook.
     * @return The first fatal error, or nullopt when every node is resolved.
     */
    std::optional<domain::LinkError> resolveAll(std::vector<domain::LinkNode>& nodes,
                                                ResolutionMode mode,
                                                StepCallback onStep = nullptr);

    /**
     * @brief Raw text with every dependency name replaced by that dependency's URL.
     *
     * The raw text is scanned once; at each position the longest dependency name
     * wins and the inserted URL is never scanned again. A dependency without a
     * URL is left as is.
     */
    static std::string SubstituteDependencies(const domain::LinkNode& node,
                                              const std::vector<domain::LinkNode>& nodes);

    /** @brief First unresolved node whose dependencies are all resolved. */
    static std::optional<size_t> FindReady(const std::vector<domain::LinkNode>& nodes);

private:
    std::optional<domain::LinkError> resolveTwoPhase(std::vector<domain::LinkNode>& nodes, const StepCallback& onStep);
    std::optional<domain::LinkError> resolveFast(std::vector<domain::LinkNode>& nodes, const StepCallback& onStep);

    std::string longUrlFor(const domain::LinkNode& node, const std::string& text) const;

    std::shared_ptr<domain::LinkRegistry> m_registry;
    std::shared_ptr<domain::PayloadEncoder> m_encoder;
};

} // namespace zlinker::application

/**
 * @file LinkerApp.hpp
 * @brief Command line driver: parse, link, preview and resolve a data file.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/AppTarget.hpp"
#include "domain/DependencyGraph.hpp"
#include "domain/GraphRenderer.hpp"
#include "domain/LinkError.hpp"
#include "domain/LinkRegistry.hpp"
#include "domain/PayloadEncoder.hpp"
#include "infrastructure/FileRepository.hpp"

namespace zlinker::app {

/**
 * @struct LinkerOptions
 * @brief Command line switches.
 */
struct LinkerOptions {
    bool withDebug = false; ///< --with-debug
    bool fast = false;      ///< -f, --fast
    bool preview = false;   ///< -p, --preview
    bool dry = false;       ///< --dry
    bool quiet = false;     ///< -q, --quiet
    bool help = false;      ///< -h, --help
    std::string dataPath = "data.txt"; ///< -d, --data
};

/**
 * @class LinkerApp
 * @brief Orchestrates one run. The only place where errors become exit codes.
 */
class LinkerApp {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitUsage = 2;

    struct ParsedArguments {
        LinkerOptions options;
        std::optional<std::string> error;
    };

    /**
     * @param workDir Base directory for the data file, .env and preview output.
     * @param targets Destination table.
     */
    explicit LinkerApp(std::filesystem::path workDir,
                       domain::AppTargetTable targets = domain::AppTargetTable::Default());

    /**
     * @brief Parses argv, runs the pipeline and returns the process exit code.
     */
    int Run(int argc, const char* const argv[]);

    /**
     * @brief Runs the pipeline for already parsed options.
     * @return The fatal error that stopped the run, if any.
     */
    std::optional<domain::LinkError> execute(const LinkerOptions& options);

    /** @brief Replaces the Shlink registry built from configuration. */
    void setRegistry(std::shared_ptr<domain::LinkRegistry> registry) { m_registry = std::move(registry); }

    /** @brief Replaces the Graphviz renderer used by --preview. */
    void setRenderer(std::shared_ptr<domain::GraphRenderer> renderer) { m_renderer = std::move(renderer); }

    /** @brief Replaces the LZ-string encoder. */
    void setEncoder(std::shared_ptr<domain::PayloadEncoder> encoder) { m_encoder = std::move(encoder); }

    static ParsedArguments ParseArguments(int argc, const char* const argv[]);

    static std::string HelpText(const domain::AppTargetTable& targets);

private:
    std::filesystem::path m_workDir;
    domain::AppTargetTable m_targets;
    std::shared_ptr<domain::LinkRegistry> m_registry;
    std::shared_ptr<domain::PayloadEncoder> m_encoder;
    std::shared_ptr<domain::GraphRenderer> m_renderer;

    std::optional<domain::LinkError> writePreview(const infrastructure::FileRepository& files,
                                                  const std::vector<domain::LinkNode>& nodes,
                                                  const domain::DependencyGraph& graph) const;
};

} // namespace zlinker::app

/**
 * @file LinkerApp.cpp
 * @brief Implementation of the LinkerApp class.
 */
#include "app/LinkerApp.hpp"

#include <iostream>
#include <sstream>
#include <vector>

#include "application/DocumentParser.hpp"
#include "application/PreviewExportService.hpp"
#include "application/ResolutionService.hpp"
#include "domain/DependencyGraph.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileRepository.hpp"
#ifdef ZLINKER_WITH_GRAPHVIZ
#include "infrastructure/GraphvizRenderer.hpp"
#endif
#include "infrastructure/LzStringEncoder.hpp"
#include "infrastructure/ShlinkRegistryAdapter.hpp"
#include "ui/ProgressPrinter.hpp"

namespace zlinker::app {

using domain::LinkError;
using domain::LinkErrorKind;

LinkerApp::LinkerApp(std::filesystem::path workDir, domain::AppTargetTable targets)
    : m_workDir(std::move(workDir)), m_targets(std::move(targets)) {}

int LinkerApp::Run(int argc, const char* const argv[]) {
    auto parsed = ParseArguments(argc, argv);
    if (parsed.error) {
        std::cerr << "[LinkerApp] " << *parsed.error << "\n\n" << HelpText(m_targets);
        return kExitUsage;
    }
    if (parsed.options.help) {
        std::cout << HelpText(m_targets);
        return kExitSuccess;
    }

    auto error = execute(parsed.options);
    if (error) {
        std::cerr << "[LinkerApp] ERROR (" << LinkError::KindToString(error->kind) << "): "
                  << error->message << std::endl;
        return kExitFailure;
    }
    return kExitSuccess;
}

std::optional<LinkError> LinkerApp::execute(const LinkerOptions& options) {
    infrastructure::FileRepository files(m_workDir);

    std::string readError;
    auto content = files.readText(options.dataPath, &readError);
    if (!content) {
        return LinkError{LinkErrorKind::Input, "Cannot read " + options.dataPath + ": " + readError};
    }

    application::DocumentParser parser(m_targets);
    auto parsed = parser.Parse(*content, options.withDebug);
    if (parsed.error) {
        return parsed.error;
    }
    std::vector<domain::LinkNode>& nodes = parsed.nodes;

    auto graph = domain::DependencyGraphBuilder::Link(nodes);
    for (const auto& overlap : graph.overlaps) {
        std::cerr << "[LinkerApp] Warning: link name '" << nodes[overlap.inner].getName()
                  << "' occurs inside '" << nodes[overlap.outer].getName()
                  << "', substitution may be ambiguous" << std::endl;
    }
    std::cout << "[LinkerApp] linked " << nodes.size() << " links (" << graph.edges.size() << " references)" << std::endl;

    if (options.preview) {
        if (auto error = writePreview(files, nodes, graph)) {
            return error;
        }
    }

    if (options.dry) {
        return std::nullopt;
    }

    auto registry = m_registry;
    if (!registry) {
        auto config = infrastructure::ConfigLoader::LoadRegistryConfig(m_workDir);
        if (!config) {
            return LinkError{LinkErrorKind::Config,
                             std::string("Missing ") + infrastructure::ConfigLoader::kApiUriVar + " or " +
                                 infrastructure::ConfigLoader::kApiKeyVar};
        }
        registry = std::make_shared<infrastructure::ShlinkRegistryAdapter>(config->apiUri, config->apiKey);
    }
    auto encoder = m_encoder ? m_encoder : std::make_shared<infrastructure::LzStringEncoder>();

    application::ResolutionService resolver(registry, encoder);
    ui::ProgressPrinter progress(std::cout, m_targets, options.quiet);

    std::cout << "[LinkerApp] resolving links for " << nodes.size() << " links..." << std::endl;
    progress.print(nodes);
    auto mode = options.fast ? application::ResolutionMode::Fast : application::ResolutionMode::TwoPhase;
    auto error = resolver.resolveAll(nodes, mode, [&progress](const std::vector<domain::LinkNode>& current) {
        progress.print(current);
    });
    if (error) {
        return error;
    }

    std::cout << "[LinkerApp] resolved " << nodes.size() << " links" << std::endl;
    return std::nullopt;
}

std::optional<LinkError> LinkerApp::writePreview(const infrastructure::FileRepository& files,
                                                 const std::vector<domain::LinkNode>& nodes,
                                                 const domain::DependencyGraph& graph) const {
    using application::PreviewExportService;

    std::cout << "[LinkerApp] generating preview for " << nodes.size() << " links..." << std::endl;
    std::string dot = PreviewExportService::toDot(nodes, graph);
    if (!files.saveText(PreviewExportService::kSourceFilename, dot)) {
        return LinkError{LinkErrorKind::Output,
                         "Could not write " + files.resolve(PreviewExportService::kSourceFilename).string()};
    }

    auto renderer = m_renderer;
#ifdef ZLINKER_WITH_GRAPHVIZ
    if (!renderer) {
        renderer = std::make_shared<infrastructure::GraphvizRenderer>();
    }
#endif
    if (!renderer) {
        return LinkError{LinkErrorKind::Output,
                         std::string("zlinker was built without Graphviz, cannot render ") +
                             PreviewExportService::kImageFilename};
    }

    std::string imagePath = files.resolve(PreviewExportService::kImageFilename).string();
    if (auto error = renderer->renderPng(dot, imagePath)) {
        return error;
    }
    std::cout << "[LinkerApp] preview written to " << imagePath << std::endl;
    return std::nullopt;
}

LinkerApp::ParsedArguments LinkerApp::ParseArguments(int argc, const char* const argv[]) {
    ParsedArguments parsed;
    LinkerOptions& options = parsed.options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--with-debug") {
            options.withDebug = true;
        } else if (arg == "-f" || arg == "--fast") {
            options.fast = true;
        } else if (arg == "-p" || arg == "--preview") {
            options.preview = true;
        } else if (arg == "--dry") {
            options.dry = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-d" || arg == "--data") {
            if (i + 1 >= argc) {
                parsed.error = "Option " + arg + " expects a file path";
                return parsed;
            }
            options.dataPath = argv[++i];
        } else if (arg.rfind("--data=", 0) == 0) {
            options.dataPath = arg.substr(7);
        } else {
            parsed.error = "Unknown argument: " + arg;
            return parsed;
        }
    }

    if (options.dataPath.empty()) {
        parsed.error = "Empty data file path";
    }
    return parsed;
}

std::string LinkerApp::HelpText(const domain::AppTargetTable& targets) {
    std::ostringstream out;
    out << "usage: zlinker [-h] [--with-debug] [-f] [-p] [--dry] [-q] [-d data.txt]\n\n"
        << "links z-app data between them.\n"
        << "(see data.sample.txt for data format; link names are ASCII letters, digits and '_')\n"
        << "separators:\n";
    for (const auto& target : targets.targets()) {
        out << std::string(application::DocumentParser::kSeparatorCount, target.separator) << " " << target.uri << "\n";
    }
    out << "\noptions:\n"
        << "  -h, --help            show this help message and exit\n"
        << "  --with-debug          create debug Cross-Roads link with all links within\n"
        << "  -f, --fast            resolve links in dependency order (faster, fails on cycles)\n"
        << "  -p, --preview         show links tree in a preview.png file (source in preview.dot)\n"
        << "  --dry                 do not compute links\n"
        << "  -q, --quiet           only show the progress bar\n"
        << "  -d, --data data.txt   data file path (default: data.txt)\n"
        << "\nenvironment:\n"
        << "  SHLINK_API_URI, SHLINK_API_KEY (also read from .env or ~/.config/zlinker/settings.json)\n";
    return out.str();
}

} // namespace zlinker::app

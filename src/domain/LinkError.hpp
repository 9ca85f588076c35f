/**
 * @file LinkError.hpp
 * @brief Fatal error values propagated up to the application driver.
 */

#pragma once

#include <string>

namespace zlinker::domain {

/**
 * @enum LinkErrorKind
 * @brief Categories of fatal errors. Every one of them aborts the run.
 */
enum class LinkErrorKind {
    Input,    ///< Data file could not be read.
    Parse,    ///< Empty or malformed data file.
    Config,   ///< Registry configuration missing.
    Output,   ///< Preview could not be written or rendered.
    Registry, ///< Registry call failed.
    Cycle     ///< Fast mode stalled on cycling dependencies.
};

struct LinkError {
    LinkErrorKind kind;
    std::string message;

    static const char* KindToString(LinkErrorKind k) {
        switch (k) {
            case LinkErrorKind::Input: return "input";
            case LinkErrorKind::Parse: return "parse";
            case LinkErrorKind::Config: return "config";
            case LinkErrorKind::Output: return "output";
            case LinkErrorKind::Registry: return "registry";
            case LinkErrorKind::Cycle: return "cycle";
        }
        return "input";
    }
};

} // namespace zlinker::domain

/**
 * @file AppTarget.cpp
 * @brief Implementation of AppTarget and AppTargetTable.
 */

#include "domain/AppTarget.hpp"

#include <stdexcept>
#include <unordered_set>

namespace zlinker::domain {

std::string AppTarget::buildUrl(const std::string& payload) const {
    return uri + "?z=" + payload;
}

AppTargetTable::AppTargetTable(std::vector<AppTarget> targets)
    : m_targets(std::move(targets)) {
    std::unordered_set<char> separators;
    std::unordered_set<std::string> uris;
    for (const auto& target : m_targets) {
        if (target.separator == '\0') {
            throw std::invalid_argument("AppTargetTable: target " + target.uri + " has no separator.");
        }
        if (!separators.insert(target.separator).second) {
            throw std::invalid_argument(std::string("AppTargetTable: duplicate separator '") + target.separator + "'.");
        }
        if (!uris.insert(target.uri).second) {
            throw std::invalid_argument("AppTargetTable: duplicate uri " + target.uri + ".");
        }
    }
}

AppTargetTable AppTargetTable::Default() {
    return AppTargetTable({
        {"https://app.fortuna-events.fr", '=', "#e6e6e6"},
        {"https://treasure.fortuna-events.fr", '@', "#a1a1e6"},
        {"https://quizz.fortuna-events.fr", '?', "#e6a1a1"},
        {"https://roads.fortuna-events.fr", '+', "#a1e6a1"},
        {"https://dice.fortuna-events.fr", '%', "#e6a1e6"},
        {"https://quest.fortuna-events.fr", '$', "#a1e6e6"},
    });
}

const AppTarget& AppTargetTable::DebugTarget() {
    static const AppTarget debug{"https://github.com/clement-gouin/z-cross-roads", '\0', "#ffffff"};
    return debug;
}

const AppTarget* AppTargetTable::findBySeparator(char separator) const {
    for (const auto& target : m_targets) {
        if (target.separator == separator) {
            return &target;
        }
    }
    return nullptr;
}

std::optional<size_t> AppTargetTable::indexOf(const std::string& uri) const {
    for (size_t i = 0; i < m_targets.size(); ++i) {
        if (m_targets[i].uri == uri) {
            return i;
        }
    }
    return std::nullopt;
}

std::string AppTargetTable::separators() const {
    std::string out;
    for (const auto& target : m_targets) {
        out.push_back(target.separator);
    }
    return out;
}

} // namespace zlinker::domain

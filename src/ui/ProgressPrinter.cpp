#include "ui/ProgressPrinter.hpp"

#include <cmath>
#include <sstream>

#include "domain/LinkStatus.hpp"

namespace zlinker::ui {

namespace {
constexpr const char* kReset = "\033[0m";
constexpr const char* kBlue = "\033[34;1m";
constexpr const char* kGreen = "\033[32;1m";
constexpr const char* kYellow = "\033[33;1m";
constexpr const char* kWhite = "\033[37;1m";
constexpr const char* kEraseLineAbove = "\x1b[1A\x1b[2K";

std::string Repeat(const std::string& s, long count) {
    std::string out;
    for (long i = 0; i < count; ++i) out += s;
    return out;
}

long RoundHalfEven(double value) {
    return static_cast<long>(std::nearbyint(value));
}
}

ProgressPrinter::ProgressPrinter(std::ostream& out, domain::AppTargetTable targets, bool quiet)
    : m_out(out), m_targets(std::move(targets)), m_quiet(quiet) {}

void ProgressPrinter::print(const std::vector<domain::LinkNode>& nodes) {
    for (size_t i = 0; i < m_linesDrawn; ++i) {
        m_out << kEraseLineAbove;
    }

    m_linesDrawn = 0;
    if (!m_quiet) {
        for (const auto& node : nodes) {
            m_out << "* " << colorOf(node.getTarget()) << node.getName() << kReset << ": " << StatusLine(node) << "\n";
            ++m_linesDrawn;
        }
    }
    m_out << BarLine(nodes) << std::endl;
    ++m_linesDrawn;
}

std::string ProgressPrinter::colorOf(const domain::AppTarget& target) const {
    auto index = m_targets.indexOf(target.uri);
    if (!index) return kWhite;
    return "\033[" + std::to_string(31 + *index) + ";1m";
}

std::string ProgressPrinter::StatusLine(const domain::LinkNode& node) {
    const auto& url = node.getUrl();
    switch (domain::StatusOf(url, node.isResolved())) {
        case domain::LinkStatus::Creating:
            return std::string(kYellow) + "creating..." + kReset;
        case domain::LinkStatus::Updating:
            return std::string(kBlue) + *url + kReset + " " + kYellow + "updating..." + kReset;
        case domain::LinkStatus::Done:
            return std::string(kBlue) + url.value_or("") + kReset + " " + kGreen + "done" + kReset;
    }
    return {};
}

std::string ProgressPrinter::BarLine(const std::vector<domain::LinkNode>& nodes) {
    double resolved = 0.0;
    double linked = 0.0;
    if (!nodes.empty()) {
        size_t resolvedCount = 0;
        size_t withUrl = 0;
        for (const auto& node : nodes) {
            if (node.isResolved()) ++resolvedCount;
            if (node.getUrl()) ++withUrl;
        }
        resolved = static_cast<double>(resolvedCount) / nodes.size();
        linked = static_cast<double>(withUrl) / nodes.size() - resolved;
    }
    double remaining = 1.0 - linked - resolved;

    std::ostringstream out;
    out << "[" << kGreen << Repeat("#", RoundHalfEven(resolved * kBarSize))
        << kYellow << Repeat("#", RoundHalfEven(linked * kBarSize))
        << kReset << Repeat("·", RoundHalfEven(remaining * kBarSize)) << "] ("
        << RoundHalfEven((linked + resolved) * 100) << "% linked, "
        << RoundHalfEven(resolved * 100) << "% resolved)";
    return out.str();
}

} // namespace zlinker::ui

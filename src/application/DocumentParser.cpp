/**
 * @file DocumentParser.cpp
 * @brief Implementation of DocumentParser.
 */

#include "application/DocumentParser.hpp"

#include <cctype>
#include <iostream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace zlinker::application {

using domain::LinkError;
using domain::LinkErrorKind;
using domain::LinkNode;

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> SplitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::stringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string Join(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::regex BuildHeaderPattern(const std::string& separators) {
    std::string charClass;
    for (char c : separators) {
        if (c == '\\' || c == ']' || c == '^' || c == '-') charClass += '\\';
        charClass += c;
    }
    return std::regex("^([" + charClass + "])\\1{" + std::to_string(DocumentParser::kSeparatorCount - 1) + "}\\s*");
}

// Word characters of a name; bytes of UTF-8 sequences are taken too so they can be rejected.
bool IsNameByte(char c) {
    auto byte = static_cast<unsigned char>(c);
    return byte >= 0x80 || std::isalnum(byte) || c == '_';
}

bool IsAscii(const std::string& s) {
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

} // namespace

DocumentParser::DocumentParser(domain::AppTargetTable targets)
    : m_targets(std::move(targets)) {}

DocumentParser::Result DocumentParser::Parse(const std::string& content, bool addDebug) const {
    Result result;

    std::string trimmed = Trim(content);
    if (trimmed.empty()) {
        result.error = LinkError{LinkErrorKind::Parse, "Empty data file"};
        return result;
    }

    const std::regex header = BuildHeaderPattern(m_targets.separators());
    std::unordered_set<std::string> names;

    const domain::AppTarget* currentTarget = nullptr;
    std::string currentName;
    std::vector<std::string> buffer;

    auto flush = [&]() {
        if (currentTarget) {
            result.nodes.emplace_back(*currentTarget, currentName, Join(buffer));
        }
    };

    size_t lineNumber = 0;
    for (const auto& line : SplitLines(trimmed)) {
        ++lineNumber;
        std::smatch match;
        std::string name;
        if (std::regex_search(line, match, header)) {
            size_t start = static_cast<size_t>(match.length(0));
            size_t end = start;
            while (end < line.size() && IsNameByte(line[end])) ++end;
            name = line.substr(start, end - start);
        }
        if (!name.empty()) {
            if (!IsAscii(name)) {
                result.nodes.clear();
                result.error = LinkError{LinkErrorKind::Parse,
                                         "Link name '" + name + "' at line " + std::to_string(lineNumber) +
                                             " must use ASCII letters, digits and '_' only"};
                return result;
            }
            flush();
            currentTarget = m_targets.findBySeparator(match[1].str()[0]);
            currentName = name;
            buffer.clear();
            if (!names.insert(currentName).second) {
                result.nodes.clear();
                result.error = LinkError{LinkErrorKind::Parse,
                                         "Duplicate link name '" + currentName + "' at line " + std::to_string(lineNumber)};
                return result;
            }
        } else if (!currentTarget) {
            result.error = LinkError{LinkErrorKind::Parse,
                                     "Content before the first link header at line " + std::to_string(lineNumber)};
            return result;
        } else {
            buffer.push_back(line);
        }
    }
    flush();

    if (addDebug) {
        if (names.count(kDebugName)) {
            result.nodes.clear();
            result.error = LinkError{LinkErrorKind::Parse, std::string("Link name '") + kDebugName + "' is reserved"};
            return result;
        }
        result.nodes.emplace_back(domain::AppTargetTable::DebugTarget(), kDebugName, BuildDebugText(result.nodes), false);
    }

    std::cout << "[DocumentParser] parsed " << result.nodes.size() << " links" << std::endl;
    return result;
}

std::string DocumentParser::BuildDebugText(const std::vector<LinkNode>& nodes) {
    std::ostringstream out;
    out << "Debug";
    for (const auto& node : nodes) {
        const std::string& name = node.getName();
        out << "\n" << name << "\n";
        for (size_t i = 0; i < name.size(); ++i) {
            if (i > 0) out << "&#x200B;";
            out << name[i];
        }
    }
    return out.str();
}

} // namespace zlinker::application

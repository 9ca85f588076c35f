#include "domain/LinkStatus.hpp"

namespace zlinker::domain {

LinkStatus StatusOf(const std::optional<std::string>& url, bool resolved) {
    if (resolved) return LinkStatus::Done;
    if (!url) return LinkStatus::Creating;
    return LinkStatus::Updating;
}

const char* ToString(LinkStatus status) {
    switch (status) {
        case LinkStatus::Creating: return "creating";
        case LinkStatus::Updating: return "updating";
        case LinkStatus::Done: return "done";
    }
    return "creating";
}

} // namespace zlinker::domain

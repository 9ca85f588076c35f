#include "infrastructure/ShlinkRegistryAdapter.hpp"

namespace zlinker::infrastructure {

ShlinkRegistryAdapter::ShlinkRegistryAdapter(const std::string& apiUri, const std::string& apiKey)
    : m_client(apiUri, apiKey) {}

domain::RegistryResult ShlinkRegistryAdapter::createOrFind(const std::string& longUrl, bool findExisting) {
    auto shortUrl = m_client.createShortUrl(longUrl, findExisting);
    if (!shortUrl) {
        return domain::RegistryResult::Failure(m_client.lastError());
    }
    return domain::RegistryResult::Ok(*shortUrl);
}

domain::RegistryResult ShlinkRegistryAdapter::update(const std::string& shortUrl, const std::string& newLongUrl) {
    if (!m_client.updateShortUrl(ShlinkClient::ShortCodeOf(shortUrl), newLongUrl)) {
        return domain::RegistryResult::Failure(m_client.lastError());
    }
    return domain::RegistryResult::Ok(shortUrl);
}

} // namespace zlinker::infrastructure

/**
 * @file ShlinkRegistryAdapter.hpp
 * @brief Adapter exposing a Shlink server as a LinkRegistry.
 */

#pragma once
#include "domain/LinkRegistry.hpp"
#include "infrastructure/ShlinkClient.hpp"
#include <string>

namespace zlinker::infrastructure {

/**
 * @class ShlinkRegistryAdapter
 * @brief Implements LinkRegistry using the Shlink REST API.
 */
class ShlinkRegistryAdapter : public domain::LinkRegistry {
public:
    ShlinkRegistryAdapter(const std::string& apiUri, const std::string& apiKey);

    /** @see domain::LinkRegistry::createOrFind */
    domain::RegistryResult createOrFind(const std::string& longUrl, bool findExisting) override;

    /** @brief Updates the short URL identified by the last path segment. @see domain::LinkRegistry::update */
    domain::RegistryResult update(const std::string& shortUrl, const std::string& newLongUrl) override;

private:
    ShlinkClient m_client;
};

} // namespace zlinker::infrastructure

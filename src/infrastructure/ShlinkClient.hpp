/**
 * @file ShlinkClient.hpp
 * @brief Low-level HTTP client for the Shlink REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace zlinker::infrastructure {

class ShlinkClient {
public:
    /**
     * @param apiUri Base URI of the REST API, e.g. "https://s.example.com/rest/v3".
     * @param apiKey Value of the X-Api-Key header.
     */
    ShlinkClient(const std::string& apiUri, const std::string& apiKey);

    /** @brief POST /short-urls. Returns the "shortUrl" field. */
    std::optional<std::string> createShortUrl(const std::string& longUrl, bool findIfExists);

    /** @brief PATCH /short-urls/{code}. */
    bool updateShortUrl(const std::string& shortCode, const std::string& longUrl);

    /** @brief Description of the last failure, empty after a success. */
    const std::string& lastError() const { return m_lastError; }

    /** @brief Last path segment of a short URL. */
    static std::string ShortCodeOf(const std::string& shortUrl);

    /**
     * @brief Splits "scheme://host[:port]/prefix" into its origin and path prefix.
     * The prefix has no trailing slash.
     */
    static std::pair<std::string, std::string> SplitBaseUri(const std::string& uri);

private:
    std::string m_origin;     ///< scheme://host[:port]
    std::string m_pathPrefix; ///< e.g. /rest/v3
    std::string m_apiKey;
    std::string m_lastError;
};

} // namespace zlinker::infrastructure

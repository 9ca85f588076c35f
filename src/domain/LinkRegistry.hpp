/**
 * @file LinkRegistry.hpp
 * @brief Interface for the external short-URL registry.
 */

#pragma once

#include <string>

namespace zlinker::domain {

/**
 * @struct RegistryResult
 * @brief Outcome of a registry call.
 */
struct RegistryResult {
    bool success = false;
    std::string shortUrl;     ///< Set by a successful createOrFind.
    std::string errorMessage; ///< Set on failure.

    static RegistryResult Ok(std::string url = {}) { return {true, std::move(url), {}}; }
    static RegistryResult Failure(std::string message) { return {false, {}, std::move(message)}; }
};

/**
 * @class LinkRegistry
 * @brief Abstract short-URL service. Calls are synchronous.
 */
class LinkRegistry {
public:
    virtual ~LinkRegistry() = default;

    /**
     * @brief Creates a short URL for a long URL.
     * @param longUrl Target URL.
     * @param findExisting If true, returns an existing short URL for the same long URL instead of creating a duplicate.
     */
    virtual RegistryResult createOrFind(const std::string& longUrl, bool findExisting) = 0;

    /**
     * @brief Repoints an existing short URL to a new long URL.
     */
    virtual RegistryResult update(const std::string& shortUrl, const std::string& newLongUrl) = 0;
};

} // namespace zlinker::domain

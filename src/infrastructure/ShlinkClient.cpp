#include "infrastructure/ShlinkClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace zlinker::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kReadTimeoutSeconds = 30;

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}
}

ShlinkClient::ShlinkClient(const std::string& apiUri, const std::string& apiKey)
    : m_apiKey(apiKey) {
    auto parts = SplitBaseUri(apiUri);
    m_origin = parts.first;
    m_pathPrefix = parts.second;
}

std::optional<std::string> ShlinkClient::createShortUrl(const std::string& longUrl, bool findIfExists) {
    httplib::Client cli(m_origin);
    if (!cli.is_valid()) {
        m_lastError = "Invalid registry URI: " + m_origin;
        std::cerr << "[ShlinkClient] " << m_lastError << std::endl;
        return std::nullopt;
    }
    cli.set_read_timeout(kReadTimeoutSeconds);

    json requestData = {
        {"longUrl", longUrl},
        {"findIfExists", findIfExists}
    };
    httplib::Headers headers = {{"X-Api-Key", m_apiKey}};

    auto res = cli.Post(m_pathPrefix + "/short-urls", headers, requestData.dump(), "application/json");
    if (res && IsSuccess(res->status)) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("shortUrl") && body["shortUrl"].is_string()) {
                m_lastError.clear();
                return body["shortUrl"].get<std::string>();
            }
            m_lastError = "Response missing 'shortUrl' field";
        } catch (const std::exception& e) {
            m_lastError = std::string("JSON Parse Error: ") + e.what();
        }
        std::cerr << "[ShlinkClient] " << m_lastError << "\nBody: " << res->body << std::endl;
    } else if (res) {
        m_lastError = std::to_string(res->status) + " " + res->reason;
        std::cerr << "[ShlinkClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        m_lastError = "Connection failed (error " + std::to_string(static_cast<int>(res.error())) + ")";
        std::cerr << "[ShlinkClient] " << m_lastError << std::endl;
    }
    return std::nullopt;
}

bool ShlinkClient::updateShortUrl(const std::string& shortCode, const std::string& longUrl) {
    httplib::Client cli(m_origin);
    if (!cli.is_valid()) {
        m_lastError = "Invalid registry URI: " + m_origin;
        std::cerr << "[ShlinkClient] " << m_lastError << std::endl;
        return false;
    }
    cli.set_read_timeout(kReadTimeoutSeconds);

    json requestData = {{"longUrl", longUrl}};
    httplib::Headers headers = {{"X-Api-Key", m_apiKey}};

    auto res = cli.Patch(m_pathPrefix + "/short-urls/" + shortCode, headers, requestData.dump(), "application/json");
    if (res && IsSuccess(res->status)) {
        m_lastError.clear();
        return true;
    }
    if (res) {
        m_lastError = std::to_string(res->status) + " " + res->reason;
        std::cerr << "[ShlinkClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        m_lastError = "Connection failed (error " + std::to_string(static_cast<int>(res.error())) + ")";
        std::cerr << "[ShlinkClient] " << m_lastError << std::endl;
    }
    return false;
}

std::string ShlinkClient::ShortCodeOf(const std::string& shortUrl) {
    std::string url = shortUrl;
    while (!url.empty() && url.back() == '/') url.pop_back();
    size_t slash = url.find_last_of('/');
    return slash == std::string::npos ? url : url.substr(slash + 1);
}

std::pair<std::string, std::string> ShlinkClient::SplitBaseUri(const std::string& uri) {
    size_t schemeEnd = uri.find("://");
    size_t hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    size_t pathStart = uri.find('/', hostStart);
    if (pathStart == std::string::npos) {
        return {uri, ""};
    }
    std::string prefix = uri.substr(pathStart);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {uri.substr(0, pathStart), prefix};
}

} // namespace zlinker::infrastructure

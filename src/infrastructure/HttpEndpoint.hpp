/**
 * @file HttpEndpoint.hpp
 * @brief Parsed scheme://host[:port][/path] base URL.
 */

#pragma once

#include <string>

namespace draftlens::infrastructure {

struct HttpEndpoint {
    std::string scheme;   ///< "http" or "https"
    std::string host;
    int port = 0;
    std::string basePath; ///< No trailing slash; empty for the root.

    /** @brief "scheme://host:port" as accepted by httplib::Client. */
    std::string origin() const;

    /** @brief basePath + @p path. */
    std::string resolve(const std::string& path) const;

    bool isLoopback() const;

    /**
     * @brief Parses a base URL.
     * @throws std::invalid_argument when it is malformed.
     */
    static HttpEndpoint Parse(const std::string& url);

    /**
     * @brief Parses and additionally requires https unless the host is loopback.
     * @throws std::invalid_argument
     */
    static HttpEndpoint ParseSecure(const std::string& url);
};

} // namespace draftlens::infrastructure

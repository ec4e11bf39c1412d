/**
 * @file HttpEndpoint.cpp
 * @brief Implementation of HttpEndpoint.
 */

#include "infrastructure/HttpEndpoint.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace draftlens::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string HttpEndpoint::origin() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

std::string HttpEndpoint::resolve(const std::string& path) const {
    if (path.empty() || path.front() != '/') {
        return basePath + "/" + path;
    }
    return basePath + path;
}

bool HttpEndpoint::isLoopback() const {
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

HttpEndpoint HttpEndpoint::Parse(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }

    HttpEndpoint ep;
    ep.scheme = ToLower(url.substr(0, sep));
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + ep.scheme);
    }

    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);
    if (authority.empty()) {
        throw std::invalid_argument("Invalid URL (missing host): " + url);
    }
    if (authority.find('@') != std::string::npos) {
        throw std::invalid_argument("Credentials in URL are not allowed: " + url);
    }

    std::string portText;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid IPv6 host: " + url);
        }
        ep.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Invalid URL authority: " + url);
            }
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            ep.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else {
            ep.host = authority;
        }
    }
    ep.host = ToLower(ep.host);
    if (ep.host.empty()) {
        throw std::invalid_argument("Invalid URL (missing host): " + url);
    }

    if (!portText.empty()) {
        if (!std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); }) ||
            portText.size() > 5) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
        ep.port = std::stoi(portText);
        if (ep.port <= 0 || ep.port > 65535) {
            throw std::invalid_argument("Port out of range in URL: " + url);
        }
    } else {
        ep.port = ep.scheme == "https" ? 443 : 80;
    }

    auto query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    ep.basePath = path;
    return ep;
}

HttpEndpoint HttpEndpoint::ParseSecure(const std::string& url) {
    HttpEndpoint ep = Parse(url);
    if (ep.scheme != "https" && !ep.isLoopback()) {
        throw std::invalid_argument("Base URL must use https unless it points at localhost: " + url);
    }
    return ep;
}

} // namespace draftlens::infrastructure

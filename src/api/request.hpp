#pragma once

#include <map>
#include <optional>
#include <string>

namespace lockbox::api {

/**
 * @brief Transport-independent HTTP request
 *
 * Header names are stored lowercase. Query parameters are percent-decoded.
 * remoteAddress is the peer's IP address when the transport knows it.
 */
struct Request {
    std::string method;
    std::string remoteAddress;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string& lowercaseName) const {
        auto it = headers.find(lowercaseName);
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> queryParam(const std::string& name) const {
        auto it = query.find(name);
        if (it == query.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::map<std::string, std::string> headers;
    std::string body;
};

} // namespace lockbox::api

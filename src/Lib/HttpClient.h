//
// Synchronous outbound HTTP(S) requests to the relay's collaborators
//

#ifndef TELESTORE_RELAY_HTTPCLIENT_H
#define TELESTORE_RELAY_HTTPCLIENT_H

#include <cstdint>
#include <string>
#include <utility.hpp>

struct sHttpResult {
    uint32_t status = 0;
    std::string content;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
};

// Performs a request against an absolute http:// or https:// url. Throws std::runtime_error when the url is
// malformed or the server can't be reached; HTTP error statuses are returned, not thrown.
auto outboundRequest(
        const std::string& method,
        const std::string& url,
        const std::string& content,
        const SimpleWeb::CaseInsensitiveMultimap& headers,
        uint32_t timeoutSeconds
) -> sHttpResult;

// Encodes fields as an application/x-www-form-urlencoded body
auto formEncode(const SimpleWeb::CaseInsensitiveMultimap& fields) -> std::string;

#endif //TELESTORE_RELAY_HTTPCLIENT_H

#include "HttpClient.h"
#include <client_http.hpp>
#include <client_https.hpp>
#include <stdexcept>

using HttpClientImpl = SimpleWeb::Client<SimpleWeb::HTTP>;
using HttpsClientImpl = SimpleWeb::Client<SimpleWeb::HTTPS>;

namespace {
struct sUrl {
    bool secure = false;
    std::string hostPort;
    std::string path;
};

auto parseUrl(const std::string& url) -> sUrl
{
    sUrl result;

    std::string remainder;
    if (url.rfind("https://", 0) == 0)
    {
        result.secure = true;
        remainder = url.substr(std::string("https://").size());
    }
    else if (url.rfind("http://", 0) == 0)
    {
        remainder = url.substr(std::string("http://").size());
    }
    else
    {
        throw std::runtime_error("Unsupported url " + url);
    }

    auto slash = remainder.find('/');
    result.hostPort = remainder.substr(0, slash);
    result.path = slash == std::string::npos ? "/" : remainder.substr(slash);

    if (result.hostPort.empty())
    {
        throw std::runtime_error("Url has no host " + url);
    }

    return result;
}

template<class ClientType>
auto performRequest(
        ClientType& client,
        const std::string& hostPort,
        const std::string& method,
        const std::string& path,
        const std::string& content,
        const SimpleWeb::CaseInsensitiveMultimap& headers,
        uint32_t timeoutSeconds
) -> sHttpResult
{
    client.config.timeout = timeoutSeconds;
    client.config.timeout_connect = timeoutSeconds;

    try
    {
        auto response = client.request(method, path, content, headers);

        sHttpResult result;
        result.status = static_cast<uint32_t>(std::stoul(response->status_code));
        result.content = response->content.string();
        return result;
    }
    catch (const SimpleWeb::system_error& error)
    {
        // The path is left out as it can carry credentials
        throw std::runtime_error(
                "Request " + method + " to " + hostPort + " failed: " + std::to_string(error.code().value()) + " "
                + error.code().message()
        );
    }
}
} // namespace

auto outboundRequest(
        const std::string& method,
        const std::string& url,
        const std::string& content,
        const SimpleWeb::CaseInsensitiveMultimap& headers,
        uint32_t timeoutSeconds
) -> sHttpResult
{
    auto target = parseUrl(url);

    if (target.secure)
    {
        HttpsClientImpl client(target.hostPort, true);
        return performRequest(client, target.hostPort, method, target.path, content, headers, timeoutSeconds);
    }

    HttpClientImpl client(target.hostPort);
    return performRequest(client, target.hostPort, method, target.path, content, headers, timeoutSeconds);
}

auto formEncode(const SimpleWeb::CaseInsensitiveMultimap& fields) -> std::string
{
    return SimpleWeb::QueryString::create(fields);
}

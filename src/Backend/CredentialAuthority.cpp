#include "CredentialAuthority.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/HttpClient.h"
#include "../Settings.h"
#include <iostream>
#include <utility>

CredentialAuthority::CredentialAuthority(std::string backendUrl) : backendUrl(std::move(backendUrl))
{
}

auto CredentialAuthority::fetchCredentials(const std::string& authToken) -> sCredentials
{
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Authorization", "Bearer " + authToken);

    sHttpResult result;
    try
    {
        result = outboundRequest(
                "GET", backendUrl + "/api/worker/credentials", "", headers, OUTBOUND_HTTP_TIMEOUT_SECONDS
        );
    }
    catch (std::exception& e)
    {
        throw eCredentialFetchError(std::string("Error fetching credentials: ") + e.what());
    }

    if (!result.ok())
    {
        throw eCredentialFetchError("Failed to fetch credentials: " + std::to_string(result.status));
    }

    auto payload = nlohmann::json::parse(result.content, nullptr, false);
    if (payload.is_discarded() || !payload.is_object())
    {
        throw eCredentialFetchError("Credential authority returned a malformed payload");
    }

    return sCredentials(payload);
}

auto CredentialAuthority::verifyDownloadToken(const std::string& token) -> sCredentials
{
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", "application/x-www-form-urlencoded");

    SimpleWeb::CaseInsensitiveMultimap fields;
    fields.emplace("token", token);

    sHttpResult result;
    try
    {
        result = outboundRequest(
                "POST",
                backendUrl + "/api/worker/verify-download-token",
                formEncode(fields),
                headers,
                OUTBOUND_HTTP_TIMEOUT_SECONDS
        );
    }
    catch (std::exception& e)
    {
        dumpExceptions(e);
        throw eNotAuthorized("Failed to verify token");
    }

    if (!result.ok())
    {
        throw eNotAuthorized("Invalid or expired token");
    }

    auto payload = nlohmann::json::parse(result.content, nullptr, false);
    if (payload.is_discarded() || !payload.is_object())
    {
        throw eNotAuthorized("Failed to verify token");
    }

    return sCredentials(payload);
}

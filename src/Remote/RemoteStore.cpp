#include "RemoteStore.h"
#include "../Lib/Errors.h"
#include "../Lib/HttpClient.h"
#include "../Lib/MimeTypes.h"
#include "../Lib/MultipartForm.h"
#include "../Settings.h"
#include "SessionClient.h"
#include <boost/algorithm/string/join.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

RemoteStore::RemoteStore(std::string botApiUrl, std::string gatewayHost)
    : botApiUrl(std::move(botApiUrl)), gatewayHost(std::move(gatewayHost))
{
}

auto RemoteStore::sendSmallObject(
        const sCredentials& credentials,
        const std::string& path,
        const std::string& fileName
) -> sRemoteRecord
{
    if (!credentials.hasSmallObjectCredentials())
    {
        std::vector<std::string> missing;
        if (credentials.botToken.empty())
        {
            missing.emplace_back("bot_token");
        }
        if (credentials.channelId.empty())
        {
            missing.emplace_back("channel_id");
        }
        throw eRemoteRejected("Missing required credentials: " + boost::algorithm::join(missing, ", "));
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        throw eRemoteRejected("Unable to open " + path + " for upload");
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    MultipartBuilder form;
    form.addField("chat_id", credentials.channelId);
    form.addFile("document", fileName, getMimeType(fileName), content);

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", form.getContentType());

    sHttpResult result;
    try
    {
        result = outboundRequest(
                "POST",
                botApiUrl + "/bot" + credentials.botToken + "/sendDocument",
                form.finish(),
                headers,
                SMALL_OBJECT_TIMEOUT_SECONDS
        );
    }
    catch (std::exception& e)
    {
        throw eRemoteRejected(std::string("Error sending object: ") + e.what());
    }

    auto response = nlohmann::json::parse(result.content, nullptr, false);
    if (response.is_discarded())
    {
        throw eRemoteRejected("Remote store returned a malformed response (" + std::to_string(result.status) + ")");
    }

    return decodeSmallObjectResponse(response);
}

auto RemoteStore::openSession(const sCredentials& credentials) -> std::unique_ptr<IRemoteSession>
{
    auto missing = credentials.missingSessionFields();
    if (!missing.empty())
    {
        throw eRemoteSession("Missing required credentials: " + boost::algorithm::join(missing, ", "));
    }

    return std::make_unique<SessionClient>(credentials, gatewayHost);
}

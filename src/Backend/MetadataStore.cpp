#include "MetadataStore.h"
#include "../Lib/HttpClient.h"
#include "../Settings.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

MetadataStore::MetadataStore(std::string backendUrl) : backendUrl(std::move(backendUrl))
{
}

void MetadataStore::notifyUploadComplete(const std::string& authToken, const sFileRecord& record)
{
    nlohmann::json body = {
            {"userId", record.userId},
            {"name", record.fileName},
            {"size", record.size},
            {"mimeType", record.mimeType},
            {"messageId", record.messageId},
            {"fileId", record.fileId}
    };

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Authorization", "Bearer " + authToken);
    headers.emplace("Content-Type", "application/json");

    auto result = outboundRequest("POST", backendUrl + "/api/files", body.dump(), headers, OUTBOUND_HTTP_TIMEOUT_SECONDS);
    if (!result.ok())
    {
        throw std::runtime_error(
                "Metadata store refused file record for message " + std::to_string(record.messageId) + ": "
                + std::to_string(result.status) + " " + result.content
        );
    }
}

#include "RemoteRecord.h"
#include "../Lib/Errors.h"

auto sRemoteRecord::fileId() const -> std::string
{
    return std::visit([](const auto& value) { return value.fileId; }, media);
}

auto sRemoteRecord::mediaKind() const -> eMediaKind
{
    switch (media.index())
    {
        case 1:
            return eMediaKind::video;
        case 2:
            return eMediaKind::audio;
        case 3:
            return eMediaKind::photo;
        default:
            return eMediaKind::document;
    }
}

namespace {
auto nestedFileId(const nlohmann::json& result, const std::string& key) -> std::string
{
    if (!result.contains(key) || !result[key].is_object())
    {
        return {};
    }

    const auto& media = result[key];
    if (!media.contains("file_id") || !media["file_id"].is_string())
    {
        return {};
    }

    return media["file_id"].get<std::string>();
}

auto photoFileId(const nlohmann::json& result) -> std::string
{
    if (!result.contains("photo") || !result["photo"].is_array() || result["photo"].empty())
    {
        return {};
    }

    // Sizes are listed smallest first
    const auto& largest = result["photo"].back();
    if (!largest.is_object() || !largest.contains("file_id") || !largest["file_id"].is_string())
    {
        return {};
    }

    return largest["file_id"].get<std::string>();
}
} // namespace

auto decodeSmallObjectResponse(const nlohmann::json& response) -> sRemoteRecord
{
    auto accepted = response.is_object() && response.contains("ok") && response["ok"].is_boolean()
            && response["ok"].get<bool>();
    if (!accepted)
    {
        auto description = response.is_object() && response.contains("description") && response["description"].is_string()
                ? response["description"].get<std::string>()
                : std::string("Unknown error");
        throw eRemoteRejected("Remote store rejected the object: " + description);
    }

    if (!response.contains("result") || !response["result"].is_object())
    {
        throw eRemoteRejected("Remote store response has no result");
    }

    const auto& result = response["result"];
    if (!result.contains("message_id") || !result["message_id"].is_number_integer())
    {
        throw eRemoteRejected("Remote store response has no message id");
    }

    sRemoteRecord record;
    record.messageId = result["message_id"].get<uint64_t>();

    auto documentId = nestedFileId(result, "document");
    auto videoId = nestedFileId(result, "video");
    auto audioId = nestedFileId(result, "audio");
    auto photoId = photoFileId(result);

    if (!documentId.empty())
    {
        record.media = sDocumentMedia{documentId};
    }
    else if (!videoId.empty())
    {
        record.media = sVideoMedia{videoId};
    }
    else if (!audioId.empty())
    {
        record.media = sAudioMedia{audioId};
    }
    else if (!photoId.empty())
    {
        record.media = sPhotoMedia{photoId};
    }
    else
    {
        throw eRemoteRejected("Failed to get a file id from the remote store response");
    }

    return record;
}

auto decodeSessionResult(uint64_t messageId, uint8_t kind, const std::string& handle) -> sRemoteRecord
{
    if (handle.empty())
    {
        throw eRemoteRejected("Remote session returned message " + std::to_string(messageId) + " without a file handle");
    }

    sRemoteRecord record;
    record.messageId = messageId;

    switch (static_cast<eMediaKind>(kind))
    {
        case eMediaKind::document:
            record.media = sDocumentMedia{handle};
            break;
        case eMediaKind::video:
            record.media = sVideoMedia{handle};
            break;
        case eMediaKind::audio:
            record.media = sAudioMedia{handle};
            break;
        case eMediaKind::photo:
            record.media = sPhotoMedia{handle};
            break;
        default:
            throw eRemoteRejected("Remote session returned unknown media kind " + std::to_string(kind));
    }

    return record;
}

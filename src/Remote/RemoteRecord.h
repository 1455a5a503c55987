//
// The remote store's record of a stored object
//

#ifndef TELESTORE_RELAY_REMOTERECORD_H
#define TELESTORE_RELAY_REMOTERECORD_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

// Media kind tags as they appear on the session protocol
enum class eMediaKind : uint8_t {
    document = 1,
    video = 2,
    audio = 3,
    photo = 4
};

struct sDocumentMedia {
    std::string fileId;
};

struct sVideoMedia {
    std::string fileId;
};

struct sAudioMedia {
    std::string fileId;
};

struct sPhotoMedia {
    std::string fileId;
};

using RemoteMedia = std::variant<sDocumentMedia, sVideoMedia, sAudioMedia, sPhotoMedia>;

struct sRemoteRecord {
    uint64_t messageId = 0;
    RemoteMedia media;

    [[nodiscard]] auto fileId() const -> std::string;
    [[nodiscard]] auto mediaKind() const -> eMediaKind;
};

// Decodes a small object API response. Throws eRemoteRejected if the remote refused the object, or the result
// carries no recognisable media
auto decodeSmallObjectResponse(const nlohmann::json& response) -> sRemoteRecord;

// Builds the record from an UPLOAD_RESULT frame's fields. Throws eRemoteRejected on an unknown kind or empty handle
auto decodeSessionResult(uint64_t messageId, uint8_t kind, const std::string& handle) -> sRemoteRecord;

#endif //TELESTORE_RELAY_REMOTERECORD_H

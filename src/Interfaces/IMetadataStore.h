//
// Interface to the metadata store, which owns file and folder records
//

#ifndef TELESTORE_RELAY_I_METADATA_STORE_H
#define TELESTORE_RELAY_I_METADATA_STORE_H

#include <cstdint>
#include <string>

struct sFileRecord {
    std::string userId;
    std::string fileName;
    uint64_t messageId = 0;
    std::string fileId;
    uint64_t size = 0;
    std::string mimeType;
};

class IMetadataStore {
public:
    virtual ~IMetadataStore() = default;

    // Records a successfully stored object. Throws std::runtime_error if the store could not be notified
    virtual void notifyUploadComplete(const std::string& authToken, const sFileRecord& record) = 0;
};

#endif //TELESTORE_RELAY_I_METADATA_STORE_H

//
// Metadata store client, records completed uploads with the backend
//

#ifndef TELESTORE_RELAY_METADATASTORE_H
#define TELESTORE_RELAY_METADATASTORE_H

#include "../Interfaces/IMetadataStore.h"
#include <string>

class MetadataStore : public IMetadataStore {
public:
    explicit MetadataStore(std::string backendUrl);

    void notifyUploadComplete(const std::string& authToken, const sFileRecord& record) override;

private:
    std::string backendUrl;
};

#endif //TELESTORE_RELAY_METADATASTORE_H

//
// The relay's process wide state, shared by every HTTP handler
//

#ifndef TELESTORE_RELAY_I_APPLICATION_H
#define TELESTORE_RELAY_I_APPLICATION_H

#include <memory>

class ChunkAssembler;
class DownloadRelay;
class UploadCoordinator;
class UploadRegistry;

class IApplication {
public:
    virtual ~IApplication() = default;

    virtual auto getChunkAssembler() -> std::shared_ptr<ChunkAssembler> = 0;
    virtual auto getUploadRegistry() -> std::shared_ptr<UploadRegistry> = 0;
    virtual auto getUploadCoordinator() -> std::shared_ptr<UploadCoordinator> = 0;
    virtual auto getDownloadRelay() -> std::shared_ptr<DownloadRelay> = 0;
};

#endif //TELESTORE_RELAY_I_APPLICATION_H

//
// Owns the relay's process wide state and its servers
//

#ifndef TELESTORE_RELAY_APPLICATION_H
#define TELESTORE_RELAY_APPLICATION_H

#include "HTTP/HttpServer.h"
#include "Interfaces/IApplication.h"
#include "Interfaces/ICredentialAuthority.h"
#include "Interfaces/IMetadataStore.h"
#include "Interfaces/IRemoteStore.h"
#include "Lib/GeneralUtils.h"
#include "Lib/TestingMacros.h"
#include "Transfer/ChunkAssembler.h"
#include "Transfer/CredentialCache.h"
#include "Transfer/DownloadRelay.h"
#include "Transfer/TransferDispatcher.h"
#include "Transfer/UploadCoordinator.h"
#include "Transfer/UploadRegistry.h"
#include <memory>
#include <string>
#include <thread>

class Application : public IApplication, public std::enable_shared_from_this<Application> {
public:
    Application(
            std::shared_ptr<IRemoteStore> remoteStore,
            std::shared_ptr<ICredentialAuthority> authority,
            std::shared_ptr<IMetadataStore> metadataStore,
            std::string uploadDir
    );
    ~Application() override;

    Application(Application const&) = delete;
    auto operator=(Application const&) -> Application& = delete;
    Application(Application&&) = delete;
    auto operator=(Application&&) -> Application& = delete;

    // Creates the HTTP server, which needs a shared reference to the application
    void initializeComponents();

    auto getChunkAssembler() -> std::shared_ptr<ChunkAssembler> override { return chunkAssembler; }
    auto getUploadRegistry() -> std::shared_ptr<UploadRegistry> override { return uploadRegistry; }
    auto getUploadCoordinator() -> std::shared_ptr<UploadCoordinator> override { return uploadCoordinator; }
    auto getDownloadRelay() -> std::shared_ptr<DownloadRelay> override { return downloadRelay; }

    // Starts the HTTP server and the sweeper
    void start();

    // Starts everything and blocks until the HTTP server stops
    void run();

    void stop();

    // Drops expired chunk sets and old finished upload records
    void sweep();

private:
    void runSweeper();

    std::shared_ptr<CredentialCache> credentialCache;
    std::shared_ptr<ChunkAssembler> chunkAssembler;
    std::shared_ptr<UploadRegistry> uploadRegistry;
    std::shared_ptr<TransferDispatcher> dispatcher;
    std::shared_ptr<UploadCoordinator> uploadCoordinator;
    std::shared_ptr<DownloadRelay> downloadRelay;
    std::shared_ptr<HttpServer> httpServer;

    InterruptableTimer sweeperTimer;
    std::thread sweeperThread;
    bool bRunning = false;
};

// Builds the application against the real collaborators named by the environment
auto createApplication() -> std::shared_ptr<Application>;

auto createApplication(
        const std::shared_ptr<IRemoteStore>& remoteStore,
        const std::shared_ptr<ICredentialAuthority>& authority,
        const std::shared_ptr<IMetadataStore>& metadataStore,
        const std::string& uploadDir
) -> std::shared_ptr<Application>;

#endif //TELESTORE_RELAY_APPLICATION_H

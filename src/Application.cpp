#include "Application.h"
#include "Backend/CredentialAuthority.h"
#include "Backend/MetadataStore.h"
#include "Remote/RemoteStore.h"
#include "Settings.h"
#include <iostream>
#include <utility>

Application::Application(
        std::shared_ptr<IRemoteStore> remoteStore,
        std::shared_ptr<ICredentialAuthority> authority,
        std::shared_ptr<IMetadataStore> metadataStore,
        std::string uploadDir
)
{
    credentialCache = std::make_shared<CredentialCache>(std::chrono::seconds(CREDENTIAL_CACHE_TTL_SECONDS));
    chunkAssembler = std::make_shared<ChunkAssembler>();
    uploadRegistry = std::make_shared<UploadRegistry>();

    dispatcher = std::make_shared<TransferDispatcher>(
            uploadRegistry,
            remoteStore,
            std::move(metadataStore),
            DISPATCH_WORKER_POOL_SIZE,
            DISPATCH_QUEUE_LIMIT,
            SMALL_OBJECT_LIMIT
    );

    uploadCoordinator = std::make_shared<UploadCoordinator>(
            chunkAssembler, uploadRegistry, dispatcher, credentialCache, authority, std::move(uploadDir)
    );

    downloadRelay = std::make_shared<DownloadRelay>(std::move(authority), std::move(remoteStore), TRANSFER_BLOCK_SIZE);
}

Application::~Application()
{
    stop();
}

void Application::initializeComponents()
{
    httpServer = std::make_shared<HttpServer>(shared_from_this());
}

void Application::start()
{
    bRunning = true;

    sweeperThread = std::thread([this]() {
        runSweeper();
    });

    httpServer->start();
}

void Application::run()
{
    start();
    httpServer->join();
}

void Application::stop()
{
    if (!bRunning)
    {
        return;
    }
    bRunning = false;

    httpServer->stop();

    sweeperTimer.stop();
    if (sweeperThread.joinable())
    {
        sweeperThread.join();
    }

    // Let running uploads reach a terminal state so their temp files are removed
    dispatcher->join();
}

void Application::sweep()
{
    auto chunkSets = chunkAssembler->pruneExpired(std::chrono::seconds(CHUNK_SESSION_TTL_SECONDS));
    auto uploads = uploadRegistry->pruneTerminal(std::chrono::seconds(UPLOAD_RECORD_RETENTION_SECONDS));

    if (chunkSets != 0 || uploads != 0)
    {
        std::cout << "Sweeper: Dropped " << chunkSets << " expired chunk sets and " << uploads
                  << " finished uploads" << std::endl;
    }
}

void Application::runSweeper()
{
    while (sweeperTimer.wait_for(std::chrono::seconds(SWEEPER_INTERVAL_SECONDS)))
    {
        try
        {
            sweep();
        }
        catch (std::exception& e)
        {
            std::cerr << "Sweeper: Pass failed" << std::endl;
            dumpExceptions(e);
        }
    }
}

auto createApplication(
        const std::shared_ptr<IRemoteStore>& remoteStore,
        const std::shared_ptr<ICredentialAuthority>& authority,
        const std::shared_ptr<IMetadataStore>& metadataStore,
        const std::string& uploadDir
) -> std::shared_ptr<Application>
{
    auto app = std::make_shared<Application>(remoteStore, authority, metadataStore, uploadDir);
    app->initializeComponents();
    return app;
}

auto createApplication() -> std::shared_ptr<Application>
{
    return createApplication(
            std::make_shared<RemoteStore>(BOT_API_URL, SESSION_GATEWAY_HOST),
            std::make_shared<CredentialAuthority>(BACKEND_URL),
            std::make_shared<MetadataStore>(BACKEND_URL),
            UPLOAD_DIR
    );
}

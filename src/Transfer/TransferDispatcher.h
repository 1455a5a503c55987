//
// Moves upload sessions through Received -> Dispatched -> InProgress -> Completed | Failed, sending the object to
// the remote store on a bounded background worker pool
//

#ifndef TELESTORE_RELAY_TRANSFERDISPATCHER_H
#define TELESTORE_RELAY_TRANSFERDISPATCHER_H

#include "../Interfaces/IMetadataStore.h"
#include "../Interfaces/IRemoteStore.h"
#include "../Lib/TestingMacros.h"
#include "UploadRegistry.h"
#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <string>

enum class eTransferStrategy {
    Stateless,
    Session
};

class TransferDispatcher {
public:
    TransferDispatcher(
            std::shared_ptr<UploadRegistry> registry,
            std::shared_ptr<IRemoteStore> remoteStore,
            std::shared_ptr<IMetadataStore> metadataStore,
            uint32_t workerCount,
            uint32_t queueLimit,
            uint64_t smallObjectLimit
    );
    ~TransferDispatcher();

    TransferDispatcher(TransferDispatcher const&) = delete;
    auto operator=(TransferDispatcher const&) -> TransferDispatcher& = delete;
    TransferDispatcher(TransferDispatcher&&) = delete;
    auto operator=(TransferDispatcher&&) -> TransferDispatcher& = delete;

    // Requests completion of an upload session and returns its state once the request has been applied.
    //   Received   -> queued for background dispatch
    //   Completed  -> returned unchanged
    //   Dispatched, InProgress -> eAlreadyInProgress
    //   Failed     -> eUploadFailed carrying the session's last error
    // Throws eUnknownSession if no such session exists, or eDispatchRejected when the worker pool is saturated
    auto complete(const std::string& uploadId) -> sUploadProgress;

    // Waits for all queued dispatches to finish. No further dispatches may be requested afterwards
    void join();

    static auto chooseStrategy(uint64_t size, const sCredentials& credentials, uint64_t smallObjectLimit)
            -> eTransferStrategy;

    [[nodiscard]] auto getPending() const -> uint32_t { return pending; }

private:
    // Runs on a worker, always leaves the session in a terminal state and removes its temp storage
    void execute(const std::shared_ptr<sUploadSession>& session);

    auto sendWithSession(const std::shared_ptr<sUploadSession>& session) -> sRemoteRecord;

    void notifyMetadataStore(const std::shared_ptr<sUploadSession>& session, const sRemoteRecord& record);

    static void removeTempStorage(const sUploadSession& session);

    std::shared_ptr<UploadRegistry> registry;
    std::shared_ptr<IRemoteStore> remoteStore;
    std::shared_ptr<IMetadataStore> metadataStore;

    uint32_t queueLimit;
    uint64_t smallObjectLimit;

    boost::asio::thread_pool pool;
    std::atomic<uint32_t> pending = 0;

EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(execute, const std::shared_ptr<sUploadSession>&);
};

#endif //TELESTORE_RELAY_TRANSFERDISPATCHER_H

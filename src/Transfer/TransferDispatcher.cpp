#include "TransferDispatcher.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/MimeTypes.h"
#include "../Remote/ScopedSession.h"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/filesystem.hpp>
#include <iostream>
#include <utility>

TransferDispatcher::TransferDispatcher(
        std::shared_ptr<UploadRegistry> registry,
        std::shared_ptr<IRemoteStore> remoteStore,
        std::shared_ptr<IMetadataStore> metadataStore,
        uint32_t workerCount,
        uint32_t queueLimit,
        uint64_t smallObjectLimit
)
    : registry(std::move(registry)),
      remoteStore(std::move(remoteStore)),
      metadataStore(std::move(metadataStore)),
      queueLimit(queueLimit),
      smallObjectLimit(smallObjectLimit),
      pool(workerCount)
{
}

TransferDispatcher::~TransferDispatcher()
{
    join();
}

void TransferDispatcher::join()
{
    pool.join();
}

auto TransferDispatcher::chooseStrategy(uint64_t size, const sCredentials& credentials, uint64_t smallObjectLimit)
        -> eTransferStrategy
{
    if (size <= smallObjectLimit && credentials.hasSmallObjectCredentials())
    {
        return eTransferStrategy::Stateless;
    }

    return eTransferStrategy::Session;
}

auto TransferDispatcher::complete(const std::string& uploadId) -> sUploadProgress
{
    auto session = registry->find(uploadId);
    if (!session)
    {
        throw eUnknownSession("Upload session not found");
    }

    std::unique_lock<std::mutex> lock(session->mutex);

    switch (session->state)
    {
        case eUploadState::Completed:
            return UploadRegistry::snapshot(*session);
        case eUploadState::Dispatched:
        case eUploadState::InProgress:
            throw eAlreadyInProgress("Upload already in progress");
        case eUploadState::Failed:
            throw eUploadFailed("Upload failed: " + session->lastError);
        case eUploadState::Received:
            break;
    }

    if (pending.fetch_add(1) >= queueLimit)
    {
        pending--;
        throw eDispatchRejected("Too many uploads in flight, try again later");
    }

    session->state = eUploadState::Dispatched;
    session->updatedAt = std::chrono::steady_clock::now();

    boost::asio::post(pool, [this, session]() {
        execute(session);
        pending--;
    });

    std::cout << "Dispatch: Queued upload " << uploadId << " (" << session->size << " bytes)" << std::endl;

    return UploadRegistry::snapshot(*session);
}

void TransferDispatcher::execute(const std::shared_ptr<sUploadSession>& session)
{
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->state = eUploadState::InProgress;
        session->updatedAt = std::chrono::steady_clock::now();
    }

    try
    {
        sRemoteRecord record;
        if (chooseStrategy(session->size, session->credentials, smallObjectLimit) == eTransferStrategy::Stateless)
        {
            record = remoteStore->sendSmallObject(session->credentials, session->tempStoragePath, session->fileName);
        }
        else
        {
            record = sendWithSession(session);
        }

        {
            std::unique_lock<std::mutex> lock(session->mutex);
            session->state = eUploadState::Completed;
            session->progressPercent = 100;
            session->messageId = record.messageId;
            session->fileId = record.fileId();
            session->updatedAt = std::chrono::steady_clock::now();
        }

        std::cout << "Dispatch: Upload " << session->uploadId << " stored as message " << record.messageId
                  << std::endl;

        notifyMetadataStore(session, record);
    }
    catch (std::exception& e)
    {
        {
            std::unique_lock<std::mutex> lock(session->mutex);
            session->state = eUploadState::Failed;
            session->lastError = e.what();
            session->updatedAt = std::chrono::steady_clock::now();
        }

        std::cerr << "Dispatch: Upload " << session->uploadId << " failed" << std::endl;
        dumpExceptions(e);
    }

    removeTempStorage(*session);
}

auto TransferDispatcher::sendWithSession(const std::shared_ptr<sUploadSession>& session) -> sRemoteRecord
{
    ScopedSession remote(remoteStore->openSession(session->credentials));

    remote->resolveChannel();

    return remote->uploadObject(
            session->tempStoragePath,
            session->fileName,
            session->size,
            [session](uint64_t sentBytes, uint64_t totalBytes) {
                auto percent = totalBytes == 0 ? 100 : static_cast<uint32_t>((sentBytes * 100) / totalBytes);

                std::unique_lock<std::mutex> lock(session->mutex);
                session->progressPercent = std::min<uint32_t>(percent, 100);
            }
    );
}

void TransferDispatcher::notifyMetadataStore(const std::shared_ptr<sUploadSession>& session, const sRemoteRecord& record)
{
    sFileRecord fileRecord;
    fileRecord.userId = session->credentials.userId;
    fileRecord.fileName = session->fileName;
    fileRecord.messageId = record.messageId;
    fileRecord.fileId = record.fileId();
    fileRecord.size = session->size;
    fileRecord.mimeType = getMimeType(session->fileName);

    try
    {
        metadataStore->notifyUploadComplete(session->authToken, fileRecord);
    }
    catch (std::exception& e)
    {
        std::cerr << "Dispatch: Unable to record upload " << session->uploadId << " with the metadata store"
                  << std::endl;
        dumpExceptions(e);
    }
}

void TransferDispatcher::removeTempStorage(const sUploadSession& session)
{
    boost::system::error_code errorCode;
    boost::filesystem::remove(session.tempStoragePath, errorCode);
    if (errorCode)
    {
        std::cerr << "Dispatch: Unable to remove " << session.tempStoragePath << ": " << errorCode.message()
                  << std::endl;
    }
}

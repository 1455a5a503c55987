#include "UploadCoordinator.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <iostream>
#include <utility>

UploadCoordinator::UploadCoordinator(
        std::shared_ptr<ChunkAssembler> chunkAssembler,
        std::shared_ptr<UploadRegistry> registry,
        std::shared_ptr<TransferDispatcher> dispatcher,
        std::shared_ptr<CredentialCache> credentialCache,
        std::shared_ptr<ICredentialAuthority> authority,
        std::string uploadDir
)
    : chunkAssembler(std::move(chunkAssembler)),
      registry(std::move(registry)),
      dispatcher(std::move(dispatcher)),
      credentialCache(std::move(credentialCache)),
      authority(std::move(authority)),
      uploadDir(std::move(uploadDir))
{
}

auto UploadCoordinator::resolveCredentials(const std::string& authToken) -> sCredentials
{
    return credentialCache->get(authToken, [this, authToken]() {
        return authority->fetchCredentials(authToken);
    });
}

auto UploadCoordinator::writeTempFile(const std::string& uploadId, const char* data, uint64_t size) -> std::string
{
    boost::filesystem::create_directories(uploadDir);

    // A fresh name per write, a chunk set may be promoted by two requests at once
    auto path = (boost::filesystem::path(uploadDir) / (uploadId + "-" + generateUUID())).string();

    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    file.write(data, static_cast<std::streamsize>(size));
    file.close();

    if (!file)
    {
        discardTempFile(path);
        throw std::runtime_error("Unable to write upload to " + path);
    }

    return path;
}

void UploadCoordinator::discardTempFile(const std::string& path)
{
    boost::system::error_code errorCode;
    boost::filesystem::remove(path, errorCode);
    if (errorCode)
    {
        std::cerr << "API: Unable to remove " << path << ": " << errorCode.message() << std::endl;
    }
}

void UploadCoordinator::registerReceived(const std::shared_ptr<sUploadSession>& session)
{
    if (!registry->create(session))
    {
        discardTempFile(session->tempStoragePath);
        throw std::runtime_error("Upload " + session->uploadId + " is already registered");
    }
}

auto UploadCoordinator::receive(const std::string& authToken, const std::string& fileName, const std::string& content)
        -> std::shared_ptr<sUploadSession>
{
    auto credentials = resolveCredentials(authToken);

    auto uploadId = generateUUID();
    auto path = writeTempFile(uploadId, content.data(), content.size());

    auto session = std::make_shared<sUploadSession>(uploadId, fileName, content.size(), path, credentials, authToken);
    registerReceived(session);

    std::cout << "API: Received " << fileName << " (" << content.size() << " bytes) as upload " << uploadId
              << std::endl;

    return session;
}

auto UploadCoordinator::complete(const std::string& uploadId) -> sUploadProgress
{
    if (registry->find(uploadId))
    {
        return dispatcher->complete(uploadId);
    }

    if (!chunkAssembler->contains(uploadId))
    {
        throw eUnknownSession("Upload session not found");
    }

    return promoteChunkSet(uploadId);
}

auto UploadCoordinator::promoteChunkSet(const std::string& uploadId) -> sUploadProgress
{
    std::vector<uint8_t> data;
    std::string authToken;
    std::string fileName;
    try
    {
        data = chunkAssembler->assemble(uploadId);
        authToken = chunkAssembler->getAuthToken(uploadId);
        fileName = chunkAssembler->status(uploadId).fileName;
    }
    catch (eUnknownSession&)
    {
        // Another request promoted the set while this one was looking at it
        if (registry->find(uploadId))
        {
            return dispatcher->complete(uploadId);
        }
        throw;
    }

    auto credentials = resolveCredentials(authToken);
    auto path = writeTempFile(uploadId, reinterpret_cast<const char*>(data.data()), data.size());

    auto session = std::make_shared<sUploadSession>(uploadId, fileName, data.size(), path, credentials, authToken);
    if (!registry->create(session))
    {
        // Lost the race, the winner owns the session and its storage
        discardTempFile(path);
        return dispatcher->complete(uploadId);
    }

    chunkAssembler->cancel(uploadId);

    std::cout << "API: Reassembled " << fileName << " (" << data.size() << " bytes) for upload " << uploadId
              << std::endl;

    try
    {
        return dispatcher->complete(uploadId);
    }
    catch (eAlreadyInProgress&)
    {
        // A concurrent completion dispatched the new session first
        return registry->get(uploadId);
    }
}

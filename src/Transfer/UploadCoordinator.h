//
// Turns client submissions, whole bodies or reassembled chunk sets, into upload sessions and hands them to the
// dispatcher
//

#ifndef TELESTORE_RELAY_UPLOADCOORDINATOR_H
#define TELESTORE_RELAY_UPLOADCOORDINATOR_H

#include "../Interfaces/ICredentialAuthority.h"
#include "../Lib/TestingMacros.h"
#include "ChunkAssembler.h"
#include "CredentialCache.h"
#include "TransferDispatcher.h"
#include "UploadRegistry.h"
#include <memory>
#include <string>

class UploadCoordinator {
public:
    UploadCoordinator(
            std::shared_ptr<ChunkAssembler> chunkAssembler,
            std::shared_ptr<UploadRegistry> registry,
            std::shared_ptr<TransferDispatcher> dispatcher,
            std::shared_ptr<CredentialCache> credentialCache,
            std::shared_ptr<ICredentialAuthority> authority,
            std::string uploadDir
    );

    // Credentials of the user holding authToken, through the cache. Throws eCredentialFetchError
    auto resolveCredentials(const std::string& authToken) -> sCredentials;

    // Stores a whole object body and registers a Received session for it
    auto receive(const std::string& authToken, const std::string& fileName, const std::string& content)
            -> std::shared_ptr<sUploadSession>;

    // Completes an upload session, promoting a finished chunk set to a session first if that is what uploadId names.
    // Throws eUnknownSession if uploadId names neither
    auto complete(const std::string& uploadId) -> sUploadProgress;

private:
    auto promoteChunkSet(const std::string& uploadId) -> sUploadProgress;

    // Writes data to a fresh file in the upload directory and returns its path
    auto writeTempFile(const std::string& uploadId, const char* data, uint64_t size) -> std::string;
    static void discardTempFile(const std::string& path);

    // Adds a freshly received session to the registry. If the id is already taken the session's file is removed and
    // std::runtime_error is thrown
    void registerReceived(const std::shared_ptr<sUploadSession>& session);

    std::shared_ptr<ChunkAssembler> chunkAssembler;
    std::shared_ptr<UploadRegistry> registry;
    std::shared_ptr<TransferDispatcher> dispatcher;
    std::shared_ptr<CredentialCache> credentialCache;
    std::shared_ptr<ICredentialAuthority> authority;
    std::string uploadDir;

EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(registerReceived, const std::shared_ptr<sUploadSession>&);
};

#endif //TELESTORE_RELAY_UPLOADCOORDINATOR_H

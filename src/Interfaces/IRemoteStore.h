//
// Interfaces to the remote object store
// The store is reachable through a stateless small object API and a session based streaming protocol
//

#ifndef TELESTORE_RELAY_I_REMOTE_STORE_H
#define TELESTORE_RELAY_I_REMOTE_STORE_H

#include "../Remote/Credentials.h"
#include "../Remote/RemoteRecord.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Called after every block sent to the remote store
using ProgressCallback = std::function<void(uint64_t sentBytes, uint64_t totalBytes)>;

// An open, authenticated session. Every operation throws eRemoteSession if the session fails.
class IRemoteSession {
public:
    virtual ~IRemoteSession() = default;

    // Resolves the destination channel named by the session's credentials
    virtual void resolveChannel() = 0;

    // Total size of the object stored in message messageId. Throws eObjectNotFound if there isn't one
    virtual auto getObjectSize(uint64_t messageId) -> uint64_t = 0;

    // Reads up to length bytes of the object starting at offset
    virtual auto readBlock(uint64_t messageId, uint64_t offset, uint64_t length) -> std::vector<uint8_t> = 0;

    // Streams the file at path to the channel in fixed size blocks
    virtual auto uploadObject(
            const std::string& path,
            const std::string& fileName,
            uint64_t size,
            const ProgressCallback& progress
    ) -> sRemoteRecord = 0;

    // Ends the session. Must be safe to call on a session that has already failed
    virtual void close() = 0;
};

class IRemoteStore {
public:
    virtual ~IRemoteStore() = default;

    // Sends the whole object in one request. Throws eRemoteRejected if the store refuses it
    virtual auto sendSmallObject(
            const sCredentials& credentials,
            const std::string& path,
            const std::string& fileName
    ) -> sRemoteRecord = 0;

    // Opens and authenticates a session. Throws eRemoteSession if credentials are missing or the session can't be opened
    virtual auto openSession(const sCredentials& credentials) -> std::unique_ptr<IRemoteSession> = 0;
};

#endif //TELESTORE_RELAY_I_REMOTE_STORE_H

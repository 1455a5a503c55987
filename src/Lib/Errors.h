//
// Relay error taxonomy
// Every error the relay reports carries a machine readable kind alongside its message
//

#ifndef TELESTORE_RELAY_ERRORS_H
#define TELESTORE_RELAY_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class eRelayError : public std::runtime_error {
public:
    explicit eRelayError(const std::string& message) : std::runtime_error(message) {}

    [[nodiscard]] virtual auto kind() const -> std::string = 0;
};

#define RELAY_ERROR(name, kindName)                                                 \
    class name : public eRelayError {                                               \
    public:                                                                         \
        explicit name(const std::string& message) : eRelayError(message) {}         \
        [[nodiscard]] auto kind() const -> std::string override { return kindName; } \
    };

// The credential authority could not be reached and nothing was cached for the user
RELAY_ERROR(eCredentialFetchError, "CredentialFetchError")

// The download token was rejected by the credential authority
RELAY_ERROR(eNotAuthorized, "Unauthorized")

RELAY_ERROR(eDuplicateSession, "DuplicateSessionError")
RELAY_ERROR(eUnknownSession, "UnknownSessionError")
RELAY_ERROR(eUnknownUpload, "UnknownUploadError")
RELAY_ERROR(eInvalidChunk, "InvalidChunkError")
RELAY_ERROR(eAlreadyInProgress, "AlreadyInProgressError")
RELAY_ERROR(eUploadFailed, "UploadFailedError")
RELAY_ERROR(eDispatchRejected, "DispatchRejectedError")

// The remote store refused the object (bad credentials, malformed payload, unrecognised result)
RELAY_ERROR(eRemoteRejected, "RemoteRejectedError")

// The remote session could not be opened, or failed while streaming
RELAY_ERROR(eRemoteSession, "RemoteSessionError")

RELAY_ERROR(eObjectNotFound, "ObjectNotFoundError")
RELAY_ERROR(eBadRequest, "BadRequest")

#undef RELAY_ERROR

class eIncompleteUpload : public eRelayError {
public:
    explicit eIncompleteUpload(std::vector<uint32_t> missing)
        : eRelayError(describe(missing)), missing(std::move(missing))
    {}

    [[nodiscard]] auto kind() const -> std::string override { return "IncompleteUploadError"; }

    // Ascending list of chunk indices that were never received
    [[nodiscard]] auto getMissing() const -> const std::vector<uint32_t>& { return missing; }

private:
    static auto describe(const std::vector<uint32_t>& missing) -> std::string
    {
        std::string result = "Not all chunks received, missing";
        for (auto index : missing)
        {
            result += " " + std::to_string(index);
        }
        return result;
    }

    std::vector<uint32_t> missing;
};

class eInvalidRange : public eRelayError {
public:
    eInvalidRange(const std::string& message, uint64_t totalSize) : eRelayError(message), totalSize(totalSize) {}

    [[nodiscard]] auto kind() const -> std::string override { return "InvalidRangeError"; }

    [[nodiscard]] auto getTotalSize() const -> uint64_t { return totalSize; }

private:
    uint64_t totalSize;
};

#endif //TELESTORE_RELAY_ERRORS_H

//
// Process wide registry of upload sessions, and the read-only progress view over them
//

#ifndef TELESTORE_RELAY_UPLOADREGISTRY_H
#define TELESTORE_RELAY_UPLOADREGISTRY_H

#include "../Remote/Credentials.h"
#include <chrono>
#include <cstdint>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

enum class eUploadState {
    Received,
    Dispatched,
    InProgress,
    Completed,
    Failed
};

// The status string clients see when polling
auto uploadStateName(eUploadState state) -> std::string;

struct sUploadSession {
    sUploadSession(
            std::string uploadId,
            std::string fileName,
            uint64_t size,
            std::string tempStoragePath,
            sCredentials credentials,
            std::string authToken
    );

    // Guards everything below it
    std::mutex mutex;

    const std::string uploadId;
    const std::string fileName;
    const uint64_t size;
    const std::string tempStoragePath;
    const sCredentials credentials;

    // The uploader's bearer token, forwarded to the metadata store
    const std::string authToken;

    eUploadState state = eUploadState::Received;
    uint32_t progressPercent = 0;

    // Set if and only if state is Completed
    std::optional<uint64_t> messageId;
    std::optional<std::string> fileId;

    std::string lastError;

    std::chrono::steady_clock::time_point updatedAt;
};

// A consistent copy of a session's observable state
struct sUploadProgress {
    std::string uploadId;
    eUploadState state = eUploadState::Received;
    uint32_t progressPercent = 0;
    std::optional<uint64_t> messageId;
    std::optional<std::string> fileId;
    std::string lastError;
};

class UploadRegistry {
public:
    // Returns false if a session with the same id already exists
    auto create(const std::shared_ptr<sUploadSession>& session) -> bool;

    // Returns nullptr if the id is unknown
    [[nodiscard]] auto find(const std::string& uploadId) const -> std::shared_ptr<sUploadSession>;

    // Throws eUnknownUpload if the id is unknown
    auto get(const std::string& uploadId) const -> sUploadProgress;

    // Drops Completed and Failed sessions whose last transition is older than retention
    auto pruneTerminal(std::chrono::seconds retention) -> size_t;

    [[nodiscard]] auto size() const -> size_t { return sessions.size(); }

    // Copies the session's state, the caller must hold session.mutex
    static auto snapshot(const sUploadSession& session) -> sUploadProgress;

private:
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sUploadSession>> sessions;
};

#endif //TELESTORE_RELAY_UPLOADREGISTRY_H

#include "UploadRegistry.h"
#include "../Lib/Errors.h"
#include <utility>
#include <vector>

auto uploadStateName(eUploadState state) -> std::string
{
    switch (state)
    {
        case eUploadState::Received:
            return "uploaded";
        case eUploadState::Dispatched:
            return "queued";
        case eUploadState::InProgress:
            return "uploading";
        case eUploadState::Completed:
            return "completed";
        case eUploadState::Failed:
            return "failed";
    }

    return "unknown";
}

sUploadSession::sUploadSession(
        std::string uploadId,
        std::string fileName,
        uint64_t size,
        std::string tempStoragePath,
        sCredentials credentials,
        std::string authToken
)
    : uploadId(std::move(uploadId)),
      fileName(std::move(fileName)),
      size(size),
      tempStoragePath(std::move(tempStoragePath)),
      credentials(std::move(credentials)),
      authToken(std::move(authToken)),
      updatedAt(std::chrono::steady_clock::now())
{
}

auto UploadRegistry::create(const std::shared_ptr<sUploadSession>& session) -> bool
{
    return sessions.insert(session->uploadId, session).second;
}

auto UploadRegistry::find(const std::string& uploadId) const -> std::shared_ptr<sUploadSession>
{
    auto session = sessions.find(uploadId);
    return session == sessions.end() ? nullptr : session->second;
}

auto UploadRegistry::snapshot(const sUploadSession& session) -> sUploadProgress
{
    sUploadProgress progress;
    progress.uploadId = session.uploadId;
    progress.state = session.state;
    progress.progressPercent = session.progressPercent;
    progress.messageId = session.messageId;
    progress.fileId = session.fileId;
    progress.lastError = session.lastError;
    return progress;
}

auto UploadRegistry::get(const std::string& uploadId) const -> sUploadProgress
{
    auto session = find(uploadId);
    if (!session)
    {
        throw eUnknownUpload("Upload not found");
    }

    std::unique_lock<std::mutex> lock(session->mutex);
    return snapshot(*session);
}

auto UploadRegistry::pruneTerminal(std::chrono::seconds retention) -> size_t
{
    auto now = std::chrono::steady_clock::now();

    std::vector<std::pair<std::string, std::shared_ptr<sUploadSession>>> expired;
    for (const auto& [uploadId, session] : sessions)
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        auto terminal = session->state == eUploadState::Completed || session->state == eUploadState::Failed;
        if (terminal && now - session->updatedAt > retention)
        {
            expired.emplace_back(uploadId, session);
        }
    }

    size_t pruned = 0;
    for (const auto& [uploadId, session] : expired)
    {
        pruned += sessions.erase_if_equal(uploadId, session);
    }

    return pruned;
}

#include "ChunkAssembler.h"
#include "../Lib/Errors.h"

void ChunkAssembler::initSession(
        const std::string& uploadId,
        const std::string& fileName,
        uint32_t totalChunks,
        const std::string& authToken
)
{
    if (totalChunks == 0)
    {
        throw eInvalidChunk("An upload must have at least one chunk");
    }

    auto chunkSet = std::make_shared<sChunkSet>();
    chunkSet->uploadId = uploadId;
    chunkSet->fileName = fileName;
    chunkSet->authToken = authToken;
    chunkSet->totalChunks = totalChunks;
    chunkSet->lastActivity = std::chrono::steady_clock::now();

    if (!chunkSets.insert(uploadId, chunkSet).second)
    {
        throw eDuplicateSession("Upload session " + uploadId + " already exists");
    }
}

auto ChunkAssembler::getChunkSet(const std::string& uploadId) const -> std::shared_ptr<sChunkSet>
{
    auto chunkSet = chunkSets.find(uploadId);
    if (chunkSet == chunkSets.end())
    {
        throw eUnknownSession("Upload session not found");
    }

    return chunkSet->second;
}

auto ChunkAssembler::putChunk(const std::string& uploadId, uint32_t index, std::vector<uint8_t> bytes) -> uint32_t
{
    auto chunkSet = getChunkSet(uploadId);

    std::unique_lock<std::mutex> lock(chunkSet->mutex);

    if (index >= chunkSet->totalChunks)
    {
        throw eInvalidChunk(
                "Chunk index " + std::to_string(index) + " is out of range for an upload of "
                + std::to_string(chunkSet->totalChunks) + " chunks"
        );
    }

    chunkSet->chunks[index] = std::move(bytes);
    chunkSet->lastActivity = std::chrono::steady_clock::now();

    return static_cast<uint32_t>(chunkSet->chunks.size());
}

auto ChunkAssembler::assemble(const std::string& uploadId) -> std::vector<uint8_t>
{
    auto chunkSet = getChunkSet(uploadId);

    std::unique_lock<std::mutex> lock(chunkSet->mutex);

    std::vector<uint32_t> missing;
    uint64_t totalSize = 0;
    for (uint32_t index = 0; index < chunkSet->totalChunks; index++)
    {
        auto chunk = chunkSet->chunks.find(index);
        if (chunk == chunkSet->chunks.end())
        {
            missing.push_back(index);
        }
        else
        {
            totalSize += chunk->second.size();
        }
    }

    if (!missing.empty())
    {
        throw eIncompleteUpload(missing);
    }

    std::vector<uint8_t> result;
    result.reserve(totalSize);
    for (const auto& [index, chunk] : chunkSet->chunks)
    {
        result.insert(result.end(), chunk.begin(), chunk.end());
    }

    return result;
}

auto ChunkAssembler::status(const std::string& uploadId) -> sChunkStatus
{
    auto chunkSet = getChunkSet(uploadId);

    std::unique_lock<std::mutex> lock(chunkSet->mutex);

    sChunkStatus result;
    result.uploadId = chunkSet->uploadId;
    result.fileName = chunkSet->fileName;
    result.totalChunks = chunkSet->totalChunks;
    result.receivedChunks = static_cast<uint32_t>(chunkSet->chunks.size());
    for (const auto& [index, chunk] : chunkSet->chunks)
    {
        result.receivedChunkIndices.push_back(index);
    }
    result.complete = result.receivedChunks == result.totalChunks;

    return result;
}

auto ChunkAssembler::getAuthToken(const std::string& uploadId) -> std::string
{
    auto chunkSet = getChunkSet(uploadId);

    std::unique_lock<std::mutex> lock(chunkSet->mutex);
    return chunkSet->authToken;
}

auto ChunkAssembler::contains(const std::string& uploadId) const -> bool
{
    return chunkSets.find(uploadId) != chunkSets.end();
}

void ChunkAssembler::cancel(const std::string& uploadId)
{
    chunkSets.erase(uploadId);
}

auto ChunkAssembler::pruneExpired(std::chrono::seconds ttl) -> size_t
{
    auto now = std::chrono::steady_clock::now();

    std::vector<std::pair<std::string, std::shared_ptr<sChunkSet>>> expired;
    for (const auto& [uploadId, chunkSet] : chunkSets)
    {
        std::unique_lock<std::mutex> lock(chunkSet->mutex);
        if (now - chunkSet->lastActivity > ttl)
        {
            expired.emplace_back(uploadId, chunkSet);
        }
    }

    size_t pruned = 0;
    for (const auto& [uploadId, chunkSet] : expired)
    {
        // Only drop the exact set that expired, the id may have been reused since
        pruned += chunkSets.erase_if_equal(uploadId, chunkSet);
    }

    return pruned;
}

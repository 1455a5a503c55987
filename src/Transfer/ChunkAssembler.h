//
// Accumulates the chunks of a multi-part client upload until it can be reassembled
//

#ifndef TELESTORE_RELAY_CHUNKASSEMBLER_H
#define TELESTORE_RELAY_CHUNKASSEMBLER_H

#include <chrono>
#include <cstdint>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sChunkSet {
    std::mutex mutex;

    std::string uploadId;
    std::string fileName;
    std::string authToken;
    uint32_t totalChunks = 0;

    // Ordered by index so that reassembly is a straight walk
    std::map<uint32_t, std::vector<uint8_t>> chunks;

    std::chrono::steady_clock::time_point lastActivity;
};

struct sChunkStatus {
    std::string uploadId;
    std::string fileName;
    uint32_t totalChunks = 0;
    uint32_t receivedChunks = 0;
    std::vector<uint32_t> receivedChunkIndices;
    bool complete = false;
};

class ChunkAssembler {
public:
    // Throws eDuplicateSession if uploadId is taken, or eInvalidChunk if totalChunks is zero
    void initSession(
            const std::string& uploadId,
            const std::string& fileName,
            uint32_t totalChunks,
            const std::string& authToken
    );

    // Stores the chunk, replacing any earlier chunk with the same index. Returns the number of distinct chunks held
    auto putChunk(const std::string& uploadId, uint32_t index, std::vector<uint8_t> bytes) -> uint32_t;

    // Concatenates the chunks in index order. Throws eIncompleteUpload naming every missing index. The set is left
    // untouched
    auto assemble(const std::string& uploadId) -> std::vector<uint8_t>;

    auto status(const std::string& uploadId) -> sChunkStatus;

    // The token presented when the set was created
    auto getAuthToken(const std::string& uploadId) -> std::string;

    [[nodiscard]] auto contains(const std::string& uploadId) const -> bool;

    // Drops the set, an unknown id is ignored
    void cancel(const std::string& uploadId);

    // Drops every set with no activity for longer than ttl, returns how many were dropped
    auto pruneExpired(std::chrono::seconds ttl) -> size_t;

    [[nodiscard]] auto size() const -> size_t { return chunkSets.size(); }

private:
    // Throws eUnknownSession if absent
    auto getChunkSet(const std::string& uploadId) const -> std::shared_ptr<sChunkSet>;

    folly::ConcurrentHashMap<std::string, std::shared_ptr<sChunkSet>> chunkSets;
};

#endif //TELESTORE_RELAY_CHUNKASSEMBLER_H

//
// Streams a stored object, or a byte range of it, from the remote store to a consumer block by block
//

#ifndef TELESTORE_RELAY_DOWNLOADRELAY_H
#define TELESTORE_RELAY_DOWNLOADRELAY_H

#include "../Interfaces/ICredentialAuthority.h"
#include "../Interfaces/IRemoteStore.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility.hpp>
#include <vector>

struct sByteRange {
    uint64_t start = 0;

    // Inclusive
    uint64_t end = 0;

    // True when a Range header was honoured
    bool partial = false;

    [[nodiscard]] auto length() const -> uint64_t { return end - start + 1; }
};

// Resolves a Range header against an object of totalSize bytes. An empty header selects the whole object. Throws
// eInvalidRange if the header is malformed or selects nothing
auto parseRangeHeader(const std::string& header, uint64_t totalSize) -> sByteRange;

// Builds the Content-Disposition value for fileName. Control bytes, quotes and backslashes become underscores so
// the value can't end the header line or the quoted string
auto contentDisposition(const std::string& fileName) -> std::string;

// Receives the response. Both calls return false once the consumer has gone away
class IDownloadSink {
public:
    virtual ~IDownloadSink() = default;

    virtual auto writeHeaders(uint32_t status, const SimpleWeb::CaseInsensitiveMultimap& headers) -> bool = 0;
    virtual auto writeBlock(const std::vector<uint8_t>& block) -> bool = 0;
};

struct sDownloadRequest {
    uint64_t messageId = 0;
    std::string token;
    std::string fileName;

    // Raw Range header, empty if none was sent
    std::string range;
};

class DownloadRelay {
public:
    DownloadRelay(
            std::shared_ptr<ICredentialAuthority> authority,
            std::shared_ptr<IRemoteStore> remoteStore,
            uint64_t blockSize
    );

    // Errors raised before writeHeaders is called can still be reported to the consumer. Errors raised after it
    // can only end the stream early. A consumer disconnect is not an error
    void stream(const sDownloadRequest& request, IDownloadSink& sink);

private:
    std::shared_ptr<ICredentialAuthority> authority;
    std::shared_ptr<IRemoteStore> remoteStore;
    uint64_t blockSize;
};

#endif //TELESTORE_RELAY_DOWNLOADRELAY_H

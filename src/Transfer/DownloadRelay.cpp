#include "DownloadRelay.h"
#include "../Lib/Errors.h"
#include "../Lib/MimeTypes.h"
#include "../Remote/ScopedSession.h"
#include <algorithm>
#include <iostream>
#include <utility>

namespace {
auto isDigits(const std::string& value) -> bool
{
    return std::all_of(value.begin(), value.end(), [](char character) { return character >= '0' && character <= '9'; });
}
} // namespace

auto parseRangeHeader(const std::string& header, uint64_t totalSize) -> sByteRange
{
    if (header.empty())
    {
        return {0, totalSize == 0 ? 0 : totalSize - 1, false};
    }

    const std::string prefix = "bytes=";
    if (header.compare(0, prefix.size(), prefix) != 0)
    {
        throw eInvalidRange("Range must be expressed in bytes", totalSize);
    }

    auto rangeText = header.substr(prefix.size());
    auto dash = rangeText.find('-');
    if (dash == std::string::npos)
    {
        throw eInvalidRange("Malformed range " + header, totalSize);
    }

    auto startText = rangeText.substr(0, dash);
    auto endText = rangeText.substr(dash + 1);
    if (!isDigits(startText) || !isDigits(endText))
    {
        throw eInvalidRange("Malformed range " + header, totalSize);
    }

    if (totalSize == 0)
    {
        throw eInvalidRange("Range not satisfiable for an empty object", totalSize);
    }

    sByteRange range;
    range.partial = true;

    try
    {
        range.start = startText.empty() ? 0 : std::stoull(startText);
        range.end = endText.empty() ? totalSize - 1 : std::stoull(endText);
    }
    catch (std::out_of_range&)
    {
        throw eInvalidRange("Malformed range " + header, totalSize);
    }

    range.end = std::min(range.end, totalSize - 1);

    if (range.start > range.end)
    {
        throw eInvalidRange("Range not satisfiable", totalSize);
    }

    return range;
}

auto contentDisposition(const std::string& fileName) -> std::string
{
    std::string safeName = fileName;
    std::replace_if(
            safeName.begin(),
            safeName.end(),
            [](char character) {
                auto byte = static_cast<unsigned char>(character);
                return byte < 0x20 || byte == 0x7f || character == '"' || character == '\\';
            },
            '_'
    );

    return "inline; filename=\"" + safeName + "\"";
}

DownloadRelay::DownloadRelay(
        std::shared_ptr<ICredentialAuthority> authority,
        std::shared_ptr<IRemoteStore> remoteStore,
        uint64_t blockSize
)
    : authority(std::move(authority)), remoteStore(std::move(remoteStore)), blockSize(blockSize)
{
}

void DownloadRelay::stream(const sDownloadRequest& request, IDownloadSink& sink)
{
    auto credentials = authority->verifyDownloadToken(request.token);

    ScopedSession session(remoteStore->openSession(credentials));

    auto totalSize = session->getObjectSize(request.messageId);
    auto range = parseRangeHeader(request.range, totalSize);

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", getMimeType(request.fileName));
    headers.emplace("Accept-Ranges", "bytes");
    headers.emplace("Content-Disposition", contentDisposition(request.fileName));
    headers.emplace("Cache-Control", "no-cache");
    headers.emplace("X-Accel-Buffering", "no");

    uint32_t status = 200;
    uint64_t length = totalSize;
    if (range.partial)
    {
        status = 206;
        length = range.length();
        headers.emplace(
                "Content-Range",
                "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/"
                        + std::to_string(totalSize)
        );
    }
    headers.emplace("Content-Length", std::to_string(length));

    if (!sink.writeHeaders(status, headers))
    {
        std::cout << "Relay: Consumer for message " << request.messageId << " went away before any data was sent"
                  << std::endl;
        return;
    }

    auto offset = range.start;
    auto remaining = length;
    while (remaining > 0)
    {
        auto block = session->readBlock(request.messageId, offset, std::min(blockSize, remaining));
        if (block.empty())
        {
            throw eRemoteSession(
                    "Remote object ended at offset " + std::to_string(offset) + ", expected "
                    + std::to_string(remaining) + " more bytes"
            );
        }

        if (block.size() > remaining)
        {
            block.resize(remaining);
        }

        if (!sink.writeBlock(block))
        {
            std::cout << "Relay: Consumer for message " << request.messageId << " disconnected after "
                      << (offset - range.start) << " bytes" << std::endl;
            return;
        }

        offset += block.size();
        remaining -= block.size();
    }
}

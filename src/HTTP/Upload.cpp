#include "../Lib/GeneralUtils.h"
#include "../Lib/MultipartForm.h"
#include "../Transfer/ChunkAssembler.h"
#include "../Transfer/UploadCoordinator.h"
#include "../Transfer/UploadRegistry.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <limits>

namespace {
auto parseForm(const std::shared_ptr<HttpServerImpl::Request>& request) -> FormFields
{
    return parseMultipartForm(getHeader(request->header, "Content-Type"), request->content.string());
}

auto formValue(const FormFields& fields, const std::string& name) -> std::string
{
    auto field = fields.find(name);
    return field == fields.end() ? std::string() : field->second.value;
}

auto progressJson(const sUploadProgress& progress) -> nlohmann::json
{
    nlohmann::json result;
    result["status"] = uploadStateName(progress.state);
    result["progress"] = progress.progressPercent;
    result["messageId"] = progress.messageId ? nlohmann::json(*progress.messageId) : nlohmann::json(nullptr);
    result["fileId"] = progress.fileId ? nlohmann::json(*progress.fileId) : nlohmann::json(nullptr);
    result["error"] = progress.lastError.empty() ? nlohmann::json(nullptr) : nlohmann::json(progress.lastError);
    return result;
}
} // namespace

void UploadApi(HttpServer* server, const std::shared_ptr<IApplication>& app)
{
    // Post     -> Receive a whole object (multipart: authToken, file, optional fileName)
    server->getServer().resource["^/upload$"]["POST"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto fields = parseForm(request);

            auto authToken = formValue(fields, "authToken");
            if (authToken.empty())
            {
                throw eBadRequest("Missing authToken");
            }

            auto file = fields.find("file");
            if (file == fields.end() || !file->second.isFile || file->second.value.empty())
            {
                throw eBadRequest("No file provided");
            }

            auto fileName = formValue(fields, "fileName");
            if (fileName.empty())
            {
                fileName = file->second.fileName;
            }
            if (fileName.empty())
            {
                throw eBadRequest("Empty filename");
            }

            auto session = app->getUploadCoordinator()->receive(authToken, fileName, file->second.value);

            nlohmann::json result;
            result["uploadId"] = session->uploadId;
            result["size"] = session->size;

            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        });
    };

    // Post     -> Send a received object, or a finished chunk set, to the remote store
    server->getServer().resource["^/complete-upload$"]["POST"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto uploadId = requireString(readJsonBody(request), "uploadId");

            auto progress = app->getUploadCoordinator()->complete(uploadId);

            nlohmann::json result;
            if (progress.state == eUploadState::Completed)
            {
                result["status"] = uploadStateName(progress.state);
                result["messageId"] = *progress.messageId;
                result["fileId"] = *progress.fileId;

                writeJson(response, SimpleWeb::StatusCode::success_ok, result);
                return;
            }

            result["status"] = uploadStateName(eUploadState::InProgress);
            result["uploadId"] = uploadId;
            result["message"] = "Upload started in background";

            writeJson(response, SimpleWeb::StatusCode::success_accepted, result);
        });
    };

    // Get      -> Poll an upload session
    server->getServer().resource["^/upload-progress/([^/]+)$"]["GET"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto progress = app->getUploadRegistry()->get(request->path_match[1].str());

            writeJson(response, SimpleWeb::StatusCode::success_ok, progressJson(progress));
        });
    };
}

void ChunkedUploadApi(HttpServer* server, const std::shared_ptr<IApplication>& app)
{
    // Post     -> Start a chunked upload (json: uploadId?, fileName, totalChunks, authToken)
    server->getServer().resource["^/init-upload$"]["POST"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto body = readJsonBody(request);

            auto fileName = requireString(body, "fileName");
            auto authToken = requireString(body, "authToken");

            if (!body.contains("totalChunks") || !body["totalChunks"].is_number_unsigned())
            {
                throw eBadRequest("totalChunks must be a non-negative integer");
            }
            auto totalChunks = body["totalChunks"].get<uint64_t>();
            if (totalChunks > std::numeric_limits<uint32_t>::max())
            {
                throw eInvalidChunk("Too many chunks");
            }

            auto uploadId = body.contains("uploadId") && body["uploadId"].is_string()
                    ? body["uploadId"].get<std::string>()
                    : std::string();
            if (uploadId.empty())
            {
                uploadId = generateUUID();
            }

            // Fail early, the credentials are needed again once the upload completes
            app->getUploadCoordinator()->resolveCredentials(authToken);

            app->getChunkAssembler()->initSession(uploadId, fileName, static_cast<uint32_t>(totalChunks), authToken);

            nlohmann::json result;
            result["uploadId"] = uploadId;
            result["totalChunks"] = totalChunks;

            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        });
    };

    // Post     -> Store one chunk (multipart: uploadId, chunkIndex, chunk)
    server->getServer().resource["^/upload-chunk$"]["POST"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto fields = parseForm(request);

            auto uploadId = formValue(fields, "uploadId");
            if (uploadId.empty())
            {
                throw eBadRequest("Missing uploadId");
            }

            // lexical_cast wraps a leading minus for unsigned targets, so only plain digits are accepted
            auto chunkIndexText = formValue(fields, "chunkIndex");
            if (chunkIndexText.empty() || !boost::algorithm::all(chunkIndexText, boost::algorithm::is_digit()))
            {
                throw eBadRequest("chunkIndex must be a non-negative integer");
            }

            uint32_t chunkIndex = 0;
            try
            {
                chunkIndex = boost::lexical_cast<uint32_t>(chunkIndexText);
            }
            catch (boost::bad_lexical_cast&)
            {
                throw eBadRequest("chunkIndex must be a non-negative integer");
            }

            auto chunk = fields.find("chunk");
            if (chunk == fields.end())
            {
                throw eBadRequest("No chunk provided");
            }

            auto bytes = std::vector<uint8_t>(chunk->second.value.begin(), chunk->second.value.end());
            auto assembler = app->getChunkAssembler();
            auto receivedChunks = assembler->putChunk(uploadId, chunkIndex, std::move(bytes));
            auto status = assembler->status(uploadId);

            nlohmann::json result;
            result["uploadId"] = uploadId;
            result["chunkIndex"] = chunkIndex;
            result["receivedChunks"] = receivedChunks;
            result["totalChunks"] = status.totalChunks;
            result["complete"] = status.complete;

            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        });
    };

    // Get      -> Which chunks of a chunked upload have arrived
    server->getServer().resource["^/upload-status/([^/]+)$"]["GET"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            sChunkStatus status;
            try
            {
                status = app->getChunkAssembler()->status(request->path_match[1].str());
            }
            catch (eUnknownSession& e)
            {
                writeError(response, SimpleWeb::StatusCode::client_error_not_found, e.kind(), e.what());
                return;
            }

            nlohmann::json result;
            result["uploadId"] = status.uploadId;
            result["fileName"] = status.fileName;
            result["totalChunks"] = status.totalChunks;
            result["receivedChunks"] = status.receivedChunks;
            result["receivedChunkIndices"] = status.receivedChunkIndices;
            result["complete"] = status.complete;

            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        });
    };

    // Post     -> Abandon a chunked upload
    server->getServer().resource["^/cancel-upload$"]["POST"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        guardRequest(response, [&]() {
            auto uploadId = requireString(readJsonBody(request), "uploadId");

            app->getChunkAssembler()->cancel(uploadId);

            nlohmann::json result;
            result["success"] = true;

            writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        });
    };
}

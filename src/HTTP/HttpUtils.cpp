#include "HttpUtils.h"
#include "../Lib/GeneralUtils.h"
#include <iostream>
#include <map>

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string& header) -> std::string
{
    auto headerItem = headers.find(header);
    return headerItem == headers.end() ? std::string() : headerItem->second;
}

auto getQueryParamAsString(const SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string
{
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end())
    {
        result = ptr->second;
    }
    return result;
}

auto readJsonBody(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json
{
    auto body = nlohmann::json::parse(request->content.string(), nullptr, false);
    if (body.is_discarded() || !body.is_object())
    {
        throw eBadRequest("Request body must be a JSON object");
    }

    return body;
}

auto requireString(const nlohmann::json& body, const std::string& field) -> std::string
{
    if (!body.contains(field) || !body[field].is_string() || body[field].get<std::string>().empty())
    {
        throw eBadRequest("Missing " + field);
    }

    return body[field].get<std::string>();
}

auto corsHeaders() -> SimpleWeb::CaseInsensitiveMultimap
{
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Access-Control-Allow-Origin", "*");
    return headers;
}

void writeJson(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const nlohmann::json& body
)
{
    auto headers = corsHeaders();
    headers.emplace("Content-Type", "application/json");

    response->write(status, body.dump(), headers);
}

void writeError(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const std::string& kind,
        const std::string& message
)
{
    nlohmann::json result;
    result["error"] = kind;
    result["message"] = message;

    writeJson(response, status, result);
}

auto statusForError(const eRelayError& error) -> SimpleWeb::StatusCode
{
    static const std::map<std::string, SimpleWeb::StatusCode> statuses = {
            {"CredentialFetchError", SimpleWeb::StatusCode::client_error_unauthorized},
            {"Unauthorized", SimpleWeb::StatusCode::client_error_unauthorized},
            {"DuplicateSessionError", SimpleWeb::StatusCode::client_error_conflict},
            {"UnknownSessionError", SimpleWeb::StatusCode::client_error_bad_request},
            {"UnknownUploadError", SimpleWeb::StatusCode::client_error_not_found},
            {"IncompleteUploadError", SimpleWeb::StatusCode::client_error_bad_request},
            {"InvalidChunkError", SimpleWeb::StatusCode::client_error_bad_request},
            {"AlreadyInProgressError", SimpleWeb::StatusCode::client_error_bad_request},
            {"UploadFailedError", SimpleWeb::StatusCode::client_error_bad_request},
            {"DispatchRejectedError", SimpleWeb::StatusCode::server_error_service_unavailable},
            {"InvalidRangeError", SimpleWeb::StatusCode::client_error_range_not_satisfiable},
            {"ObjectNotFoundError", SimpleWeb::StatusCode::client_error_not_found},
            {"RemoteRejectedError", SimpleWeb::StatusCode::server_error_bad_gateway},
            {"RemoteSessionError", SimpleWeb::StatusCode::server_error_bad_gateway},
            {"BadRequest", SimpleWeb::StatusCode::client_error_bad_request},
    };

    auto status = statuses.find(error.kind());
    return status == statuses.end() ? SimpleWeb::StatusCode::server_error_internal_server_error : status->second;
}

void writeError(const std::shared_ptr<HttpServerImpl::Response>& response, const eRelayError& error)
{
    nlohmann::json result;
    result["error"] = error.kind();
    result["message"] = error.what();

    auto headers = corsHeaders();
    headers.emplace("Content-Type", "application/json");

    if (const auto* incomplete = dynamic_cast<const eIncompleteUpload*>(&error))
    {
        result["missing"] = incomplete->getMissing();
    }

    if (const auto* invalidRange = dynamic_cast<const eInvalidRange*>(&error))
    {
        headers.emplace("Content-Range", "bytes */" + std::to_string(invalidRange->getTotalSize()));
    }

    response->write(statusForError(error), result.dump(), headers);
}

void guardRequest(const std::shared_ptr<HttpServerImpl::Response>& response, const std::function<void()>& handler)
{
    try
    {
        handler();
    }
    catch (eRelayError& e)
    {
        std::cerr << "API: " << e.kind() << ": " << e.what() << std::endl;
        writeError(response, e);
    }
    catch (std::exception& e)
    {
        dumpExceptions(e);
        writeError(response, SimpleWeb::StatusCode::server_error_internal_server_error, "InternalError", e.what());
    }
}

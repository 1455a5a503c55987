//
// Request parsing and response helpers shared by the API handlers
//

#ifndef TELESTORE_RELAY_HTTPUTILS_H
#define TELESTORE_RELAY_HTTPUTILS_H

#include "../Lib/Errors.h"
#include "HttpServer.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string& header) -> std::string;
auto getQueryParamAsString(const SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;

// Parses the request body as a JSON object. Throws eBadRequest if it isn't one
auto readJsonBody(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json;

// Returns the named string field of a JSON body. Throws eBadRequest if it is missing or empty
auto requireString(const nlohmann::json& body, const std::string& field) -> std::string;

// Headers every response carries
auto corsHeaders() -> SimpleWeb::CaseInsensitiveMultimap;

void writeJson(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const nlohmann::json& body
);

void writeError(
        const std::shared_ptr<HttpServerImpl::Response>& response,
        SimpleWeb::StatusCode status,
        const std::string& kind,
        const std::string& message
);

// Writes the error envelope with the status matching the error's kind
void writeError(const std::shared_ptr<HttpServerImpl::Response>& response, const eRelayError& error);

auto statusForError(const eRelayError& error) -> SimpleWeb::StatusCode;

// Runs handler, answering any exception it raises with the error envelope
void guardRequest(const std::shared_ptr<HttpServerImpl::Response>& response, const std::function<void()>& handler);

#endif //TELESTORE_RELAY_HTTPUTILS_H

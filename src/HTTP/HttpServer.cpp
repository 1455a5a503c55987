#include "HttpServer.h"
#include "../Settings.h"
#include "HttpUtils.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace {
auto isoTimestamp() -> std::string
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::ostringstream result;
    result << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return result.str();
}
} // namespace

HttpServer::HttpServer(const std::shared_ptr<IApplication>& app)
{
    server.config.port = HTTP_PORT;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = HTTP_WORKER_POOL_SIZE;
    server.config.timeout_content = HTTP_CONTENT_TIMEOUT_SECONDS;
    server.config.max_request_streambuf_size = MAX_REQUEST_SIZE;

    server.resource["^/health$"]["GET"] = [](const std::shared_ptr<HttpServerImpl::Response>& response,
                                              const std::shared_ptr<HttpServerImpl::Request>& /*request*/) {
        nlohmann::json result;
        result["status"] = "ok";
        result["timestamp"] = isoTimestamp();

        writeJson(response, SimpleWeb::StatusCode::success_ok, result);
    };

    // CORS preflight for every route
    server.resource["^.*$"]["OPTIONS"] = [](const std::shared_ptr<HttpServerImpl::Response>& response,
                                             const std::shared_ptr<HttpServerImpl::Request>& /*request*/) {
        auto headers = corsHeaders();
        headers.emplace("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        headers.emplace("Access-Control-Allow-Headers", "Content-Type, Authorization, Range");
        headers.emplace("Access-Control-Max-Age", "86400");

        response->write(SimpleWeb::StatusCode::success_no_content, headers);
    };

    server.default_resource["GET"] = [](const std::shared_ptr<HttpServerImpl::Response>& response,
                                        const std::shared_ptr<HttpServerImpl::Request>& /*request*/) {
        writeError(response, SimpleWeb::StatusCode::client_error_not_found, "NotFound", "No such endpoint");
    };

    server.default_resource["POST"] = server.default_resource["GET"];

    // Report unhandled request errors other than the client going away
    server.on_error = [](const std::shared_ptr<HttpServerImpl::Request>& /*request*/,
                         const SimpleWeb::error_code& errorCode) {
        if (errorCode && errorCode != SimpleWeb::errc::operation_canceled
            && errorCode != SimpleWeb::error::eof && errorCode != SimpleWeb::errc::connection_reset)
        {
            std::cerr << "API: Request error: " << errorCode.message() << std::endl;
        }
    };

    UploadApi(this, app);
    ChunkedUploadApi(this, app);
    DownloadApi(this, app);
}

void HttpServer::start()
{
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    std::cout << "API: Server listening on port " << server.config.port << std::endl << std::endl;
}

void HttpServer::join()
{
    if (server_thread.joinable())
    {
        server_thread.join();
    }
}

void HttpServer::stop()
{
    server.stop();
    if (server_thread.joinable())
    {
        server_thread.join();
    }
}

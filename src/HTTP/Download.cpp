#include "../Lib/GeneralUtils.h"
#include "../Transfer/DownloadRelay.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <future>
#include <iostream>

namespace {
// Writes the relayed object straight to the client connection, one send per block
class HttpDownloadSink : public IDownloadSink {
public:
    explicit HttpDownloadSink(std::shared_ptr<HttpServerImpl::Response> response) : response(std::move(response)) {}

    auto writeHeaders(uint32_t status, const SimpleWeb::CaseInsensitiveMultimap& headers) -> bool override
    {
        auto allHeaders = corsHeaders();
        allHeaders.insert(headers.begin(), headers.end());

        response->write(
                status == 206 ? SimpleWeb::StatusCode::success_partial_content : SimpleWeb::StatusCode::success_ok,
                allHeaders
        );
        bHeadersSent = true;

        return flush();
    }

    auto writeBlock(const std::vector<uint8_t>& block) -> bool override
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        response->write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));

        return flush();
    }

    [[nodiscard]] auto headersSent() const -> bool { return bHeadersSent; }

private:
    auto flush() -> bool
    {
        std::promise<SimpleWeb::error_code> sendPromise;
        response->send([&sendPromise](const SimpleWeb::error_code& errorCode) {
            sendPromise.set_value(errorCode);
        });

        if (auto errorCode = sendPromise.get_future().get())
        {
            std::cout << "Relay: Client has disconnected: " << errorCode.message() << std::endl;
            return false;
        }

        return true;
    }

    std::shared_ptr<HttpServerImpl::Response> response;
    bool bHeadersSent = false;
};
} // namespace

void DownloadApi(HttpServer* server, const std::shared_ptr<IApplication>& app)
{
    // Get      -> Stream a stored object (messageId, token, fileName), honouring Range
    server->getServer().resource["^/download$"]["GET"] = [app](
            const std::shared_ptr<HttpServerImpl::Response>& response,
            const std::shared_ptr<HttpServerImpl::Request>& request) {
        auto query_fields = request->parse_query_string();

        sDownloadRequest downloadRequest;
        downloadRequest.token = getQueryParamAsString(query_fields, "token");
        downloadRequest.fileName = getQueryParamAsString(query_fields, "fileName");
        downloadRequest.range = getHeader(request->header, "Range");

        if (downloadRequest.fileName.empty())
        {
            downloadRequest.fileName = "file";
        }

        // lexical_cast wraps a leading minus for unsigned targets, so only plain digits are accepted
        auto messageIdText = getQueryParamAsString(query_fields, "messageId");
        if (messageIdText.empty() || !boost::algorithm::all(messageIdText, boost::algorithm::is_digit()))
        {
            writeError(response, SimpleWeb::StatusCode::client_error_bad_request, "BadRequest", "Missing or invalid messageId");
            return;
        }

        try
        {
            downloadRequest.messageId = boost::lexical_cast<uint64_t>(messageIdText);
        }
        catch (boost::bad_lexical_cast&)
        {
            writeError(response, SimpleWeb::StatusCode::client_error_bad_request, "BadRequest", "Missing or invalid messageId");
            return;
        }

        if (downloadRequest.token.empty())
        {
            writeError(response, SimpleWeb::StatusCode::client_error_bad_request, "BadRequest", "Missing token");
            return;
        }

        HttpDownloadSink sink(response);
        try
        {
            app->getDownloadRelay()->stream(downloadRequest, sink);
        }
        catch (std::exception& e)
        {
            if (sink.headersSent())
            {
                // The status line is gone, all that can be done is to cut the body short
                std::cerr << "Relay: Aborting download of message " << downloadRequest.messageId << std::endl;
                dumpExceptions(e);
                response->close_connection_after_response = true;
                return;
            }

            if (auto* relayError = dynamic_cast<eRelayError*>(&e))
            {
                std::cerr << "Relay: " << relayError->kind() << ": " << relayError->what() << std::endl;
                writeError(response, *relayError);
                return;
            }

            dumpExceptions(e);
            writeError(response, SimpleWeb::StatusCode::server_error_internal_server_error, "InternalError", e.what());
        }
    };
}

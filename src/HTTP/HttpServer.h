//
// Inbound HTTP API of the relay
//

#ifndef TELESTORE_RELAY_HTTPSERVER_H
#define TELESTORE_RELAY_HTTPSERVER_H

#include "../Interfaces/IApplication.h"
#include <memory>
#include <server_http.hpp>
#include <thread>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

class HttpServer {
public:
    explicit HttpServer(const std::shared_ptr<IApplication>& app);

    void start();
    void join();
    void stop();

    auto getServer() -> HttpServerImpl& { return this->server; }

private:
    HttpServerImpl server;
    std::thread server_thread;
};

void UploadApi(HttpServer* server, const std::shared_ptr<IApplication>& app);
void ChunkedUploadApi(HttpServer* server, const std::shared_ptr<IApplication>& app);
void DownloadApi(HttpServer* server, const std::shared_ptr<IApplication>& app);

#endif //TELESTORE_RELAY_HTTPSERVER_H

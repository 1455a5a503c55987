//
// Client side of the remote session protocol, spoken over a WebSocket to the session gateway
//

#ifndef TELESTORE_RELAY_SESSIONCLIENT_H
#define TELESTORE_RELAY_SESSIONCLIENT_H

#include "../Interfaces/IRemoteStore.h"
#include "../Lib/Messaging/Message.h"
#include <atomic>
#include <client_ws.hpp>
#include <folly/concurrency/UnboundedQueue.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using WsClient = SimpleWeb::SocketClient<SimpleWeb::WS>;

class SessionClient : public IRemoteSession {
public:
    // Connects to the gateway and authorizes the session. Throws eRemoteSession if the gateway can't be reached or
    // refuses the credentials
    SessionClient(const sCredentials& credentials, const std::string& gatewayHost);
    ~SessionClient() override;

    SessionClient(SessionClient const&) = delete;
    auto operator=(SessionClient const&) -> SessionClient& = delete;
    SessionClient(SessionClient&&) = delete;
    auto operator=(SessionClient&&) -> SessionClient& = delete;

    void resolveChannel() override;
    auto getObjectSize(uint64_t messageId) -> uint64_t override;
    auto readBlock(uint64_t messageId, uint64_t offset, uint64_t length) -> std::vector<uint8_t> override;
    auto uploadObject(
            const std::string& path,
            const std::string& fileName,
            uint64_t size,
            const ProgressCallback& progress
    ) -> sRemoteRecord override;
    void close() override;

private:
    void onMessage(const std::shared_ptr<WsClient::InMessage>& in_message);
    void onDisconnected(const std::string& reason);

    // Sends a frame and waits until it has been handed to the socket
    void send(const Message& message);

    // Waits for the next reply. A SESSION_ERROR frame, a dropped socket or a timeout throw eRemoteSession
    auto waitForReply() -> std::shared_ptr<Message>;

    // Waits for the next reply and throws eRemoteSession unless it has the expected id
    auto expectReply(uint32_t expectedId) -> std::shared_ptr<Message>;

    sCredentials credentials;
    int64_t channelId = 0;

    std::shared_ptr<WsClient> client;
    std::shared_ptr<WsClient::Connection> pConnection;
    std::mutex connectionMutex;
    std::thread clientThread;

    // A null entry marks the end of the socket
    folly::UMPSCQueue<std::shared_ptr<Message>, true> replies;
    std::string disconnectReason;

    std::atomic<bool> bClosed = false;

EXPOSE_PROPERTY_FOR_TESTING_READONLY(channelId);
};

#endif //TELESTORE_RELAY_SESSIONCLIENT_H

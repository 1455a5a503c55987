#include "SessionClient.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <stdexcept>

// Binary, final frame
constexpr unsigned char BINARY_FRAME = 130;

SessionClient::SessionClient(const sCredentials& credentials, const std::string& gatewayHost)
    : credentials(credentials)
{
    uint64_t apiId = 0;
    try
    {
        channelId = std::stoll(credentials.channelId);
        apiId = std::stoull(credentials.apiId);
    }
    catch (std::logic_error&)
    {
        throw eRemoteSession("Credentials carry a malformed channel or application id");
    }

    client = std::make_shared<WsClient>(gatewayHost + SESSION_GATEWAY_PATH);

    client->on_open = [this, apiId](const std::shared_ptr<WsClient::Connection>& connection) {
        {
            std::unique_lock<std::mutex> lock(connectionMutex);
            pConnection = connection;
        }

        auto msg = Message(SESSION_AUTHORIZE);
        msg.push_string(this->credentials.session);
        msg.push_ulong(apiId);
        msg.push_string(this->credentials.apiHash);

        auto out_message = std::make_shared<WsClient::OutMessage>(msg.getData().size());
        out_message->write(reinterpret_cast<const char*>(msg.getData().data()), static_cast<std::streamsize>(msg.getData().size()));
        connection->send(out_message, nullptr, BINARY_FRAME);
    };

    client->on_message = [this](const std::shared_ptr<WsClient::Connection>& /*connection*/,
                                const std::shared_ptr<WsClient::InMessage>& in_message) {
        onMessage(in_message);
    };

    client->on_close = [this](const std::shared_ptr<WsClient::Connection>& /*connection*/, int status,
                              const std::string& reason) {
        onDisconnected("Session closed by gateway (" + std::to_string(status) + "): " + reason);
    };

    client->on_error = [this](const std::shared_ptr<WsClient::Connection>& /*connection*/,
                              const SimpleWeb::error_code& errorCode) {
        onDisconnected("Session socket error: " + errorCode.message());
    };

    clientThread = std::thread([this]() {
        client->start();
    });

    try
    {
        expectReply(SESSION_READY);
    }
    catch (std::exception&)
    {
        // The client thread must be joined before the members go away
        close();
        throw;
    }

    std::cout << "Session: Opened remote session for channel " << channelId << std::endl;
}

SessionClient::~SessionClient()
{
    try
    {
        close();
    }
    catch (std::exception& e)
    {
        dumpExceptions(e);
    }
}

void SessionClient::onMessage(const std::shared_ptr<WsClient::InMessage>& in_message)
{
    auto content = in_message->string();
    auto data = std::vector<uint8_t>(content.begin(), content.end());

    try
    {
        replies.enqueue(std::make_shared<Message>(data));
    }
    catch (std::out_of_range&)
    {
        std::cerr << "Session: Dropped a truncated frame from the gateway" << std::endl;
    }
}

void SessionClient::onDisconnected(const std::string& reason)
{
    {
        std::unique_lock<std::mutex> lock(connectionMutex);
        pConnection = nullptr;
        if (disconnectReason.empty())
        {
            disconnectReason = reason;
        }
    }

    replies.enqueue(nullptr);
}

void SessionClient::send(const Message& message)
{
    std::shared_ptr<WsClient::Connection> connection;
    {
        std::unique_lock<std::mutex> lock(connectionMutex);
        connection = pConnection;
    }

    if (!connection)
    {
        throw eRemoteSession("Remote session is not connected");
    }

    auto out_message = std::make_shared<WsClient::OutMessage>(message.getData().size());
    out_message->write(
            reinterpret_cast<const char*>(message.getData().data()),
            static_cast<std::streamsize>(message.getData().size())
    );

    auto promise = std::make_shared<std::promise<SimpleWeb::error_code>>();
    auto future = promise->get_future();
    connection->send(
            out_message,
            [promise](const SimpleWeb::error_code& errorCode) {
                promise->set_value(errorCode);
            },
            BINARY_FRAME
    );

    if (future.wait_for(std::chrono::seconds(REMOTE_RESPONSE_TIMEOUT_SECONDS)) != std::future_status::ready)
    {
        throw eRemoteSession("Timed out sending to the remote session");
    }

    if (auto errorCode = future.get())
    {
        throw eRemoteSession("Error sending to the remote session: " + errorCode.message());
    }
}

auto SessionClient::waitForReply() -> std::shared_ptr<Message>
{
    std::shared_ptr<Message> reply;
    if (!replies.try_dequeue_for(reply, std::chrono::seconds(REMOTE_RESPONSE_TIMEOUT_SECONDS)))
    {
        throw eRemoteSession("Timed out waiting for the remote session");
    }

    if (!reply)
    {
        std::unique_lock<std::mutex> lock(connectionMutex);

        // Leave the marker in place so that any later wait fails immediately too
        replies.enqueue(nullptr);
        throw eRemoteSession(disconnectReason);
    }

    if (reply->getId() == SESSION_ERROR)
    {
        std::string details;
        try
        {
            details = reply->pop_string();
        }
        catch (std::out_of_range&)
        {
            throw eRemoteSession("Remote session sent a malformed error frame");
        }

        throw eRemoteSession("Remote session error: " + details);
    }

    return reply;
}

auto SessionClient::expectReply(uint32_t expectedId) -> std::shared_ptr<Message>
{
    auto reply = waitForReply();
    if (reply->getId() != expectedId)
    {
        throw eRemoteSession(
                "Unexpected reply " + std::to_string(reply->getId()) + " from the remote session, expected "
                + std::to_string(expectedId)
        );
    }

    return reply;
}

void SessionClient::resolveChannel()
{
    auto msg = Message(RESOLVE_CHANNEL);
    msg.push_long(channelId);
    send(msg);

    auto reply = expectReply(CHANNEL_RESOLVED);
    int64_t resolved = 0;
    try
    {
        resolved = reply->pop_long();
    }
    catch (std::out_of_range&)
    {
        throw eRemoteSession("Remote session sent a malformed channel reply");
    }

    if (resolved != channelId)
    {
        throw eRemoteSession("Remote session resolved the wrong channel");
    }
}

auto SessionClient::getObjectSize(uint64_t messageId) -> uint64_t
{
    auto msg = Message(OBJECT_INFO);
    msg.push_long(channelId);
    msg.push_ulong(messageId);
    send(msg);

    auto reply = waitForReply();
    if (reply->getId() == OBJECT_NOT_FOUND)
    {
        throw eObjectNotFound("File not found");
    }

    if (reply->getId() != OBJECT_DETAILS)
    {
        throw eRemoteSession("Unexpected reply " + std::to_string(reply->getId()) + " to an object lookup");
    }

    try
    {
        return reply->pop_ulong();
    }
    catch (std::out_of_range&)
    {
        throw eRemoteSession("Remote session sent malformed object details");
    }
}

auto SessionClient::readBlock(uint64_t messageId, uint64_t offset, uint64_t length) -> std::vector<uint8_t>
{
    auto msg = Message(OBJECT_READ);
    msg.push_long(channelId);
    msg.push_ulong(messageId);
    msg.push_ulong(offset);
    msg.push_ulong(length);
    send(msg);

    auto reply = waitForReply();
    if (reply->getId() == OBJECT_NOT_FOUND)
    {
        throw eObjectNotFound("File not found");
    }

    if (reply->getId() != OBJECT_CHUNK)
    {
        throw eRemoteSession("Unexpected reply " + std::to_string(reply->getId()) + " to an object read");
    }

    try
    {
        return reply->pop_bytes();
    }
    catch (std::out_of_range&)
    {
        throw eRemoteSession("Remote session sent a malformed object chunk");
    }
}

auto SessionClient::uploadObject(
        const std::string& path,
        const std::string& fileName,
        uint64_t size,
        const ProgressCallback& progress
) -> sRemoteRecord
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        throw eRemoteSession("Unable to open " + path + " for upload");
    }

    auto begin = Message(UPLOAD_BEGIN);
    begin.push_long(channelId);
    begin.push_string(fileName);
    begin.push_ulong(size);
    send(begin);

    expectReply(UPLOAD_READY);

    std::vector<char> block(TRANSFER_BLOCK_SIZE);
    uint64_t sent = 0;
    while (sent < size)
    {
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        auto count = static_cast<uint64_t>(file.gcount());
        if (count == 0)
        {
            throw eRemoteSession("Upload source " + path + " ended after " + std::to_string(sent) + " bytes");
        }

        auto chunk = Message(UPLOAD_CHUNK);
        chunk.push_bytes(reinterpret_cast<const uint8_t*>(block.data()), count);
        send(chunk);

        sent += count;
        if (progress)
        {
            progress(sent, size);
        }
    }

    send(Message(UPLOAD_END));

    auto result = expectReply(UPLOAD_RESULT);
    try
    {
        auto messageId = result->pop_ulong();
        auto kind = result->pop_ubyte();
        auto handle = result->pop_string();

        return decodeSessionResult(messageId, kind, handle);
    }
    catch (std::out_of_range&)
    {
        throw eRemoteSession("Remote session sent a malformed upload result");
    }
}

void SessionClient::close()
{
    if (bClosed.exchange(true))
    {
        return;
    }

    std::shared_ptr<WsClient::Connection> connection;
    {
        std::unique_lock<std::mutex> lock(connectionMutex);
        connection = pConnection;
    }

    if (connection)
    {
        try
        {
            send(Message(SESSION_CLOSE));
        }
        catch (eRemoteSession& e)
        {
            std::cerr << "Session: Unable to say goodbye to the gateway: " << e.what() << std::endl;
        }
    }

    client->stop();
    if (clientThread.joinable())
    {
        clientThread.join();
    }

    std::cout << "Session: Closed remote session for channel " << channelId << std::endl;
}

#ifndef TELESTORE_RELAY_TEST_UTILS_H
#define TELESTORE_RELAY_TEST_UTILS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <client_http.hpp>
#include <client_ws.hpp>
#include <server_http.hpp>
#include <server_ws.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;

// Writes data to a new file in directory and returns its path
auto writeTestFile(const std::string& directory, const std::vector<uint8_t>& data) -> std::string;

auto readTestFile(const std::string& path) -> std::vector<uint8_t>;

/**
 * RAII class for creating a uniquely named temporary directory that is removed with everything in it
 */
class TemporaryDirectory
{
public:
    TemporaryDirectory() : directory(generateTempDirectoryPath())
    {
        std::filesystem::create_directories(directory);
    }

    ~TemporaryDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&)            = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&)                 = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&)      = delete;

    [[nodiscard]] auto path() const -> std::string
    {
        return directory.string();
    }

    // Number of regular files currently in the directory
    [[nodiscard]] auto fileCount() const -> size_t
    {
        size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(directory))
        {
            if (entry.is_regular_file())
            {
                count++;
            }
        }
        return count;
    }

private:
    std::filesystem::path directory;

    static auto generateTempDirectoryPath() -> std::filesystem::path
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());

        std::stringstream ss;
        ss << "telestore_relay_test_" << std::hex << std::setfill('0') << std::setw(16) << dis(gen);

        return std::filesystem::temp_directory_path() / ss.str();
    }
};

/**
 * Blocks callers of pass() while closed, used to hold background work at a known point
 */
class TestGate
{
public:
    void close()
    {
        std::unique_lock<std::mutex> lock(mutex);
        bOpen = false;
    }

    void open()
    {
        std::unique_lock<std::mutex> lock(mutex);
        bOpen = true;
        cv.notify_all();
    }

    void pass()
    {
        std::unique_lock<std::mutex> lock(mutex);
        waiting++;
        waitingCv.notify_all();
        cv.wait(lock, [this] { return bOpen; });
        waiting--;
    }

    // Waits until at least one caller is held at the gate
    auto waitForArrival(std::chrono::milliseconds timeout) -> bool
    {
        std::unique_lock<std::mutex> lock(mutex);
        return waitingCv.wait_for(lock, timeout, [this] { return waiting > 0; });
    }

private:
    std::mutex mutex;
    std::condition_variable cv;
    std::condition_variable waitingCv;
    bool bOpen = true;
    uint32_t waiting = 0;
};

using TestWsServer = SimpleWeb::SocketServer<SimpleWeb::WS>;
using TestWsClient = SimpleWeb::SocketClient<SimpleWeb::WS>;

using TestHttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // TELESTORE_RELAY_TEST_UTILS_H

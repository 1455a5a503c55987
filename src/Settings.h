//
// Relay configuration
// Everything is read from the environment once, with a sensible default for each setting
//

#ifndef TELESTORE_RELAY_SETTINGS_H
#define TELESTORE_RELAY_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string& variable, const std::string& _default) -> std::string
{
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

// Collaborators
#define BACKEND_URL                     GET_ENV("BACKEND_URL", "http://localhost:8080")
#define BOT_API_URL                     GET_ENV("BOT_API_URL", "https://api.telegram.org")
#define SESSION_GATEWAY_HOST            GET_ENV("SESSION_GATEWAY_HOST", "localhost:8001")

// Local temporary storage for uploaded objects
#define UPLOAD_DIR                      GET_ENV("UPLOAD_DIR", "/tmp/uploads")

// Transfer sizing
#define SMALL_OBJECT_LIMIT              std::stoull(GET_ENV("SMALL_OBJECT_LIMIT", std::to_string(1024ULL * 1024ULL * 50ULL)))
#define TRANSFER_BLOCK_SIZE             std::stoull(GET_ENV("TRANSFER_BLOCK_SIZE", std::to_string(1024ULL * 1024ULL)))
#define MAX_REQUEST_SIZE                std::stoull(GET_ENV("MAX_REQUEST_SIZE", std::to_string(1024ULL * 1024ULL * 2049ULL)))

// Lifetimes
#define CREDENTIAL_CACHE_TTL_SECONDS    std::stoul(GET_ENV("CREDENTIAL_CACHE_TTL_SECONDS", std::to_string(60 * 60)))
#define CHUNK_SESSION_TTL_SECONDS       std::stoul(GET_ENV("CHUNK_SESSION_TTL_SECONDS", std::to_string(60 * 60 * 6)))
#define UPLOAD_RECORD_RETENTION_SECONDS std::stoul(GET_ENV("UPLOAD_RECORD_RETENTION_SECONDS", std::to_string(60 * 60)))

// Background dispatch
#define DISPATCH_WORKER_POOL_SIZE       std::stoul(GET_ENV("DISPATCH_WORKER_POOL_SIZE", "8"))
#define DISPATCH_QUEUE_LIMIT            std::stoul(GET_ENV("DISPATCH_QUEUE_LIMIT", "64"))

#ifndef BUILD_TESTS
    #define HTTP_PORT                   static_cast<uint16_t>(std::stoul(GET_ENV("HTTP_PORT", "10000")))

    constexpr uint32_t REMOTE_RESPONSE_TIMEOUT_SECONDS = 300;
    constexpr uint32_t OUTBOUND_HTTP_TIMEOUT_SECONDS = 10;
    constexpr uint32_t SMALL_OBJECT_TIMEOUT_SECONDS = 300;
    constexpr uint32_t SWEEPER_INTERVAL_SECONDS = 60;
#else
    #define HTTP_PORT                   static_cast<uint16_t>(23480)

    constexpr uint32_t REMOTE_RESPONSE_TIMEOUT_SECONDS = 2;
    constexpr uint32_t OUTBOUND_HTTP_TIMEOUT_SECONDS = 2;
    constexpr uint32_t SMALL_OBJECT_TIMEOUT_SECONDS = 2;
    constexpr uint32_t SWEEPER_INTERVAL_SECONDS = 1;
#endif

const uint32_t HTTP_WORKER_POOL_SIZE = 128;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = (60ULL * 60ULL);

constexpr const char* SESSION_GATEWAY_PATH = "/session/ws/";
constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

const uint64_t MESSAGE_INITIAL_VECTOR_SIZE = (1024ULL * 64ULL);

#endif //TELESTORE_RELAY_SETTINGS_H

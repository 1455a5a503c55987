//
// Per user cache of remote store credentials, with stale-on-error fallback
//

#ifndef TELESTORE_RELAY_CREDENTIALCACHE_H
#define TELESTORE_RELAY_CREDENTIALCACHE_H

#include "../Remote/Credentials.h"
#include <chrono>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <functional>
#include <memory>
#include <string>

class CredentialCache {
public:
    using FetchFunction = std::function<sCredentials()>;

    explicit CredentialCache(std::chrono::seconds ttl);

    // Returns the cached credentials for userKey while they are fresh, otherwise calls fetch and caches the result.
    // If fetch fails, any cached entry is returned regardless of its age; only when nothing was ever cached does the
    // failure propagate as eCredentialFetchError.
    auto get(const std::string& userKey, const FetchFunction& fetch) -> sCredentials;

    [[nodiscard]] auto size() const -> size_t { return cache.size(); }

private:
    struct sCacheEntry {
        sCredentials credentials;
        std::chrono::steady_clock::time_point fetchedAt;
    };

    auto stale(const std::string& userKey) const -> std::shared_ptr<sCacheEntry>;

    std::chrono::seconds ttl;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sCacheEntry>> cache;
};

#endif //TELESTORE_RELAY_CREDENTIALCACHE_H

#include "CredentialCache.h"
#include "../Lib/Errors.h"
#include <iostream>

CredentialCache::CredentialCache(std::chrono::seconds ttl) : ttl(ttl)
{
}

auto CredentialCache::stale(const std::string& userKey) const -> std::shared_ptr<sCacheEntry>
{
    auto entry = cache.find(userKey);
    return entry == cache.end() ? nullptr : entry->second;
}

auto CredentialCache::get(const std::string& userKey, const FetchFunction& fetch) -> sCredentials
{
    if (auto entry = stale(userKey))
    {
        if (std::chrono::steady_clock::now() - entry->fetchedAt < ttl)
        {
            return entry->credentials;
        }
    }

    try
    {
        auto credentials = fetch();
        cache.insert_or_assign(
                userKey,
                std::make_shared<sCacheEntry>(sCacheEntry{credentials, std::chrono::steady_clock::now()})
        );
        return credentials;
    }
    catch (std::exception& e)
    {
        if (auto entry = stale(userKey))
        {
            std::cerr << "Relay: Credential fetch failed, using cached credentials: " << e.what() << std::endl;
            return entry->credentials;
        }

        if (dynamic_cast<eCredentialFetchError*>(&e) != nullptr)
        {
            throw;
        }

        throw eCredentialFetchError(std::string("Error fetching credentials: ") + e.what());
    }
}

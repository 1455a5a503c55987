#include "../../Lib/Errors.h"
#include "../../tests/fakes/FakeCredentialAuthority.h"
#include "../CredentialCache.h"
#include <boost/test/unit_test.hpp>

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
BOOST_AUTO_TEST_SUITE(CredentialCache_test_suite)
    BOOST_AUTO_TEST_CASE(test_fresh_entry_is_served_from_cache)
    {
        CredentialCache cache(std::chrono::seconds(3600));
        uint32_t fetches = 0;

        auto fetch = [&fetches]() {
            fetches++;
            return completeCredentials("7");
        };

        BOOST_CHECK_EQUAL(cache.get("token", fetch).userId, "7");
        BOOST_CHECK_EQUAL(cache.get("token", fetch).userId, "7");

        // Only the first call should have reached the authority
        BOOST_CHECK_EQUAL(fetches, 1);
        BOOST_CHECK_EQUAL(cache.size(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_entries_are_keyed_by_token)
    {
        CredentialCache cache(std::chrono::seconds(3600));

        cache.get("token-a", []() { return completeCredentials("1"); });
        cache.get("token-b", []() { return completeCredentials("2"); });

        BOOST_CHECK_EQUAL(cache.get("token-a", []() -> sCredentials { throw eCredentialFetchError("down"); }).userId, "1");
        BOOST_CHECK_EQUAL(cache.get("token-b", []() -> sCredentials { throw eCredentialFetchError("down"); }).userId, "2");
    }

    BOOST_AUTO_TEST_CASE(test_expired_entry_is_refreshed)
    {
        // A zero ttl means every entry is already expired
        CredentialCache cache(std::chrono::seconds(0));

        cache.get("token", []() { return completeCredentials("old"); });
        auto refreshed = cache.get("token", []() { return completeCredentials("new"); });

        BOOST_CHECK_EQUAL(refreshed.userId, "new");
    }

    BOOST_AUTO_TEST_CASE(test_stale_entry_is_served_when_fetch_fails)
    {
        CredentialCache cache(std::chrono::seconds(0));

        cache.get("token", []() { return completeCredentials("cached"); });

        sCredentials result;
        BOOST_CHECK_NO_THROW(
                result = cache.get("token", []() -> sCredentials { throw eCredentialFetchError("Backend unreachable"); })
        );
        BOOST_CHECK_EQUAL(result.userId, "cached");
    }

    BOOST_AUTO_TEST_CASE(test_fetch_failure_without_entry_propagates)
    {
        CredentialCache cache(std::chrono::seconds(3600));

        BOOST_CHECK_THROW(
                cache.get("token", []() -> sCredentials { throw eCredentialFetchError("Backend unreachable"); }),
                eCredentialFetchError
        );

        // Other failures are reported the same way
        BOOST_CHECK_THROW(
                cache.get("token", []() -> sCredentials { throw std::runtime_error("socket closed"); }),
                eCredentialFetchError
        );

        BOOST_CHECK_EQUAL(cache.size(), 0);
    }

    BOOST_AUTO_TEST_CASE(test_fetch_through_authority)
    {
        FakeCredentialAuthority authority;
        authority.addUser("token", completeCredentials("9"));

        CredentialCache cache(std::chrono::seconds(0));
        auto fetch = [&authority]() { return authority.fetchCredentials("token"); };

        BOOST_CHECK_EQUAL(cache.get("token", fetch).userId, "9");

        authority.setUnavailable(true);
        BOOST_CHECK_EQUAL(cache.get("token", fetch).userId, "9");
        BOOST_CHECK_EQUAL(authority.fetches.load(), 2);
    }
BOOST_AUTO_TEST_SUITE_END()
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

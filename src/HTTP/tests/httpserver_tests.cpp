#include "../../tests/fixtures/HttpClientFixture.h"
#include "../../tests/fixtures/HttpServerFixture.h"
#include <boost/test/unit_test.hpp>

struct HttpServerTestFixture : public HttpServerFixture, public HttpClientFixture {};

BOOST_FIXTURE_TEST_SUITE(HttpServer_test_suite, HttpServerTestFixture)
/*
 * This test suite is responsible for testing the routes the HttpServer handles itself
 */

    BOOST_AUTO_TEST_CASE(test_health)
    {
        auto result = getJson("/health");

        BOOST_CHECK_EQUAL(std::stoi(result->status_code), (int) SimpleWeb::StatusCode::success_ok);
        BOOST_CHECK_EQUAL(jsonResult["status"], "ok");

        // yyyy-mm-ddThh:mm:ssZ
        auto timestamp = jsonResult["timestamp"].get<std::string>();
        BOOST_CHECK_EQUAL(timestamp.size(), 20);
        BOOST_CHECK_EQUAL(timestamp[10], 'T');
        BOOST_CHECK_EQUAL(timestamp.back(), 'Z');

        BOOST_CHECK_EQUAL(getResponseHeader(result, "Access-Control-Allow-Origin"), "*");
        BOOST_CHECK_EQUAL(getResponseHeader(result, "Content-Type"), "application/json");
    }

    BOOST_AUTO_TEST_CASE(test_cors_preflight)
    {
        for (const auto* path : {"/upload", "/download", "/upload-progress/abc", "/anything"})
        {
            auto result = httpClient.request("OPTIONS", path);

            BOOST_CHECK_EQUAL(std::stoi(result->status_code), (int) SimpleWeb::StatusCode::success_no_content);
            BOOST_CHECK_EQUAL(getResponseHeader(result, "Access-Control-Allow-Origin"), "*");
            BOOST_CHECK_EQUAL(getResponseHeader(result, "Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
            BOOST_CHECK_EQUAL(
                    getResponseHeader(result, "Access-Control-Allow-Headers"), "Content-Type, Authorization, Range"
            );
            BOOST_CHECK_EQUAL(result->content.string(), "");
        }
    }

    BOOST_AUTO_TEST_CASE(test_unknown_endpoint)
    {
        auto result = getJson("/not-a-route");
        BOOST_CHECK_EQUAL(std::stoi(result->status_code), (int) SimpleWeb::StatusCode::client_error_not_found);
        BOOST_CHECK_EQUAL(jsonResult["error"], "NotFound");
        BOOST_CHECK_EQUAL(getResponseHeader(result, "Access-Control-Allow-Origin"), "*");

        result = postJson("/not-a-route", nlohmann::json::object());
        BOOST_CHECK_EQUAL(std::stoi(result->status_code), (int) SimpleWeb::StatusCode::client_error_not_found);

        // Routes only answer the methods they define
        result = getJson("/complete-upload");
        BOOST_CHECK_EQUAL(std::stoi(result->status_code), (int) SimpleWeb::StatusCode::client_error_not_found);
    }
BOOST_AUTO_TEST_SUITE_END()

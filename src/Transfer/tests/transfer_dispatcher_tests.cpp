#include "../../Lib/Errors.h"
#include "../../tests/fakes/FakeCredentialAuthority.h"
#include "../../tests/fakes/FakeMetadataStore.h"
#include "../../tests/fakes/FakeRemoteStore.h"
#include "../../Remote/RemoteStore.h"
#include "../../tests/utils.h"
#include "../TransferDispatcher.h"
#include <boost/test/unit_test.hpp>
#include <thread>

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
struct TransferDispatcherFixture
{
    // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
    TemporaryDirectory tempDir;

    std::shared_ptr<UploadRegistry> registry = std::make_shared<UploadRegistry>();
    std::shared_ptr<FakeRemoteStore> remoteStore = std::make_shared<FakeRemoteStore>();
    std::shared_ptr<FakeMetadataStore> metadataStore = std::make_shared<FakeMetadataStore>();
    std::shared_ptr<TransferDispatcher> dispatcher;
    // NOLINTEND(misc-non-private-member-variables-in-classes)

    TransferDispatcherFixture() : TransferDispatcherFixture(4) {}

    explicit TransferDispatcherFixture(uint32_t queueLimit)
    {
        dispatcher = std::make_shared<TransferDispatcher>(registry, remoteStore, metadataStore, 2, queueLimit, 4096);
    }

    ~TransferDispatcherFixture()
    {
        remoteStore->gate.open();
        dispatcher->join();
    }

    TransferDispatcherFixture(TransferDispatcherFixture const&)                    = delete;
    auto operator=(TransferDispatcherFixture const&) -> TransferDispatcherFixture& = delete;
    TransferDispatcherFixture(TransferDispatcherFixture&&)                         = delete;
    auto operator=(TransferDispatcherFixture&&) -> TransferDispatcherFixture&      = delete;

    auto addSession(const std::string& uploadId, uint32_t size, const sCredentials& credentials = completeCredentials("7"))
            -> std::shared_ptr<sUploadSession>
    {
        auto data = generateRandomData(size);
        auto path = writeTestFile(tempDir.path(), *data);

        auto session = std::make_shared<sUploadSession>(uploadId, "video.mp4", size, path, credentials, "user-token");
        registry->create(session);
        return session;
    }
};

struct SaturatedDispatcherFixture : public TransferDispatcherFixture
{
    SaturatedDispatcherFixture() : TransferDispatcherFixture(1) {}
};

BOOST_AUTO_TEST_SUITE(TransferDispatcher_test_suite)
    BOOST_AUTO_TEST_CASE(test_choose_strategy)
    {
        auto credentials = completeCredentials("1");

        BOOST_CHECK(TransferDispatcher::chooseStrategy(100, credentials, 100) == eTransferStrategy::Stateless);
        BOOST_CHECK(TransferDispatcher::chooseStrategy(101, credentials, 100) == eTransferStrategy::Session);

        // Without a bot token every object goes through a session
        credentials.botToken = "";
        BOOST_CHECK(TransferDispatcher::chooseStrategy(1, credentials, 100) == eTransferStrategy::Session);

        credentials = completeCredentials("1");
        credentials.channelId = "";
        BOOST_CHECK(TransferDispatcher::chooseStrategy(1, credentials, 100) == eTransferStrategy::Session);
    }

    BOOST_FIXTURE_TEST_CASE(test_small_object_completes_statelessly, TransferDispatcherFixture)
    {
        auto session = addSession("small", 1000);
        auto expected = readTestFile(session->tempStoragePath);

        auto queued = dispatcher->complete("small");
        BOOST_CHECK(queued.state == eUploadState::Dispatched);

        dispatcher->join();

        auto progress = registry->get("small");
        BOOST_CHECK(progress.state == eUploadState::Completed);
        BOOST_CHECK_EQUAL(progress.progressPercent, 100);
        BOOST_CHECK_EQUAL(*progress.fileId, "small-" + std::to_string(*progress.messageId));

        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 1);
        BOOST_CHECK_EQUAL(remoteStore->sessionsOpened.load(), 0);
        BOOST_CHECK(remoteStore->getObject(*progress.messageId) == expected);
        BOOST_CHECK_EQUAL(remoteStore->getName(*progress.messageId), "video.mp4");

        // Temp storage is released once the session is terminal
        BOOST_CHECK_EQUAL(tempDir.fileCount(), 0);

        auto records = metadataStore->getRecords();
        BOOST_CHECK_EQUAL(records.size(), 1);
        BOOST_CHECK_EQUAL(records[0].first, "user-token");
        BOOST_CHECK_EQUAL(records[0].second.userId, "7");
        BOOST_CHECK_EQUAL(records[0].second.fileName, "video.mp4");
        BOOST_CHECK_EQUAL(records[0].second.messageId, *progress.messageId);
        BOOST_CHECK_EQUAL(records[0].second.fileId, *progress.fileId);
        BOOST_CHECK_EQUAL(records[0].second.size, 1000);
        BOOST_CHECK_EQUAL(records[0].second.mimeType, "video/mp4");
    }

    BOOST_FIXTURE_TEST_CASE(test_large_object_uses_a_session, TransferDispatcherFixture)
    {
        auto session = addSession("large", 10000);
        auto expected = readTestFile(session->tempStoragePath);

        dispatcher->complete("large");
        dispatcher->join();

        auto progress = registry->get("large");
        BOOST_CHECK(progress.state == eUploadState::Completed);
        BOOST_CHECK_EQUAL(progress.progressPercent, 100);
        BOOST_CHECK_EQUAL(*progress.fileId, "session-" + std::to_string(*progress.messageId));
        BOOST_CHECK(remoteStore->getObject(*progress.messageId) == expected);

        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 0);
        BOOST_CHECK_EQUAL(remoteStore->sessionUploads.load(), 1);

        // The session is always closed exactly once
        BOOST_CHECK_EQUAL(remoteStore->sessionsOpened.load(), 1);
        BOOST_CHECK_EQUAL(remoteStore->sessionsClosed.load(), 1);
        BOOST_CHECK_EQUAL(tempDir.fileCount(), 0);
    }

    BOOST_FIXTURE_TEST_CASE(test_progress_is_reported_while_uploading, TransferDispatcherFixture)
    {
        addSession("large", 10000);

        remoteStore->gate.close();
        dispatcher->complete("large");
        BOOST_CHECK(remoteStore->gate.waitForArrival(std::chrono::seconds(5)));

        auto progress = registry->get("large");
        BOOST_CHECK(progress.state == eUploadState::InProgress);
        BOOST_CHECK_EQUAL(progress.progressPercent, 0);

        remoteStore->gate.open();
        dispatcher->join();

        BOOST_CHECK_EQUAL(registry->get("large").progressPercent, 100);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_is_idempotent_once_completed, TransferDispatcherFixture)
    {
        addSession("small", 100);

        dispatcher->complete("small");
        dispatcher->join();

        auto first = registry->get("small");
        auto second = dispatcher->complete("small");

        BOOST_CHECK(second.state == eUploadState::Completed);
        BOOST_CHECK_EQUAL(*second.messageId, *first.messageId);
        BOOST_CHECK_EQUAL(*second.fileId, *first.fileId);

        // Nothing was sent a second time
        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 1);
        BOOST_CHECK_EQUAL(metadataStore->getRecords().size(), 1);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_while_in_flight, TransferDispatcherFixture)
    {
        addSession("small", 100);

        remoteStore->gate.close();
        dispatcher->complete("small");
        BOOST_CHECK(remoteStore->gate.waitForArrival(std::chrono::seconds(5)));

        BOOST_CHECK_THROW(dispatcher->complete("small"), eAlreadyInProgress);

        remoteStore->gate.open();
        dispatcher->join();

        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 1);
    }

    BOOST_FIXTURE_TEST_CASE(test_unknown_session, TransferDispatcherFixture)
    {
        BOOST_CHECK_THROW(dispatcher->complete("missing"), eUnknownSession);
    }

    BOOST_FIXTURE_TEST_CASE(test_rejected_object_fails_the_upload, TransferDispatcherFixture)
    {
        addSession("small", 100);
        remoteStore->bRejectSmallObjects = true;

        dispatcher->complete("small");
        dispatcher->join();

        auto progress = registry->get("small");
        BOOST_CHECK(progress.state == eUploadState::Failed);
        BOOST_CHECK_EQUAL(progress.lastError, "Remote store rejected the object: Unauthorized");
        BOOST_CHECK(!progress.messageId.has_value());
        BOOST_CHECK(!progress.fileId.has_value());

        BOOST_CHECK_EQUAL(tempDir.fileCount(), 0);
        BOOST_CHECK(metadataStore->getRecords().empty());

        // A failed upload reports its error rather than being dispatched again
        try
        {
            dispatcher->complete("small");
            BOOST_FAIL("complete should have thrown");
        }
        catch (eUploadFailed& e)
        {
            BOOST_CHECK_EQUAL(std::string(e.what()), "Upload failed: Remote store rejected the object: Unauthorized");
        }
        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 1);
    }

    BOOST_AUTO_TEST_CASE(test_failed_upload_error_hides_bot_token)
    {
        TemporaryDirectory tempDir;
        auto registry = std::make_shared<UploadRegistry>();
        auto metadataStore = std::make_shared<FakeMetadataStore>();
        auto unreachable = std::make_shared<RemoteStore>("http://localhost:1", "localhost:1");
        auto dispatcher = std::make_shared<TransferDispatcher>(registry, unreachable, metadataStore, 1, 4, 4096);

        auto path = writeTestFile(tempDir.path(), *generateRandomData(100));
        registry->create(
                std::make_shared<sUploadSession>("small", "notes.txt", 100, path, completeCredentials("7"), "user-token")
        );

        dispatcher->complete("small");
        dispatcher->join();

        auto progress = registry->get("small");
        BOOST_CHECK(progress.state == eUploadState::Failed);
        BOOST_CHECK(!progress.lastError.empty());
        BOOST_CHECK_EQUAL(progress.lastError.find("bot-token"), std::string::npos);
        BOOST_CHECK_EQUAL(progress.lastError.find("123456"), std::string::npos);
    }

    BOOST_FIXTURE_TEST_CASE(test_session_failure_closes_the_session, TransferDispatcherFixture)
    {
        addSession("large", 10000);
        remoteStore->bFailUpload = true;

        dispatcher->complete("large");
        dispatcher->join();

        BOOST_CHECK(registry->get("large").state == eUploadState::Failed);
        BOOST_CHECK_EQUAL(remoteStore->sessionsOpened.load(), 1);
        BOOST_CHECK_EQUAL(remoteStore->sessionsClosed.load(), 1);
        BOOST_CHECK_EQUAL(tempDir.fileCount(), 0);
    }

    BOOST_FIXTURE_TEST_CASE(test_session_open_failure, TransferDispatcherFixture)
    {
        addSession("large", 10000);
        remoteStore->bFailOpen = true;

        dispatcher->complete("large");
        dispatcher->join();

        auto progress = registry->get("large");
        BOOST_CHECK(progress.state == eUploadState::Failed);
        BOOST_CHECK_EQUAL(progress.lastError, "Unable to open a remote session");
        BOOST_CHECK_EQUAL(remoteStore->sessionsClosed.load(), 0);
    }

    BOOST_FIXTURE_TEST_CASE(test_metadata_failure_does_not_fail_the_upload, TransferDispatcherFixture)
    {
        addSession("small", 100);
        metadataStore->bFail = true;

        dispatcher->complete("small");
        dispatcher->join();

        auto progress = registry->get("small");
        BOOST_CHECK(progress.state == eUploadState::Completed);
        BOOST_CHECK(progress.messageId.has_value());
    }

    BOOST_FIXTURE_TEST_CASE(test_saturated_pool_rejects_dispatch, SaturatedDispatcherFixture)
    {
        addSession("first", 100);
        addSession("second", 100);

        remoteStore->gate.close();
        dispatcher->complete("first");
        BOOST_CHECK(remoteStore->gate.waitForArrival(std::chrono::seconds(5)));

        BOOST_CHECK_THROW(dispatcher->complete("second"), eDispatchRejected);

        // The rejected session is untouched and can be completed later
        BOOST_CHECK(registry->get("second").state == eUploadState::Received);
        BOOST_CHECK_EQUAL(dispatcher->getPending(), 1);

        remoteStore->gate.open();

        // Wait for the first dispatch to release its slot
        for (auto attempt = 0; attempt < 500 && dispatcher->getPending() != 0; attempt++)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        BOOST_CHECK_NO_THROW(dispatcher->complete("second"));
        dispatcher->join();

        BOOST_CHECK(registry->get("first").state == eUploadState::Completed);
        BOOST_CHECK(registry->get("second").state == eUploadState::Completed);
    }

    BOOST_FIXTURE_TEST_CASE(test_execute_always_releases_temp_storage, TransferDispatcherFixture)
    {
        auto session = addSession("large", 10000);
        remoteStore->bFailUpload = true;

        dispatcher->callexecute(session);

        BOOST_CHECK(registry->get("large").state == eUploadState::Failed);
        BOOST_CHECK(!std::filesystem::exists(session->tempStoragePath));
        BOOST_CHECK_EQUAL(remoteStore->sessionsClosed.load(), 1);
    }
BOOST_AUTO_TEST_SUITE_END()
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

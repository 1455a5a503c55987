#include "../../Lib/Errors.h"
#include "../../tests/fakes/FakeCredentialAuthority.h"
#include "../../tests/fakes/FakeMetadataStore.h"
#include "../../tests/fakes/FakeRemoteStore.h"
#include "../../tests/utils.h"
#include "../UploadCoordinator.h"
#include <boost/test/unit_test.hpp>

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
struct UploadCoordinatorFixture
{
    // NOLINTBEGIN(misc-non-private-member-variables-in-classes)
    TemporaryDirectory uploadDir;

    std::shared_ptr<FakeRemoteStore> remoteStore = std::make_shared<FakeRemoteStore>();
    std::shared_ptr<FakeCredentialAuthority> authority = std::make_shared<FakeCredentialAuthority>();
    std::shared_ptr<FakeMetadataStore> metadataStore = std::make_shared<FakeMetadataStore>();

    std::shared_ptr<ChunkAssembler> chunkAssembler = std::make_shared<ChunkAssembler>();
    std::shared_ptr<UploadRegistry> registry = std::make_shared<UploadRegistry>();
    std::shared_ptr<TransferDispatcher> dispatcher =
            std::make_shared<TransferDispatcher>(registry, remoteStore, metadataStore, 2, 8, 4096);
    std::shared_ptr<CredentialCache> credentialCache = std::make_shared<CredentialCache>(std::chrono::seconds(3600));

    UploadCoordinator coordinator =
            UploadCoordinator(chunkAssembler, registry, dispatcher, credentialCache, authority, uploadDir.path());
    // NOLINTEND(misc-non-private-member-variables-in-classes)

    UploadCoordinatorFixture()
    {
        authority->addUser("user-token", completeCredentials("42"));
    }

    ~UploadCoordinatorFixture()
    {
        remoteStore->gate.open();
        dispatcher->join();
    }

    UploadCoordinatorFixture(UploadCoordinatorFixture const&)                    = delete;
    auto operator=(UploadCoordinatorFixture const&) -> UploadCoordinatorFixture& = delete;
    UploadCoordinatorFixture(UploadCoordinatorFixture&&)                         = delete;
    auto operator=(UploadCoordinatorFixture&&) -> UploadCoordinatorFixture&      = delete;
};

BOOST_AUTO_TEST_SUITE(UploadCoordinator_test_suite)
    BOOST_FIXTURE_TEST_CASE(test_receive_stores_the_body, UploadCoordinatorFixture)
    {
        auto session = coordinator.receive("user-token", "notes.txt", "hello world");

        BOOST_CHECK_EQUAL(session->fileName, "notes.txt");
        BOOST_CHECK_EQUAL(session->size, 11);
        BOOST_CHECK_EQUAL(session->authToken, "user-token");
        BOOST_CHECK_EQUAL(session->credentials.userId, "42");

        auto stored = readTestFile(session->tempStoragePath);
        BOOST_CHECK_EQUAL(std::string(stored.begin(), stored.end()), "hello world");
        BOOST_CHECK_EQUAL(uploadDir.fileCount(), 1);

        BOOST_CHECK(registry->get(session->uploadId).state == eUploadState::Received);
    }

    BOOST_FIXTURE_TEST_CASE(test_received_id_already_registered, UploadCoordinatorFixture)
    {
        auto first = coordinator.receive("user-token", "notes.txt", "hello world");

        auto path = writeTestFile(uploadDir.path(), {'x', 'y'});
        auto duplicate = std::make_shared<sUploadSession>(
                first->uploadId, "other.txt", 2, path, completeCredentials("42"), "user-token"
        );
        BOOST_CHECK_EQUAL(uploadDir.fileCount(), 2);

        BOOST_CHECK_THROW(coordinator.callregisterReceived(duplicate), std::runtime_error);

        // The duplicate's file is gone and the first session is untouched
        BOOST_CHECK_EQUAL(uploadDir.fileCount(), 1);
        BOOST_CHECK(registry->find(first->uploadId) == first);
        auto stored = readTestFile(first->tempStoragePath);
        BOOST_CHECK_EQUAL(std::string(stored.begin(), stored.end()), "hello world");
    }

    BOOST_FIXTURE_TEST_CASE(test_receive_with_unknown_token, UploadCoordinatorFixture)
    {
        BOOST_CHECK_THROW(coordinator.receive("bad-token", "notes.txt", "hello"), eCredentialFetchError);

        // Nothing is stored for a rejected upload
        BOOST_CHECK_EQUAL(uploadDir.fileCount(), 0);
        BOOST_CHECK_EQUAL(registry->size(), 0);
    }

    BOOST_FIXTURE_TEST_CASE(test_credentials_are_cached, UploadCoordinatorFixture)
    {
        coordinator.resolveCredentials("user-token");
        coordinator.resolveCredentials("user-token");
        BOOST_CHECK_EQUAL(authority->fetches.load(), 1);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_received_upload, UploadCoordinatorFixture)
    {
        auto session = coordinator.receive("user-token", "notes.txt", "hello world");

        auto progress = coordinator.complete(session->uploadId);
        BOOST_CHECK(progress.state == eUploadState::Dispatched);

        dispatcher->join();

        BOOST_CHECK(registry->get(session->uploadId).state == eUploadState::Completed);
        BOOST_CHECK_EQUAL(uploadDir.fileCount(), 0);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_chunk_set, UploadCoordinatorFixture)
    {
        chunkAssembler->initSession("chunked", "photo.png", 3, "user-token");
        chunkAssembler->putChunk("chunked", 1, {'b', 'b'});
        chunkAssembler->putChunk("chunked", 0, {'a', 'a'});
        chunkAssembler->putChunk("chunked", 2, {'c'});

        auto progress = coordinator.complete("chunked");
        BOOST_CHECK_EQUAL(progress.uploadId, "chunked");
        BOOST_CHECK(progress.state == eUploadState::Dispatched);

        // The chunk set is replaced by the upload session
        BOOST_CHECK(!chunkAssembler->contains("chunked"));

        dispatcher->join();

        auto result = registry->get("chunked");
        BOOST_CHECK(result.state == eUploadState::Completed);

        auto stored = remoteStore->getObject(*result.messageId);
        BOOST_CHECK_EQUAL(std::string(stored.begin(), stored.end()), "aabbc");
        BOOST_CHECK_EQUAL(remoteStore->getName(*result.messageId), "photo.png");

        auto records = metadataStore->getRecords();
        BOOST_CHECK_EQUAL(records.size(), 1);
        BOOST_CHECK_EQUAL(records[0].second.size, 5);
        BOOST_CHECK_EQUAL(records[0].second.mimeType, "image/png");
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_incomplete_chunk_set, UploadCoordinatorFixture)
    {
        chunkAssembler->initSession("chunked", "photo.png", 3, "user-token");
        chunkAssembler->putChunk("chunked", 1, {'b'});

        try
        {
            coordinator.complete("chunked");
            BOOST_FAIL("complete should have thrown");
        }
        catch (eIncompleteUpload& e)
        {
            BOOST_CHECK(e.getMissing() == std::vector<uint32_t>({0, 2}));
        }

        // The set is kept so the client can send what is missing
        BOOST_CHECK(chunkAssembler->contains("chunked"));
        BOOST_CHECK(registry->find("chunked") == nullptr);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_chunk_set_twice, UploadCoordinatorFixture)
    {
        chunkAssembler->initSession("chunked", "notes.txt", 1, "user-token");
        chunkAssembler->putChunk("chunked", 0, {'a'});

        remoteStore->gate.close();
        coordinator.complete("chunked");
        BOOST_CHECK(remoteStore->gate.waitForArrival(std::chrono::seconds(5)));

        BOOST_CHECK_THROW(coordinator.complete("chunked"), eAlreadyInProgress);

        remoteStore->gate.open();
        dispatcher->join();

        BOOST_CHECK(coordinator.complete("chunked").state == eUploadState::Completed);
        BOOST_CHECK_EQUAL(remoteStore->smallObjectsSent.load(), 1);
    }

    BOOST_FIXTURE_TEST_CASE(test_complete_unknown_upload, UploadCoordinatorFixture)
    {
        BOOST_CHECK_THROW(coordinator.complete("missing"), eUnknownSession);
    }
BOOST_AUTO_TEST_SUITE_END()
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

#include <gtest/gtest.h>
#include "uplift/transfer/upload_coordinator.hpp"
#include "support/fake_storage_client.hpp"
#include "support/recording_callbacks.hpp"
#include "support/upload_fixtures.hpp"
#include <algorithm>
#include <set>

using namespace uplift;
using namespace uplift::test;
using core::UploadError;
using storage::PartStatus;
using storage::SessionStatus;
using transfer::UploadCoordinator;
using transfer::UploadOutcome;

class UploadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = open_store(dir / "uploads.db");
        ASSERT_NE(store, nullptr);

        client = std::make_shared<FakeStorageClient>();
        callbacks = std::make_shared<RecordingCallbacks>();

        config.minimum_chunk_size = 1;
        config.chunk_size = 4 * KB;
        config.retry_delay = std::chrono::milliseconds(1);
        config.max_concurrent_parts = 3;
    }

    void TearDown() override {
        client->open_gate();
        for (const auto& coordinator : coordinators) {
            coordinator->shutdown();
        }
        pool->join();
    }

    std::shared_ptr<UploadCoordinator> make_coordinator() {
        auto coordinator = std::make_shared<UploadCoordinator>(session.session_id, store, client, config, pool,
                                                               progress, monitor, callbacks);
        coordinators.push_back(coordinator);
        return coordinator;
    }

    // Writes a source file, records its session and attaches a coordinator
    std::shared_ptr<UploadCoordinator> start(uint64_t file_size, uint64_t chunk_bytes,
                                             const std::function<void(storage::UploadSession&)>& adjust = {}) {
        auto source = dir / "source.bin";
        write_pattern_file(source, file_size);

        session = make_session(source, chunk_bytes, parts);
        if (adjust) {
            adjust(session);
        }
        EXPECT_TRUE(store->create_session(session, parts));

        auto coordinator = make_coordinator();
        auto result = coordinator->attach();
        EXPECT_TRUE(result) << result.message;
        return coordinator;
    }

    std::vector<storage::UploadPart> stored_parts() {
        std::vector<storage::UploadPart> stored;
        EXPECT_TRUE(store->get_parts(session.session_id, stored));
        return stored;
    }

    SessionStatus stored_status() {
        storage::UploadSession stored;
        EXPECT_TRUE(store->get_session(session.session_id, stored));
        return stored.status;
    }

    TempDir dir;
    std::shared_ptr<storage::UploadStore> store;
    std::shared_ptr<FakeStorageClient> client;
    std::shared_ptr<RecordingCallbacks> callbacks;
    transfer::UploadConfig config;
    transfer::ProgressHub progress;
    transfer::PerformanceMonitor monitor;
    storage::UploadSession session;
    std::vector<storage::UploadPart> parts;
    std::vector<std::shared_ptr<UploadCoordinator>> coordinators;
    std::shared_ptr<boost::asio::thread_pool> pool = std::make_shared<boost::asio::thread_pool>(5);
};

TEST_F(UploadCoordinatorTest, UploadsEveryPartAndCompletes) {
    config.chunk_size = 5 * MB;
    config.minimum_chunk_size = 5 * MB;
    auto coordinator = start(23 * MB, 5 * MB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(30)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(stored_status(), SessionStatus::COMPLETED);

    EXPECT_EQ(client->initiate_calls(), 1);
    EXPECT_EQ(client->complete_calls(), 1);

    auto completed = client->completed_parts();
    ASSERT_EQ(completed.size(), 5);
    for (uint32_t i = 0; i < 5; ++i) {
        EXPECT_EQ(completed[i].part_number, i + 1);
        EXPECT_EQ(completed[i].integrity_token, "\"etag-" + std::to_string(i + 1) + "\"");
    }
    EXPECT_EQ(client->received_bytes(1), 5 * MB);
    EXPECT_EQ(client->received_bytes(5), 3 * MB);

    for (const auto& part : stored_parts()) {
        EXPECT_EQ(part.status, PartStatus::UPLOADED);
        EXPECT_FALSE(part.content_digest.empty());
    }

    auto finished = callbacks->finished();
    ASSERT_EQ(finished.size(), 1);
    EXPECT_EQ(finished[0].outcome, UploadOutcome::COMPLETED);

    auto snapshot = coordinator->snapshot();
    EXPECT_EQ(snapshot.uploaded_parts, 5);
    EXPECT_DOUBLE_EQ(snapshot.overall_progress, 100.0);
}

TEST_F(UploadCoordinatorTest, RetriesTransientPartFailures) {
    client->fail_part(3, 2);
    auto coordinator = start(18 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->attempts(3), 3);
    EXPECT_EQ(client->attempts(1), 1);

    auto stored = stored_parts();
    EXPECT_EQ(stored[2].retry_count, 2);
    EXPECT_EQ(stored[2].status, PartStatus::UPLOADED);
    EXPECT_EQ(stored[0].retry_count, 0);
}

TEST_F(UploadCoordinatorTest, OverlappingRetriesAllRun) {
    client->fail_part(1, 1);
    client->fail_part(3, 2);
    client->fail_part(4, 3);
    auto coordinator = start(16 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);

    auto stored = stored_parts();
    EXPECT_EQ(stored[0].retry_count, 1);
    EXPECT_EQ(stored[2].retry_count, 2);
    EXPECT_EQ(stored[3].retry_count, 3);
    EXPECT_EQ(client->attempts(4), 4);
    EXPECT_EQ(client->complete_calls(), 1);
}

TEST_F(UploadCoordinatorTest, ExhaustedRetriesFailTheSession) {
    client->fail_part(2, 100);
    auto coordinator = start(16 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);

    // One initial attempt plus max_retries
    EXPECT_EQ(client->attempts(2), 4);
    EXPECT_EQ(client->complete_calls(), 0);

    auto stored = stored_parts();
    EXPECT_EQ(stored[1].status, PartStatus::FAILED);
    EXPECT_EQ(stored[1].retry_count, 4);

    storage::UploadSession failed;
    ASSERT_TRUE(store->get_session(session.session_id, failed));
    ASSERT_TRUE(failed.error_message.has_value());
    EXPECT_NE(failed.error_message->find("Part 2"), std::string::npos);

    auto finished = callbacks->finished();
    ASSERT_EQ(finished.size(), 1);
    EXPECT_EQ(finished[0].outcome, UploadOutcome::FAILED);
}

TEST_F(UploadCoordinatorTest, FailedSessionCancelsPartsInFlight) {
    config.max_concurrent_parts = 4;
    client->hold_parts({1, 3, 4});
    client->fail_part(2, 100);
    auto coordinator = start(16 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
    ASSERT_TRUE(wait_until([&] { return coordinator->in_flight_parts().empty(); }));

    EXPECT_EQ(client->cancelled_parts(), (std::set<uint32_t>{1, 3, 4}));
    EXPECT_EQ(client->complete_calls(), 0);
    EXPECT_EQ(stored_status(), SessionStatus::FAILED);

    for (const auto& part : stored_parts()) {
        if (part.part_number == 2) {
            EXPECT_EQ(part.status, PartStatus::FAILED);
        } else {
            EXPECT_NE(part.status, PartStatus::UPLOADED) << "part " << part.part_number;
            EXPECT_FALSE(part.integrity_token.has_value()) << "part " << part.part_number;
        }
    }

    auto finished = callbacks->finished();
    ASSERT_EQ(finished.size(), 1);
    EXPECT_EQ(finished[0].outcome, UploadOutcome::FAILED);
}

TEST_F(UploadCoordinatorTest, PermanentRejectionIsNotRetried) {
    client->fail_part(1, 1, UploadError::PERMANENT_REJECTION);
    auto coordinator = start(12 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
    EXPECT_EQ(client->attempts(1), 1);
}

TEST_F(UploadCoordinatorTest, ZeroRetriesFailOnFirstError) {
    client->fail_part(1, 1);
    auto coordinator = start(8 * KB, 4 * KB, [](storage::UploadSession& s) { s.max_retries = 0; });

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
    EXPECT_EQ(client->attempts(1), 1);
}

TEST_F(UploadCoordinatorTest, RespectsConcurrencyLimit) {
    config.max_concurrent_parts = 2;
    client->close_gate();
    auto coordinator = start(32 * KB, 4 * KB);

    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(client->in_flight(), 2);
    EXPECT_EQ(coordinator->in_flight_parts().size(), 2);

    client->open_gate();
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->max_in_flight(), 2);
}

TEST_F(UploadCoordinatorTest, PauseDrainsInFlightPartsThenResumes) {
    client->close_gate();
    auto coordinator = start(18 * KB, 4 * KB);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 3; }));

    ASSERT_TRUE(coordinator->pause());
    EXPECT_EQ(coordinator->status(), SessionStatus::PAUSED);
    EXPECT_EQ(stored_status(), SessionStatus::PAUSED);
    EXPECT_FALSE(coordinator->wait_until_settled(std::chrono::milliseconds(50)));

    client->open_gate();
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::PAUSED);

    uint32_t uploaded = 0;
    ASSERT_TRUE(store->count_uploaded_parts(session.session_id, uploaded));
    EXPECT_EQ(uploaded, 3);
    EXPECT_EQ(client->attempts(4), 0);

    ASSERT_TRUE(coordinator->resume());
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->attempts(1), 1);

    auto paused = callbacks->paused();
    ASSERT_EQ(paused.size(), 1);
    EXPECT_FALSE(paused[0].constraint_violation);
    EXPECT_EQ(callbacks->resumed().size(), 1);
}

TEST_F(UploadCoordinatorTest, PauseRequiresRunningSession) {
    auto coordinator = start(8 * KB, 4 * KB);
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));

    EXPECT_EQ(coordinator->pause().error, UploadError::INVALID_STATE);
    EXPECT_EQ(coordinator->resume().error, UploadError::INVALID_STATE);
}

TEST_F(UploadCoordinatorTest, CancelAbortsRemoteUpload) {
    client->close_gate();
    auto coordinator = start(16 * KB, 4 * KB);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 3; }));

    ASSERT_TRUE(coordinator->cancel());
    EXPECT_EQ(coordinator->status(), SessionStatus::ABORTED);
    EXPECT_EQ(stored_status(), SessionStatus::ABORTED);
    EXPECT_EQ(client->abort_calls(), 1);
    EXPECT_EQ(client->aborted_upload().upload_id, "upload-1");

    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 0; }));
    EXPECT_EQ(client->complete_calls(), 0);

    auto finished = callbacks->finished();
    ASSERT_EQ(finished.size(), 1);
    EXPECT_EQ(finished[0].outcome, UploadOutcome::CANCELLED);

    EXPECT_EQ(coordinator->cancel().error, UploadError::INVALID_STATE);
}

TEST_F(UploadCoordinatorTest, CancelSucceedsWhenAbortFails) {
    client->close_gate();
    client->set_abort_result(core::UploadResult(UploadError::TRANSIENT_NETWORK, "connection reset"));
    auto coordinator = start(16 * KB, 4 * KB);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() > 0; }));

    ASSERT_TRUE(coordinator->cancel());
    EXPECT_EQ(stored_status(), SessionStatus::ABORTED);
    EXPECT_EQ(client->abort_calls(), 1);
}

TEST_F(UploadCoordinatorTest, CompletionIsRetriedOnce) {
    client->fail_complete(1);
    auto coordinator = start(8 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->complete_calls(), 2);
    EXPECT_EQ(callbacks->finished().size(), 1);
}

TEST_F(UploadCoordinatorTest, SecondCompletionFailureFailsSession) {
    client->fail_complete(2);
    auto coordinator = start(8 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
    EXPECT_EQ(client->complete_calls(), 2);
}

TEST_F(UploadCoordinatorTest, InitiateIsRetried) {
    client->fail_initiate(2);
    auto coordinator = start(8 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->initiate_calls(), 3);

    storage::UploadSession stored;
    ASSERT_TRUE(store->get_session(session.session_id, stored));
    EXPECT_EQ(stored.remote_upload_id, "upload-3");
    EXPECT_EQ(stored.remote_path, "uploads/source.bin");
}

TEST_F(UploadCoordinatorTest, RejectedInitiateFailsSession) {
    client->fail_initiate(1, UploadError::PERMANENT_REJECTION);
    auto coordinator = start(8 * KB, 4 * KB);

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
    EXPECT_EQ(client->attempts(1), 0);
}

TEST_F(UploadCoordinatorTest, ChangedSourceFailsSession) {
    auto source = dir / "source.bin";
    client->close_gate();
    auto coordinator = start(12 * KB, 4 * KB);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 3; }));
    ASSERT_TRUE(coordinator->pause());
    client->open_gate();
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));

    write_pattern_file(source, 20 * KB);

    EXPECT_EQ(coordinator->resume().error, UploadError::SOURCE_READ);
    EXPECT_EQ(coordinator->status(), SessionStatus::FAILED);
}

TEST_F(UploadCoordinatorTest, ContinuesFromRecordedParts) {
    auto source = dir / "source.bin";
    write_pattern_file(source, 16 * KB);
    session = make_session(source, 4 * KB, parts);
    session.status = SessionStatus::IN_PROGRESS;
    session.remote_upload_id = "upload-earlier";
    session.remote_path = "uploads/source.bin";
    parts[0].status = PartStatus::UPLOADED;
    parts[0].integrity_token = "\"etag-earlier-1\"";
    parts[1].status = PartStatus::UPLOADED;
    parts[1].integrity_token = "\"etag-earlier-2\"";
    ASSERT_TRUE(store->create_session(session, parts));

    auto coordinator = make_coordinator();
    ASSERT_TRUE(coordinator->attach());
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));

    EXPECT_EQ(coordinator->status(), SessionStatus::COMPLETED);
    EXPECT_EQ(client->initiate_calls(), 0);
    EXPECT_EQ(client->attempts(1), 0);
    EXPECT_EQ(client->attempts(2), 0);
    EXPECT_EQ(client->attempts(3), 1);

    auto completed = client->completed_parts();
    ASSERT_EQ(completed.size(), 4);
    EXPECT_EQ(completed[0].integrity_token, "\"etag-earlier-1\"");
    EXPECT_EQ(completed[3].integrity_token, "\"etag-4\"");
}

TEST_F(UploadCoordinatorTest, AttachRejectsFinishedSession) {
    auto source = dir / "source.bin";
    write_pattern_file(source, 8 * KB);
    session = make_session(source, 4 * KB, parts);
    session.status = SessionStatus::COMPLETED;
    ASSERT_TRUE(store->create_session(session, parts));

    auto coordinator = make_coordinator();
    EXPECT_EQ(coordinator->attach().error, UploadError::INVALID_STATE);
    EXPECT_EQ(client->initiate_calls(), 0);
}

TEST_F(UploadCoordinatorTest, InconsistentLayoutFailsSession) {
    auto source = dir / "source.bin";
    write_pattern_file(source, 12 * KB);
    session = make_session(source, 4 * KB, parts);
    parts.pop_back();
    ASSERT_TRUE(store->create_session(session, parts));

    auto coordinator = make_coordinator();
    EXPECT_EQ(coordinator->attach().error, UploadError::INVALID_STATE);
    EXPECT_EQ(stored_status(), SessionStatus::FAILED);
}

TEST_F(UploadCoordinatorTest, ConstraintViolationPausesAndAutoResumes) {
    client->close_gate();
    auto coordinator = start(16 * KB, 4 * KB, [](storage::UploadSession& s) {
        s.constraints.auto_resume_delay = std::chrono::milliseconds(10);
    });
    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 3; }));

    coordinator->on_constraints_violated("Network lost");
    EXPECT_EQ(coordinator->status(), SessionStatus::PAUSED);

    storage::UploadSession paused;
    ASSERT_TRUE(store->get_session(session.session_id, paused));
    EXPECT_TRUE(paused.auto_paused);
    EXPECT_EQ(paused.pause_reason, "Network lost");

    client->open_gate();
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));

    coordinator->on_constraints_satisfied();
    ASSERT_TRUE(wait_until([&] { return coordinator->status() == SessionStatus::COMPLETED; }));

    auto events = callbacks->paused();
    ASSERT_EQ(events.size(), 1);
    EXPECT_TRUE(events[0].constraint_violation);
    EXPECT_EQ(callbacks->resumed().size(), 1);
}

TEST_F(UploadCoordinatorTest, UserPauseIsNotAutoResumed) {
    client->close_gate();
    auto coordinator = start(16 * KB, 4 * KB, [](storage::UploadSession& s) {
        s.constraints.auto_resume_delay = std::chrono::milliseconds(0);
    });
    ASSERT_TRUE(wait_until([&] { return client->in_flight() == 3; }));

    coordinator->on_constraints_violated("Battery low");
    ASSERT_TRUE(coordinator->pause());
    client->open_gate();
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));

    coordinator->on_constraints_satisfied();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(coordinator->status(), SessionStatus::PAUSED);

    storage::UploadSession stored;
    ASSERT_TRUE(store->get_session(session.session_id, stored));
    EXPECT_FALSE(stored.auto_paused);
}

TEST_F(UploadCoordinatorTest, PublishesProgress) {
    std::mutex mutex;
    std::vector<uint32_t> uploaded_parts;
    auto token = progress.subscribe_all([&](const transfer::ProgressSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        uploaded_parts.push_back(snapshot.uploaded_parts);
    });

    auto coordinator = start(12 * KB, 4 * KB);
    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    progress.unsubscribe(token);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(uploaded_parts.empty());
    EXPECT_EQ(*std::max_element(uploaded_parts.begin(), uploaded_parts.end()), 3);
}

TEST_F(UploadCoordinatorTest, ExternalStatusChangeIsObserved) {
    config.retry_delay = std::chrono::milliseconds(50);
    client->fail_part(1, 1);
    auto coordinator = start(8 * KB, 4 * KB);

    ASSERT_TRUE(wait_until([&] { return client->attempts(1) == 1; }));
    ASSERT_TRUE(store->transition_session(session.session_id,
                                          {SessionStatus::IN_PROGRESS}, SessionStatus::ABORTED));

    ASSERT_TRUE(coordinator->wait_until_settled(std::chrono::seconds(10)));
    EXPECT_EQ(coordinator->status(), SessionStatus::ABORTED);
    EXPECT_EQ(client->complete_calls(), 0);
}

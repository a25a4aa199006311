#include <gtest/gtest.h>
#include "uplift/transfer/constraint_monitor.hpp"
#include "support/fake_storage_client.hpp"
#include "support/recording_callbacks.hpp"
#include "support/upload_fixtures.hpp"

using namespace uplift;
using namespace uplift::test;
using storage::SessionStatus;
using transfer::ConstraintMonitor;
using transfer::EnvironmentState;
using transfer::UploadConstraints;

class ConstraintMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = open_store(dir / "uploads.db");
        ASSERT_NE(store, nullptr);

        client = std::make_shared<FakeStorageClient>();
        callbacks = std::make_shared<RecordingCallbacks>();

        config.minimum_chunk_size = 1;
        config.chunk_size = 4 * KB;
        config.retry_delay = std::chrono::milliseconds(1);

        manager = std::make_unique<transfer::UploadManager>(store, client, config);
        manager->set_lifecycle_callbacks(callbacks);

        wifi = UploadConstraints::wifi_only();
        wifi.auto_resume_delay = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        client->open_gate();
        monitor.reset();
        manager.reset();
    }

    std::string start(const std::string& name, const UploadConstraints& constraints) {
        auto path = dir / name;
        write_pattern_file(path, 16 * KB);

        std::string id;
        EXPECT_TRUE(manager->start(path, constraints, id));
        return id;
    }

    SessionStatus status_of(const std::string& id) {
        storage::UploadSession session;
        EXPECT_TRUE(store->get_session(id, session));
        return session.status;
    }

    static EnvironmentState on_mobile_data() {
        EnvironmentState state;
        state.metered = true;
        return state;
    }

    TempDir dir;
    std::shared_ptr<storage::UploadStore> store;
    std::shared_ptr<FakeStorageClient> client;
    std::shared_ptr<RecordingCallbacks> callbacks;
    transfer::UploadConfig config;
    std::unique_ptr<transfer::UploadManager> manager;
    std::unique_ptr<ConstraintMonitor> monitor;
    UploadConstraints wifi;
};

TEST_F(ConstraintMonitorTest, AllowsReflectsCurrentState) {
    monitor = std::make_unique<ConstraintMonitor>(*manager, on_mobile_data());

    EXPECT_FALSE(monitor->allows(wifi));
    EXPECT_TRUE(monitor->allows(UploadConstraints()));
    EXPECT_TRUE(monitor->current().metered);
}

TEST_F(ConstraintMonitorTest, SessionBornPausedUntilStateAllows) {
    monitor = std::make_unique<ConstraintMonitor>(*manager, on_mobile_data());

    auto id = start("a.bin", wifi);
    EXPECT_EQ(status_of(id), SessionStatus::PAUSED);
    EXPECT_EQ(client->initiate_calls(), 0);

    ASSERT_TRUE(monitor->update(EnvironmentState()));
    ASSERT_TRUE(wait_until([&] { return status_of(id) == SessionStatus::COMPLETED; }));
}

TEST_F(ConstraintMonitorTest, ViolationPausesOnlyAffectedSessions) {
    monitor = std::make_unique<ConstraintMonitor>(*manager);
    client->close_gate();

    auto strict = start("a.bin", wifi);
    auto relaxed = start("b.bin", UploadConstraints());
    ASSERT_TRUE(wait_until([&] { return client->in_flight() > 0; }));

    ASSERT_TRUE(monitor->update(on_mobile_data()));
    EXPECT_EQ(status_of(strict), SessionStatus::PAUSED);
    EXPECT_EQ(status_of(relaxed), SessionStatus::IN_PROGRESS);

    auto paused = callbacks->paused();
    ASSERT_EQ(paused.size(), 1);
    EXPECT_EQ(paused[0].session_id, strict);
    EXPECT_TRUE(paused[0].constraint_violation);

    client->open_gate();
    ASSERT_TRUE(manager->wait_for(relaxed, std::chrono::seconds(10)));
    EXPECT_EQ(status_of(relaxed), SessionStatus::COMPLETED);

    ASSERT_TRUE(manager->wait_for(strict, std::chrono::seconds(10)));
    ASSERT_TRUE(monitor->update(EnvironmentState()));
    ASSERT_TRUE(wait_until([&] { return status_of(strict) == SessionStatus::COMPLETED; }));
    EXPECT_EQ(callbacks->resumed().size(), 1);
}

TEST_F(ConstraintMonitorTest, UserPausedSessionsStayPaused) {
    monitor = std::make_unique<ConstraintMonitor>(*manager);
    client->close_gate();

    auto id = start("a.bin", wifi);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() > 0; }));
    ASSERT_TRUE(manager->pause(id));
    client->open_gate();
    ASSERT_TRUE(manager->wait_for(id, std::chrono::seconds(10)));

    ASSERT_TRUE(monitor->update(on_mobile_data()));
    ASSERT_TRUE(monitor->update(EnvironmentState()));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    storage::UploadSession session;
    ASSERT_TRUE(store->get_session(id, session));
    EXPECT_EQ(session.status, SessionStatus::PAUSED);
    EXPECT_FALSE(session.auto_paused);
}

TEST_F(ConstraintMonitorTest, EvaluateSingleSession) {
    monitor = std::make_unique<ConstraintMonitor>(*manager);
    EXPECT_EQ(monitor->evaluate("unknown").error, core::UploadError::NOT_FOUND);

    client->close_gate();
    auto id = start("a.bin", wifi);
    ASSERT_TRUE(wait_until([&] { return client->in_flight() > 0; }));
    ASSERT_TRUE(monitor->evaluate(id));
    EXPECT_EQ(status_of(id), SessionStatus::IN_PROGRESS);
}

TEST_F(ConstraintMonitorTest, DetachesProbeOnDestruction) {
    monitor = std::make_unique<ConstraintMonitor>(*manager, on_mobile_data());
    monitor.reset();

    auto id = start("a.bin", wifi);
    EXPECT_NE(status_of(id), SessionStatus::PAUSED);
}

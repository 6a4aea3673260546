#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cstdio>
#include <filesystem>

#include "core/batch_processor.hpp"
#include "core/notification_router.hpp"
#include "core/trigger_detectors.hpp"
#include "core/weekly_digest_processor.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_channel_adapter.hpp"

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using attn::testing::utc_time;

namespace attn {
namespace integration {

// One "process": everything wired to the same database file
struct RouterProcess {
    RouterProcess(const std::string& db_path, std::shared_ptr<testing::ManualClock> clock,
                  std::shared_ptr<notification::ChannelRegistry> channels)
        : db(db_path),
          store(&db),
          ledger(&db, config.cooldowns) {
        opened = db.open();
        router = std::make_unique<NotificationRouter>(&db, &store, &ledger, channels, nullptr, config, clock);
        batch = std::make_unique<BatchProcessor>(&store, channels, nullptr, config);
        weekly = std::make_unique<WeeklyDigestProcessor>(&store, channels, nullptr, config);
    }

    RouterConfig config;
    DatabaseManager db;
    NotificationStore store;
    DedupLedger ledger;
    bool opened = false;
    std::unique_ptr<NotificationRouter> router;
    std::unique_ptr<BatchProcessor> batch;
    std::unique_ptr<WeeklyDigestProcessor> weekly;
};

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = ::testing::TempDir() + "attn_e2e/router.db";
        std::filesystem::remove_all(::testing::TempDir() + "attn_e2e");

        primary = std::make_shared<NiceMock<testing::MockChannelAdapter>>(Channel::PRIMARY_CHAT);
        sms = std::make_shared<NiceMock<testing::MockChannelAdapter>>(Channel::SHORT_MESSAGE);
        channels = std::make_shared<notification::ChannelRegistry>();
        channels->register_adapter(primary);
        channels->register_adapter(sms);

        clock = std::make_shared<testing::ManualClock>(utc_time(2026, 10, 19, 10, 3));
    }

    void TearDown() override {
        std::filesystem::remove_all(::testing::TempDir() + "attn_e2e");
    }

    std::string db_path;
    std::shared_ptr<NiceMock<testing::MockChannelAdapter>> primary;
    std::shared_ptr<NiceMock<testing::MockChannelAdapter>> sms;
    std::shared_ptr<notification::ChannelRegistry> channels;
    std::shared_ptr<testing::ManualClock> clock;
};

TEST_F(EndToEndTest, PendingItemsSurviveRestart) {
    {
        RouterProcess process(db_path, clock, channels);
        ASSERT_TRUE(process.opened);
        triggers::notify_wip_warning(*process.router, 4, 5);
        triggers::notify_task_status_change(*process.router, "t1", "Deck", "todo", "doing");
    }

    RouterProcess restarted(db_path, clock, channels);
    ASSERT_TRUE(restarted.opened);
    EXPECT_EQ(restarted.store.count_pending(Priority::BATCHED), 2u);

    EXPECT_CALL(*primary, send(_)).WillOnce(Return(true));
    EXPECT_EQ(restarted.batch->run_batch(utc_time(2026, 10, 19, 13, 0)), 2u);
    EXPECT_EQ(restarted.batch->run_batch(utc_time(2026, 10, 19, 13, 1)), 0u);
}

TEST_F(EndToEndTest, DedupSurvivesRestart) {
    {
        RouterProcess process(db_path, clock, channels);
        ASSERT_TRUE(process.opened);
        EXPECT_TRUE(process.router->queue_immediate("X", "blocker_resolved", std::string("b1")).is_created());
    }

    clock->advance(std::chrono::hours(2));
    RouterProcess restarted(db_path, clock, channels);
    ASSERT_TRUE(restarted.opened);
    EXPECT_TRUE(restarted.router->queue_immediate("X", "blocker_resolved", std::string("b1")).is_suppressed());
}

TEST_F(EndToEndTest, FullDay) {
    RouterProcess process(db_path, clock, channels);
    ASSERT_TRUE(process.opened);

    // Morning: an urgent deadline and some batched chatter
    EXPECT_CALL(*primary, send(::testing::StartsWith("[URGENT] 'Deck' due in 5h"))).WillOnce(Return(true));
    triggers::TaskSnapshot deck{"t1", "Deck", clock->now() + std::chrono::hours(5), false, {{"Numbers", false}}};
    EXPECT_EQ(triggers::check_urgent_deadlines(*process.router, {deck}, clock->now()).size(), 1u);

    triggers::notify_new_blocker(*process.router, "b1", "Legal review", std::string("Dana"));
    triggers::notify_wip_warning(*process.router, 5, 5);
    process.router->log_silent("Inbox scanned", "email_activity");
    process.router->queue_weekly("Week in review");

    // 13:00 digest
    std::string digest;
    EXPECT_CALL(*primary, send(::testing::StartsWith("=== Daily Update ===")))
        .WillOnce(::testing::DoAll(::testing::SaveArg<0>(&digest), Return(true)));
    EXPECT_EQ(process.batch->run_batch(utc_time(2026, 10, 19, 13, 0)), 2u);
    EXPECT_NE(digest.find("[New Blocker]"), std::string::npos);
    EXPECT_NE(digest.find("[Wip Warning]"), std::string::npos);

    // Sunday evening report
    EXPECT_CALL(*primary, send("Week in review")).WillOnce(Return(true));
    EXPECT_TRUE(process.weekly->run_weekly(utc_time(2026, 10, 25, 20, 0)));

    for (const auto& n : process.store.recent(10)) {
        EXPECT_TRUE(n.sent_at.has_value()) << n.message;
    }
}

} // namespace integration
} // namespace attn

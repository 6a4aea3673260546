#include "gtest/gtest.h"
#include "core/digest_formatter.hpp"

namespace {

attn::Notification item(const std::string& kind, const std::string& message) {
    attn::Notification n;
    n.priority = attn::Priority::BATCHED;
    n.context.event_kind = kind;
    n.message = message;
    return n;
}

} // namespace

TEST(DigestFormatterTest, HumanizeEventKind) {
    EXPECT_EQ(attn::digest::humanize_event_kind("wip_warning"), "Wip Warning");
    EXPECT_EQ(attn::digest::humanize_event_kind("task_status"), "Task Status");
    EXPECT_EQ(attn::digest::humanize_event_kind("DEADLINE_week"), "Deadline Week");
    EXPECT_EQ(attn::digest::humanize_event_kind("other"), "Other");
    EXPECT_EQ(attn::digest::humanize_event_kind("q3report"), "Q3Report");
}

TEST(DigestFormatterTest, GroupsInFirstSeenOrder) {
    std::vector<attn::Notification> items{
        item("email_activity", "1"),
        item("wip_warning", "2"),
        item("email_activity", "3"),
        item("", "4"),
    };

    auto groups = attn::digest::group_by_event_kind(items);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].event_kind, "email_activity");
    ASSERT_EQ(groups[0].items.size(), 2u);
    EXPECT_EQ(groups[0].items[0]->message, "1");
    EXPECT_EQ(groups[0].items[1]->message, "3");
    EXPECT_EQ(groups[1].event_kind, "wip_warning");
    EXPECT_EQ(groups[2].event_kind, "other");
}

TEST(DigestFormatterTest, FormatsDigestTemplate) {
    std::vector<attn::Notification> items{
        item("wip_warning", "WIP at 4/5 - one slot remaining"),
        item("email_activity", "Reply from vendor"),
    };

    EXPECT_EQ(attn::digest::format_digest(items),
              "=== Daily Update ===\n"
              "\n"
              "[Wip Warning]\n"
              "  - WIP at 4/5 - one slot remaining\n"
              "\n"
              "[Email Activity]\n"
              "  - Reply from vendor\n");
}

TEST(DigestFormatterTest, EmptyInputIsJustTheHeader) {
    EXPECT_EQ(attn::digest::format_digest({}), "=== Daily Update ===\n");
}

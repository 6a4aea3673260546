#pragma once

#include "notification_router.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace attn {
namespace triggers {

// Event kinds used by the bundled detectors. The router accepts any other
// non-empty kind as well.
namespace event_kind {
constexpr const char* BLOCKER_RESOLVED = "blocker_resolved";
constexpr const char* BLOCKER_ESCALATION = "blocker_escalation";
constexpr const char* DEADLINE_URGENT = "deadline_urgent";
constexpr const char* PACKAGE_ARRIVAL = "package_arrival";
constexpr const char* MEETING_REMINDER = "meeting_reminder";
constexpr const char* CRITICAL_PATH_CHANGE = "critical_path_change";
constexpr const char* TASK_STATUS = "task_status";
constexpr const char* WIP_WARNING = "wip_warning";
constexpr const char* EMAIL_ACTIVITY = "email_activity";
constexpr const char* NEW_BLOCKER = "new_blocker";
constexpr const char* DEADLINE_WEEK = "deadline_week";
constexpr const char* WEEKLY_REPORT = "weekly_report";
} // namespace event_kind

const std::vector<std::string>& resolution_keywords();
const std::vector<std::string>& escalation_keywords();

struct FullKitItem {
    std::string description;
    bool satisfied = false;
};

struct TaskSnapshot {
    std::string id;
    std::string title;
    std::optional<TimePoint> due_date;
    bool completed = false;
    std::vector<FullKitItem> full_kit;
};

struct BlockerSnapshot {
    std::string id;
    std::string description;
    std::string waiting_on;
    std::string watch_pattern;
};

struct InboundMessage {
    std::string from;
    std::string subject;
    std::string body;
};

struct BlockerUpdate {
    std::string blocker_id;
    bool resolved = false;
    IntakeResult intake;
};

// Whole hours from now until due, never negative
int64_t hours_until(TimePoint due, TimePoint now);

// Sender contains waiting_on, or watch_pattern appears in subject or body.
// Case-insensitive; a blocker with neither field never matches.
bool matches_blocker(const BlockerSnapshot& blocker, const InboundMessage& message);

// More resolution keywords than escalation keywords in subject and body
bool is_resolution(const std::string& subject, const std::string& body);

// Immediate deadline_urgent for every open task due within 24 hours (overdue
// included) that still has unsatisfied full-kit items. Returns the
// notifications actually created.
std::vector<Notification> check_urgent_deadlines(NotificationRouter& router,
                                                 const std::vector<TaskSnapshot>& tasks,
                                                 TimePoint now);

// Immediate blocker_resolved / blocker_escalation for every blocker the
// message matches. Callers resolve the blockers reported with resolved set.
std::vector<BlockerUpdate> check_blocker_updates(NotificationRouter& router,
                                                 const std::vector<BlockerSnapshot>& blockers,
                                                 const InboundMessage& message);

IntakeResult notify_task_status_change(NotificationRouter& router,
                                       const std::string& task_id,
                                       const std::string& title,
                                       const std::string& old_status,
                                       const std::string& new_status);

IntakeResult notify_new_blocker(NotificationRouter& router,
                                const std::string& blocker_id,
                                const std::string& description,
                                const std::optional<std::string>& waiting_on = std::nullopt);

// Type-wide batched warning once WIP is within one slot of its limit;
// nullopt below that
std::optional<IntakeResult> notify_wip_warning(NotificationRouter& router, int current_wip, int wip_limit);

} // namespace triggers
} // namespace attn

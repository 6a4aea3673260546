#include "trigger_detectors.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>

namespace attn {
namespace triggers {

namespace {

constexpr size_t kMaxListedKitItems = 3;

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t count_keywords(const std::string& text, const std::vector<std::string>& keywords) {
    return static_cast<size_t>(std::count_if(keywords.begin(), keywords.end(),
        [&text](const std::string& keyword) { return contains(text, keyword); }));
}

} // namespace

const std::vector<std::string>& resolution_keywords() {
    static const std::vector<std::string> keywords{
        "attached", "here is", "completed", "finished",
        "done", "ready", "sent", "enclosed"};
    return keywords;
}

const std::vector<std::string>& escalation_keywords() {
    static const std::vector<std::string> keywords{
        "need more", "additional", "question", "clarify",
        "missing", "waiting"};
    return keywords;
}

int64_t hours_until(TimePoint due, TimePoint now) {
    if (due <= now) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::hours>(due - now).count();
}

bool matches_blocker(const BlockerSnapshot& blocker, const InboundMessage& message) {
    if (blocker.waiting_on.empty() && blocker.watch_pattern.empty()) {
        return false;
    }

    if (!blocker.waiting_on.empty() && contains(to_lower(message.from), to_lower(blocker.waiting_on))) {
        return true;
    }

    if (!blocker.watch_pattern.empty()) {
        std::string pattern = to_lower(blocker.watch_pattern);
        return contains(to_lower(message.subject), pattern) || contains(to_lower(message.body), pattern);
    }
    return false;
}

bool is_resolution(const std::string& subject, const std::string& body) {
    std::string text = to_lower(subject + " " + body);
    return count_keywords(text, resolution_keywords()) > count_keywords(text, escalation_keywords());
}

std::vector<Notification> check_urgent_deadlines(NotificationRouter& router,
                                                 const std::vector<TaskSnapshot>& tasks,
                                                 TimePoint now) {
    std::vector<Notification> created;

    for (const auto& task : tasks) {
        if (task.completed || !task.due_date || *task.due_date > now + std::chrono::hours(24)) {
            continue;
        }

        std::vector<const FullKitItem*> incomplete;
        for (const auto& item : task.full_kit) {
            if (!item.satisfied) {
                incomplete.push_back(&item);
            }
        }
        if (incomplete.empty()) {
            continue;
        }

        std::string items_list;
        for (size_t i = 0; i < incomplete.size() && i < kMaxListedKitItems; ++i) {
            if (i > 0) {
                items_list += ", ";
            }
            items_list += incomplete[i]->description;
        }

        int64_t hours_left = hours_until(*task.due_date, now);
        std::string message = "'" + task.title + "' due in " + std::to_string(hours_left) +
                              "h, waiting on: " + items_list;

        auto result = router.queue_immediate(message, event_kind::DEADLINE_URGENT, task.id,
            {{"hours_left", std::to_string(hours_left)},
             {"incomplete_items", std::to_string(incomplete.size())}});
        if (result.is_created()) {
            created.push_back(*result.notification);
        }
    }

    ATTN_LOG_DEBUG("Deadline check over {} tasks created {} notifications", tasks.size(), created.size());
    return created;
}

std::vector<BlockerUpdate> check_blocker_updates(NotificationRouter& router,
                                                 const std::vector<BlockerSnapshot>& blockers,
                                                 const InboundMessage& message) {
    std::vector<BlockerUpdate> updates;

    for (const auto& blocker : blockers) {
        if (!matches_blocker(blocker, message)) {
            continue;
        }

        BlockerUpdate update;
        update.blocker_id = blocker.id;
        update.resolved = is_resolution(message.subject, message.body);

        std::string text;
        const char* kind;
        if (update.resolved) {
            text = "UNBLOCKED: " + blocker.description + " - Email from " + message.from;
            kind = event_kind::BLOCKER_RESOLVED;
        } else {
            text = "BLOCKER UPDATE: " + blocker.description + " - " + message.from + " sent update";
            kind = event_kind::BLOCKER_ESCALATION;
        }

        update.intake = router.queue_immediate(text, kind, blocker.id,
            {{"email_from", message.from}, {"email_subject", message.subject}});
        updates.push_back(std::move(update));
    }

    return updates;
}

IntakeResult notify_task_status_change(NotificationRouter& router,
                                       const std::string& task_id,
                                       const std::string& title,
                                       const std::string& old_status,
                                       const std::string& new_status) {
    std::string message = "Task '" + title + "': " + old_status + " -> " + new_status;
    return router.queue_batched(message, event_kind::TASK_STATUS, task_id,
                                {{"old_status", old_status}, {"new_status", new_status}});
}

IntakeResult notify_new_blocker(NotificationRouter& router,
                                const std::string& blocker_id,
                                const std::string& description,
                                const std::optional<std::string>& waiting_on) {
    std::string message = "New blocker: " + description;
    Metadata metadata{{"description", description}};
    if (waiting_on && !waiting_on->empty()) {
        message += " (waiting on " + *waiting_on + ")";
        metadata["waiting_on"] = *waiting_on;
    }
    return router.queue_batched(message, event_kind::NEW_BLOCKER, blocker_id, metadata);
}

std::optional<IntakeResult> notify_wip_warning(NotificationRouter& router, int current_wip, int wip_limit) {
    if (current_wip < wip_limit - 1) {
        return std::nullopt;
    }

    std::string message = "WIP at " + std::to_string(current_wip) + "/" + std::to_string(wip_limit);
    message += current_wip >= wip_limit ? " - AT LIMIT" : " - one slot remaining";

    return router.queue_batched(message, event_kind::WIP_WARNING, std::nullopt,
                                {{"current", std::to_string(current_wip)},
                                 {"limit", std::to_string(wip_limit)}});
}

} // namespace triggers
} // namespace attn

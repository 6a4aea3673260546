#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace attn {

std::string DedupKey::to_string() const {
    return event_kind + ":" + source_entity_id.value_or("*");
}

std::string NotificationContext::to_json() const {
    nlohmann::json j;
    j["event_kind"] = event_kind;
    if (source_entity_id) {
        j["source_entity_id"] = *source_entity_id;
    } else {
        j["source_entity_id"] = nullptr;
    }
    j["metadata"] = metadata;
    return j.dump();
}

NotificationContext NotificationContext::from_json(const std::string& json_str) {
    NotificationContext context;
    auto j = nlohmann::json::parse(json_str);

    context.event_kind = j.value("event_kind", std::string());
    if (j.contains("source_entity_id") && j["source_entity_id"].is_string()) {
        context.source_entity_id = j["source_entity_id"].get<std::string>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        for (auto& [key, value] : j["metadata"].items()) {
            context.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return context;
}

std::string priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::IMMEDIATE: return "immediate";
        case Priority::BATCHED: return "batched";
        case Priority::WEEKLY: return "weekly";
        case Priority::SILENT: return "silent";
        default: return "unknown";
    }
}

Result<Priority> parse_priority(const std::string& priority_str) {
    std::string lower = priority_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // P0..P3 are accepted as aliases
    if (lower == "immediate" || lower == "p0") return Result<Priority>::success(Priority::IMMEDIATE);
    if (lower == "batched" || lower == "p1") return Result<Priority>::success(Priority::BATCHED);
    if (lower == "weekly" || lower == "p2") return Result<Priority>::success(Priority::WEEKLY);
    if (lower == "silent" || lower == "p3") return Result<Priority>::success(Priority::SILENT);
    return Result<Priority>::error("unknown priority '" + priority_str + "'");
}

std::string channel_to_string(Channel channel) {
    switch (channel) {
        case Channel::PRIMARY_CHAT: return "primary_chat";
        case Channel::SHORT_MESSAGE: return "short_message";
        case Channel::LOG_ONLY: return "log_only";
        default: return "unknown";
    }
}

Result<Channel> parse_channel(const std::string& channel_str) {
    if (channel_str == "primary_chat") return Result<Channel>::success(Channel::PRIMARY_CHAT);
    if (channel_str == "short_message") return Result<Channel>::success(Channel::SHORT_MESSAGE);
    if (channel_str == "log_only") return Result<Channel>::success(Channel::LOG_ONLY);
    return Result<Channel>::error("unknown channel '" + channel_str + "'");
}

std::string outcome_to_string(IntakeOutcome outcome) {
    switch (outcome) {
        case IntakeOutcome::CREATED: return "created";
        case IntakeOutcome::SUPPRESSED: return "suppressed";
        case IntakeOutcome::LOGGED: return "logged";
        default: return "unknown";
    }
}

int64_t to_epoch_millis(TimePoint time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count();
}

TimePoint from_epoch_millis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

std::string format_iso8601(TimePoint time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
    }

    std::tm tm_struct{};
    gmtime_r(&time_t, &tm_struct);

    std::stringstream ss;
    ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

} // namespace attn

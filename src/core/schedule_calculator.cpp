#include "schedule_calculator.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace attn {

namespace schedule_utils {

Result<std::chrono::minutes> parse_time_of_day(const std::string& time_str) {
    // Parse time in HH:MM format
    std::istringstream iss(time_str);
    std::string hour_str, minute_str;

    if (!std::getline(iss, hour_str, ':') || !std::getline(iss, minute_str)) {
        return Result<std::chrono::minutes>::error("expected HH:MM, got '" + time_str + "'");
    }

    auto all_digits = [](const std::string& s) {
        return !s.empty() && s.size() <= 2 &&
               std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    };
    if (!all_digits(hour_str) || minute_str.size() != 2 || !all_digits(minute_str)) {
        return Result<std::chrono::minutes>::error("expected HH:MM, got '" + time_str + "'");
    }

    int hours = std::stoi(hour_str);
    int minutes = std::stoi(minute_str);
    if (hours > 23 || minutes > 59) {
        return Result<std::chrono::minutes>::error("time of day out of range: '" + time_str + "'");
    }
    return Result<std::chrono::minutes>::success(std::chrono::minutes(hours * 60 + minutes));
}

TimePoint local_day_start(TimePoint local_time) {
    return TimePoint(std::chrono::floor<Days>(local_time));
}

int weekday(TimePoint local_time) {
    auto days = std::chrono::floor<Days>(local_time).time_since_epoch().count();
    // 1970-01-01 was a Thursday
    auto since_thursday = ((days % 7) + 7) % 7;
    return static_cast<int>((since_thursday + 4) % 7);
}

} // namespace schedule_utils

using schedule_utils::Days;

ScheduleCalculator::ScheduleCalculator(const RouterConfig& config)
    : weekly_day_(config.weekly_day),
      weekly_time_(std::chrono::hours(kFallbackWeeklyHour)),
      utc_offset_(config.utc_offset) {

    for (const auto& time_str : config.batch_times) {
        auto parsed = schedule_utils::parse_time_of_day(time_str);
        if (parsed.is_error()) {
            ATTN_LOG_WARN("Ignoring batch time: {}", parsed.error());
            continue;
        }
        batch_slots_.push_back(parsed.value());
    }
    std::sort(batch_slots_.begin(), batch_slots_.end());
    batch_slots_.erase(std::unique(batch_slots_.begin(), batch_slots_.end()), batch_slots_.end());

    if (batch_slots_.empty()) {
        ATTN_LOG_WARN("No usable batch times configured; batched items go out at {:02}:00 the next day",
                      kFallbackBatchHour);
    }

    if (weekly_day_ < 0 || weekly_day_ > 6) {
        ATTN_LOG_WARN("Invalid weekly day {}; using Sunday", weekly_day_);
        weekly_day_ = kFallbackWeeklyDay;
    }

    auto weekly = schedule_utils::parse_time_of_day(config.weekly_time);
    if (weekly.is_success()) {
        weekly_time_ = weekly.value();
    } else {
        ATTN_LOG_WARN("Invalid weekly time: {}; using {:02}:00", weekly.error(), kFallbackWeeklyHour);
    }
}

TimePoint ScheduleCalculator::next_batch_time(TimePoint now) const {
    auto local_now = now + utc_offset_;
    auto day_start = schedule_utils::local_day_start(local_now);

    if (batch_slots_.empty()) {
        return day_start + Days(1) + std::chrono::hours(kFallbackBatchHour) - utc_offset_;
    }

    for (const auto& slot : batch_slots_) {
        auto candidate = day_start + slot;
        if (candidate > local_now) {
            return candidate - utc_offset_;
        }
    }

    // Past the last slot: first slot tomorrow
    return day_start + Days(1) + batch_slots_.front() - utc_offset_;
}

TimePoint ScheduleCalculator::next_weekly_time(TimePoint now) const {
    auto local_now = now + utc_offset_;
    auto day_start = schedule_utils::local_day_start(local_now);

    for (int offset = 0; offset <= 7; ++offset) {
        auto day = day_start + Days(offset);
        if (schedule_utils::weekday(day) != weekly_day_) {
            continue;
        }
        auto candidate = day + weekly_time_;
        if (candidate > local_now) {
            return candidate - utc_offset_;
        }
    }

    // Unreachable: some day within the next eight matches and lies ahead
    return day_start + Days(7) + weekly_time_ - utc_offset_;
}

std::string ScheduleCalculator::format_local(TimePoint time_point, bool with_date) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point + utc_offset_);
    std::tm tm_struct{};
    gmtime_r(&time_t, &tm_struct);

    std::stringstream ss;
    ss << std::put_time(&tm_struct, with_date ? "%Y-%m-%d %H:%M" : "%H:%M");
    return ss.str();
}

} // namespace attn

#pragma once

#include "result.hpp"
#include "router_config.hpp"
#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace attn {

// Delivery boundaries for the batched and weekly tiers. Wall-clock math uses
// the configured UTC offset, never the process time zone.
class ScheduleCalculator {
public:
    static constexpr int kFallbackBatchHour = 9;
    static constexpr int kFallbackWeeklyDay = 0;
    static constexpr int kFallbackWeeklyHour = 20;

    explicit ScheduleCalculator(const RouterConfig& config);

    // Smallest batch slot strictly after now, wrapping to the next day
    TimePoint next_batch_time(TimePoint now) const;

    // Next weekly day/time strictly after now
    TimePoint next_weekly_time(TimePoint now) const;

    // Valid slots as minutes after local midnight, sorted
    const std::vector<std::chrono::minutes>& batch_slots() const { return batch_slots_; }
    int weekly_day() const { return weekly_day_; }
    std::chrono::minutes weekly_time() const { return weekly_time_; }

    // "HH:MM" in the recipient's wall clock
    std::string format_local(TimePoint time_point, bool with_date = false) const;

private:
    std::vector<std::chrono::minutes> batch_slots_;
    int weekly_day_;
    std::chrono::minutes weekly_time_;
    std::chrono::minutes utc_offset_;
};

namespace schedule_utils {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

// "HH:MM", 00:00 .. 23:59
Result<std::chrono::minutes> parse_time_of_day(const std::string& time_str);

// Start of the local day containing time_point, expressed as a local time_point
TimePoint local_day_start(TimePoint local_time);

// 0 = Sunday .. 6 = Saturday
int weekday(TimePoint local_time);

} // namespace schedule_utils

} // namespace attn

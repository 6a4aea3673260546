#pragma once

#include "core/clock.hpp"
#include <ctime>
#include <mutex>

namespace attn {
namespace testing {

// Clock whose time only moves when a test moves it
class ManualClock : public attn::Clock {
public:
    explicit ManualClock(attn::TimePoint start = attn::TimePoint()) : now_(start) {}

    attn::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(attn::TimePoint time_point) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = time_point;
    }

    template<typename Duration>
    void advance(Duration duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<attn::TimePoint::duration>(duration);
    }

private:
    mutable std::mutex mutex_;
    attn::TimePoint now_;
};

// UTC wall-clock time
inline attn::TimePoint utc_time(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    std::tm tm_struct{};
    tm_struct.tm_year = year - 1900;
    tm_struct.tm_mon = month - 1;
    tm_struct.tm_mday = day;
    tm_struct.tm_hour = hour;
    tm_struct.tm_min = minute;
    tm_struct.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

} // namespace testing
} // namespace attn

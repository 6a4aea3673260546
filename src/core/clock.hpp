#pragma once

#include "types.hpp"

namespace attn {

// Source of "now" for intake. Processors take their invocation time explicitly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace attn

#pragma once

#include "database_manager.hpp"
#include "../core/types.hpp"
#include <chrono>
#include <string>

namespace attn {

// Durable run lock for one processor tier, stored in the processor_runs
// table. It excludes overlapping runs across processes sharing the database
// file. A holder that dies without releasing blocks the tier only until its
// lease expires.
class ProcessorLease {
public:
    ProcessorLease(DatabaseManager* db, Priority tier, std::chrono::minutes duration);
    ~ProcessorLease();

    ProcessorLease(const ProcessorLease&) = delete;
    ProcessorLease& operator=(const ProcessorLease&) = delete;

    // Takes the lease when no live lease exists for the tier. Throws
    // DatabaseError when the claim cannot be written.
    bool acquire(TimePoint now);

    // No-op unless held
    void release();

    bool held() const { return held_; }
    const std::string& owner() const { return owner_; }

private:
    DatabaseManager* db_;
    std::string tier_;
    std::chrono::minutes duration_;
    std::string owner_;
    bool held_ = false;
};

} // namespace attn

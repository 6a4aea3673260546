#pragma once

#include "types.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace attn {

// Write-only audit trail: one JSON object per line for every intake call and
// every digest delivery. Never read back by the router.
class AuditLog {
public:
    explicit AuditLog(const std::string& file_path, size_t message_max_length = 200);
    ~AuditLog();

    void record(TimePoint at,
                const std::string& priority,
                const std::string& event_kind,
                const std::string& message,
                const std::string& status);

    const std::string& file_path() const { return file_path_; }
    bool is_open() const { return file_.is_open(); }

private:
    std::string file_path_;
    size_t message_max_length_;
    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace attn

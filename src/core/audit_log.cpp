#include "audit_log.hpp"
#include "../utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

namespace attn {

AuditLog::AuditLog(const std::string& file_path, size_t message_max_length)
    : file_path_(file_path), message_max_length_(message_max_length) {
    std::error_code ec;
    std::filesystem::path path(file_path_);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    file_.open(file_path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        ATTN_LOG_ERROR("Failed to open audit log {}", file_path_);
    }
}

AuditLog::~AuditLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void AuditLog::record(TimePoint at,
                      const std::string& priority,
                      const std::string& event_kind,
                      const std::string& message,
                      const std::string& status) {
    nlohmann::json entry;
    entry["timestamp"] = format_iso8601(at);
    entry["priority"] = priority;
    entry["event_kind"] = event_kind;
    entry["message"] = message.substr(0, message_max_length_);
    entry["status"] = status;

    // Truncation may split a multi-byte character
    std::string line = entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        ATTN_LOG_WARN("Audit log unavailable, dropping entry: {}", line);
        return;
    }

    file_ << line << '\n';
    file_.flush();
    if (!file_) {
        ATTN_LOG_ERROR("Failed to write notification audit entry to {}", file_path_);
        file_.clear();
    }
}

} // namespace attn

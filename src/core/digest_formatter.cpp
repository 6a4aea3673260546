#include "digest_formatter.hpp"
#include <cctype>
#include <sstream>

namespace attn {
namespace digest {

namespace {

const char* kDigestHeader = "=== Daily Update ===";
const char* kUnknownEventKind = "other";

} // namespace

std::vector<DigestGroup> group_by_event_kind(const std::vector<Notification>& notifications) {
    std::vector<DigestGroup> groups;

    for (const auto& notification : notifications) {
        std::string kind = notification.context.event_kind.empty()
            ? std::string(kUnknownEventKind) : notification.context.event_kind;

        auto it = groups.begin();
        for (; it != groups.end(); ++it) {
            if (it->event_kind == kind) {
                break;
            }
        }

        if (it == groups.end()) {
            groups.push_back(DigestGroup{kind, {&notification}});
        } else {
            it->items.push_back(&notification);
        }
    }

    return groups;
}

std::string humanize_event_kind(const std::string& event_kind) {
    std::string result;
    result.reserve(event_kind.size());

    bool word_start = true;
    for (char c : event_kind) {
        if (c == '_') {
            result += ' ';
            word_start = true;
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            result += static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
            word_start = false;
        } else {
            result += c;
            word_start = true;
        }
    }
    return result;
}

std::string format_digest(const std::vector<Notification>& notifications) {
    std::vector<std::string> lines{kDigestHeader, ""};

    for (const auto& group : group_by_event_kind(notifications)) {
        lines.push_back("[" + humanize_event_kind(group.event_kind) + "]");
        for (const auto* item : group.items) {
            lines.push_back("  - " + item->message);
        }
        lines.push_back("");
    }

    std::stringstream ss;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            ss << "\n";
        }
        ss << lines[i];
    }
    return ss.str();
}

} // namespace digest
} // namespace attn

#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace attn {
namespace digest {

struct DigestGroup {
    std::string event_kind;
    std::vector<const Notification*> items;
};

// Groups in first-seen order; items keep their input order
std::vector<DigestGroup> group_by_event_kind(const std::vector<Notification>& notifications);

// "wip_warning" -> "Wip Warning"
std::string humanize_event_kind(const std::string& event_kind);

// One message for a whole batch:
//   === Daily Update ===
//
//   [Wip Warning]
//     - WIP at 4/5 - one slot remaining
//
std::string format_digest(const std::vector<Notification>& notifications);

} // namespace digest
} // namespace attn

#include "log_channel.hpp"
#include "utils/logger.hpp"

namespace attn {
namespace notification {

bool LogChannel::send(const std::string& text) {
    ATTN_LOG_INFO("[notification] {}", text);
    return true;
}

} // namespace notification
} // namespace attn

#pragma once

#include <string>
#include <vector>

namespace attn {
namespace notification {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error_message;

    bool ok() const { return error_message.empty() && status_code >= 200 && status_code < 300; }
};

// Blocking JSON POST through libcurl
HttpResponse post_json(const std::string& url,
                       const std::string& json_body,
                       const std::vector<std::string>& extra_headers,
                       long timeout_seconds);

// Keeps libcurl's global state alive for the lifetime of the holder
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace notification
} // namespace attn

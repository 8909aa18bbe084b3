#pragma once
#include <map>
#include <stdexcept>
#include <string>

namespace bags::http {

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message) : std::runtime_error(message) {}
};

struct Response {
    unsigned status = 0;
    std::string body;
    std::string final_host;
    std::string final_target;

    bool ok() const noexcept { return status >= 200U && status < 300U; }
};

using Headers = std::map<std::string, std::string>;

constexpr int kDefaultTimeoutSecs = 15;

// Blocking HTTPS GET on port 443. Follows up to five same-scheme redirects.
// Throws HttpError on transport failures; any HTTP status is returned.
Response get(const std::string& host, const std::string& target,
             const Headers& headers = {}, int timeout_sec = kDefaultTimeoutSecs);

// Blocking HTTPS POST with a text body
Response post(const std::string& host, const std::string& target, const std::string& body,
              const Headers& headers = {}, int timeout_sec = kDefaultTimeoutSecs);

// Percent-encodes everything except RFC 3986 unreserved characters
std::string urlEncode(const std::string& value);

} // namespace bags::http

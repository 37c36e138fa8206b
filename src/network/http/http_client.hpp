#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace SeoAudit {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Status, Other };

}  // namespace Http
}  // namespace Network
}  // namespace SeoAudit

namespace SeoAudit {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;

    bool is_html() const;
};

namespace Network {
namespace Http {

// A failed request is reported through Response::success, never by throwing.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_timeout(std::chrono::seconds /*timeout*/) {}
    virtual void     set_user_agent(const std::string& /*user_agent*/) {}
    virtual Response get(const std::string& url) = 0;
};

const char* error_type_name(ErrorType type);

}  // namespace Http
}  // namespace Network
}  // namespace SeoAudit

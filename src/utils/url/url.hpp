#pragma once
#include <string>

namespace SeoAudit {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // Prepends http:// unless the target already names an http(s) scheme.
    static std::string normalize_target(const std::string& target);
    static std::string strip_fragment(const std::string& url);

    // Lower-cased host, trailing dot removed, with ":port" when one is given.
    static std::string authority(const std::string& url);
    static bool        is_http(const std::string& url);
    static bool        has_scheme(const std::string& url);
};

}  // namespace Utils
}  // namespace SeoAudit

#include "url.hpp"
#include <cctype>
#include <regex>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace SeoAudit {
namespace Utils {

namespace {

std::string clean_host(std::string h) {
    if (!h.empty() && h.back() == '.')
        h.pop_back();
    for (char& c : h) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c + ('a' - 'A'));
    }
    return h;
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }

    bool trailing_dir = path.length() > 1
                        && (path.back() == '/' || Text::ends_with(path, "/.")
                            || Text::ends_with(path, "/.."));
    if (trailing_dir && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

}  // namespace

bool Url::has_scheme(const std::string& url) {
    if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0])))
        return false;

    for (size_t i = 1; i < url.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (c == ':')
            return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return false;
}

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    if (has_scheme(url)) {
        size_t colon  = sv.find(':');
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& href) {
    std::string relative = Text::trim(href);
    if (relative.empty())
        return strip_fragment(base);

    if (relative[0] == '#')
        return strip_fragment(base) + relative;

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (has_scheme(relative))
        return relative;

    UrlParsed base_parsed = parse(base);
    if (base_parsed.scheme.empty() || base_parsed.host.empty())
        return "";

    if (relative.rfind("//", 0) == 0)
        return base_parsed.scheme + ":" + relative;

    std::string auth = base_parsed.host;
    if (!base_parsed.port.empty())
        auth += ":" + base_parsed.port;
    std::string origin = base_parsed.scheme + "://" + auth;

    std::string query_frag;
    size_t      qf = relative.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = relative.substr(qf);
        relative   = relative.substr(0, qf);
    }

    std::string path;
    if (relative.empty()) {
        path = base_parsed.path;
    }
    else if (relative[0] == '/') {
        path = relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir  = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        path = dir + relative;
    }

    return origin + remove_dot_segments(path) + query_frag;
}

std::string Url::normalize_target(const std::string& target) {
    static const std::regex http_prefix("^https?://", std::regex::icase);
    std::string             trimmed = Text::trim(target);
    if (std::regex_search(trimmed, http_prefix))
        return trimmed;
    return "http://" + trimmed;
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string Url::authority(const std::string& url) {
    UrlParsed   p    = parse(url);
    std::string auth = clean_host(p.host);
    if (!auth.empty() && !p.port.empty())
        auth += ":" + p.port;
    return auth;
}

bool Url::is_http(const std::string& url) {
    std::string scheme = parse(url).scheme;
    return scheme == "http" || scheme == "https";
}

}  // namespace Utils
}  // namespace SeoAudit

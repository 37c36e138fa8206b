#pragma once
#include <cctype>
#include <string>
#include <vector>

namespace SeoAudit {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_DEPTH     = 3;
    static constexpr int         MIN_DEPTH         = 1;
    static constexpr int         DEFAULT_MAX_PAGES = 50;
    static constexpr int         MIN_MAX_PAGES     = 10;
    static constexpr const char* VERSION           = "1.0.0";

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr const char* USER_AGENT              = "SEOAuditTool/1.0";
    static constexpr const char* ACCEPT_HEADER =
        "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    static constexpr const char* HTML_CONTENT_TYPE = "text/html";
    static constexpr long        HTTP_SUCCESS_MIN  = 200;
    static constexpr long        HTTP_ERROR_MIN    = 400;  // first status treated as a failed fetch

    static constexpr const char* DEFAULT_LOG_FILE    = "seo_audit.log";
    static constexpr const char* DEFAULT_FORMAT      = "txt";
    static constexpr const char* OUTPUT_FILE_STEM    = "audit-results";

    // On-page heuristics
    static constexpr size_t TITLE_MIN_LENGTH   = 10;
    static constexpr size_t TITLE_MAX_LENGTH   = 60;
    static constexpr size_t META_MIN_LENGTH    = 50;
    static constexpr size_t META_MAX_LENGTH    = 160;
    static constexpr size_t MAX_EXTERNAL_LINKS = 10;

    static constexpr int PROGRESS_BAR_WIDTH = 40;
};

// Paths ending in one of these are never queued for fetching.
inline const std::vector<std::string>& get_skipped_extensions() {
    static const std::vector<std::string> extensions = {
        ".pdf", ".jpg", ".png", ".gif", ".css", ".js"};
    return extensions;
}

inline std::string get_matching_extension(const std::string&              path,
                                          const std::vector<std::string>& extensions) {
    if (path.empty())
        return "";

    std::string path_lower = path;
    for (char& c : path_lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& ext : extensions) {
        if (path_lower.size() >= ext.size()
            && path_lower.compare(path_lower.size() - ext.size(), ext.size(), ext) == 0) {
            return ext;
        }
    }
    return "";
}

inline bool has_extension(const std::string& path, const std::vector<std::string>& extensions) {
    return !get_matching_extension(path, extensions).empty();
}

}  // namespace Core
}  // namespace SeoAudit

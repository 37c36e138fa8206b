#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace SeoAudit {
namespace Core {

struct Config {
    std::string domain;
    int         depth           = Constants::DEFAULT_DEPTH;
    int         max_pages       = Constants::DEFAULT_MAX_PAGES;
    int         timeout_seconds = Constants::REQUEST_TIMEOUT_SECONDS;
    bool        verbose         = false;
    bool        show_progress   = true;
    std::string output_dir;  // empty = no export
    std::string format     = Constants::DEFAULT_FORMAT;
    std::string log_file   = Constants::DEFAULT_LOG_FILE;
    std::string user_agent = Constants::USER_AGENT;
    std::string config_path;

    size_t title_min_length   = Constants::TITLE_MIN_LENGTH;
    size_t title_max_length   = Constants::TITLE_MAX_LENGTH;
    size_t meta_min_length    = Constants::META_MIN_LENGTH;
    size_t meta_max_length    = Constants::META_MAX_LENGTH;
    size_t max_external_links = Constants::MAX_EXTERNAL_LINKS;

    // Throws std::invalid_argument on the first constraint that does not hold.
    void validate() const;

    static Config                          parse(int argc, char* argv[]);
    static void                            load_yaml(Config& config, const std::string& path);
    static const std::vector<std::string>& supported_formats();
};

}  // namespace Core
}  // namespace SeoAudit

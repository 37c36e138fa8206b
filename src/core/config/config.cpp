#include "config.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace SeoAudit {
namespace Core {

const std::vector<std::string>& Config::supported_formats() {
    static const std::vector<std::string> formats = {"txt", "csv", "md", "json", "xlsx"};
    return formats;
}

void Config::load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["domain"])
            config.domain = yaml["domain"].as<std::string>();
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["max_pages"])
            config.max_pages = yaml["max_pages"].as<int>();
        if (yaml["timeout"])
            config.timeout_seconds = yaml["timeout"].as<int>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["progress"])
            config.show_progress = yaml["progress"].as<bool>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["format"])
            config.format = yaml["format"].as<std::string>();
        if (yaml["log_file"])
            config.log_file = yaml["log_file"].as<std::string>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();

        YAML::Node limits = yaml["limits"];
        if (limits && limits.IsMap()) {
            if (limits["title_min"])
                config.title_min_length = limits["title_min"].as<size_t>();
            if (limits["title_max"])
                config.title_max_length = limits["title_max"].as<size_t>();
            if (limits["meta_min"])
                config.meta_min_length = limits["meta_min"].as<size_t>();
            if (limits["meta_max"])
                config.meta_max_length = limits["meta_max"].as<size_t>();
            if (limits["max_external_links"])
                config.max_external_links = limits["max_external_links"].as<size_t>();
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

void Config::validate() const {
    if (domain.empty())
        throw std::invalid_argument("A domain to crawl is required");
    if (depth < Constants::MIN_DEPTH)
        throw std::invalid_argument("Depth must be at least " + std::to_string(Constants::MIN_DEPTH));
    if (max_pages < Constants::MIN_MAX_PAGES)
        throw std::invalid_argument("Minimum pages must be "
                                    + std::to_string(Constants::MIN_MAX_PAGES));
    if (timeout_seconds <= 0)
        throw std::invalid_argument("Timeout must be a positive number of seconds");
    if (title_min_length > title_max_length)
        throw std::invalid_argument("limits.title_min exceeds limits.title_max");
    if (meta_min_length > meta_max_length)
        throw std::invalid_argument("limits.meta_min exceeds limits.meta_max");

    const auto& formats = supported_formats();
    if (std::find(formats.begin(), formats.end(), format) == formats.end())
        throw std::invalid_argument("Unsupported output format: " + format);
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"SEO Website Crawler - Comprehensive SEO Analysis Tool"};
    app.set_version_flag("--version", Constants::VERSION);
    app.footer("Examples:\n"
               "  seoaudit example.com                   # Basic crawl\n"
               "  seoaudit example.com -d 5 -p 100       # Crawl with 5 depth and 100 max pages\n"
               "  seoaudit example.com -o reports -f md  # Export a Markdown report");

    app.add_option("domain", config.domain, "Domain to crawl (e.g., example.com)");
    app.add_option("-d,--depth", config.depth, "Maximum crawl depth (default: 3, min: 1)");
    app.add_option("-p,-m,--max-pages", config.max_pages, "Maximum pages to crawl (default: 50, min: 10)");
    app.add_option("--timeout", config.timeout_seconds, "Per-request timeout in seconds");
    app.add_option("-o,--output", config.output_dir, "Directory to save the audit report in");
    app.add_option("-f,--format", config.format, "Report format: txt, csv, md, json or xlsx");
    app.add_option("--log-file", config.log_file, "Log file path (empty to disable)");
    app.add_option("--user-agent", config.user_agent, "User-Agent header sent with requests");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
    app.add_flag(
        "--no-progress",
        [&](size_t count) {
            if (count > 0)
                config.show_progress = false;
        },
        "Disable the progress bar");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.validate();
    return config;
}

}  // namespace Core
}  // namespace SeoAudit

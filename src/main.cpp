#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "report/progress_bar.hpp"
#include "report/report_writer.hpp"
#include "storage/disk_storage.hpp"

namespace {

using namespace SeoAudit;

Engine::CrawlerConfig to_crawler_config(const Core::Config& config) {
    Engine::CrawlerConfig crawler_config;
    crawler_config.max_pages                 = config.max_pages;
    crawler_config.max_depth                 = config.depth;
    crawler_config.timeout_seconds           = config.timeout_seconds;
    crawler_config.user_agent                = config.user_agent;
    crawler_config.limits.title_min_length   = config.title_min_length;
    crawler_config.limits.title_max_length   = config.title_max_length;
    crawler_config.limits.meta_min_length    = config.meta_min_length;
    crawler_config.limits.meta_max_length    = config.meta_max_length;
    crawler_config.limits.max_external_links = config.max_external_links;
    return crawler_config;
}

Engine::CrawlOutcome run_crawler(const Core::Config& config, Core::Logger& logger) {
    curl_global_init(CURL_GLOBAL_ALL);

    Engine::CrawlOutcome outcome;
    {
        Engine::Crawler crawler(to_crawler_config(config), logger);

        std::optional<Report::ProgressBar> progress;
        if (config.show_progress) {
            progress.emplace(std::cerr, config.max_pages);
            crawler.set_progress_callback(
                [&progress](const Engine::CrawlProgress& p) { progress->update(p); });
        }

        outcome = crawler.run(config.domain);
        if (progress)
            progress->finish();
    }

    curl_global_cleanup();
    return outcome;
}

bool export_report(const Core::Config&         config,
                   const Engine::CrawlOutcome& outcome,
                   Core::Logger&               logger) {
    auto format = Report::parse_format(config.format);
    if (!format) {
        logger.error("Unsupported output format: " + config.format);
        return false;
    }

    Storage::DiskStorage storage(config.output_dir, logger);
    std::string          filename = Report::ReportWriter::filename(*format);
    if (*format == Report::ReportFormat::Xlsx) {
        return storage.save_file(filename, [&outcome](const std::string& path) {
            Report::ReportWriter::write_xlsx(outcome.records, path);
        });
    }
    return storage.save(filename, Report::ReportWriter::render(outcome.records, *format));
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Core::ConsoleLogger logger;
        logger.error(e.what());
        return 1;
    }

    int                 level = config.verbose ? Core::LOG_ALL : Core::LOG_DEFAULT;
    Core::ConsoleLogger logger(level, config.log_file);

    Engine::CrawlOutcome outcome = run_crawler(config, logger);
    std::cout << Report::ReportWriter::render_console(outcome);

    if (!outcome.ok())
        return 1;

    if (!config.output_dir.empty() && !outcome.records.empty()) {
        if (!export_report(config, outcome, logger))
            return 1;
    }

    return 0;
}

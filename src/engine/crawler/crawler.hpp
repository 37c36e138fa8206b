#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../analysis/page_analyzer.hpp"
#include "../../analysis/page_issues.hpp"
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "frontier.hpp"

namespace SeoAudit {
namespace Engine {

using Analysis::AnalyzerLimits;
using Analysis::PageIssueRecord;
using Network::Http::HttpClient;

struct CrawlerConfig {
    int                    max_pages       = Core::Constants::DEFAULT_MAX_PAGES;
    int                    max_depth       = Core::Constants::DEFAULT_DEPTH;
    int                    timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS;
    std::string            user_agent      = Core::Constants::USER_AGENT;
    AnalyzerLimits         limits;
};

enum class CrawlStatus { Complete, Failed };

struct CrawlStats {
    size_t pages_visited    = 0;
    size_t pages_analyzed   = 0;
    size_t pages_skipped    = 0;  // non-HTML responses
    size_t pages_failed     = 0;
    size_t links_discovered = 0;
};

struct CrawlOutcome {
    CrawlStatus                  status = CrawlStatus::Complete;
    std::vector<PageIssueRecord> records;  // in analysis order; pages without issues are omitted
    std::string                  error;    // set when status is Failed
    CrawlStats                   stats;

    bool ok() const { return status == CrawlStatus::Complete; }
};

struct CrawlProgress {
    size_t      visited   = 0;
    size_t      pending   = 0;
    int         max_pages = 0;
    std::string url;
};

using ProgressCallback = std::function<void(const CrawlProgress&)>;
using ClientFactory    = std::function<std::unique_ptr<HttpClient>()>;

/**
 * Sequential single-site crawler.
 *
 * run() fetches one page at a time on the calling thread until the frontier
 * is exhausted or max_pages URLs have been visited. A URL is marked visited
 * before it is fetched, so failed fetches count against the page cap and are
 * never retried. Per-page failures are logged and skipped; only an exception
 * outside the page loop (such as a client that cannot be constructed) ends
 * the crawl as Failed.
 */
class Crawler {
public:
    Crawler(const CrawlerConfig& config, Core::Logger& logger, ClientFactory client_factory = {});

    void         set_progress_callback(ProgressCallback callback);
    // Replaces the default rule set built from CrawlerConfig::limits.
    void         set_analyzer(std::unique_ptr<Analysis::PageAnalyzer> analyzer);
    CrawlOutcome run(const std::string& target);

    const Frontier& frontier() const { return frontier_; }

private:
    CrawlerConfig          config_;
    Core::Logger&          logger_;
    ClientFactory          client_factory_;
    ProgressCallback       progress_;
    std::unique_ptr<Analysis::PageAnalyzer> analyzer_;
    Frontier               frontier_;

    std::unique_ptr<HttpClient> create_client();

    std::optional<Response> fetch_page(HttpClient& client, const FrontierEntry& entry, CrawlStats& stats);
    void process_page(HttpClient& client, const FrontierEntry& entry, CrawlOutcome& outcome);
    void analyze_page(const FrontierEntry& entry, const Response& res, CrawlOutcome& outcome);
    size_t extract_links(const std::string& base_url, const std::vector<std::string>& hrefs, int depth);
    void report_progress(const std::string& url) const;
};

}  // namespace Engine
}  // namespace SeoAudit

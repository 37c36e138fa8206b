#include "crawler.hpp"
#include <stdexcept>
#include "../../network/http/curl_client.hpp"
#include "../../utils/html/document.hpp"
#include "../../utils/url/url.hpp"

namespace SeoAudit {
namespace Engine {

using namespace SeoAudit::Network::Http;
using Utils::Url;
using Utils::Html::Document;

Crawler::Crawler(const CrawlerConfig& config, Core::Logger& logger, ClientFactory client_factory)
    : config_(config),
      logger_(logger),
      client_factory_(std::move(client_factory)),
      analyzer_(std::make_unique<Analysis::PageAnalyzer>(config.limits)),
      frontier_(config.max_pages, config.max_depth) {
}

void Crawler::set_progress_callback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

void Crawler::set_analyzer(std::unique_ptr<Analysis::PageAnalyzer> analyzer) {
    if (!analyzer)
        throw std::invalid_argument("Crawler requires a page analyzer");
    analyzer_ = std::move(analyzer);
}

std::unique_ptr<HttpClient> Crawler::create_client() {
    std::unique_ptr<HttpClient> client =
        client_factory_ ? client_factory_() : std::make_unique<CurlClient>();
    if (!client)
        throw std::runtime_error("HTTP client factory returned no client");

    client->set_timeout(std::chrono::seconds(config_.timeout_seconds));
    client->set_user_agent(config_.user_agent);
    return client;
}

CrawlOutcome Crawler::run(const std::string& target) {
    CrawlOutcome outcome;

    try {
        std::string seed = Url::normalize_target(target);
        logger_.info("Crawler: Starting for " + seed);

        frontier_ = Frontier(config_.max_pages, config_.max_depth);
        frontier_.seed(seed);
        if (frontier_.scope_host().empty())
            throw std::invalid_argument("Cannot determine a host to crawl from '" + target + "'");
        logger_.info("Crawler: Domain set to " + frontier_.scope_host());

        auto client = create_client();

        while (frontier_.should_continue()) {
            auto entry = frontier_.next_candidate();
            if (!entry)
                break;

            frontier_.mark_visited(entry->url);
            process_page(*client, *entry, outcome);
            report_progress(entry->url);
        }

        outcome.status = CrawlStatus::Complete;
        logger_.success("Crawl complete: " + std::to_string(frontier_.visited_count())
                        + " pages visited, " + std::to_string(outcome.records.size())
                        + " with issues.");
    } catch (const std::exception& e) {
        outcome.status = CrawlStatus::Failed;
        outcome.error  = e.what();
        logger_.error("Crawl aborted: " + outcome.error);
    }

    outcome.stats.pages_visited = frontier_.visited_count();
    return outcome;
}

std::optional<Response>
Crawler::fetch_page(HttpClient& client, const FrontierEntry& entry, CrawlStats& stats) {
    logger_.debug("Fetching: " + entry.url + " (Depth " + std::to_string(entry.depth) + ")");

    Response res;
    try {
        res = client.get(entry.url);
    } catch (const std::exception& e) {
        res.success    = false;
        res.error      = e.what();
        res.error_type = ErrorType::Other;
    }

    if (!res.success) {
        logger_.warn("Error crawling " + entry.url + ": " + res.error + " ["
                     + error_type_name(res.error_type) + "]");
        ++stats.pages_failed;
        return std::nullopt;
    }

    if (!res.effective_url.empty() && res.effective_url != entry.url)
        logger_.debug("Redirected: " + entry.url + " -> " + res.effective_url);

    if (!res.is_html()) {
        logger_.debug("Skipped (Content-Type '" + res.content_type + "'): " + entry.url);
        ++stats.pages_skipped;
        return std::nullopt;
    }

    return res;
}

void Crawler::process_page(HttpClient& client, const FrontierEntry& entry, CrawlOutcome& outcome) {
    auto res = fetch_page(client, entry, outcome.stats);
    if (!res)
        return;

    try {
        analyze_page(entry, *res, outcome);
    } catch (const std::exception& e) {
        logger_.error("Unexpected error crawling " + entry.url + ": " + e.what());
        ++outcome.stats.pages_failed;
    }
}

void Crawler::analyze_page(const FrontierEntry& entry, const Response& res, CrawlOutcome& outcome) {
    Document        doc    = Document::parse(res.body);
    PageIssueRecord record = analyzer_->analyze(entry.url, doc);
    ++outcome.stats.pages_analyzed;

    if (record.empty()) {
        logger_.debug("No issues: " + entry.url);
    }
    else {
        logger_.info("Analyzed: " + entry.url + " (" + std::to_string(record.issues.size())
                     + " issue categories)");
        outcome.records.push_back(std::move(record));
    }

    outcome.stats.links_discovered += extract_links(entry.url, doc.links, entry.depth);
}

size_t Crawler::extract_links(const std::string&              base_url,
                              const std::vector<std::string>& hrefs,
                              int                             depth) {
    size_t added = 0;
    for (const auto& href : hrefs) {
        std::string absolute_link = Url::strip_fragment(Url::resolve(base_url, href));
        if (absolute_link.empty())
            continue;
        if (frontier_.offer(absolute_link, depth + 1))
            ++added;
    }
    return added;
}

void Crawler::report_progress(const std::string& url) const {
    if (!progress_)
        return;

    CrawlProgress progress;
    progress.visited   = frontier_.visited_count();
    progress.pending   = frontier_.pending_count();
    progress.max_pages = config_.max_pages;
    progress.url       = url;
    progress_(progress);
}

}  // namespace Engine
}  // namespace SeoAudit

#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>
#include "../../src/engine/crawler/crawler.hpp"

using namespace SeoAudit;
using namespace SeoAudit::Engine;
using Analysis::IssueCategory;

namespace {

// In-memory site served by URL. Unknown URLs answer 404.
class FakeHttpClient : public Network::Http::HttpClient {
public:
    explicit FakeHttpClient(std::map<std::string, Response> pages, std::vector<std::string>* log)
        : pages_(std::move(pages)), log_(log) {}

    void set_timeout(std::chrono::seconds timeout) override {
        timeout_ = timeout;
        if (on_configure)
            on_configure(*this);
    }
    void set_user_agent(const std::string& user_agent) override {
        user_agent_ = user_agent;
        if (on_configure)
            on_configure(*this);
    }

    Response get(const std::string& url) override {
        if (log_)
            log_->push_back(url);

        auto it = pages_.find(url);
        if (it != pages_.end())
            return it->second;

        Response res;
        res.status_code = 404;
        res.success     = false;
        res.error       = "HTTP 404";
        res.error_type  = Network::Http::ErrorType::Status;
        return res;
    }

    std::chrono::seconds                        timeout_{0};
    std::string                                 user_agent_;
    std::function<void(const FakeHttpClient&)> on_configure;

private:
    std::map<std::string, Response> pages_;
    std::vector<std::string>*       log_;
};

// Rejects one page as if its markup broke a rule; every other page is analyzed normally.
class FailingAnalyzer : public Analysis::PageAnalyzer {
public:
    explicit FailingAnalyzer(std::string failing_url) : failing_url_(std::move(failing_url)) {}

    PageIssueRecord analyze(const std::string& url, const Utils::Html::Document& doc) const override {
        if (url == failing_url_)
            throw std::runtime_error("analyzer rejected " + url);
        return Analysis::PageAnalyzer::analyze(url, doc);
    }

private:
    std::string failing_url_;
};

Response html(const std::string& body) {
    Response res;
    res.status_code  = 200;
    res.success      = true;
    res.content_type = "text/html; charset=utf-8";
    res.body         = body;
    return res;
}

Response binary(const std::string& content_type) {
    Response res;
    res.status_code  = 200;
    res.success      = true;
    res.content_type = content_type;
    res.body         = "%PDF-1.4 <a href=\"/hidden\">x</a>";
    return res;
}

// Passes every analyzer check apart from whatever extra markup is appended.
std::string good_page(const std::string& extra = "") {
    return "<html><head><title>A perfectly sized page title</title>"
           "<meta name=\"description\" content=\""
           + std::string(80, 'd') + "\"></head><body><h1>Main</h1><h2>Section</h2><h3>Topic</h3>"
             "<h4>Detail</h4><h5>Note</h5><h6>Aside</h6>"
           + extra + "</body></html>";
}

std::string link(const std::string& href) {
    return "<a href=\"" + href + "\">link</a>";
}

class CrawlerTest : public ::testing::Test {
protected:
    Core::NullLogger                logger;
    std::map<std::string, Response> site;
    std::vector<std::string>        requests;
    CrawlerConfig                   config;

    ClientFactory factory() {
        return [this]() { return std::make_unique<FakeHttpClient>(site, &requests); };
    }

    CrawlOutcome crawl(const std::string& target = "http://site.test/") {
        Crawler crawler(config, logger, factory());
        return crawler.run(target);
    }

    const PageIssueRecord* find(const CrawlOutcome& outcome, const std::string& url) {
        for (const auto& record : outcome.records) {
            if (record.url == url)
                return &record;
        }
        return nullptr;
    }
};

}  // namespace

TEST_F(CrawlerTest, CyclicLinksTerminate) {
    site["http://site.test/"]  = html(good_page(link("/a")));
    site["http://site.test/a"] = html(good_page(link("/b")));
    site["http://site.test/b"] = html(good_page(link("/") + link("/a")));

    auto outcome = crawl();

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(requests.size(), 3u);
    EXPECT_EQ(outcome.stats.pages_visited, 3u);
    EXPECT_EQ(outcome.stats.pages_analyzed, 3u);
    EXPECT_TRUE(outcome.records.empty());
}

TEST_F(CrawlerTest, PageCapBoundsFetches) {
    std::string links;
    for (int i = 0; i < 30; ++i)
        links += link("/p" + std::to_string(i));
    site["http://site.test/"] = html(good_page(links));
    for (int i = 0; i < 30; ++i)
        site["http://site.test/p" + std::to_string(i)] = html(good_page());

    config.max_pages = 10;
    auto outcome     = crawl();

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(requests.size(), 10u);
    EXPECT_EQ(outcome.stats.pages_visited, 10u);
}

TEST_F(CrawlerTest, ZeroIssuePagesAreOmitted) {
    site["http://site.test/"]    = html(good_page(link("/bad")));
    site["http://site.test/bad"] = html("<html><body><h1>Only a heading</h1></body></html>");

    auto outcome = crawl();

    ASSERT_EQ(outcome.records.size(), 1u);
    EXPECT_EQ(outcome.records[0].url, "http://site.test/bad");
    EXPECT_TRUE(outcome.records[0].has(IssueCategory::Title));
    EXPECT_TRUE(outcome.records[0].has(IssueCategory::MetaDescription));
    EXPECT_EQ(outcome.stats.pages_analyzed, 2u);
}

TEST_F(CrawlerTest, NonHtmlPagesAreSkipped) {
    site["http://site.test/"]       = html(good_page(link("/report")));
    site["http://site.test/report"] = binary("application/pdf");

    auto outcome = crawl();

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(find(outcome, "http://site.test/report"), nullptr);
    EXPECT_EQ(outcome.stats.pages_skipped, 1u);
    EXPECT_EQ(outcome.stats.pages_analyzed, 1u);
    EXPECT_EQ(requests.size(), 2u);
}

TEST_F(CrawlerTest, DenylistedLinksAreNeverFetched) {
    site["http://site.test/"] =
        html(good_page(link("/guide.pdf") + link("/logo.PNG") + link("/app.js") + link("/ok")));
    site["http://site.test/ok"] = html(good_page());

    auto outcome = crawl();

    std::vector<std::string> expected = {"http://site.test/", "http://site.test/ok"};
    EXPECT_EQ(requests, expected);
    EXPECT_TRUE(outcome.ok());
}

TEST_F(CrawlerTest, OutOfScopeLinksAreNotFollowed) {
    site["http://site.test/"] = html(good_page(link("https://other.test/") + link("//cdn.test/x")
                                               + link("mailto:a@site.test") + link("/in")));
    site["http://site.test/in"] = html(good_page());

    auto outcome = crawl();

    EXPECT_EQ(requests.size(), 2u);
    EXPECT_EQ(outcome.stats.links_discovered, 1u);
}

TEST_F(CrawlerTest, FragmentsCollapseToOnePage) {
    site["http://site.test/"]  = html(good_page(link("/a#top") + link("/a#bottom") + link("#self")));
    site["http://site.test/a"] = html(good_page());

    crawl();

    std::vector<std::string> expected = {"http://site.test/", "http://site.test/a"};
    EXPECT_EQ(requests, expected);
}

TEST_F(CrawlerTest, FailedFetchDoesNotStopCrawl) {
    site["http://site.test/"]   = html(good_page(link("/gone") + link("/next")));
    site["http://site.test/next"] = html("<title>Next</title><h1>n</h1>");

    auto outcome = crawl();

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.stats.pages_failed, 1u);
    EXPECT_EQ(outcome.stats.pages_visited, 3u);
    EXPECT_NE(find(outcome, "http://site.test/next"), nullptr);
    EXPECT_EQ(find(outcome, "http://site.test/gone"), nullptr);
}

TEST_F(CrawlerTest, AnalysisErrorDoesNotStopCrawl) {
    site["http://site.test/"]       = html(good_page(link("/broken") + link("/next")));
    site["http://site.test/broken"] = html(good_page(link("/behind-broken")));
    site["http://site.test/next"]   = html("<title>Next</title><h1>n</h1>");
    site["http://site.test/behind-broken"] = html(good_page());

    Crawler crawler(config, logger, factory());
    crawler.set_analyzer(std::make_unique<FailingAnalyzer>("http://site.test/broken"));
    auto outcome = crawler.run("http://site.test/");

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.stats.pages_failed, 1u);
    EXPECT_EQ(outcome.stats.pages_analyzed, 2u);
    EXPECT_EQ(outcome.stats.pages_visited, 3u);
    EXPECT_EQ(find(outcome, "http://site.test/broken"), nullptr);
    EXPECT_NE(find(outcome, "http://site.test/next"), nullptr);
    EXPECT_FALSE(crawler.frontier().is_visited("http://site.test/behind-broken"));
}

TEST_F(CrawlerTest, AnalyzerIsRequired) {
    Crawler crawler(config, logger, factory());
    EXPECT_THROW(crawler.set_analyzer(nullptr), std::invalid_argument);
}

TEST_F(CrawlerTest, DepthLimitIsHonoured) {
    site["http://site.test/"]   = html(good_page(link("/d1")));
    site["http://site.test/d1"] = html(good_page(link("/d2")));
    site["http://site.test/d2"] = html(good_page(link("/d3")));
    site["http://site.test/d3"] = html(good_page());

    config.max_depth = 2;
    crawl();

    std::vector<std::string> expected = {
        "http://site.test/", "http://site.test/d1", "http://site.test/d2"};
    EXPECT_EQ(requests, expected);
}

TEST_F(CrawlerTest, SchemeLessTargetIsNormalized) {
    site["http://site.test"] = html(good_page());

    auto outcome = crawl("site.test");

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], "http://site.test");
    EXPECT_TRUE(outcome.ok());
}

TEST_F(CrawlerTest, LinksResolveAgainstRequestedUrl) {
    Response redirected             = html(good_page(link("/about") + link("blog")));
    redirected.effective_url        = "http://www.site.test/docs/";
    site["http://site.test"]        = redirected;
    site["http://site.test/about"]  = html(good_page());
    site["http://site.test/blog"]   = html(good_page());

    auto outcome = crawl("site.test");

    std::sort(requests.begin(), requests.end());
    std::vector<std::string> expected = {
        "http://site.test", "http://site.test/about", "http://site.test/blog"};
    EXPECT_EQ(requests, expected);
    EXPECT_EQ(outcome.stats.links_discovered, 2u);
}

TEST_F(CrawlerTest, ClientIsConfigured) {
    site["http://site.test/"] = html(good_page());
    config.timeout_seconds    = 7;
    config.user_agent         = "TestAgent/2.0";

    std::chrono::seconds timeout{0};
    std::string          user_agent;
    Crawler              crawler(config, logger, [&]() {
        auto client = std::make_unique<FakeHttpClient>(site, nullptr);
        client->on_configure = [&](const FakeHttpClient& c) {
            timeout    = c.timeout_;
            user_agent = c.user_agent_;
        };
        return client;
    });
    auto outcome = crawler.run("http://site.test/");

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(timeout, std::chrono::seconds(7));
    EXPECT_EQ(user_agent, "TestAgent/2.0");
}

TEST_F(CrawlerTest, ClientFailureEndsCrawlAsFailed) {
    Crawler crawler(config, logger, []() -> std::unique_ptr<Network::Http::HttpClient> {
        throw std::runtime_error("no transport");
    });
    auto outcome = crawler.run("http://site.test/");

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, CrawlStatus::Failed);
    EXPECT_EQ(outcome.error, "no transport");
    EXPECT_TRUE(outcome.records.empty());
}

TEST_F(CrawlerTest, MissingHostEndsCrawlAsFailed) {
    auto outcome = crawl("http://");
    EXPECT_FALSE(outcome.ok());
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_TRUE(requests.empty());
}

TEST_F(CrawlerTest, ProgressIsReportedPerPage) {
    site["http://site.test/"]  = html(good_page(link("/a")));
    site["http://site.test/a"] = html(good_page());

    std::vector<CrawlProgress> updates;
    Crawler                    crawler(config, logger, factory());
    crawler.set_progress_callback([&](const CrawlProgress& p) { updates.push_back(p); });
    crawler.run("http://site.test/");

    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].visited, 1u);
    EXPECT_EQ(updates[0].pending, 1u);
    EXPECT_EQ(updates[0].url, "http://site.test/");
    EXPECT_EQ(updates[1].visited, 2u);
    EXPECT_EQ(updates[1].pending, 0u);
    EXPECT_EQ(updates[1].max_pages, config.max_pages);
}

TEST_F(CrawlerTest, FrontierIsDrainedAfterRun) {
    site["http://site.test/"]  = html(good_page(link("/a")));
    site["http://site.test/a"] = html(good_page());

    Crawler crawler(config, logger, factory());
    crawler.run("http://site.test/");

    EXPECT_EQ(crawler.frontier().pending_count(), 0u);
    EXPECT_TRUE(crawler.frontier().is_visited("http://site.test/a"));
    EXPECT_EQ(crawler.frontier().scope_host(), "site.test");
}

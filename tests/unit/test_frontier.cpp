#include <gtest/gtest.h>
#include <set>
#include "../../src/engine/crawler/frontier.hpp"

using namespace SeoAudit::Engine;

class FrontierTest : public ::testing::Test {
protected:
    Frontier frontier{50, 3};

    void SetUp() override { frontier.seed("http://example.com"); }
};

TEST_F(FrontierTest, SeedStartsPendingAtDepthZero) {
    EXPECT_EQ(frontier.scope_host(), "example.com");
    EXPECT_EQ(frontier.pending_count(), 1u);
    EXPECT_TRUE(frontier.should_continue());

    auto entry = frontier.next_candidate();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->url, "http://example.com");
    EXPECT_EQ(entry->depth, 0);
    EXPECT_FALSE(frontier.next_candidate().has_value());
}

TEST_F(FrontierTest, OfferIsIdempotent) {
    EXPECT_TRUE(frontier.offer("http://example.com/a", 1));
    EXPECT_FALSE(frontier.offer("http://example.com/a", 1));
    EXPECT_FALSE(frontier.offer("http://example.com/a", 2));
    EXPECT_EQ(frontier.pending_count(), 2u);
}

TEST_F(FrontierTest, OfferRejectsVisited) {
    frontier.mark_visited("http://example.com");
    EXPECT_FALSE(frontier.offer("http://example.com", 1));
    EXPECT_FALSE(frontier.is_pending("http://example.com"));
    EXPECT_TRUE(frontier.is_visited("http://example.com"));
}

TEST_F(FrontierTest, NeverPendingAndVisitedAtOnce) {
    ASSERT_TRUE(frontier.offer("http://example.com/a", 1));
    frontier.mark_visited("http://example.com/a");
    EXPECT_TRUE(frontier.is_visited("http://example.com/a"));
    EXPECT_FALSE(frontier.is_pending("http://example.com/a"));
}

TEST_F(FrontierTest, ScopeRejectsOtherHosts) {
    EXPECT_FALSE(frontier.offer("http://google.com/path", 1));
    EXPECT_FALSE(frontier.offer("http://sub.example.com/path", 1));
    EXPECT_FALSE(frontier.offer("http://example.com:8080/path", 1));
    EXPECT_EQ(frontier.pending_count(), 1u);
}

TEST_F(FrontierTest, ScopeAcceptsBothHttpSchemes) {
    EXPECT_TRUE(frontier.offer("https://example.com/secure", 1));
    EXPECT_TRUE(frontier.offer("http://EXAMPLE.com/upper", 1));
    EXPECT_FALSE(frontier.offer("ftp://example.com/file", 1));
    EXPECT_FALSE(frontier.offer("mailto:info@example.com", 1));
}

TEST_F(FrontierTest, ScopeRejectsDenylistedExtensions) {
    for (const char* url : {"http://example.com/report.pdf",
                            "http://example.com/photo.JPG",
                            "http://example.com/logo.png",
                            "http://example.com/anim.gif",
                            "http://example.com/site.css",
                            "http://example.com/app.js"}) {
        EXPECT_FALSE(frontier.offer(url, 1)) << url;
    }
    EXPECT_TRUE(frontier.offer("http://example.com/data.json", 1));
    EXPECT_TRUE(frontier.offer("http://example.com/page.html", 1));
    EXPECT_TRUE(frontier.offer("http://example.com/download?file=a.pdf", 1));
}

TEST_F(FrontierTest, MalformedUrlsAreOutOfScope) {
    EXPECT_FALSE(frontier.in_scope(""));
    EXPECT_FALSE(frontier.in_scope("/relative/path"));
    EXPECT_FALSE(frontier.in_scope("http:///no-host"));
    EXPECT_FALSE(frontier.in_scope(":::"));
}

TEST_F(FrontierTest, DepthLimit) {
    EXPECT_TRUE(frontier.offer("http://example.com/d3", 3));
    EXPECT_FALSE(frontier.offer("http://example.com/d4", 4));
}

TEST_F(FrontierTest, PageCapStopsTraversal) {
    Frontier capped(2, 3);
    capped.seed("http://example.com");
    capped.offer("http://example.com/a", 1);
    capped.offer("http://example.com/b", 1);

    capped.mark_visited(capped.next_candidate()->url);
    EXPECT_TRUE(capped.should_continue());
    capped.mark_visited(capped.next_candidate()->url);
    EXPECT_FALSE(capped.should_continue());
    EXPECT_EQ(capped.pending_count(), 1u);
}

TEST_F(FrontierTest, DrainsEveryPendingUrl) {
    std::set<std::string> offered = {"http://example.com/a", "http://example.com/b", "http://example.com/c"};
    for (const auto& url : offered)
        frontier.offer(url, 1);
    offered.insert("http://example.com");

    std::set<std::string> drained;
    while (auto entry = frontier.next_candidate())
        drained.insert(entry->url);

    EXPECT_EQ(drained, offered);
    EXPECT_FALSE(frontier.should_continue());
}

TEST_F(FrontierTest, SeedResetsState) {
    frontier.mark_visited("http://example.com");
    frontier.seed("https://other.org/start");

    EXPECT_EQ(frontier.scope_host(), "other.org");
    EXPECT_EQ(frontier.visited_count(), 0u);
    EXPECT_TRUE(frontier.is_pending("https://other.org/start"));
}

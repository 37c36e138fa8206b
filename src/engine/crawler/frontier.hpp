#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace SeoAudit {
namespace Engine {

struct FrontierEntry {
    std::string url;
    int         depth = 0;
};

/**
 * Discovered and visited URL sets for a single-site crawl.
 *
 * The frontier is a set, not a queue: next_candidate() hands out an
 * arbitrary pending URL and the visit order is unspecified. A URL is never
 * pending and visited at the same time.
 */
class Frontier {
public:
    Frontier(int max_pages, int max_depth);

    void seed(const std::string& url);

    std::optional<FrontierEntry> next_candidate();
    void                         mark_visited(const std::string& url);

    // Queues url when it is in scope, within max_depth and not yet seen.
    bool offer(const std::string& url, int depth);
    bool should_continue() const;

    // Same host as the seed, http(s), and not a known non-HTML extension.
    bool in_scope(const std::string& url) const;

    bool is_visited(const std::string& url) const;
    bool is_pending(const std::string& url) const;

    size_t             visited_count() const { return visited_.size(); }
    size_t             pending_count() const { return pending_.size(); }
    int                max_pages() const { return max_pages_; }
    int                max_depth() const { return max_depth_; }
    const std::string& scope_host() const { return scope_host_; }

private:
    int                                  max_pages_;
    int                                  max_depth_;
    std::string                          scope_host_;
    std::unordered_map<std::string, int> pending_;
    std::unordered_set<std::string>      visited_;
};

}  // namespace Engine
}  // namespace SeoAudit

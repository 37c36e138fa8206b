#include "frontier.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace SeoAudit {
namespace Engine {

using Utils::Url;

Frontier::Frontier(int max_pages, int max_depth) : max_pages_(max_pages), max_depth_(max_depth) {
}

void Frontier::seed(const std::string& url) {
    pending_.clear();
    visited_.clear();
    scope_host_ = Url::authority(url);
    pending_.emplace(url, 0);
}

std::optional<FrontierEntry> Frontier::next_candidate() {
    if (pending_.empty())
        return std::nullopt;

    auto          it = pending_.begin();
    FrontierEntry entry{it->first, it->second};
    pending_.erase(it);
    return entry;
}

void Frontier::mark_visited(const std::string& url) {
    pending_.erase(url);
    visited_.insert(url);
}

bool Frontier::in_scope(const std::string& url) const {
    if (scope_host_.empty() || !Url::is_http(url))
        return false;

    auto parsed = Url::parse(url);
    if (parsed.host.empty() || Url::authority(url) != scope_host_)
        return false;

    return !Core::has_extension(parsed.path, Core::get_skipped_extensions());
}

bool Frontier::offer(const std::string& url, int depth) {
    if (depth > max_depth_ || !in_scope(url))
        return false;
    if (visited_.count(url) || pending_.count(url))
        return false;

    pending_.emplace(url, depth);
    return true;
}

bool Frontier::should_continue() const {
    return !pending_.empty() && visited_.size() < static_cast<size_t>(max_pages_);
}

bool Frontier::is_visited(const std::string& url) const {
    return visited_.count(url) > 0;
}

bool Frontier::is_pending(const std::string& url) const {
    return pending_.count(url) > 0;
}

}  // namespace Engine
}  // namespace SeoAudit

#include "page_issues.hpp"

namespace SeoAudit {
namespace Analysis {

const char* category_name(IssueCategory category) {
    switch (category) {
        case IssueCategory::Title: return "Title Issues";
        case IssueCategory::MetaDescription: return "Meta Description Issues";
        case IssueCategory::HeadingStructure: return "Heading Structure Issues";
        case IssueCategory::Link: return "Link Issues";
        case IssueCategory::Image: return "Image SEO Issues";
    }
    return "Other Issues";
}

bool PageIssueRecord::has(IssueCategory category) const {
    return issues.find(category) != issues.end();
}

const std::vector<std::string>& PageIssueRecord::get(IssueCategory category) const {
    static const std::vector<std::string> none;
    auto it = issues.find(category);
    return it == issues.end() ? none : it->second;
}

}  // namespace Analysis
}  // namespace SeoAudit

#pragma once
#include <array>
#include <map>
#include <string>
#include <vector>

namespace SeoAudit {
namespace Analysis {

enum class IssueCategory { Title, MetaDescription, HeadingStructure, Link, Image };

inline constexpr std::array<IssueCategory, 5> ALL_CATEGORIES = {IssueCategory::Title,
                                                                 IssueCategory::MetaDescription,
                                                                 IssueCategory::HeadingStructure,
                                                                 IssueCategory::Link,
                                                                 IssueCategory::Image};

// Report heading for a category, e.g. "Title Issues".
const char* category_name(IssueCategory category);

struct PageIssueRecord {
    std::string                                          url;
    std::map<IssueCategory, std::vector<std::string>> issues;  // only non-empty categories

    bool                            empty() const { return issues.empty(); }
    bool                            has(IssueCategory category) const;
    const std::vector<std::string>& get(IssueCategory category) const;

    bool operator==(const PageIssueRecord& other) const {
        return url == other.url && issues == other.issues;
    }
};

}  // namespace Analysis
}  // namespace SeoAudit

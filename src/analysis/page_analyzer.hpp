#pragma once
#include <string>
#include <vector>

#include "../core/types/constants.hpp"
#include "../utils/html/document.hpp"
#include "page_issues.hpp"

namespace SeoAudit {
namespace Analysis {

struct AnalyzerLimits {
    size_t title_min_length   = Core::Constants::TITLE_MIN_LENGTH;
    size_t title_max_length   = Core::Constants::TITLE_MAX_LENGTH;
    size_t meta_min_length    = Core::Constants::META_MIN_LENGTH;
    size_t meta_max_length    = Core::Constants::META_MAX_LENGTH;
    size_t max_external_links = Core::Constants::MAX_EXTERNAL_LINKS;
};

/**
 * On-page SEO checks for a single parsed page.
 *
 * Every rule runs on every page and the categories are independent of each
 * other. The result only holds categories that produced at least one issue.
 * Lengths are counted in Unicode code points.
 */
class PageAnalyzer {
public:
    explicit PageAnalyzer(AnalyzerLimits limits = {});
    virtual ~PageAnalyzer() = default;

    virtual PageIssueRecord analyze(const std::string& url, const Utils::Html::Document& doc) const;

    const AnalyzerLimits& limits() const { return limits_; }

private:
    AnalyzerLimits limits_;

    void check_title(const Utils::Html::Document& doc, std::vector<std::string>& out) const;
    void check_meta_description(const Utils::Html::Document& doc,
                                std::vector<std::string>&    out) const;
    void check_headings(const Utils::Html::Document& doc, std::vector<std::string>& out) const;
    void check_links(const std::string&           url,
                     const Utils::Html::Document& doc,
                     std::vector<std::string>&    out) const;
    void check_images(const Utils::Html::Document& doc, std::vector<std::string>& out) const;
};

}  // namespace Analysis
}  // namespace SeoAudit

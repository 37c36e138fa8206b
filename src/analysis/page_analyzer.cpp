#include "page_analyzer.hpp"
#include <algorithm>
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace SeoAudit {
namespace Analysis {

using Utils::Html::Document;
using namespace Utils::Text;

namespace {
constexpr int MAX_HEADING_LEVEL = 6;

bool outside(size_t value, size_t min, size_t max) {
    return value < min || value > max;
}
}  // namespace

PageAnalyzer::PageAnalyzer(AnalyzerLimits limits) : limits_(limits) {
}

PageIssueRecord PageAnalyzer::analyze(const std::string& url, const Document& doc) const {
    PageIssueRecord record;
    record.url = url;

    auto add = [&record](IssueCategory category, std::vector<std::string> issues) {
        if (!issues.empty())
            record.issues.emplace(category, std::move(issues));
    };

    std::vector<std::string> title, meta, headings, links, images;
    check_title(doc, title);
    check_meta_description(doc, meta);
    check_headings(doc, headings);
    check_links(url, doc, links);
    check_images(doc, images);

    add(IssueCategory::Title, std::move(title));
    add(IssueCategory::MetaDescription, std::move(meta));
    add(IssueCategory::HeadingStructure, std::move(headings));
    add(IssueCategory::Link, std::move(links));
    add(IssueCategory::Image, std::move(images));
    return record;
}

void PageAnalyzer::check_title(const Document& doc, std::vector<std::string>& out) const {
    if (!doc.title || is_blank(*doc.title)) {
        out.emplace_back("Missing Title Tag");
        return;
    }

    size_t length = utf8_length(*doc.title);
    if (outside(length, limits_.title_min_length, limits_.title_max_length)) {
        out.push_back("Title Tag Length Issue (Current: " + std::to_string(length) + " chars)");
    }
}

void PageAnalyzer::check_meta_description(const Document&          doc,
                                          std::vector<std::string>& out) const {
    auto content = doc.meta_content("description");
    if (!content || is_blank(*content)) {
        out.emplace_back("Missing Meta Description");
        return;
    }

    size_t length = utf8_length(*content);
    if (outside(length, limits_.meta_min_length, limits_.meta_max_length)) {
        out.push_back("Meta Description Length Issue (Current: " + std::to_string(length)
                      + " chars)");
    }
}

// Each level that is used while the next one is not counts as a gap,
// independently of the H1 rules.
void PageAnalyzer::check_headings(const Document& doc, std::vector<std::string>& out) const {
    size_t h1 = doc.heading_count(1);
    if (h1 == 0)
        out.emplace_back("No H1 Tag Found");
    else if (h1 > 1)
        out.emplace_back("Multiple H1 Tags");

    for (int level = 1; level < MAX_HEADING_LEVEL; ++level) {
        if (doc.heading_count(level) > 0 && doc.heading_count(level + 1) == 0) {
            out.push_back("Potential Heading Hierarchy Issue (Missing H" + std::to_string(level + 1)
                          + ")");
        }
    }
}

void PageAnalyzer::check_links(const std::string&        url,
                               const Document&           doc,
                               std::vector<std::string>& out) const {
    std::string page_host = Utils::Url::authority(url);

    size_t external = std::count_if(doc.links.begin(), doc.links.end(), [&](const std::string& href) {
        std::string host = Utils::Url::authority(Utils::Url::resolve(url, href));
        return !host.empty() && host != page_host;
    });

    if (external > limits_.max_external_links) {
        out.push_back("High Number of External Links (" + std::to_string(external) + ")");
    }
}

void PageAnalyzer::check_images(const Document& doc, std::vector<std::string>& out) const {
    size_t missing_alt = std::count_if(doc.images.begin(), doc.images.end(), [](const auto& img) {
        return !img.alt || img.alt->empty();
    });

    if (missing_alt > 0) {
        out.push_back(std::to_string(missing_alt) + " Images Missing Alt Text");
    }
}

}  // namespace Analysis
}  // namespace SeoAudit

#pragma once
#include <ostream>
#include <string>

#include "../core/types/constants.hpp"
#include "../engine/crawler/crawler.hpp"

namespace SeoAudit {
namespace Report {

// Single-line "Crawling: [####....] n/total pages" display redrawn in place.
class ProgressBar {
public:
    ProgressBar(std::ostream& out, int total, int width = Core::Constants::PROGRESS_BAR_WIDTH);

    void update(const Engine::CrawlProgress& progress);
    void finish();

    std::string render(size_t done) const;

private:
    std::ostream& out_;
    int           total_;
    int           width_;
    bool          finished_ = false;
};

}  // namespace Report
}  // namespace SeoAudit

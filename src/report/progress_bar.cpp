#include "progress_bar.hpp"
#include <algorithm>

namespace SeoAudit {
namespace Report {

ProgressBar::ProgressBar(std::ostream& out, int total, int width)
    : out_(out), total_(std::max(total, 1)), width_(std::max(width, 1)) {
}

std::string ProgressBar::render(size_t done) const {
    size_t total  = static_cast<size_t>(total_);
    size_t capped = std::min(done, total);
    size_t filled = capped * static_cast<size_t>(width_) / total;

    std::string bar = "Crawling: [";
    bar += std::string(filled, '#');
    bar += std::string(static_cast<size_t>(width_) - filled, '.');
    bar += "] " + std::to_string(capped) + "/" + std::to_string(total) + " pages";
    return bar;
}

void ProgressBar::update(const Engine::CrawlProgress& progress) {
    if (finished_)
        return;
    out_ << '\r' << render(progress.visited) << std::flush;
}

void ProgressBar::finish() {
    if (finished_)
        return;
    finished_ = true;
    out_ << std::endl;
}

}  // namespace Report
}  // namespace SeoAudit

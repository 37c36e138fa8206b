#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../analysis/page_issues.hpp"
#include "../engine/crawler/crawler.hpp"

namespace SeoAudit {
namespace Report {

enum class ReportFormat { Text, Csv, Markdown, Json, Xlsx };

std::optional<ReportFormat> parse_format(const std::string& name);
const char*                 extension(ReportFormat format);

class ReportWriter {
public:
    // Text formats only; throws std::invalid_argument for Xlsx.
    static std::string render(const std::vector<Analysis::PageIssueRecord>& records,
                              ReportFormat                                  format);

    // Writes a workbook with the CSV column layout to path.
    // Throws std::runtime_error when libxlsxwriter cannot create or close it.
    static void write_xlsx(const std::vector<Analysis::PageIssueRecord>& records,
                           const std::string&                            path);

    // Console summary shown after a crawl, including the empty and failed cases.
    static std::string render_console(const Engine::CrawlOutcome& outcome);

    // "audit-results.<ext>"
    static std::string filename(ReportFormat format);

private:
    static std::string to_text(const std::vector<Analysis::PageIssueRecord>& records);
    static std::string to_csv(const std::vector<Analysis::PageIssueRecord>& records);
    static std::string to_markdown(const std::vector<Analysis::PageIssueRecord>& records);
    static std::string to_json(const std::vector<Analysis::PageIssueRecord>& records);
};

std::string csv_escape(const std::string& field);

}  // namespace Report
}  // namespace SeoAudit

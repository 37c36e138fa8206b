#include "report_writer.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <xlsxwriter.h>
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace SeoAudit {
namespace Report {

using Analysis::ALL_CATEGORIES;
using Analysis::category_name;
using Analysis::PageIssueRecord;
using json = nlohmann::json;

std::optional<ReportFormat> parse_format(const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    if (lower == "txt" || lower == "text")
        return ReportFormat::Text;
    if (lower == "csv")
        return ReportFormat::Csv;
    if (lower == "md" || lower == "markdown")
        return ReportFormat::Markdown;
    if (lower == "json")
        return ReportFormat::Json;
    if (lower == "xlsx")
        return ReportFormat::Xlsx;
    return std::nullopt;
}

const char* extension(ReportFormat format) {
    switch (format) {
        case ReportFormat::Csv: return "csv";
        case ReportFormat::Markdown: return "md";
        case ReportFormat::Json: return "json";
        case ReportFormat::Xlsx: return "xlsx";
        default: return "txt";
    }
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"')
            escaped += '"';
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string ReportWriter::filename(ReportFormat format) {
    return std::string(Core::Constants::OUTPUT_FILE_STEM) + "." + extension(format);
}

std::string ReportWriter::render(const std::vector<PageIssueRecord>& records, ReportFormat format) {
    switch (format) {
        case ReportFormat::Csv: return to_csv(records);
        case ReportFormat::Markdown: return to_markdown(records);
        case ReportFormat::Json: return to_json(records);
        case ReportFormat::Xlsx:
            throw std::invalid_argument("xlsx reports are binary and written with write_xlsx");
        default: return to_text(records);
    }
}

std::string ReportWriter::to_text(const std::vector<PageIssueRecord>& records) {
    std::ostringstream out;
    for (const auto& record : records) {
        out << "URL: " << record.url << "\n";
        for (const auto& [category, issues] : record.issues) {
            out << category_name(category) << ":\n";
            for (const auto& issue : issues)
                out << "  - " << issue << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string ReportWriter::to_csv(const std::vector<PageIssueRecord>& records) {
    std::ostringstream out;
    out << "URL";
    for (auto category : ALL_CATEGORIES)
        out << "," << category_name(category);
    out << "\r\n";

    for (const auto& record : records) {
        out << csv_escape(record.url);
        for (auto category : ALL_CATEGORIES)
            out << "," << csv_escape(Utils::Text::join(record.get(category), "; "));
        out << "\r\n";
    }
    return out.str();
}

std::string ReportWriter::to_markdown(const std::vector<PageIssueRecord>& records) {
    std::ostringstream out;
    out << "# SEO Audit Results\n\n";
    for (const auto& record : records) {
        out << "## " << record.url << "\n\n";
        for (const auto& [category, issues] : record.issues) {
            out << "### " << category_name(category) << "\n";
            for (const auto& issue : issues)
                out << "- " << issue << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string ReportWriter::to_json(const std::vector<PageIssueRecord>& records) {
    json pages = json::array();
    for (const auto& record : records) {
        json issues = json::object();
        for (const auto& [category, list] : record.issues)
            issues[category_name(category)] = list;
        pages.push_back({{"url", record.url}, {"issues", issues}});
    }
    return pages.dump(2) + "\n";
}

namespace {

struct WorkbookCloser {
    void operator()(lxw_workbook* workbook) const noexcept { workbook_close(workbook); }
};

void check_cell(lxw_error err, const std::string& path) {
    if (err != LXW_NO_ERROR)
        throw std::runtime_error("Error writing " + path + ": " + lxw_strerror(err));
}

}  // namespace

void ReportWriter::write_xlsx(const std::vector<PageIssueRecord>& records, const std::string& path) {
    std::unique_ptr<lxw_workbook, WorkbookCloser> workbook(workbook_new(path.c_str()));
    if (!workbook)
        throw std::runtime_error("Cannot create workbook: " + path);

    lxw_worksheet* sheet = workbook_add_worksheet(workbook.get(), "SEO Audit");
    lxw_format*    bold  = workbook_add_format(workbook.get());
    if (!sheet || !bold)
        throw std::runtime_error("Cannot create worksheet in " + path);
    format_set_bold(bold);

    lxw_col_t col = 0;
    check_cell(worksheet_write_string(sheet, 0, col++, "URL", bold), path);
    for (auto category : ALL_CATEGORIES)
        check_cell(worksheet_write_string(sheet, 0, col++, category_name(category), bold), path);

    lxw_row_t row = 1;
    for (const auto& record : records) {
        col = 0;
        check_cell(worksheet_write_string(sheet, row, col++, record.url.c_str(), nullptr), path);
        for (auto category : ALL_CATEGORIES) {
            std::string cell = Utils::Text::join(record.get(category), "; ");
            check_cell(worksheet_write_string(sheet, row, col++, cell.c_str(), nullptr), path);
        }
        ++row;
    }

    worksheet_set_column(sheet, 0, 0, 50, nullptr);
    worksheet_set_column(sheet, 1, static_cast<lxw_col_t>(ALL_CATEGORIES.size()), 40, nullptr);

    lxw_error err = workbook_close(workbook.release());
    if (err != LXW_NO_ERROR)
        throw std::runtime_error("Error saving " + path + ": " + lxw_strerror(err));
}

std::string ReportWriter::render_console(const Engine::CrawlOutcome& outcome) {
    if (!outcome.ok())
        return "Crawling error: " + outcome.error + "\n";
    if (outcome.stats.pages_analyzed == 0)
        return "No pages could be analyzed.\n";
    if (outcome.records.empty())
        return "No SEO issues found across " + std::to_string(outcome.stats.pages_analyzed)
               + " pages.\n";

    return "\n--- SEO AUDIT RESULTS ---\n\n" + to_text(outcome.records);
}

}  // namespace Report
}  // namespace SeoAudit

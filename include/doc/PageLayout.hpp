#pragma once

#include <string>
#include <vector>

#include "chart/Geometry.hpp"
#include "report/Models.hpp"

// Paginated document description consumed by the PDF renderer. Each Page is a
// fixed-size sheet; blocks that do not fit flow onto continuation sheets.
namespace doc {

enum class PageBlockKind {
    Title,          // large centred text (cover)
    Heading,        // section title
    Subheading,     // group label inside a section
    Subtitle,       // muted line under a heading
    Paragraph,
    Meta,           // small muted line
    Chart,          // one chart, centred
    ChartRow,       // two or more charts side by side
    ScoreCards,
    Table,
    ProgressBar,
    Spacer
};

struct ScoreCard {
    std::string label;
    std::string value;
    std::string value_color;
    std::string note;              // delta line, may be empty
    std::string note_color;
};

struct PageTable {
    std::vector<std::string> columns;
    std::vector<double> widths;    // fractions of the content width
    std::vector<std::vector<std::string>> rows;
};

struct PageBlock {
    PageBlockKind kind = PageBlockKind::Paragraph;
    std::string text;
    std::string color;             // empty -> renderer default for the kind
    bool bold = false;
    bool centered = false;
    std::vector<chart::Chart> charts;
    std::vector<ScoreCard> cards;
    PageTable table;
    double fraction = 0.0;         // ProgressBar fill, 0..1
    double height = 0.0;           // Spacer
    bool keep_with_previous = false;
};

enum class PageStyle {
    Cover,
    Content,
    LeadCapture      // full-bleed brand colour, centred white text
};

struct Page {
    PageStyle style = PageStyle::Content;
    std::vector<PageBlock> blocks;
};

struct PagedReport {
    std::string title;
    report::Brand brand;
    std::string domain;
    std::string date_label;
    std::string footer;
    std::vector<Page> pages;
};

PageBlock title_block(const std::string& text, const std::string& color = "");
PageBlock heading_block(const std::string& text);
PageBlock subheading_block(const std::string& text, const std::string& color = "");
PageBlock subtitle_block(const std::string& text);
PageBlock paragraph_block(const std::string& text, bool bold = false);
PageBlock meta_block(const std::string& text, const std::string& color = "");
// Truncation line ("...and N more"), never separated from the list above it.
PageBlock more_block(const std::string& text);
PageBlock chart_block(chart::Chart c);
PageBlock chart_row_block(std::vector<chart::Chart> charts);
PageBlock table_block(PageTable t);
PageBlock progress_block(double fraction, const std::string& color);
PageBlock spacer_block(double height);

// Cover, scorecard, executive summary, top quick wins, trend, visibility,
// and the lead capture page for public reports.
PagedReport assemble_summary_pages(const report::ReportData& d);

// Every section backed by data, in reading order.
PagedReport assemble_detailed_pages(const report::ReportData& d);

}  // namespace doc

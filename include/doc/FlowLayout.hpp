#pragma once

#include <string>
#include <vector>

#include "report/Models.hpp"

// Flow document description consumed by the DOCX renderer: a linear run of
// paragraphs and tables, pagination left to the word processor.
namespace doc {

enum class FlowKind {
    Title,
    Heading1,
    Heading2,
    Paragraph,
    Bullet,
    Table,
    PageBreak
};

struct FlowRun {
    std::string text;
    bool bold = false;
    bool italic = false;
    std::string color;          // "#rrggbb", empty -> style default
    int half_points = 0;        // 0 -> style default
};

struct FlowTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

struct FlowBlock {
    FlowKind kind = FlowKind::Paragraph;
    std::vector<FlowRun> runs;
    FlowTable table;
    bool centered = false;
};

struct FlowReport {
    std::string title;
    report::Brand brand;
    std::string header_text;
    std::string footer_text;
    std::vector<FlowBlock> blocks;
};

FlowBlock flow_title(const std::string& text, const std::string& color = "");
FlowBlock flow_heading(const std::string& text, int level = 1);
FlowBlock flow_text(const std::string& text, bool bold = false, const std::string& color = "");
FlowBlock flow_muted(const std::string& text);
FlowBlock flow_bullet(const std::string& text);
FlowBlock flow_table(std::vector<std::string> header, std::vector<std::vector<std::string>> rows);
FlowBlock flow_page_break();

FlowReport assemble_summary_flow(const report::ReportData& d);

FlowReport assemble_detailed_flow(const report::ReportData& d);

}  // namespace doc

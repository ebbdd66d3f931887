#pragma once

#include <string>
#include <vector>

#include "report/Models.hpp"

// Text helpers shared by the paginated and flow templates. Anything both
// formats print goes through here so the wording cannot drift apart.
namespace doc {

// rounded integer, "82"
std::string score_text(double score);

// at most one decimal, trailing ".0" dropped: 6 -> "6", 2.5 -> "2.5"
std::string number_text(double v);

std::string percent_text(double v);

// green / blue / amber / orange / red by grade band
std::string score_color(double score);

std::string severity_color(report::Severity s);

std::string severity_label(report::Severity s);

std::string pillar_label(report::Pillar p);

std::string category_label(const std::string& category);

// "chatgpt" -> "Chatgpt"
std::string provider_label(const std::string& provider);

// "+3 vs last crawl", "-2.5 vs last crawl", "No change"
std::string delta_label(double delta);

std::string delta_color(double delta);

// "1 page", "3 pages"; plural defaults to singular + "s"
std::string count_label(long long n, const std::string& singular, const std::string& plural = "");

// "...and 4 more issues", "...and 1 more issue"
std::string more_label(size_t hidden, const std::string& singular, const std::string& plural = "");

std::string truncate_url(const std::string& url, size_t max);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

struct CategoryLine {
    std::string label;
    double score = 0.0;
    double delta = 0.0;
};

// Technical SEO, Content Quality, AI Readiness, Performance (0 when absent).
std::vector<CategoryLine> category_lines(const report::ReportData& d);

std::string report_title();

std::string document_title(const report::ReportData& d, report::TemplateType t);

// "12 pages analyzed | B Grade" with " | Detailed Analysis" for the long form
std::string cover_subtitle(const report::ReportData& d, report::TemplateType t);

// completion date of the crawl, else the generation date
std::string report_date(const report::ReportData& d);

std::string footer_text(const report::ReportData& d);

std::string quick_win_title(size_t index, const report::QuickWin& w);

// "+8 pts | 3 pages | Effort: low | +120 clicks/month"
std::string quick_win_meta(const report::QuickWin& w);

// "Owner: Engineering | Effort: low | Visibility: high"
std::string quick_win_tags(const report::QuickWin& w);

// "+8 pts | 3 pages affected | +120 clicks/month"
std::string quick_win_impact(const report::QuickWin& w);

// "CODE | Category"
std::string issue_heading(const report::Issue& i);

// "3 pages | -8 pts | Visibility: high | +120 clicks/month"
std::string issue_meta(const report::Issue& i);

std::string action_meta(const report::Issue& i);

std::string playbook_line(const std::string& docs_url);

std::string coverage_meta(const report::CoverageMetric& m);

std::string platform_detail(const report::PlatformVisibility& p);

std::string competitor_detail(const report::Competitor& c);

std::string competitor_queries(const report::Competitor& c);

std::string gap_query_line(const report::GapQuery& g);

std::string issues_found_line(const report::ReportData& d);

std::string action_plan_intro(const report::ReportData& d);

std::string lead_capture_heading();

std::string lead_capture_message(const report::Brand& b);

std::string lead_capture_cta(const report::Brand& b);

std::string powered_by();

}  // namespace doc

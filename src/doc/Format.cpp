#include "doc/Format.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "doc/Limits.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace doc {

using report::Severity;

std::string score_text(double score) {
    return textutil::format_int(score);
}

std::string number_text(double v) {
    std::string s = textutil::format_fixed(v, 1);
    if (s.size() > 2 && s.compare(s.size() - 2, 2, ".0") == 0) s.resize(s.size() - 2);
    return s;
}

std::string percent_text(double v) {
    return number_text(v) + "%";
}

std::string score_color(double score) {
    if (score >= 90.0) return "#16a34a";
    if (score >= 80.0) return "#2563eb";
    if (score >= 70.0) return "#ca8a04";
    if (score >= 60.0) return "#ea580c";
    return "#dc2626";
}

std::string severity_color(Severity s) {
    switch (s) {
        case Severity::Critical: return "#dc2626";
        case Severity::Warning: return "#ea580c";
        case Severity::Info: return "#2563eb";
    }
    return "#374151";
}

std::string severity_label(Severity s) {
    return textutil::capitalize(report::to_string(s));
}

std::string pillar_label(report::Pillar p) {
    switch (p) {
        case report::Pillar::Technical: return "Technical SEO";
        case report::Pillar::Content: return "Content";
        case report::Pillar::AiReadiness: return "AI Readiness";
    }
    return "";
}

std::string category_label(const std::string& category) {
    if (category == "technical") return "Technical";
    if (category == "content") return "Content";
    if (category == "ai_readiness") return "AI Readiness";
    if (category == "performance") return "Performance";
    return textutil::title_case_words(category);
}

std::string provider_label(const std::string& provider) {
    return textutil::capitalize(provider);
}

std::string delta_label(double delta) {
    if (delta > 0.0) return "+" + number_text(delta) + " vs last crawl";
    if (delta < 0.0) return number_text(delta) + " vs last crawl";
    return "No change";
}

std::string delta_color(double delta) {
    if (delta > 0.0) return "#16a34a";
    if (delta < 0.0) return "#dc2626";
    return "#6b7280";
}

std::string count_label(long long n, const std::string& singular, const std::string& plural) {
    const std::string many = plural.empty() ? singular + "s" : plural;
    return std::to_string(n) + " " + (n == 1 ? singular : many);
}

std::string more_label(size_t hidden, const std::string& singular, const std::string& plural) {
    const std::string many = plural.empty() ? singular + "s" : plural;
    return "...and " + std::to_string(hidden) + " more " + (hidden == 1 ? singular : many);
}

std::string truncate_url(const std::string& url, size_t max) {
    return textutil::truncate(url, max);
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<CategoryLine> category_lines(const report::ReportData& d) {
    return {
        {"Technical SEO", d.scores.technical, d.score_deltas.technical},
        {"Content Quality", d.scores.content, d.score_deltas.content},
        {"AI Readiness", d.scores.ai_readiness, d.score_deltas.ai_readiness},
        {"Performance", d.scores.performance.value_or(0.0), d.score_deltas.performance},
    };
}

std::string report_title() {
    return "AI-Readiness Report";
}

std::string document_title(const report::ReportData& d, report::TemplateType t) {
    if (t == report::TemplateType::Detailed) return "AI-Readiness Detailed Report - " + d.project.domain;
    return "AI-Readiness Report - " + d.project.domain;
}

std::string cover_subtitle(const report::ReportData& d, report::TemplateType t) {
    std::string s = count_label(d.crawl.pages_scored, "page") + " analyzed | " + d.scores.letter_grade + " Grade";
    if (t == report::TemplateType::Detailed) s += " | Detailed Analysis";
    return s;
}

std::string report_date(const report::ReportData& d) {
    std::string label = report::long_date_label(d.crawl.completed_at);
    if (label.empty()) label = report::long_date_label(d.generated_at);
    return label;
}

std::string footer_text(const report::ReportData& d) {
    const report::Brand b = report::resolve_brand(d);
    std::string s = "Generated by " + b.name;
    const std::string date = report::long_date_label(d.generated_at);
    if (!date.empty()) s += " on " + date;
    return s;
}

std::string quick_win_title(size_t index, const report::QuickWin& w) {
    return std::to_string(index) + ". " + w.message;
}

std::string quick_win_meta(const report::QuickWin& w) {
    std::string s = "+" + number_text(w.score_impact) + " pts | " + count_label(w.affected_pages, "page") +
                    " | Effort: " + report::to_string(w.effort);
    if (w.roi.traffic_estimate) s += " | " + *w.roi.traffic_estimate;
    return s;
}

std::string quick_win_tags(const report::QuickWin& w) {
    return "Owner: " + w.owner + " | Effort: " + report::to_string(w.effort) +
           " | Visibility: " + report::to_string(w.roi.visibility_impact);
}

std::string quick_win_impact(const report::QuickWin& w) {
    std::string s = "+" + number_text(w.score_impact) + " pts | " + count_label(w.affected_pages, "page") +
                    " affected";
    if (w.roi.traffic_estimate) s += " | " + *w.roi.traffic_estimate;
    return s;
}

std::string issue_heading(const report::Issue& i) {
    return i.code + " | " + category_label(i.category);
}

std::string issue_meta(const report::Issue& i) {
    std::string s = count_label(i.affected_pages, "page") + " | -" + number_text(i.score_impact) + " pts";
    if (i.roi) {
        s += " | Visibility: " + std::string(report::to_string(i.roi->visibility_impact));
        if (i.roi->traffic_estimate) s += " | " + *i.roi->traffic_estimate;
    }
    return s;
}

std::string action_meta(const report::Issue& i) {
    std::string s = count_label(i.affected_pages, "page") + " | -" + number_text(i.score_impact) + " pts impact";
    if (i.roi) {
        s += " | Visibility: " + std::string(report::to_string(i.roi->visibility_impact));
        if (i.roi->traffic_estimate) s += " | " + *i.roi->traffic_estimate;
    }
    s += " | Owner: " + i.owner + " (" + report::to_string(i.effort) + " effort)";
    s += " | Pillar: " + pillar_label(i.pillar);
    return s;
}

std::string playbook_line(const std::string& docs_url) {
    return "Playbook: " + docs_url;
}

std::string coverage_meta(const report::CoverageMetric& m) {
    return "Pillar: " + pillar_label(m.pillar) + " | Compliant pages: " +
           std::to_string(m.total_pages - m.affected_pages) + "/" + std::to_string(m.total_pages);
}

std::string platform_detail(const report::PlatformVisibility& p) {
    std::string s = "Mentions: " + percent_text(p.brand_mention_rate) +
                    " | Citations: " + percent_text(p.url_citation_rate);
    if (p.avg_position) s += " | Avg Position: " + textutil::format_fixed(*p.avg_position, 1);
    s += " | " + count_label(p.checks_count, "check");
    return s;
}

std::string competitor_detail(const report::Competitor& c) {
    return count_label(c.mention_count, "mention") + " across " + join(c.platforms, ", ");
}

std::string competitor_queries(const report::Competitor& c) {
    if (c.queries.empty()) return "";
    std::vector<std::string> shown(c.queries.begin(),
                                   c.queries.begin() + static_cast<std::ptrdiff_t>(std::min(c.queries.size(), kCompetitorQueries)));
    return "Top queries: " + join(shown, ", ");
}

std::string gap_query_line(const report::GapQuery& g) {
    return g.query + " (" + provider_label(g.platform) + "): " + join(g.competitors_cited, ", ");
}

std::string issues_found_line(const report::ReportData& d) {
    return count_label(d.issues.total, "issue") + " found across " + count_label(d.crawl.pages_scored, "page");
}

std::string action_plan_intro(const report::ReportData& d) {
    return "Based on the " + count_label(d.issues.total, "issue") +
           " identified, here is a tiered action plan organized by priority and impact.";
}

std::string lead_capture_heading() {
    return "Ready to optimize for AI Search?";
}

std::string lead_capture_message(const report::Brand& b) {
    if (!b.is_default) return "Contact " + b.name + " to implement these expert AI SEO optimizations.";
    return "Scan your site free and start your journey to AI visibility.";
}

std::string lead_capture_cta(const report::Brand& b) {
    return b.is_default ? "llmboost.io" : "Contact Agency";
}

std::string powered_by() {
    return std::string("Powered by ") + report::kDefaultBrandName;
}

}  // namespace doc

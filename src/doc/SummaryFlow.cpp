#include "doc/FlowLayout.hpp"

#include <algorithm>

#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "report/Timestamps.hpp"

namespace doc {

using report::ReportData;
using report::TemplateType;

static FlowBlock centered(FlowBlock b) {
    b.centered = true;
    return b;
}

FlowReport assemble_summary_flow(const ReportData& d) {
    FlowReport out;
    out.brand = report::resolve_brand(d);
    out.title = document_title(d, TemplateType::Summary);
    out.header_text = out.brand.name + " | " + d.project.domain;
    out.footer_text = footer_text(d);
    auto& b = out.blocks;

    b.push_back(flow_title(report_title(), out.brand.color));
    b.push_back(centered(flow_text(d.project.domain, true)));
    b.push_back(centered(flow_text("Overall Score: " + score_text(d.scores.overall) + " | Grade " + d.scores.letter_grade,
                                   true, score_color(d.scores.overall))));
    b.push_back(centered(flow_muted(cover_subtitle(d, TemplateType::Summary))));
    if (!d.config.prepared_for.empty()) b.push_back(centered(flow_text("Prepared for " + d.config.prepared_for)));
    const std::string date = report_date(d);
    if (!date.empty()) b.push_back(centered(flow_muted(date)));
    b.push_back(flow_page_break());

    b.push_back(flow_heading("Category Scorecard"));
    std::vector<std::vector<std::string>> score_rows;
    score_rows.push_back({"Overall Score", score_text(d.scores.overall)});
    for (const auto& line : category_lines(d)) score_rows.push_back({line.label, score_text(line.score)});
    b.push_back(flow_table({"Category", "Score"}, std::move(score_rows)));

    if (d.crawl.summary && !d.crawl.summary->empty()) {
        b.push_back(flow_heading("Executive Summary"));
        b.push_back(flow_text(*d.crawl.summary));
    }

    b.push_back(flow_heading("Top Quick Wins"));
    if (d.quick_wins.empty()) {
        b.push_back(flow_text("No critical or warning issues were found in this crawl."));
    } else {
        const size_t shown = std::min(d.quick_wins.size(), kSummaryQuickWins);
        for (size_t i = 0; i < shown; ++i) {
            const auto& w = d.quick_wins[i];
            b.push_back(flow_text(quick_win_title(i + 1, w), true));
            b.push_back(flow_text(w.recommendation));
            b.push_back(flow_muted(quick_win_meta(w)));
        }
        if (d.quick_wins.size() > shown) b.push_back(flow_muted(more_label(d.quick_wins.size() - shown, "quick win")));
    }

    if (d.history.size() > 1) {
        b.push_back(flow_heading("Score Trend"));
        std::vector<std::vector<std::string>> rows;
        for (const auto& h : d.history) rows.push_back({report::short_date_label(h.completed_at), score_text(h.overall)});
        b.push_back(flow_table({"Date", "Overall Score"}, std::move(rows)));
    }

    if (d.visibility) {
        b.push_back(flow_heading("AI Visibility Snapshot"));
        std::vector<std::vector<std::string>> rows;
        for (const auto& p : d.visibility->platforms) {
            rows.push_back({provider_label(p.provider), percent_text(p.brand_mention_rate)});
        }
        b.push_back(flow_table({"Platform", "Brand Mention Rate"}, std::move(rows)));
    }

    if (d.config.is_public) {
        b.push_back(flow_page_break());
        b.push_back(flow_title(lead_capture_heading(), out.brand.color));
        b.push_back(centered(flow_text(lead_capture_message(out.brand))));
        b.push_back(centered(flow_text(lead_capture_cta(out.brand), true, out.brand.color)));
        b.push_back(centered(flow_muted(powered_by())));
    }

    return out;
}

}  // namespace doc

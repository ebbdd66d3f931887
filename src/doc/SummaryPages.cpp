#include "doc/PageLayout.hpp"

#include <algorithm>

#include "chart/BarChart.hpp"
#include "chart/LineChart.hpp"
#include "chart/PieChart.hpp"
#include "chart/RadarChart.hpp"
#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "report/Timestamps.hpp"

namespace doc {

using report::ReportData;
using report::TemplateType;

static PageBlock centered(PageBlock b) {
    b.centered = true;
    return b;
}

static Page cover_page(const ReportData& d, const report::Brand& brand) {
    Page p;
    p.style = PageStyle::Cover;
    p.blocks.push_back(spacer_block(60.0));
    p.blocks.push_back(chart_block(
        chart::layout_score_gauge(d.scores.overall, "Grade " + d.scores.letter_grade, 180.0, brand.color)));
    p.blocks.push_back(spacer_block(24.0));
    p.blocks.push_back(title_block(report_title()));
    p.blocks.push_back(centered(subheading_block(d.project.domain, brand.color)));
    p.blocks.push_back(centered(meta_block(cover_subtitle(d, TemplateType::Summary))));
    if (!d.config.prepared_for.empty()) {
        p.blocks.push_back(centered(paragraph_block("Prepared for " + d.config.prepared_for)));
    }
    const std::string date = report_date(d);
    if (!date.empty()) p.blocks.push_back(centered(meta_block(date)));
    return p;
}

static void add_scorecard(Page& p, const ReportData& d, const report::Brand& brand) {
    p.blocks.push_back(heading_block("Category Scorecard"));

    chart::RadarScores rs;
    rs.technical = d.scores.technical;
    rs.content = d.scores.content;
    rs.ai_readiness = d.scores.ai_readiness;
    rs.performance = d.scores.performance.value_or(0.0);
    p.blocks.push_back(chart_block(chart::layout_radar_chart(rs, 180.0, brand.color)));

    PageBlock cards;
    cards.kind = PageBlockKind::ScoreCards;
    cards.cards.push_back({"Overall Score", score_text(d.scores.overall), score_color(d.scores.overall), "", ""});
    for (const auto& line : category_lines(d)) {
        cards.cards.push_back({line.label, score_text(line.score), score_color(line.score), "", ""});
    }
    p.blocks.push_back(std::move(cards));
}

static void add_quick_wins(Page& p, const ReportData& d) {
    p.blocks.push_back(heading_block("Top Quick Wins"));

    if (d.quick_wins.empty()) {
        p.blocks.push_back(paragraph_block("No critical or warning issues were found in this crawl."));
        return;
    }

    const size_t shown = std::min(d.quick_wins.size(), kSummaryQuickWins);
    for (size_t i = 0; i < shown; ++i) {
        const auto& w = d.quick_wins[i];
        p.blocks.push_back(paragraph_block(quick_win_title(i + 1, w), true));
        p.blocks.push_back(paragraph_block(w.recommendation));
        p.blocks.push_back(meta_block(quick_win_meta(w)));
    }
    if (d.quick_wins.size() > shown) {
        p.blocks.push_back(more_block(more_label(d.quick_wins.size() - shown, "quick win")));
    }
}

static chart::Chart overall_trend(const ReportData& d, const std::string& color) {
    chart::Series s;
    s.name = "Overall";
    s.color = color;
    for (const auto& h : d.history) {
        s.data.push_back({report::short_date_label(h.completed_at), h.overall});
    }
    chart::LineChartOptions opt;
    opt.width = 500.0;
    opt.height = 200.0;
    return chart::layout_line_chart({s}, opt);
}

// Plotted points as text, so the scores can be read without the chart.
static PageTable trend_values(const ReportData& d) {
    PageTable t;
    t.columns = {"Date", "Overall Score"};
    t.widths = {0.5, 0.5};
    for (const auto& h : d.history) t.rows.push_back({report::short_date_label(h.completed_at), score_text(h.overall)});
    return t;
}

static chart::Chart mention_bars(const report::Visibility& v, const std::string& color) {
    std::vector<chart::BarDatum> bars;
    for (const auto& p : v.platforms) {
        bars.push_back({provider_label(p.provider), p.brand_mention_rate, color});
    }
    chart::BarChartOptions opt;
    opt.width = 450.0;
    opt.height = 140.0;
    opt.title = "Brand Mention Rate (%)";
    opt.max_value = 100.0;
    opt.value_suffix = "%";
    return chart::layout_bar_chart(bars, opt);
}

static Page lead_capture_page(const report::Brand& brand) {
    Page p;
    p.style = PageStyle::LeadCapture;
    p.blocks.push_back(spacer_block(260.0));
    p.blocks.push_back(title_block(lead_capture_heading(), "#ffffff"));
    p.blocks.push_back(centered(meta_block(lead_capture_message(brand), "#ffffff")));
    p.blocks.push_back(spacer_block(24.0));
    p.blocks.push_back(centered(subheading_block(lead_capture_cta(brand), "#ffffff")));
    p.blocks.push_back(spacer_block(240.0));
    p.blocks.push_back(centered(meta_block(powered_by(), "#ffffff")));
    return p;
}

PagedReport assemble_summary_pages(const ReportData& d) {
    PagedReport out;
    out.brand = report::resolve_brand(d);
    out.title = document_title(d, TemplateType::Summary);
    out.domain = d.project.domain;
    out.date_label = report_date(d);
    out.footer = footer_text(d);

    out.pages.push_back(cover_page(d, out.brand));

    Page scores;
    add_scorecard(scores, d, out.brand);
    if (d.crawl.summary && !d.crawl.summary->empty()) {
        scores.blocks.push_back(heading_block("Executive Summary"));
        scores.blocks.push_back(paragraph_block(*d.crawl.summary));
    }
    add_quick_wins(scores, d);
    out.pages.push_back(std::move(scores));

    const bool trend = d.history.size() > 1;
    if (trend || d.visibility) {
        Page p;
        if (trend) {
            p.blocks.push_back(heading_block("Score Trend"));
            p.blocks.push_back(chart_block(overall_trend(d, out.brand.color)));
            p.blocks.push_back(table_block(trend_values(d)));
        }
        if (d.visibility) {
            p.blocks.push_back(heading_block("AI Visibility Snapshot"));
            p.blocks.push_back(chart_block(mention_bars(*d.visibility, out.brand.color)));
        }
        out.pages.push_back(std::move(p));
    }

    if (d.config.is_public) out.pages.push_back(lead_capture_page(out.brand));

    return out;
}

}  // namespace doc

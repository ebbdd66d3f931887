#include "doc/PageLayout.hpp"

#include <algorithm>
#include <utility>

#include "chart/BarChart.hpp"
#include "chart/LineChart.hpp"
#include "chart/PieChart.hpp"
#include "chart/RadarChart.hpp"
#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace doc {

using report::ReportData;
using report::Severity;
using report::TemplateType;

static PageBlock centered(PageBlock b) {
    b.centered = true;
    return b;
}

static void section(Page& p, const std::string& title, const std::string& subtitle = "") {
    p.blocks.push_back(heading_block(title));
    if (!subtitle.empty()) p.blocks.push_back(subtitle_block(subtitle));
}

static Page cover(const ReportData& d, const report::Brand& brand) {
    Page p;
    p.style = PageStyle::Cover;
    p.blocks.push_back(spacer_block(60.0));
    p.blocks.push_back(chart_block(
        chart::layout_score_gauge(d.scores.overall, "Grade " + d.scores.letter_grade, 180.0, brand.color)));
    p.blocks.push_back(spacer_block(24.0));
    p.blocks.push_back(title_block(report_title()));
    p.blocks.push_back(centered(subheading_block(d.project.domain, brand.color)));
    p.blocks.push_back(centered(meta_block(cover_subtitle(d, TemplateType::Detailed))));
    if (!d.config.prepared_for.empty()) {
        p.blocks.push_back(centered(paragraph_block("Prepared for " + d.config.prepared_for)));
    }
    const std::string date = report_date(d);
    if (!date.empty()) p.blocks.push_back(centered(meta_block(date)));
    return p;
}

static void scorecard_with_deltas(Page& p, const ReportData& d, const report::Brand& brand) {
    section(p, "Category Scorecard");

    chart::RadarScores rs;
    rs.technical = d.scores.technical;
    rs.content = d.scores.content;
    rs.ai_readiness = d.scores.ai_readiness;
    rs.performance = d.scores.performance.value_or(0.0);
    p.blocks.push_back(chart_block(chart::layout_radar_chart(rs, 180.0, brand.color)));

    PageBlock cards;
    cards.kind = PageBlockKind::ScoreCards;
    cards.cards.push_back({"Overall Score", score_text(d.scores.overall), score_color(d.scores.overall),
                           delta_label(d.score_deltas.overall), delta_color(d.score_deltas.overall)});
    for (const auto& line : category_lines(d)) {
        cards.cards.push_back({line.label, score_text(line.score), score_color(line.score),
                               delta_label(line.delta), delta_color(line.delta)});
    }
    p.blocks.push_back(std::move(cards));
}

static void issues_overview(Page& p, const ReportData& d, const report::Brand& brand) {
    if (d.issues.total == 0) return;
    section(p, "Issues Overview", issues_found_line(d));

    std::vector<chart::PieSlice> slices;
    for (const auto& s : d.issues.by_severity) {
        slices.push_back({severity_label(s.severity), static_cast<double>(s.count), severity_color(s.severity)});
    }
    chart::PieChartOptions pie;
    pie.size = 120.0;
    pie.legend_width = 110.0;

    std::vector<chart::BarDatum> bars;
    for (const auto& c : d.issues.by_category) {
        bars.push_back({category_label(c.category), static_cast<double>(c.count), brand.color});
    }
    chart::BarChartOptions bar;
    bar.width = 270.0;
    bar.height = 160.0;
    bar.title = "By Category";

    p.blocks.push_back(chart_row_block({chart::layout_pie_chart(slices, pie), chart::layout_bar_chart(bars, bar)}));
}

static void quick_wins_by_pillar(Page& p, const ReportData& d) {
    section(p, "Quick Wins", "Top recommendations sorted by impact-to-effort ratio");

    if (d.quick_wins.empty()) {
        p.blocks.push_back(paragraph_block("All priority issues are resolved. Keep monitoring future crawls."));
        return;
    }

    for (auto pillar : {report::Pillar::Technical, report::Pillar::Content, report::Pillar::AiReadiness}) {
        std::vector<const report::QuickWin*> wins;
        for (const auto& w : d.quick_wins) {
            if (w.pillar == pillar) wins.push_back(&w);
        }
        if (wins.empty()) continue;

        p.blocks.push_back(subheading_block(pillar_label(pillar)));
        const size_t shown = std::min(wins.size(), kQuickWinsPerPillar);
        for (size_t i = 0; i < shown; ++i) {
            const auto& w = *wins[i];
            p.blocks.push_back(paragraph_block(w.message, true));
            p.blocks.push_back(paragraph_block(w.recommendation));
            p.blocks.push_back(meta_block(quick_win_tags(w)));
            p.blocks.push_back(meta_block(quick_win_impact(w)));
            if (!w.docs_url.empty()) p.blocks.push_back(meta_block(playbook_line(w.docs_url)));
        }
        if (wins.size() > shown) p.blocks.push_back(more_block(more_label(wins.size() - shown, "quick win")));
    }
}

static void readiness_coverage(Page& p, const ReportData& d, const report::Brand& brand) {
    if (d.readiness_coverage.empty()) return;
    section(p, "Readiness Coverage", "Share of pages meeting core technical and AI-readiness controls");

    const size_t shown = std::min(d.readiness_coverage.size(), kCoverageHighlights);
    for (size_t i = 0; i < shown; ++i) {
        const auto& m = d.readiness_coverage[i];
        p.blocks.push_back(paragraph_block(m.label + ": " + std::to_string(m.coverage_percent) + "%", true));
        p.blocks.push_back(meta_block(m.description));
        p.blocks.push_back(meta_block(coverage_meta(m)));
        PageBlock bar = progress_block(m.coverage_percent / 100.0, brand.color);
        bar.keep_with_previous = true;
        p.blocks.push_back(std::move(bar));
    }
    if (d.readiness_coverage.size() > shown) {
        p.blocks.push_back(more_block(more_label(d.readiness_coverage.size() - shown, "control")));
    }
}

static Page trends(const ReportData& d, const report::Brand& brand) {
    std::vector<std::string> labels;
    for (const auto& h : d.history) labels.push_back(report::short_date_label(h.completed_at));

    auto series = [&](const std::string& name, const std::string& color, auto value) {
        chart::Series s;
        s.name = name;
        s.color = color;
        for (size_t i = 0; i < d.history.size(); ++i) s.data.push_back({labels[i], value(d.history[i])});
        return s;
    };

    Page p;
    section(p, "Score Trend", "Overall score progression across crawls");
    chart::LineChartOptions overall;
    overall.width = 500.0;
    overall.height = 200.0;
    p.blocks.push_back(chart_block(chart::layout_line_chart(
        {series("Overall", brand.color, [](const report::HistoryPoint& h) { return h.overall; })}, overall)));

    PageTable overall_values;
    overall_values.columns = {"Date", "Overall Score"};
    overall_values.widths = {0.5, 0.5};
    for (size_t i = 0; i < d.history.size(); ++i) {
        overall_values.rows.push_back({labels[i], score_text(d.history[i].overall)});
    }
    p.blocks.push_back(table_block(std::move(overall_values)));

    section(p, "Category Trends");
    chart::LineChartOptions cats;
    cats.width = 500.0;
    cats.height = 220.0;
    p.blocks.push_back(chart_block(chart::layout_line_chart(
        {series("Technical", "#2563eb", [](const report::HistoryPoint& h) { return h.technical; }),
         series("Content", "#16a34a", [](const report::HistoryPoint& h) { return h.content; }),
         series("AI Readiness", "#9333ea", [](const report::HistoryPoint& h) { return h.ai_readiness; }),
         series("Performance", "#ea580c",
                [](const report::HistoryPoint& h) { return h.performance.value_or(0.0); })},
        cats)));

    PageTable cat_values;
    cat_values.columns = {"Date", "Technical", "Content", "AI Readiness", "Performance"};
    cat_values.widths = {0.2, 0.2, 0.2, 0.2, 0.2};
    for (size_t i = 0; i < d.history.size(); ++i) {
        const auto& h = d.history[i];
        cat_values.rows.push_back({labels[i], score_text(h.technical), score_text(h.content),
                                   score_text(h.ai_readiness), score_text(h.performance.value_or(0.0))});
    }
    p.blocks.push_back(table_block(std::move(cat_values)));
    return p;
}

static Page visibility(const report::Visibility& v, const report::Brand& brand) {
    Page p;
    section(p, "AI Visibility Snapshot", "How your brand appears across AI platforms");

    std::vector<chart::BarDatum> bars;
    for (const auto& pl : v.platforms) bars.push_back({provider_label(pl.provider), pl.brand_mention_rate, brand.color});
    chart::BarChartOptions opt;
    opt.width = 450.0;
    opt.height = 140.0;
    opt.title = "Brand Mention Rate (%)";
    opt.max_value = 100.0;
    opt.value_suffix = "%";
    p.blocks.push_back(chart_block(chart::layout_bar_chart(bars, opt)));

    section(p, "Platform Details");
    for (const auto& pl : v.platforms) {
        p.blocks.push_back(paragraph_block(provider_label(pl.provider), true));
        p.blocks.push_back(meta_block(platform_detail(pl)));
    }
    return p;
}

static Page issue_catalog(const ReportData& d) {
    Page p;
    section(p, "Issue Catalog", issues_found_line(d));

    if (d.issues.items.empty()) {
        p.blocks.push_back(paragraph_block("No issues were found in this crawl."));
        return p;
    }
    p.blocks.push_back(paragraph_block(
        "Issues are grouped by severity level. Each issue includes a recommendation and estimated impact."));

    for (Severity sev : {Severity::Critical, Severity::Warning, Severity::Info}) {
        std::vector<const report::Issue*> group;
        for (const auto& i : d.issues.items) {
            if (i.severity == sev) group.push_back(&i);
        }
        if (group.empty()) continue;

        p.blocks.push_back(subheading_block(severity_label(sev) + " (" + std::to_string(group.size()) + ")",
                                            severity_color(sev)));
        const size_t shown = std::min(group.size(), kIssuesPerSeverity);
        for (size_t k = 0; k < shown; ++k) {
            const auto& is = *group[k];
            p.blocks.push_back(meta_block(issue_heading(is)));
            p.blocks.push_back(paragraph_block(is.message, true));
            if (!is.recommendation.empty()) p.blocks.push_back(paragraph_block(is.recommendation));
            p.blocks.push_back(meta_block(issue_meta(is)));
        }
        if (group.size() > shown) {
            p.blocks.push_back(more_block(more_label(group.size() - shown, std::string(report::to_string(sev)) + " issue")));
        }
    }
    return p;
}

static Page worst_pages(const ReportData& d) {
    Page p;
    section(p, "Lowest Scoring Pages", "Pages that need the most attention");

    PageTable t;
    t.columns = {"URL", "Score", "Grade", "Issues"};
    t.widths = {0.61, 0.13, 0.13, 0.13};
    const size_t shown = std::min(d.pages.size(), kWorstPages);
    for (size_t i = 0; i < shown; ++i) {
        const auto& pg = d.pages[i];
        t.rows.push_back({truncate_url(pg.url, kUrlChars), score_text(pg.overall), pg.grade,
                          std::to_string(pg.issue_count)});
    }
    p.blocks.push_back(table_block(std::move(t)));
    if (d.pages.size() > shown) p.blocks.push_back(more_block(more_label(d.pages.size() - shown, "page")));
    return p;
}

static PageTable content_health_table(const report::ContentHealth& h) {
    PageTable t;
    t.columns = {"Metric", "Value"};
    t.widths = {0.7, 0.3};
    t.rows.push_back({"Average Word Count", score_text(h.avg_word_count)});
    auto opt_row = [&](const char* label, const std::optional<double>& v) {
        if (v) t.rows.push_back({label, textutil::format_fixed(*v, 1)});
    };
    opt_row("Clarity Score", h.avg_clarity);
    opt_row("Authority Score", h.avg_authority);
    opt_row("Comprehensiveness", h.avg_comprehensiveness);
    opt_row("Structure Score", h.avg_structure);
    opt_row("Citation Worthiness", h.avg_citation_worthiness);
    t.rows.push_back({"Pages Above Threshold",
                      std::to_string(h.pages_above_threshold) + " / " + std::to_string(h.total_pages)});
    return t;
}

static Page grades_and_health(const ReportData& d, const report::Brand& brand) {
    Page p;
    if (!d.grade_distribution.empty()) {
        section(p, "Grade Distribution", "Distribution of page grades across your site");
        std::vector<chart::BarDatum> bars;
        for (const auto& g : d.grade_distribution) {
            bars.push_back({g.grade + " (" + std::to_string(g.count) + ")", static_cast<double>(g.percentage),
                            brand.color});
        }
        chart::BarChartOptions opt;
        opt.width = 450.0;
        opt.height = 160.0;
        opt.title = "Pages by Grade (%)";
        opt.max_value = 100.0;
        opt.value_suffix = "%";
        p.blocks.push_back(chart_block(chart::layout_bar_chart(bars, opt)));
    }
    if (d.content_health) {
        section(p, "Content Health Metrics", "Aggregate content quality signals");
        p.blocks.push_back(table_block(content_health_table(*d.content_health)));
    }
    return p;
}

static Page competitors(const ReportData& d) {
    Page p;
    if (d.competitors && !d.competitors->empty()) {
        const auto& list = *d.competitors;
        section(p, "Competitor Analysis", "Domains that appear alongside your brand in AI responses");
        const size_t shown = std::min(list.size(), kCompetitors);
        for (size_t i = 0; i < shown; ++i) {
            p.blocks.push_back(paragraph_block(list[i].domain, true));
            p.blocks.push_back(meta_block(competitor_detail(list[i])));
            const std::string q = competitor_queries(list[i]);
            if (!q.empty()) p.blocks.push_back(meta_block(q));
        }
        if (list.size() > shown) p.blocks.push_back(more_block(more_label(list.size() - shown, "competitor")));
    }
    if (d.gap_queries && !d.gap_queries->empty()) {
        const auto& gaps = *d.gap_queries;
        section(p, "Competitor Gap Queries", "Queries where competitors are cited but your brand is not");
        const size_t shown = std::min(gaps.size(), kGapQueries);
        for (size_t i = 0; i < shown; ++i) p.blocks.push_back(paragraph_block(gap_query_line(gaps[i])));
        if (gaps.size() > shown) p.blocks.push_back(more_block(more_label(gaps.size() - shown, "query", "queries")));
    }
    return p;
}

static Page action_plan(const ReportData& d) {
    Page p;
    section(p, "Action Plan", "Prioritized roadmap for improving your AI readiness score");
    p.blocks.push_back(paragraph_block(action_plan_intro(d)));

    for (const auto& tier : d.action_plan) {
        p.blocks.push_back(subheading_block(tier.title));
        p.blocks.push_back(meta_block(tier.description));
        const size_t shown = std::min(tier.items.size(), kActionItemsPerTier);
        for (size_t i = 0; i < shown; ++i) {
            const auto& it = tier.items[i];
            p.blocks.push_back(paragraph_block(it.message, true));
            if (!it.recommendation.empty()) p.blocks.push_back(paragraph_block(it.recommendation));
            p.blocks.push_back(meta_block(action_meta(it)));
            if (!it.docs_url.empty()) p.blocks.push_back(meta_block(playbook_line(it.docs_url)));
        }
        if (tier.items.size() > shown) p.blocks.push_back(more_block(more_label(tier.items.size() - shown, "item")));
    }
    return p;
}

static Page integrations(const report::IntegrationData& in) {
    Page p;

    if (in.gsc) {
        section(p, "Google Search Console Data", "Top search queries driving traffic to your site");
        PageTable t;
        t.columns = {"Query", "Impressions", "Clicks", "Position"};
        t.widths = {0.46, 0.18, 0.18, 0.18};
        const auto& rows = in.gsc->top_queries;
        const size_t shown = std::min(rows.size(), kSearchQueries);
        for (size_t i = 0; i < shown; ++i) {
            t.rows.push_back({truncate_url(rows[i].query, kQueryChars), textutil::format_thousands(rows[i].impressions),
                              textutil::format_thousands(rows[i].clicks), textutil::format_fixed(rows[i].position, 1)});
        }
        p.blocks.push_back(table_block(std::move(t)));
        if (rows.size() > shown) p.blocks.push_back(more_block(more_label(rows.size() - shown, "query", "queries")));
    }

    if (in.ga4) {
        section(p, "Google Analytics Data");
        PageTable m;
        m.columns = {"Metric", "Value"};
        m.widths = {0.7, 0.3};
        m.rows.push_back({"Bounce Rate", textutil::format_fixed(in.ga4->bounce_rate * 100.0, 1) + "%"});
        m.rows.push_back({"Avg Engagement Time", textutil::format_fixed(in.ga4->avg_engagement, 0) + "s"});
        p.blocks.push_back(table_block(std::move(m)));

        const auto& pages = in.ga4->top_pages;
        if (!pages.empty()) {
            p.blocks.push_back(subheading_block("Top Pages by Sessions"));
            PageTable t;
            t.columns = {"URL", "Sessions"};
            t.widths = {0.75, 0.25};
            const size_t shown = std::min(pages.size(), kAnalyticsPages);
            for (size_t i = 0; i < shown; ++i) {
                t.rows.push_back({truncate_url(pages[i].url, kSessionUrlChars),
                                  textutil::format_thousands(pages[i].sessions)});
            }
            p.blocks.push_back(table_block(std::move(t)));
            if (pages.size() > shown) p.blocks.push_back(more_block(more_label(pages.size() - shown, "page")));
        }
    }

    if (in.clarity) {
        section(p, "Microsoft Clarity Data");
        PageTable m;
        m.columns = {"Metric", "Value"};
        m.widths = {0.7, 0.3};
        m.rows.push_back({"Average UX Score", textutil::format_fixed(in.clarity->avg_ux_score, 1)});
        p.blocks.push_back(table_block(std::move(m)));

        const auto& rage = in.clarity->rage_click_pages;
        p.blocks.push_back(subheading_block("Rage Click Pages"));
        if (rage.empty()) {
            p.blocks.push_back(paragraph_block("No rage clicks detected."));
        } else {
            const size_t shown = std::min(rage.size(), kRageClickPages);
            for (size_t i = 0; i < shown; ++i) p.blocks.push_back(paragraph_block(truncate_url(rage[i], kSessionUrlChars)));
            if (rage.size() > shown) p.blocks.push_back(more_block(more_label(rage.size() - shown, "page")));
        }
    }
    return p;
}

PagedReport assemble_detailed_pages(const ReportData& d) {
    PagedReport out;
    out.brand = report::resolve_brand(d);
    out.title = document_title(d, TemplateType::Detailed);
    out.domain = d.project.domain;
    out.date_label = report_date(d);
    out.footer = footer_text(d);

    out.pages.push_back(cover(d, out.brand));

    Page overview;
    scorecard_with_deltas(overview, d, out.brand);
    if (d.crawl.summary && !d.crawl.summary->empty()) {
        section(overview, "Executive Summary");
        overview.blocks.push_back(paragraph_block(*d.crawl.summary));
    }
    issues_overview(overview, d, out.brand);
    out.pages.push_back(std::move(overview));

    Page wins;
    quick_wins_by_pillar(wins, d);
    readiness_coverage(wins, d, out.brand);
    out.pages.push_back(std::move(wins));

    if (d.history.size() > 1) out.pages.push_back(trends(d, out.brand));
    if (d.visibility) out.pages.push_back(visibility(*d.visibility, out.brand));

    out.pages.push_back(issue_catalog(d));

    if (!d.pages.empty()) out.pages.push_back(worst_pages(d));
    if (!d.grade_distribution.empty() || d.content_health) out.pages.push_back(grades_and_health(d, out.brand));

    const bool has_competitors = d.competitors && !d.competitors->empty();
    const bool has_gaps = d.gap_queries && !d.gap_queries->empty();
    if (has_competitors || has_gaps) out.pages.push_back(competitors(d));

    if (!d.action_plan.empty()) out.pages.push_back(action_plan(d));
    if (d.integrations) out.pages.push_back(integrations(*d.integrations));

    return out;
}

}  // namespace doc

#include "doc/FlowLayout.hpp"

#include <algorithm>

#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace doc {

using report::ReportData;
using report::Severity;
using report::TemplateType;

using Rows = std::vector<std::vector<std::string>>;

static FlowBlock centered(FlowBlock b) {
    b.centered = true;
    return b;
}

static void cover(std::vector<FlowBlock>& b, const ReportData& d, const report::Brand& brand) {
    b.push_back(flow_title(report_title(), brand.color));
    b.push_back(centered(flow_text(d.project.domain, true)));
    b.push_back(centered(flow_text("Overall Score: " + score_text(d.scores.overall) + " | Grade " + d.scores.letter_grade,
                                   true, score_color(d.scores.overall))));
    b.push_back(centered(flow_muted(cover_subtitle(d, TemplateType::Detailed))));
    if (!d.config.prepared_for.empty()) b.push_back(centered(flow_text("Prepared for " + d.config.prepared_for)));
    const std::string date = report_date(d);
    if (!date.empty()) b.push_back(centered(flow_muted(date)));
    b.push_back(flow_page_break());
}

static void scorecard(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Category Scorecard"));
    Rows rows;
    rows.push_back({"Overall Score", score_text(d.scores.overall), delta_label(d.score_deltas.overall)});
    for (const auto& line : category_lines(d)) {
        rows.push_back({line.label, score_text(line.score), delta_label(line.delta)});
    }
    b.push_back(flow_table({"Category", "Score", "Change"}, std::move(rows)));
}

static void issues_overview(std::vector<FlowBlock>& b, const ReportData& d) {
    if (d.issues.total == 0) return;
    b.push_back(flow_heading("Issues Overview"));
    b.push_back(flow_muted(issues_found_line(d)));

    Rows sev;
    for (const auto& s : d.issues.by_severity) sev.push_back({severity_label(s.severity), std::to_string(s.count)});
    b.push_back(flow_table({"Severity", "Issues"}, std::move(sev)));

    Rows cat;
    for (const auto& c : d.issues.by_category) cat.push_back({category_label(c.category), std::to_string(c.count)});
    b.push_back(flow_table({"Category", "Issues"}, std::move(cat)));
}

static void quick_wins(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Quick Wins"));
    b.push_back(flow_muted("Top recommendations sorted by impact-to-effort ratio"));

    if (d.quick_wins.empty()) {
        b.push_back(flow_text("All priority issues are resolved. Keep monitoring future crawls."));
        return;
    }

    for (auto pillar : {report::Pillar::Technical, report::Pillar::Content, report::Pillar::AiReadiness}) {
        std::vector<const report::QuickWin*> wins;
        for (const auto& w : d.quick_wins) {
            if (w.pillar == pillar) wins.push_back(&w);
        }
        if (wins.empty()) continue;

        b.push_back(flow_heading(pillar_label(pillar), 2));
        const size_t shown = std::min(wins.size(), kQuickWinsPerPillar);
        for (size_t i = 0; i < shown; ++i) {
            const auto& w = *wins[i];
            b.push_back(flow_text(w.message, true));
            b.push_back(flow_text(w.recommendation));
            b.push_back(flow_muted(quick_win_tags(w)));
            b.push_back(flow_muted(quick_win_impact(w)));
            if (!w.docs_url.empty()) b.push_back(flow_muted(playbook_line(w.docs_url)));
        }
        if (wins.size() > shown) b.push_back(flow_muted(more_label(wins.size() - shown, "quick win")));
    }
}

static void coverage(std::vector<FlowBlock>& b, const ReportData& d) {
    if (d.readiness_coverage.empty()) return;
    b.push_back(flow_heading("Readiness Coverage"));
    b.push_back(flow_muted("Share of pages meeting core technical and AI-readiness controls"));

    const size_t shown = std::min(d.readiness_coverage.size(), kCoverageHighlights);
    for (size_t i = 0; i < shown; ++i) {
        const auto& m = d.readiness_coverage[i];
        b.push_back(flow_text(m.label + ": " + std::to_string(m.coverage_percent) + "%", true));
        b.push_back(flow_muted(m.description));
        b.push_back(flow_muted(coverage_meta(m)));
    }
    if (d.readiness_coverage.size() > shown) {
        b.push_back(flow_muted(more_label(d.readiness_coverage.size() - shown, "control")));
    }
}

static void trends(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Score Trend"));
    b.push_back(flow_muted("Overall score progression across crawls"));
    Rows overall;
    for (const auto& h : d.history) overall.push_back({report::short_date_label(h.completed_at), score_text(h.overall)});
    b.push_back(flow_table({"Date", "Overall Score"}, std::move(overall)));

    b.push_back(flow_heading("Category Trends"));
    Rows cats;
    for (const auto& h : d.history) {
        cats.push_back({report::short_date_label(h.completed_at), score_text(h.technical), score_text(h.content),
                        score_text(h.ai_readiness), score_text(h.performance.value_or(0.0))});
    }
    b.push_back(flow_table({"Date", "Technical", "Content", "AI Readiness", "Performance"}, std::move(cats)));
}

static void visibility(std::vector<FlowBlock>& b, const report::Visibility& v) {
    b.push_back(flow_heading("AI Visibility Snapshot"));
    b.push_back(flow_muted("How your brand appears across AI platforms"));
    Rows rows;
    for (const auto& p : v.platforms) rows.push_back({provider_label(p.provider), percent_text(p.brand_mention_rate)});
    b.push_back(flow_table({"Platform", "Brand Mention Rate"}, std::move(rows)));

    b.push_back(flow_heading("Platform Details"));
    for (const auto& p : v.platforms) {
        b.push_back(flow_text(provider_label(p.provider), true));
        b.push_back(flow_muted(platform_detail(p)));
    }
}

static void issue_catalog(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Issue Catalog"));
    b.push_back(flow_muted(issues_found_line(d)));

    if (d.issues.items.empty()) {
        b.push_back(flow_text("No issues were found in this crawl."));
        return;
    }
    b.push_back(flow_text("Issues are grouped by severity level. Each issue includes a recommendation and estimated impact."));

    for (Severity sev : {Severity::Critical, Severity::Warning, Severity::Info}) {
        std::vector<const report::Issue*> group;
        for (const auto& i : d.issues.items) {
            if (i.severity == sev) group.push_back(&i);
        }
        if (group.empty()) continue;

        FlowBlock h = flow_heading(severity_label(sev) + " (" + std::to_string(group.size()) + ")", 2);
        h.runs.front().color = severity_color(sev);
        b.push_back(std::move(h));

        const size_t shown = std::min(group.size(), kIssuesPerSeverity);
        for (size_t k = 0; k < shown; ++k) {
            const auto& is = *group[k];
            b.push_back(flow_muted(issue_heading(is)));
            b.push_back(flow_text(is.message, true));
            if (!is.recommendation.empty()) b.push_back(flow_text(is.recommendation));
            b.push_back(flow_muted(issue_meta(is)));
        }
        if (group.size() > shown) {
            b.push_back(flow_muted(more_label(group.size() - shown, std::string(report::to_string(sev)) + " issue")));
        }
    }
}

static void worst_pages(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Lowest Scoring Pages"));
    b.push_back(flow_muted("Pages that need the most attention"));
    Rows rows;
    const size_t shown = std::min(d.pages.size(), kWorstPages);
    for (size_t i = 0; i < shown; ++i) {
        const auto& pg = d.pages[i];
        rows.push_back({truncate_url(pg.url, kUrlChars), score_text(pg.overall), pg.grade, std::to_string(pg.issue_count)});
    }
    b.push_back(flow_table({"URL", "Score", "Grade", "Issues"}, std::move(rows)));
    if (d.pages.size() > shown) b.push_back(flow_muted(more_label(d.pages.size() - shown, "page")));
}

static void grades_and_health(std::vector<FlowBlock>& b, const ReportData& d) {
    if (!d.grade_distribution.empty()) {
        b.push_back(flow_heading("Grade Distribution"));
        b.push_back(flow_muted("Distribution of page grades across your site"));
        Rows rows;
        for (const auto& g : d.grade_distribution) {
            rows.push_back({g.grade + " (" + std::to_string(g.count) + ")", std::to_string(g.percentage) + "%"});
        }
        b.push_back(flow_table({"Grade", "Share of Pages"}, std::move(rows)));
    }

    if (d.content_health) {
        const auto& h = *d.content_health;
        b.push_back(flow_heading("Content Health Metrics"));
        b.push_back(flow_muted("Aggregate content quality signals"));
        Rows rows;
        rows.push_back({"Average Word Count", score_text(h.avg_word_count)});
        auto opt_row = [&](const char* label, const std::optional<double>& v) {
            if (v) rows.push_back({label, textutil::format_fixed(*v, 1)});
        };
        opt_row("Clarity Score", h.avg_clarity);
        opt_row("Authority Score", h.avg_authority);
        opt_row("Comprehensiveness", h.avg_comprehensiveness);
        opt_row("Structure Score", h.avg_structure);
        opt_row("Citation Worthiness", h.avg_citation_worthiness);
        rows.push_back({"Pages Above Threshold",
                        std::to_string(h.pages_above_threshold) + " / " + std::to_string(h.total_pages)});
        b.push_back(flow_table({"Metric", "Value"}, std::move(rows)));
    }
}

static void competitors(std::vector<FlowBlock>& b, const ReportData& d) {
    if (d.competitors && !d.competitors->empty()) {
        const auto& list = *d.competitors;
        b.push_back(flow_heading("Competitor Analysis"));
        b.push_back(flow_muted("Domains that appear alongside your brand in AI responses"));
        const size_t shown = std::min(list.size(), kCompetitors);
        for (size_t i = 0; i < shown; ++i) {
            b.push_back(flow_text(list[i].domain, true));
            b.push_back(flow_muted(competitor_detail(list[i])));
            const std::string q = competitor_queries(list[i]);
            if (!q.empty()) b.push_back(flow_muted(q));
        }
        if (list.size() > shown) b.push_back(flow_muted(more_label(list.size() - shown, "competitor")));
    }

    if (d.gap_queries && !d.gap_queries->empty()) {
        const auto& gaps = *d.gap_queries;
        b.push_back(flow_heading("Competitor Gap Queries"));
        b.push_back(flow_muted("Queries where competitors are cited but your brand is not"));
        const size_t shown = std::min(gaps.size(), kGapQueries);
        for (size_t i = 0; i < shown; ++i) b.push_back(flow_bullet(gap_query_line(gaps[i])));
        if (gaps.size() > shown) b.push_back(flow_muted(more_label(gaps.size() - shown, "query", "queries")));
    }
}

static void action_plan(std::vector<FlowBlock>& b, const ReportData& d) {
    b.push_back(flow_heading("Action Plan"));
    b.push_back(flow_muted("Prioritized roadmap for improving your AI readiness score"));
    b.push_back(flow_text(action_plan_intro(d)));

    for (const auto& tier : d.action_plan) {
        b.push_back(flow_heading(tier.title, 2));
        b.push_back(flow_muted(tier.description));
        const size_t shown = std::min(tier.items.size(), kActionItemsPerTier);
        for (size_t i = 0; i < shown; ++i) {
            const auto& it = tier.items[i];
            b.push_back(flow_bullet(it.message));
            if (!it.recommendation.empty()) b.push_back(flow_text(it.recommendation));
            b.push_back(flow_muted(action_meta(it)));
            if (!it.docs_url.empty()) b.push_back(flow_muted(playbook_line(it.docs_url)));
        }
        if (tier.items.size() > shown) b.push_back(flow_muted(more_label(tier.items.size() - shown, "item")));
    }
}

static void integrations(std::vector<FlowBlock>& b, const report::IntegrationData& in) {
    if (in.gsc) {
        b.push_back(flow_heading("Google Search Console Data"));
        b.push_back(flow_muted("Top search queries driving traffic to your site"));
        const auto& q = in.gsc->top_queries;
        const size_t shown = std::min(q.size(), kSearchQueries);
        Rows rows;
        for (size_t i = 0; i < shown; ++i) {
            rows.push_back({truncate_url(q[i].query, kQueryChars), textutil::format_thousands(q[i].impressions),
                            textutil::format_thousands(q[i].clicks), textutil::format_fixed(q[i].position, 1)});
        }
        b.push_back(flow_table({"Query", "Impressions", "Clicks", "Position"}, std::move(rows)));
        if (q.size() > shown) b.push_back(flow_muted(more_label(q.size() - shown, "query", "queries")));
    }

    if (in.ga4) {
        b.push_back(flow_heading("Google Analytics Data"));
        b.push_back(flow_table({"Metric", "Value"},
                               {{"Bounce Rate", textutil::format_fixed(in.ga4->bounce_rate * 100.0, 1) + "%"},
                                {"Avg Engagement Time", textutil::format_fixed(in.ga4->avg_engagement, 0) + "s"}}));
        const auto& pages = in.ga4->top_pages;
        if (!pages.empty()) {
            b.push_back(flow_heading("Top Pages by Sessions", 2));
            const size_t shown = std::min(pages.size(), kAnalyticsPages);
            Rows rows;
            for (size_t i = 0; i < shown; ++i) {
                rows.push_back({truncate_url(pages[i].url, kSessionUrlChars), textutil::format_thousands(pages[i].sessions)});
            }
            b.push_back(flow_table({"URL", "Sessions"}, std::move(rows)));
            if (pages.size() > shown) b.push_back(flow_muted(more_label(pages.size() - shown, "page")));
        }
    }

    if (in.clarity) {
        b.push_back(flow_heading("Microsoft Clarity Data"));
        b.push_back(flow_table({"Metric", "Value"},
                               {{"Average UX Score", textutil::format_fixed(in.clarity->avg_ux_score, 1)}}));
        const auto& rage = in.clarity->rage_click_pages;
        b.push_back(flow_heading("Rage Click Pages", 2));
        if (rage.empty()) {
            b.push_back(flow_text("No rage clicks detected."));
        } else {
            const size_t shown = std::min(rage.size(), kRageClickPages);
            for (size_t i = 0; i < shown; ++i) b.push_back(flow_bullet(truncate_url(rage[i], kSessionUrlChars)));
            if (rage.size() > shown) b.push_back(flow_muted(more_label(rage.size() - shown, "page")));
        }
    }
}

FlowReport assemble_detailed_flow(const ReportData& d) {
    FlowReport out;
    out.brand = report::resolve_brand(d);
    out.title = document_title(d, TemplateType::Detailed);
    out.header_text = out.brand.name + " | " + d.project.domain;
    out.footer_text = footer_text(d);
    auto& b = out.blocks;

    cover(b, d, out.brand);
    scorecard(b, d);
    if (d.crawl.summary && !d.crawl.summary->empty()) {
        b.push_back(flow_heading("Executive Summary"));
        b.push_back(flow_text(*d.crawl.summary));
    }
    issues_overview(b, d);
    quick_wins(b, d);
    coverage(b, d);

    if (d.history.size() > 1) trends(b, d);
    if (d.visibility) visibility(b, *d.visibility);

    issue_catalog(b, d);

    if (!d.pages.empty()) worst_pages(b, d);
    grades_and_health(b, d);
    competitors(b, d);

    if (!d.action_plan.empty()) action_plan(b, d);
    if (d.integrations) integrations(b, *d.integrations);

    return out;
}

}  // namespace doc

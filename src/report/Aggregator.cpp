#include "report/Aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "enrich/Integrations.hpp"
#include "report/ActionPlan.hpp"
#include "report/TextUtil.hpp"
#include "report/Timestamps.hpp"

namespace report {

static int severity_rank(Severity s) {
    switch (s) {
        case Severity::Critical: return 0;
        case Severity::Warning: return 1;
        case Severity::Info: return 2;
    }
    return 3;
}

static void require_non_negative(const std::optional<int>& v, const std::string& what) {
    if (v && *v < 0) {
        throw std::invalid_argument("ReportAggregator: " + what + " must not be negative (got " +
                                    std::to_string(*v) + ")");
    }
}

// A collaborator-backed section that throws is dropped, not fatal.
template <typename Fn>
static auto optional_section(const char* name, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        std::cerr << "ReportAggregator: " << name << " unavailable: " << e.what() << "\n";
        return std::nullopt;
    }
}

Pillar pillar_for_category(const std::string& category) {
    const std::string k = textutil::to_lower_copy(category);
    if (k == "content") return Pillar::Content;
    if (k == "ai_readiness" || k == "ai-readiness") return Pillar::AiReadiness;
    return Pillar::Technical;
}

std::string default_owner(Pillar p) {
    switch (p) {
        case Pillar::Technical: return "Engineering";
        case Pillar::Content: return "Content";
        case Pillar::AiReadiness: return "SEO";
    }
    return "Engineering";
}

Effort default_effort(Severity s) {
    switch (s) {
        case Severity::Critical: return Effort::Low;
        case Severity::Warning: return Effort::Medium;
        case Severity::Info: return Effort::High;
    }
    return Effort::Medium;
}

static Issue issue_from_raw(const RawIssue& r) {
    const auto sev = parse_severity(r.severity);
    if (!sev) {
        throw std::invalid_argument("ReportAggregator: issue " + r.code + " has unknown severity '" +
                                    r.severity + "'");
    }

    Issue is;
    is.code = r.code;
    is.category = r.category;
    is.severity = *sev;
    is.message = r.message;
    is.recommendation = r.recommendation.value_or("");
    is.score_impact = r.score_impact ? std::fabs(*r.score_impact) : score_deduction(*sev);

    std::optional<Pillar> pillar;
    if (r.pillar) pillar = parse_pillar(*r.pillar);
    is.pillar = pillar.value_or(pillar_for_category(r.category));

    is.owner = (r.owner && !r.owner->empty()) ? *r.owner : default_owner(is.pillar);

    std::optional<Effort> effort;
    if (r.effort) effort = parse_effort(*r.effort);
    is.effort = effort.value_or(default_effort(*sev));

    is.docs_url = r.docs_url.value_or("");
    return is;
}

std::vector<Issue> dedupe_issues(const std::vector<RawIssue>& raw) {
    std::vector<Issue> items;
    std::unordered_map<std::string, size_t> index;

    for (const auto& r : raw) {
        if (r.code.empty()) {
            throw std::invalid_argument("ReportAggregator: issue row without code");
        }
        auto it = index.find(r.code);
        if (it != index.end()) {
            items[it->second].affected_pages += 1;
            continue;
        }
        Issue is = issue_from_raw(r);
        is.affected_pages = 1;
        index.emplace(r.code, items.size());
        items.push_back(std::move(is));
    }

    std::sort(items.begin(), items.end(), [](const Issue& a, const Issue& b) {
        const int ra = severity_rank(a.severity), rb = severity_rank(b.severity);
        if (ra != rb) return ra < rb;
        if (a.affected_pages != b.affected_pages) return a.affected_pages > b.affected_pages;
        return a.code < b.code;
    });
    return items;
}

IssueSummary summarize_issues(std::vector<Issue> items) {
    IssueSummary s;
    s.total = static_cast<int>(items.size());

    for (Severity sev : {Severity::Critical, Severity::Warning, Severity::Info}) {
        const auto n = std::count_if(items.begin(), items.end(),
                                     [sev](const Issue& i) { return i.severity == sev; });
        if (n > 0) s.by_severity.push_back({sev, static_cast<int>(n)});
    }

    for (const auto& i : items) {
        auto it = std::find_if(s.by_category.begin(), s.by_category.end(),
                               [&](const CategoryCount& c) { return c.category == i.category; });
        if (it == s.by_category.end()) {
            s.by_category.push_back({i.category, 1});
        } else {
            it->count += 1;
        }
    }

    s.items = std::move(items);
    return s;
}

std::vector<HistoryPoint> completed_history(const std::vector<RawHistoryCrawl>& raw) {
    struct Entry {
        std::int64_t t;
        HistoryPoint p;
    };
    std::vector<Entry> entries;

    for (const auto& h : raw) {
        require_non_negative(h.pages_scored, "history " + h.id + " pages_scored");
        if (textutil::to_lower_copy(h.status) != "completed") continue;

        const auto t = parse_iso8601(h.completed_at);
        if (!t) {
            std::cerr << "ReportAggregator: skipping history crawl " << h.id
                      << " with unreadable completion time '" << h.completed_at << "'\n";
            continue;
        }

        HistoryPoint p;
        p.crawl_id = h.id;
        p.completed_at = h.completed_at;
        p.overall = h.overall;
        p.technical = h.technical;
        p.content = h.content;
        p.ai_readiness = h.ai_readiness;
        p.performance = h.performance;
        p.pages_scored = h.pages_scored.value_or(0);
        entries.push_back({*t, std::move(p)});
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const Entry& a, const Entry& b) { return a.t < b.t; });

    std::vector<HistoryPoint> out;
    out.reserve(entries.size());
    for (auto& e : entries) out.push_back(std::move(e.p));
    return out;
}

ScoreDeltas compute_score_deltas(const Scores& current,
                                 const std::vector<HistoryPoint>& history,
                                 const std::string& current_crawl_id,
                                 const std::string& current_completed_at) {
    std::optional<std::int64_t> current_t = parse_iso8601(current_completed_at);
    if (!current_t) {
        for (const auto& h : history) {
            if (h.crawl_id == current_crawl_id) current_t = parse_iso8601(h.completed_at);
        }
    }

    const HistoryPoint* prior = nullptr;
    std::int64_t prior_t = 0;

    for (const auto& h : history) {
        if (h.crawl_id == current_crawl_id) continue;
        const auto t = parse_iso8601(h.completed_at);
        if (!t) continue;
        if (current_t && *t >= *current_t) continue;
        if (!prior || *t > prior_t) {
            prior = &h;
            prior_t = *t;
        }
    }

    ScoreDeltas d;
    if (!prior) return d;

    d.overall = round_to(current.overall - prior->overall, 1);
    d.technical = round_to(current.technical - prior->technical, 1);
    d.content = round_to(current.content - prior->content, 1);
    d.ai_readiness = round_to(current.ai_readiness - prior->ai_readiness, 1);
    if (current.performance && prior->performance) {
        d.performance = round_to(*current.performance - *prior->performance, 1);
    }
    return d;
}

std::optional<Visibility> summarize_visibility(const std::vector<enrich::VisibilityCheck>& checks) {
    if (checks.empty()) return std::nullopt;

    struct Acc {
        int mentions = 0;
        int citations = 0;
        int count = 0;
        std::vector<std::optional<double>> positions;
    };

    std::vector<std::string> order;
    std::unordered_map<std::string, Acc> by_provider;

    for (const auto& c : checks) {
        auto it = by_provider.find(c.provider);
        if (it == by_provider.end()) {
            order.push_back(c.provider);
            it = by_provider.emplace(c.provider, Acc{}).first;
        }
        Acc& a = it->second;
        a.count += 1;
        if (c.brand_mentioned.value_or(false)) a.mentions += 1;
        if (c.url_cited.value_or(false)) a.citations += 1;
        if (c.citation_position) a.positions.push_back(c.citation_position);
    }

    Visibility v;
    for (const auto& provider : order) {
        const Acc& a = by_provider.at(provider);
        PlatformVisibility p;
        p.provider = provider;
        p.checks_count = a.count;
        p.brand_mention_rate = std::round(100.0 * a.mentions / a.count);
        p.url_citation_rate = std::round(100.0 * a.citations / a.count);
        if (!a.positions.empty()) p.avg_position = std::round(average_present(a.positions));
        v.platforms.push_back(std::move(p));
    }
    return v;
}

std::optional<ContentHealth> summarize_content_health(const std::vector<RawPageScore>& pages) {
    if (pages.empty()) return std::nullopt;

    ContentHealth h;
    h.total_pages = static_cast<int>(pages.size());

    std::vector<std::optional<double>> words;
    std::vector<std::optional<double>> clarity, authority, comprehensiveness, structure, citation;

    for (const auto& p : pages) {
        const int wc = p.word_count.value_or(0);
        words.push_back(static_cast<double>(wc));
        if (wc >= kContentWordThreshold) h.pages_above_threshold += 1;

        if (p.llm_scores) {
            clarity.push_back(p.llm_scores->clarity);
            authority.push_back(p.llm_scores->authority);
            comprehensiveness.push_back(p.llm_scores->comprehensiveness);
            structure.push_back(p.llm_scores->structure);
            citation.push_back(p.llm_scores->citation_worthiness);
        }
    }

    h.avg_word_count = std::round(average_present(words));

    auto avg_or_null = [](const std::vector<std::optional<double>>& v) -> std::optional<double> {
        const bool any = std::any_of(v.begin(), v.end(), [](const std::optional<double>& x) { return x.has_value(); });
        if (!any) return std::nullopt;
        return average_present(v);
    };
    h.avg_clarity = avg_or_null(clarity);
    h.avg_authority = avg_or_null(authority);
    h.avg_comprehensiveness = avg_or_null(comprehensiveness);
    h.avg_structure = avg_or_null(structure);
    h.avg_citation_worthiness = avg_or_null(citation);

    return h;
}

std::vector<GradeBucket> grade_distribution(const std::vector<PageScore>& pages) {
    std::vector<GradeBucket> out;
    if (pages.empty()) return out;

    for (const char* g : {"A", "B", "C", "D", "F"}) {
        const auto n = std::count_if(pages.begin(), pages.end(),
                                     [g](const PageScore& p) { return p.grade == g; });
        GradeBucket b;
        b.grade = g;
        b.count = static_cast<int>(n);
        b.percentage = static_cast<int>(std::lround(100.0 * static_cast<double>(n) / pages.size()));
        out.push_back(b);
    }
    return out;
}

static std::optional<double> page_performance(const RawPageScore& p) {
    if (!p.lighthouse_perf && !p.lighthouse_seo) return std::nullopt;
    const double perf = p.lighthouse_perf.value_or(0.0);
    const double seo = p.lighthouse_seo.value_or(0.0);
    return std::round((perf + seo) / 2.0 * 100.0);
}

static std::vector<PageScore> build_pages(const std::vector<RawPageScore>& raw) {
    std::vector<PageScore> out;
    out.reserve(raw.size());

    for (const auto& r : raw) {
        require_non_negative(r.issue_count, "page " + r.url + " issue_count");
        PageScore p;
        p.url = r.url;
        p.title = r.title.value_or("");
        p.overall = r.overall;
        p.technical = r.technical.value_or(0.0);
        p.content = r.content.value_or(0.0);
        p.ai_readiness = r.ai_readiness.value_or(0.0);
        p.performance = page_performance(r);
        p.grade = letter_grade(r.overall);
        p.issue_count = r.issue_count.value_or(0);
        out.push_back(std::move(p));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const PageScore& a, const PageScore& b) { return a.overall < b.overall; });
    return out;
}

static Scores build_scores(const std::vector<RawPageScore>& pages, const CategoryWeights& w) {
    std::vector<std::optional<double>> tech, content, ai, perf;
    for (const auto& p : pages) {
        tech.push_back(p.technical);
        content.push_back(p.content);
        ai.push_back(p.ai_readiness);
        perf.push_back(page_performance(p));
    }

    Scores s;
    s.technical = average_present(tech);
    s.content = average_present(content);
    s.ai_readiness = average_present(ai);
    if (std::any_of(perf.begin(), perf.end(), [](const std::optional<double>& v) { return v.has_value(); })) {
        s.performance = average_present(perf);
    }
    s.overall = weighted_overall(s.technical, s.content, s.ai_readiness, s.performance, w);
    s.letter_grade = letter_grade(s.overall);
    return s;
}

static std::vector<QuickWin> promote_quick_wins(std::vector<Issue>& items,
                                                int total_pages,
                                                std::optional<double> impressions,
                                                const RoiConstants& k) {
    std::vector<QuickWin> wins;

    for (auto& is : items) {
        if (wins.size() >= kMaxQuickWins) break;
        if (is.severity != Severity::Critical && is.severity != Severity::Warning) continue;

        RoiInput in;
        in.severity = is.severity;
        in.score_deduction = is.score_impact;
        in.affected_pages = is.affected_pages;
        in.total_pages = total_pages;
        in.impressions = impressions;
        is.roi = estimate_issue_roi(in, k);

        QuickWin w;
        w.code = is.code;
        w.message = is.message;
        w.recommendation = is.recommendation;
        w.effort = is.effort;
        w.affected_pages = is.affected_pages;
        w.score_impact = is.score_impact;
        w.roi = *is.roi;
        w.pillar = is.pillar;
        w.owner = is.owner;
        w.docs_url = is.docs_url;
        wins.push_back(std::move(w));
    }
    return wins;
}

ReportData aggregate(const RawInputs& raw, const AggregateOptions& opt) {
    require_non_negative(raw.crawl.pages_found, "crawl.pages_found");
    require_non_negative(raw.crawl.pages_crawled, "crawl.pages_crawled");
    require_non_negative(raw.crawl.pages_scored, "crawl.pages_scored");

    ReportData d;

    d.project.name = raw.project.name;
    d.project.domain = raw.project.domain;
    d.project.branding = raw.project.branding;

    d.crawl.id = raw.crawl.id;
    d.crawl.completed_at = raw.crawl.completed_at;
    d.crawl.pages_found = raw.crawl.pages_found.value_or(0);
    d.crawl.pages_crawled = raw.crawl.pages_crawled.value_or(0);
    d.crawl.pages_scored = raw.crawl.pages_scored.value_or(0);
    d.crawl.summary = raw.crawl.summary;

    d.scores = build_scores(raw.pages, opt.weights);
    d.pages = build_pages(raw.pages);
    d.grade_distribution = grade_distribution(d.pages);

    const int total_pages = static_cast<int>(raw.pages.size());
    std::vector<Issue> items = dedupe_issues(raw.issues);
    d.quick_wins = promote_quick_wins(items, total_pages, raw.gsc_impressions, opt.roi);
    d.readiness_coverage = build_readiness_coverage(items, total_pages);
    d.action_plan = build_action_plan(items);
    d.issues = summarize_issues(std::move(items));

    d.history = completed_history(raw.history);
    d.score_deltas = compute_score_deltas(d.scores, d.history, d.crawl.id, d.crawl.completed_at);

    if (raw.visibility_checks) {
        const auto& checks = *raw.visibility_checks;
        d.visibility = optional_section("visibility", [&] { return summarize_visibility(checks); });

        const auto analysis = optional_section("competitors", [&] { return enrich::aggregate_competitors(checks); });
        if (analysis) {
            d.competitors = analysis->competitors;
            d.gap_queries = analysis->gap_queries;
        }
    } else {
        std::cerr << "ReportAggregator: no visibility checks for crawl " << raw.crawl.id
                  << ", visibility and competitors omitted\n";
    }

    d.content_health = optional_section("content health", [&] { return summarize_content_health(raw.pages); });

    if (raw.enrichments) {
        d.integrations = optional_section("integrations", [&] { return enrich::aggregate_integrations(*raw.enrichments); });
    }

    d.config = opt.config;
    d.generated_at = opt.generated_at.empty() ? current_utc_iso8601() : opt.generated_at;
    return d;
}

}  // namespace report

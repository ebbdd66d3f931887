#include <catch2/catch.hpp>

#include <numeric>

#include "io/JsonIO.hpp"
#include "report/ActionPlan.hpp"
#include "report/Aggregator.hpp"
#include "support/Fixtures.hpp"

using namespace report;

static int severity_sum(const IssueSummary& s) {
    return std::accumulate(s.by_severity.begin(), s.by_severity.end(), 0,
                           [](int acc, const SeverityCount& c) { return acc + c.count; });
}

static int category_sum(const IssueSummary& s) {
    return std::accumulate(s.by_category.begin(), s.by_category.end(), 0,
                           [](int acc, const CategoryCount& c) { return acc + c.count; });
}

TEST_CASE("Aggregator: issue summary", "[aggregator][issues]") {
    const ReportData d = fixtures::make_report_data();

    SECTION("duplicates collapse by code with affected page counts") {
        REQUIRE(d.issues.total == 4);
        REQUIRE(d.issues.items.size() == 4);
        CHECK(d.issues.items[0].code == "MISSING_TITLE");
        CHECK(d.issues.items[0].affected_pages == 3);
        CHECK(d.issues.items[1].code == "THIN_CONTENT");
        CHECK(d.issues.items[1].affected_pages == 2);
        CHECK(d.issues.items[2].code == "MISSING_LLMS_TXT");
        CHECK(d.issues.items[3].code == "MISSING_ALT_TEXT");
    }
    SECTION("group counts sum to the total") {
        CHECK(severity_sum(d.issues) == d.issues.total);
        CHECK(category_sum(d.issues) == d.issues.total);
        REQUIRE(d.issues.by_severity.size() == 3);
        CHECK(d.issues.by_severity[1].severity == Severity::Warning);
        CHECK(d.issues.by_severity[1].count == 2);
    }
    SECTION("defaults come from severity and category") {
        const Issue& title = d.issues.items[0];
        CHECK(title.score_impact == 8.0);
        CHECK(title.pillar == Pillar::Technical);
        CHECK(title.owner == "Engineering");
        CHECK(title.effort == Effort::Low);

        const Issue& llms = d.issues.items[2];
        CHECK(llms.score_impact == 2.5);
        CHECK(llms.pillar == Pillar::AiReadiness);
        CHECK(llms.owner == "SEO");
        CHECK(llms.docs_url == "https://docs.acme.example/llms-txt");
    }
    SECTION("unknown severity is rejected") {
        RawIssue bad;
        bad.code = "X";
        bad.severity = "fatal";
        CHECK_THROWS_AS(dedupe_issues({bad}), std::invalid_argument);
    }
}

TEST_CASE("Aggregator: scores", "[aggregator][scores]") {
    const ReportData d = fixtures::make_report_data();

    CHECK(d.scores.technical == Approx(70.0));
    CHECK(d.scores.content == Approx(70.0));
    CHECK(d.scores.ai_readiness == Approx(70.0));
    REQUIRE(d.scores.performance);
    CHECK(*d.scores.performance == Approx(77.5));
    CHECK(d.scores.overall == Approx(71.9));
    CHECK(d.scores.letter_grade == "C");

    SECTION("missing performance still yields an overall score") {
        auto raw = fixtures::make_raw_inputs();
        for (auto& p : raw.pages) {
            p.lighthouse_perf.reset();
            p.lighthouse_seo.reset();
        }
        const ReportData no_perf = aggregate(raw, fixtures::make_options());
        CHECK_FALSE(no_perf.scores.performance);
        CHECK(no_perf.scores.overall == Approx(70.0));
    }
}

TEST_CASE("Aggregator: pages and grade distribution", "[aggregator][pages]") {
    const ReportData d = fixtures::make_report_data();

    REQUIRE(d.pages.size() == 4);
    CHECK(d.pages.front().url == "https://acme.example/pricing");
    CHECK(d.pages.front().grade == "F");
    CHECK(d.pages.back().grade == "A");
    REQUIRE(d.pages.front().performance);
    CHECK(*d.pages.front().performance == Approx(60.0));

    REQUIRE(d.grade_distribution.size() == 5);
    CHECK(d.grade_distribution[0].grade == "A");
    CHECK(d.grade_distribution[0].percentage == 25);
    CHECK(d.grade_distribution[2].grade == "C");
    CHECK(d.grade_distribution[2].count == 0);

    SECTION("no pages means no distribution") {
        CHECK(grade_distribution({}).empty());
    }
}

TEST_CASE("Aggregator: history and deltas", "[aggregator][history]") {
    const ReportData d = fixtures::make_report_data();

    SECTION("only completed crawls, oldest first") {
        REQUIRE(d.history.size() == 3);
        CHECK(d.history[0].crawl_id == "crawl-1");
        CHECK(d.history[1].crawl_id == "crawl-2");
        CHECK(d.history[2].crawl_id == "crawl-3");
    }
    SECTION("deltas use the latest prior completed crawl") {
        CHECK(d.score_deltas.overall == Approx(6.9));
        CHECK(d.score_deltas.technical == Approx(4.0));
        CHECK(d.score_deltas.content == Approx(6.0));
        CHECK(d.score_deltas.ai_readiness == Approx(5.0));
        CHECK(d.score_deltas.performance == Approx(5.5));
    }
    SECTION("no prior crawl means zero deltas") {
        const ReportData minimal = aggregate(fixtures::make_minimal_inputs(), fixtures::make_options());
        CHECK(minimal.history.empty());
        CHECK(minimal.score_deltas.overall == 0.0);
        CHECK(minimal.score_deltas.technical == 0.0);
    }
    SECTION("crawls completed after the current one are not prior") {
        auto point = [](const std::string& id, const std::string& at, double overall) {
            HistoryPoint p;
            p.crawl_id = id;
            p.completed_at = at;
            p.overall = overall;
            return p;
        };
        const std::vector<HistoryPoint> h = {point("old", "2026-01-05T10:00:00Z", 60),
                                             point("cur", "2026-02-05T10:00:00Z", 70),
                                             point("newer", "2026-03-05T10:00:00Z", 90)};
        Scores cur;
        cur.overall = 70;

        CHECK(compute_score_deltas(cur, h, "cur").overall == Approx(10.0));
        CHECK(compute_score_deltas(cur, h, "re-run", "2026-02-05T10:00:00Z").overall == Approx(10.0));
        CHECK(compute_score_deltas(cur, {h[2]}, "cur", "2026-02-05T10:00:00Z").overall == 0.0);

        RawInputs raw = fixtures::make_raw_inputs();
        RawHistoryCrawl later;
        later.id = "crawl-4";
        later.completed_at = "2026-04-01T10:00:00Z";
        later.overall = 95;
        later.technical = 95;
        later.content = 95;
        later.ai_readiness = 95;
        raw.history.push_back(later);
        const ReportData older_report = aggregate(raw, fixtures::make_options());
        CHECK(older_report.score_deltas.overall == Approx(6.9));
    }
    SECTION("unreadable completion time is skipped") {
        RawHistoryCrawl h;
        h.id = "bad";
        h.completed_at = "yesterday";
        CHECK(completed_history({h}).empty());
    }
}

TEST_CASE("Aggregator: quick wins", "[aggregator][quick_wins]") {
    const ReportData d = fixtures::make_report_data();

    REQUIRE(d.quick_wins.size() == 3);
    const QuickWin& top = d.quick_wins[0];
    CHECK(top.code == "MISSING_TITLE");
    CHECK(top.roi.visibility_impact == VisibilityImpact::High);
    CHECK(top.roi.page_reach == 3);
    REQUIRE(top.roi.traffic_estimate);
    CHECK(*top.roi.traffic_estimate == "+192 clicks/month");
    CHECK(top.pillar == Pillar::Technical);

    SECTION("every promoted issue carries its roi") {
        for (const auto& i : d.issues.items) {
            CHECK(static_cast<bool>(i.roi) == (i.severity != Severity::Info));
        }
    }
    SECTION("capped") {
        auto raw = fixtures::make_minimal_inputs();
        for (int i = 0; i < 15; ++i) {
            RawIssue r;
            r.code = "W" + std::to_string(i);
            r.category = "technical";
            r.severity = "warning";
            r.message = "warning " + std::to_string(i);
            raw.issues.push_back(r);
        }
        const ReportData many = aggregate(raw, fixtures::make_options());
        CHECK(many.quick_wins.size() == kMaxQuickWins);
    }
}

TEST_CASE("Aggregator: action plan and coverage", "[aggregator][action_plan]") {
    const ReportData d = fixtures::make_report_data();

    REQUIRE(d.action_plan.size() == 4);
    CHECK(d.action_plan[0].items[0].code == "MISSING_TITLE");
    CHECK(d.action_plan[1].items[0].code == "THIN_CONTENT");
    CHECK(d.action_plan[2].items[0].code == "MISSING_LLMS_TXT");
    CHECK(d.action_plan[3].items[0].code == "MISSING_ALT_TEXT");

    REQUIRE(d.readiness_coverage.size() == coverage_controls().size());
    CHECK(d.readiness_coverage[0].code == "MISSING_TITLE");
    CHECK(d.readiness_coverage[0].coverage_percent == 25);
    CHECK(d.readiness_coverage.back().coverage_percent == 100);

    SECTION("empty tiers are dropped") {
        Issue info;
        info.code = "I";
        info.severity = Severity::Info;
        const auto plan = build_action_plan({info});
        REQUIRE(plan.size() == 1);
        CHECK(plan[0].title == "Priority 4: Long-term Optimization");
    }
}

TEST_CASE("Aggregator: visibility and competitors", "[aggregator][visibility]") {
    const ReportData d = fixtures::make_report_data();

    REQUIRE(d.visibility);
    REQUIRE(d.visibility->platforms.size() == 2);
    const auto& chatgpt = d.visibility->platforms[0];
    CHECK(chatgpt.provider == "chatgpt");
    CHECK(chatgpt.checks_count == 2);
    CHECK(chatgpt.brand_mention_rate == 50.0);
    CHECK(chatgpt.url_citation_rate == 50.0);
    REQUIRE(chatgpt.avg_position);
    CHECK(*chatgpt.avg_position == 2.0);
    CHECK_FALSE(d.visibility->platforms[1].avg_position);

    REQUIRE(d.competitors);
    REQUIRE(d.competitors->size() == 2);
    CHECK((*d.competitors)[0].domain == "rival.example");
    CHECK((*d.competitors)[0].mention_count == 3);

    REQUIRE(d.gap_queries);
    REQUIRE(d.gap_queries->size() == 2);
    CHECK((*d.gap_queries)[0].platform == "perplexity");
    CHECK((*d.gap_queries)[0].competitors_cited.size() == 2);
}

TEST_CASE("Aggregator: content health and integrations", "[aggregator][enrichment]") {
    const ReportData d = fixtures::make_report_data();

    REQUIRE(d.content_health);
    CHECK(d.content_health->total_pages == 4);
    CHECK(d.content_health->pages_above_threshold == 2);
    CHECK(d.content_health->avg_word_count == 438.0);
    REQUIRE(d.content_health->avg_clarity);
    CHECK(*d.content_health->avg_clarity == Approx(70.0));

    REQUIRE(d.integrations);
    REQUIRE(d.integrations->gsc);
    const auto& top = d.integrations->gsc->top_queries.front();
    CHECK(top.query == "crm software");
    CHECK(top.impressions == 1000.0);
    CHECK(top.position == Approx(5.0));
    REQUIRE(d.integrations->ga4);
    CHECK(d.integrations->ga4->bounce_rate == Approx(0.4));
    REQUIRE(d.integrations->clarity);
    CHECK(d.integrations->clarity->rage_click_pages.size() == 1);
}

TEST_CASE("Aggregator: missing collaborators", "[aggregator][optional]") {
    const ReportData d = aggregate(fixtures::make_minimal_inputs(), fixtures::make_options());

    CHECK_FALSE(d.visibility);
    CHECK_FALSE(d.competitors);
    CHECK_FALSE(d.gap_queries);
    CHECK_FALSE(d.integrations);
    REQUIRE(d.content_health);
    REQUIRE(d.content_health->avg_authority);
    CHECK(*d.content_health->avg_authority == Approx(60.0));

    SECTION("pages without model scores leave the averages null") {
        auto raw = fixtures::make_minimal_inputs();
        for (auto& p : raw.pages) p.llm_scores.reset();
        const ReportData bare = aggregate(raw, fixtures::make_options());
        REQUIRE(bare.content_health);
        CHECK_FALSE(bare.content_health->avg_clarity);
        CHECK_FALSE(bare.content_health->avg_citation_worthiness);
    }

    SECTION("no pages leaves the page-backed sections empty") {
        auto raw = fixtures::make_minimal_inputs();
        raw.pages.clear();
        const ReportData empty = aggregate(raw, fixtures::make_options());
        CHECK_FALSE(empty.content_health);
        CHECK(empty.grade_distribution.empty());
        CHECK(empty.readiness_coverage.empty());
        CHECK(empty.scores.overall == 0.0);
    }
}

TEST_CASE("Aggregator: contract violations", "[aggregator][errors]") {
    SECTION("negative crawl page count") {
        auto raw = fixtures::make_raw_inputs();
        raw.crawl.pages_scored = -1;
        CHECK_THROWS_AS(aggregate(raw, fixtures::make_options()), std::invalid_argument);
    }
    SECTION("negative page issue count") {
        auto raw = fixtures::make_raw_inputs();
        raw.pages[0].issue_count = -2;
        CHECK_THROWS_AS(aggregate(raw, fixtures::make_options()), std::invalid_argument);
    }
}

TEST_CASE("Aggregator: deterministic output", "[aggregator][determinism]") {
    const auto raw = fixtures::make_raw_inputs();
    const ReportData a = aggregate(raw, fixtures::make_options());
    const ReportData b = aggregate(raw, fixtures::make_options());

    CHECK(report_data_to_json(a).dump() == report_data_to_json(b).dump());
    CHECK(a.generated_at == fixtures::kGeneratedAt);
    CHECK(a.config.branding_color.empty());
}

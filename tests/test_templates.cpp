#include <catch2/catch.hpp>

#include <algorithm>

#include "doc/FlowLayout.hpp"
#include "doc/Format.hpp"
#include "doc/Limits.hpp"
#include "doc/PageLayout.hpp"
#include "support/Fixtures.hpp"

using namespace doc;

static std::vector<std::string> page_headings(const PagedReport& r) {
    std::vector<std::string> out;
    for (const auto& page : r.pages) {
        for (const auto& b : page.blocks) {
            if (b.kind == PageBlockKind::Heading) out.push_back(b.text);
        }
    }
    return out;
}

static std::vector<std::string> page_texts(const PagedReport& r) {
    std::vector<std::string> out;
    for (const auto& page : r.pages) {
        for (const auto& b : page.blocks) {
            if (!b.text.empty()) out.push_back(b.text);
        }
    }
    return out;
}

static std::string block_text(const FlowBlock& b) {
    std::string s;
    for (const auto& run : b.runs) s += run.text;
    return s;
}

static std::vector<std::string> flow_headings(const FlowReport& r) {
    std::vector<std::string> out;
    for (const auto& b : r.blocks) {
        if (b.kind == FlowKind::Heading1) out.push_back(block_text(b));
    }
    return out;
}

static std::vector<std::string> flow_texts(const FlowReport& r) {
    std::vector<std::string> out;
    for (const auto& b : r.blocks) out.push_back(block_text(b));
    return out;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static report::ReportData with_history(size_t n) {
    report::ReportData d = fixtures::make_report_data();
    d.history.resize(std::min(n, d.history.size()));
    return d;
}

TEST_CASE("Templates: trend section needs two crawls", "[templates][trend]") {
    for (size_t n : {0u, 1u}) {
        const report::ReportData d = with_history(n);
        CHECK_FALSE(contains(page_headings(assemble_summary_pages(d)), "Score Trend"));
        CHECK_FALSE(contains(page_headings(assemble_detailed_pages(d)), "Score Trend"));
        CHECK_FALSE(contains(flow_headings(assemble_summary_flow(d)), "Score Trend"));
        CHECK_FALSE(contains(flow_headings(assemble_detailed_flow(d)), "Category Trends"));
    }

    for (size_t n : {2u, 3u}) {
        const report::ReportData d = with_history(n);
        CHECK(contains(page_headings(assemble_summary_pages(d)), "Score Trend"));
        CHECK(contains(page_headings(assemble_detailed_pages(d)), "Score Trend"));
        CHECK(contains(flow_headings(assemble_summary_flow(d)), "Score Trend"));
        CHECK(contains(flow_headings(assemble_detailed_flow(d)), "Category Trends"));
    }
}

TEST_CASE("Templates: sections follow their data", "[templates][sections]") {
    report::ReportData d = fixtures::make_report_data();

    SECTION("all sections present for a full report") {
        const auto headings = page_headings(assemble_detailed_pages(d));
        for (const char* h : {"Category Scorecard", "Issues Overview", "Quick Wins", "Readiness Coverage",
                              "AI Visibility Snapshot", "Issue Catalog", "Lowest Scoring Pages",
                              "Competitor Analysis", "Action Plan", "Google Search Console Data"}) {
            INFO(h);
            CHECK(contains(headings, h));
        }
    }
    SECTION("missing collaborators drop their sections in both templates") {
        d.visibility.reset();
        d.competitors.reset();
        d.gap_queries.reset();
        d.integrations.reset();

        const auto paged = page_headings(assemble_detailed_pages(d));
        const auto flow = flow_headings(assemble_detailed_flow(d));
        for (const char* h : {"AI Visibility Snapshot", "Competitor Analysis", "Competitor Gap Queries",
                              "Google Search Console Data", "Google Analytics Data"}) {
            INFO(h);
            CHECK_FALSE(contains(paged, h));
            CHECK_FALSE(contains(flow, h));
        }
        CHECK_FALSE(contains(page_headings(assemble_summary_pages(d)), "AI Visibility Snapshot"));
        CHECK_FALSE(contains(flow_headings(assemble_summary_flow(d)), "AI Visibility Snapshot"));
    }
    SECTION("no quick wins prints a notice") {
        d.quick_wins.clear();
        CHECK(contains(page_texts(assemble_summary_pages(d)), "No critical or warning issues were found in this crawl."));
        CHECK(contains(flow_texts(assemble_summary_flow(d)), "No critical or warning issues were found in this crawl."));
    }
}

TEST_CASE("Templates: long lists are truncated", "[templates][truncation]") {
    report::ReportData d = fixtures::make_report_data();

    SECTION("summary quick wins") {
        const report::QuickWin w = d.quick_wins.front();
        d.quick_wins.assign(kSummaryQuickWins + 2, w);

        const std::string more = "...and 2 more quick wins";
        CHECK(contains(page_texts(assemble_summary_pages(d)), more));
        CHECK(contains(flow_texts(assemble_summary_flow(d)), more));
    }
    SECTION("issue catalog per severity") {
        report::Issue critical = d.issues.items.front();
        for (size_t i = 0; i < kIssuesPerSeverity + 3; ++i) {
            critical.code = "CRIT_" + std::to_string(i);
            d.issues.items.push_back(critical);
        }

        const std::string more = "...and 4 more critical issues";
        CHECK(contains(page_texts(assemble_detailed_pages(d)), more));
        CHECK(contains(flow_texts(assemble_detailed_flow(d)), more));
    }
    SECTION("only overflowing lists get an indicator") {
        std::vector<std::string> indicators;
        for (const auto& t : page_texts(assemble_detailed_pages(d))) {
            if (t.rfind("...and ", 0) == 0) indicators.push_back(t);
        }
        // eight coverage controls, six highlighted
        REQUIRE(indicators.size() == 1);
        CHECK(indicators[0] == "...and 2 more controls");
    }
    SECTION("indicators are bound to the block above them") {
        for (const auto& page : assemble_detailed_pages(d).pages) {
            for (size_t i = 0; i < page.blocks.size(); ++i) {
                const auto& b = page.blocks[i];
                if (b.text.rfind("...and ", 0) != 0) continue;
                CHECK(b.keep_with_previous);
                CHECK(i > 0);
            }
        }
    }
}

TEST_CASE("Templates: branding and lead capture", "[templates][branding]") {
    report::ReportData d = fixtures::make_report_data();

    SECTION("default brand") {
        const PagedReport r = assemble_summary_pages(d);
        CHECK(r.brand.name == report::kDefaultBrandName);
        CHECK(r.brand.color == report::kDefaultBrandColor);
        CHECK(r.pages.front().style == PageStyle::Cover);
    }
    SECTION("config colour wins over project branding") {
        d.project.branding = report::Branding{"", "Acme Agency", "#111111"};
        d.config.branding_color = "#ff0000";
        const FlowReport r = assemble_summary_flow(d);
        CHECK(r.brand.name == "Acme Agency");
        CHECK(r.brand.color == "#ff0000");
        CHECK(r.header_text == "Acme Agency | acme.example");
    }
    SECTION("public reports end with a lead capture page") {
        d.config.is_public = true;
        const PagedReport r = assemble_summary_pages(d);
        CHECK(r.pages.back().style == PageStyle::LeadCapture);
        CHECK(contains(flow_texts(assemble_summary_flow(d)), lead_capture_heading()));
    }
    SECTION("private reports do not") {
        const PagedReport r = assemble_summary_pages(d);
        CHECK(r.pages.back().style != PageStyle::LeadCapture);
    }
    SECTION("prepared for line") {
        d.config.prepared_for = "Jordan";
        CHECK(contains(page_texts(assemble_summary_pages(d)), "Prepared for Jordan"));
    }
}

TEST_CASE("Templates: counts agree with their nouns", "[templates][format]") {
    report::ReportData d = fixtures::make_report_data();
    const report::Issue* alt = nullptr;
    for (const auto& i : d.issues.items) {
        if (i.code == "MISSING_ALT_TEXT") alt = &i;
    }
    REQUIRE(alt);
    REQUIRE(alt->affected_pages == 1);
    CHECK(issue_meta(*alt).rfind("1 page | ", 0) == 0);

    report::Competitor c;
    c.domain = "rival.example";
    c.mention_count = 1;
    c.platforms = {"chatgpt"};
    CHECK(competitor_detail(c) == "1 mention across chatgpt");

    d.crawl.pages_scored = 1;
    CHECK(issues_found_line(d) == "4 issues found across 1 page");

    SECTION("a single hidden entry reads in the singular") {
        report::QuickWin w = d.quick_wins.front();
        d.quick_wins.assign(kSummaryQuickWins + 1, w);
        CHECK(contains(page_texts(assemble_summary_pages(d)), "...and 1 more quick win"));
        CHECK(contains(flow_texts(assemble_summary_flow(d)), "...and 1 more quick win"));
    }
}

TEST_CASE("Templates: formatting helpers", "[templates][format]") {
    CHECK(score_text(81.6) == "82");
    CHECK(number_text(6.0) == "6");
    CHECK(number_text(2.5) == "2.5");
    CHECK(delta_label(0.0) == "No change");
    CHECK(delta_label(3.0) == "+3 vs last crawl");
    CHECK(delta_label(-2.5) == "-2.5 vs last crawl");
    CHECK(more_label(4, "issue") == "...and 4 more issues");
    CHECK(more_label(1, "page") == "...and 1 more page");
    CHECK(more_label(3, "query", "queries") == "...and 3 more queries");
    CHECK(count_label(1, "page") == "1 page");
    CHECK(count_label(0, "page") == "0 pages");
    CHECK(count_label(2, "mention") == "2 mentions");
    CHECK(provider_label("chatgpt") == "Chatgpt");
}

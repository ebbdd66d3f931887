#include "support/Fixtures.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fixtures {

static report::RawPageScore page(const std::string& path,
                                 const std::string& title,
                                 double overall,
                                 double technical,
                                 double content,
                                 double ai,
                                 int words) {
    report::RawPageScore p;
    p.url = "https://acme.example" + path;
    p.title = title;
    p.overall = overall;
    p.technical = technical;
    p.content = content;
    p.ai_readiness = ai;
    p.word_count = words;
    p.issue_count = 0;
    return p;
}

static report::RawIssue issue(const std::string& code,
                              const std::string& category,
                              const std::string& severity,
                              const std::string& message,
                              const std::string& recommendation) {
    report::RawIssue r;
    r.code = code;
    r.category = category;
    r.severity = severity;
    r.message = message;
    r.recommendation = recommendation;
    return r;
}

static report::RawHistoryCrawl history(const std::string& id,
                                       const std::string& completed_at,
                                       double overall,
                                       double technical,
                                       double content,
                                       double ai,
                                       double performance) {
    report::RawHistoryCrawl h;
    h.id = id;
    h.completed_at = completed_at;
    h.pages_scored = 4;
    h.overall = overall;
    h.technical = technical;
    h.content = content;
    h.ai_readiness = ai;
    h.performance = performance;
    return h;
}

static enrich::VisibilityCheck probe(const std::string& provider,
                                     const std::string& query,
                                     bool brand,
                                     bool cited,
                                     std::vector<enrich::CompetitorMention> mentions) {
    enrich::VisibilityCheck c;
    c.provider = provider;
    c.query = query;
    c.brand_mentioned = brand;
    c.url_cited = cited;
    c.competitor_mentions = std::move(mentions);
    return c;
}

static void add_base(report::RawInputs& in) {
    in.project.name = "Acme";
    in.project.domain = "acme.example";

    in.crawl.id = "crawl-3";
    in.crawl.completed_at = "2026-03-01T10:00:00Z";
    in.crawl.pages_found = 4;
    in.crawl.pages_crawled = 4;
    in.crawl.pages_scored = 4;

    auto pricing = page("/pricing", "Pricing", 45, 40, 50, 44, 180);
    pricing.lighthouse_perf = 0.5;
    pricing.lighthouse_seo = 0.7;
    pricing.issue_count = 2;
    pricing.llm_scores = report::LlmContentScores{60.0, 50.0, 40.0, 70.0, 30.0};

    auto blog = page("/blog", "Blog", 66, 70, 60, 64, 250);
    blog.issue_count = 2;

    auto home = page("/", "Home", 92, 90, 90, 88, 900);
    home.lighthouse_perf = 0.9;
    home.lighthouse_seo = 1.0;
    home.llm_scores = report::LlmContentScores{80.0, 70.0, 60.0, 90.0, 50.0};

    auto about = page("/about", "About", 81, 80, 80, 84, 420);
    about.issue_count = 1;

    in.pages = {pricing, blog, home, about};

    const std::string title_msg = "Page is missing a title tag";
    const std::string title_rec = "Add a unique descriptive title to every page.";
    const std::string thin_msg = "Page has fewer than 300 words";
    const std::string thin_rec = "Expand thin pages with original useful content.";

    auto llms = issue("MISSING_LLMS_TXT", "ai_readiness", "warning", "Site has no llms.txt file",
                      "Publish an llms.txt file at the site root.");
    llms.score_impact = 2.5;
    llms.docs_url = "https://docs.acme.example/llms-txt";

    in.issues = {
        issue("MISSING_TITLE", "technical", "critical", title_msg, title_rec),
        issue("THIN_CONTENT", "content", "warning", thin_msg, thin_rec),
        issue("MISSING_TITLE", "technical", "critical", title_msg, title_rec),
        llms,
        issue("THIN_CONTENT", "content", "warning", thin_msg, thin_rec),
        issue("MISSING_ALT_TEXT", "content", "info", "Images are missing alt text",
              "Describe every meaningful image with alt text."),
        issue("MISSING_TITLE", "technical", "critical", title_msg, title_rec),
    };
}

report::RawInputs make_raw_inputs() {
    report::RawInputs in;
    add_base(in);

    auto failed = history("crawl-x", "2026-02-20T09:00:00Z", 10, 10, 10, 10, 10);
    failed.status = "failed";

    in.history = {
        history("crawl-2", "2026-02-05T09:00:00Z", 65, 66, 64, 65, 72),
        history("crawl-3", "2026-03-01T10:00:00Z", 71.9, 70, 70, 70, 77.5),
        failed,
        history("crawl-1", "2026-01-05T09:00:00Z", 60, 60, 62, 58, 70),
    };

    auto first = probe("chatgpt", "best crm tools", true, true, {{"rival.example", true}});
    first.citation_position = 2.0;
    in.visibility_checks = std::vector<enrich::VisibilityCheck>{
        first,
        probe("perplexity", "best crm tools", false, false, {{"rival.example", true}, {"other.example", true}}),
        probe("chatgpt", "crm pricing", false, false, {{"rival.example", true}}),
        probe("perplexity", "crm pricing", true, false, {{"other.example", false}}),
    };

    in.enrichments = std::vector<enrich::RawEnrichment>{
        {"gsc", json{{"queries", json::array({
                         json{{"query", "crm software"}, {"impressions", 800}, {"clicks", 40}, {"position", 4.2}},
                         json{{"query", "best crm"}, {"impressions", "300"}, {"clicks", 12}, {"position", 8}},
                     })}}},
        {"gsc", json{{"query", "crm software"}, {"impressions", 200}, {"clicks", 10}, {"position", 5.8}}},
        {"ga4", json{{"bounceRate", 0.42},
                     {"avgEngagement", 63},
                     {"pages", json::array({json{{"url", "https://acme.example/"}, {"sessions", 120}}})}}},
        {"clarity", json{{"uxScore", 72}, {"rageClicks", json::array({"https://acme.example/pricing"})}}},
    };

    in.gsc_impressions = 12000.0;
    return in;
}

report::RawInputs make_minimal_inputs() {
    report::RawInputs in;
    add_base(in);
    return in;
}

report::AggregateOptions make_options() {
    report::AggregateOptions opt;
    opt.generated_at = kGeneratedAt;
    return opt;
}

report::ReportData make_report_data() {
    return report::aggregate(make_raw_inputs(), make_options());
}

}  // namespace fixtures

#include "io/JsonIO.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

// Absent and null both mean "not supplied".
static bool present(const json& j, const char* key) {
    return j.contains(key) && !j.at(key).is_null();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!present(j, key)) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<double> optional_number(const json& j, const char* key, const std::string& where) {
    if (!present(j, key)) return std::nullopt;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static std::optional<int> optional_int(const json& j, const char* key, const std::string& where) {
    if (!present(j, key)) return std::nullopt;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int>();
}

static std::optional<bool> optional_bool(const json& j, const char* key, const std::string& where) {
    if (!present(j, key)) return std::nullopt;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

// Calls parse(element, path) for each element of j[key]; absent or null is an
// empty list.
template <typename T, typename Parse>
static std::vector<T> parse_list(const json& j, const char* key, const std::string& where, Parse parse) {
    std::vector<T> out;
    if (!present(j, key)) return out;
    const json& arr = j.at(key);
    require_array(arr, where + "." + key);
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        out.push_back(parse(arr.at(i), index_path(where, key, i)));
    }
    return out;
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON in " + path + ": " + e.what());
    }
    return j;
}

static report::RawProject parse_project(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawProject p;
    p.name = require_string(j, "name", where);
    p.domain = require_string(j, "domain", where);

    if (present(j, "branding")) {
        const json& b = j.at("branding");
        const std::string bw = where + ".branding";
        require_object(b, bw);
        report::Branding branding;
        branding.logo_url = optional_string(b, "logo_url", bw).value_or("");
        branding.company_name = optional_string(b, "company_name", bw).value_or("");
        branding.primary_color = optional_string(b, "primary_color", bw).value_or("");
        p.branding = branding;
    }
    return p;
}

static report::RawCrawl parse_crawl(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawCrawl c;
    c.id = require_string(j, "id", where);
    c.completed_at = optional_string(j, "completed_at", where).value_or("");
    c.pages_found = optional_int(j, "pages_found", where);
    c.pages_crawled = optional_int(j, "pages_crawled", where);
    c.pages_scored = optional_int(j, "pages_scored", where);
    c.summary = optional_string(j, "summary", where);
    return c;
}

static report::RawPageScore parse_page(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawPageScore p;
    p.url = require_string(j, "url", where);
    p.title = optional_string(j, "title", where);
    p.overall = require_number(j, "overall", where);
    p.technical = optional_number(j, "technical", where);
    p.content = optional_number(j, "content", where);
    p.ai_readiness = optional_number(j, "ai_readiness", where);
    p.lighthouse_perf = optional_number(j, "lighthouse_perf", where);
    p.lighthouse_seo = optional_number(j, "lighthouse_seo", where);
    p.word_count = optional_int(j, "word_count", where);
    p.issue_count = optional_int(j, "issue_count", where);

    if (present(j, "llm_scores")) {
        const json& s = j.at("llm_scores");
        const std::string sw = where + ".llm_scores";
        require_object(s, sw);
        report::LlmContentScores llm;
        llm.clarity = optional_number(s, "clarity", sw);
        llm.authority = optional_number(s, "authority", sw);
        llm.comprehensiveness = optional_number(s, "comprehensiveness", sw);
        llm.structure = optional_number(s, "structure", sw);
        llm.citation_worthiness = optional_number(s, "citation_worthiness", sw);
        p.llm_scores = llm;
    }
    return p;
}

static report::RawIssue parse_issue(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawIssue i;
    i.code = require_string(j, "code", where);
    i.category = require_string(j, "category", where);
    i.severity = require_string(j, "severity", where);
    i.message = require_string(j, "message", where);
    i.recommendation = optional_string(j, "recommendation", where);
    i.score_impact = optional_number(j, "score_impact", where);
    i.pillar = optional_string(j, "pillar", where);
    i.owner = optional_string(j, "owner", where);
    i.effort = optional_string(j, "effort", where);
    i.docs_url = optional_string(j, "docs_url", where);
    return i;
}

static report::RawHistoryCrawl parse_history(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawHistoryCrawl h;
    h.id = require_string(j, "id", where);
    h.status = optional_string(j, "status", where).value_or("completed");
    h.completed_at = require_string(j, "completed_at", where);
    h.pages_scored = optional_int(j, "pages_scored", where);
    h.overall = require_number(j, "overall", where);
    h.technical = require_number(j, "technical", where);
    h.content = require_number(j, "content", where);
    h.ai_readiness = require_number(j, "ai_readiness", where);
    h.performance = optional_number(j, "performance", where);
    return h;
}

static enrich::CompetitorMention parse_mention(const json& j, const std::string& where) {
    require_object(j, where);

    enrich::CompetitorMention m;
    m.domain = require_string(j, "domain", where);
    m.mentioned = optional_bool(j, "mentioned", where).value_or(false);
    return m;
}

static enrich::VisibilityCheck parse_check(const json& j, const std::string& where) {
    require_object(j, where);

    enrich::VisibilityCheck c;
    c.provider = require_string(j, "provider", where);
    c.query = require_string(j, "query", where);
    c.brand_mentioned = optional_bool(j, "brand_mentioned", where);
    c.url_cited = optional_bool(j, "url_cited", where);
    c.citation_position = optional_number(j, "citation_position", where);
    c.competitor_mentions = parse_list<enrich::CompetitorMention>(j, "competitor_mentions", where, parse_mention);
    return c;
}

static enrich::RawEnrichment parse_enrichment(const json& j, const std::string& where) {
    require_object(j, where);

    // `data` is free-form; envelope parsers deal with its shape.
    enrich::RawEnrichment e;
    e.provider = require_string(j, "provider", where);
    e.data = j.contains("data") ? j.at("data") : json::object();
    return e;
}

report::RawInputs parse_raw_inputs(const json& j, const std::string& where) {
    require_object(j, where);

    report::RawInputs raw;
    raw.project = parse_project(require_field(j, "project", where), where + ".project");
    raw.crawl = parse_crawl(require_field(j, "crawl", where), where + ".crawl");
    raw.pages = parse_list<report::RawPageScore>(j, "pages", where, parse_page);
    raw.issues = parse_list<report::RawIssue>(j, "issues", where, parse_issue);
    raw.history = parse_list<report::RawHistoryCrawl>(j, "history", where, parse_history);

    if (present(j, "visibility_checks")) {
        raw.visibility_checks = parse_list<enrich::VisibilityCheck>(j, "visibility_checks", where, parse_check);
    }
    if (present(j, "enrichments")) {
        raw.enrichments = parse_list<enrich::RawEnrichment>(j, "enrichments", where, parse_enrichment);
    }
    raw.gsc_impressions = optional_number(j, "gsc_impressions", where);
    return raw;
}

report::RawInputs load_raw_inputs(const std::string& path) {
    return parse_raw_inputs(read_json_file(path), "root");
}

RenderSettings parse_config(const json& j, const std::string& where) {
    require_object(j, where);

    RenderSettings s;
    s.config.branding_color = optional_string(j, "brandingColor", where).value_or("");
    s.config.prepared_for = optional_string(j, "preparedFor", where).value_or("");
    s.config.is_public = optional_bool(j, "isPublic", where).value_or(false);

    if (present(j, "roi")) {
        const json& r = j.at("roi");
        const std::string rw = where + ".roi";
        require_object(r, rw);
        const auto ctr = optional_number(r, "ctrImprovementPer10Points", rw);
        if (ctr) {
            if (*ctr < 0.0) throw std::runtime_error(rw + ".ctrImprovementPer10Points must not be negative");
            s.roi.ctr_improvement_per_10_points = *ctr;
        }
    }
    return s;
}

RenderSettings load_config(const std::string& path) {
    return parse_config(read_json_file(path), "root");
}

render::RenderJob parse_job(const json& j, const std::string& where) {
    require_object(j, where);

    render::RenderJob job;
    job.report_id = require_string(j, "reportId", where);
    job.project_id = require_string(j, "projectId", where);
    job.crawl_id = require_string(j, "crawlId", where);
    job.user_id = require_string(j, "userId", where);

    const auto type = report::parse_template_type(require_string(j, "type", where));
    if (!type) throw std::runtime_error(where + ".type must be one of: summary, detailed");
    job.type = *type;

    const auto format = report::parse_output_format(require_string(j, "format", where));
    if (!format) throw std::runtime_error(where + ".format must be one of: pdf, docx");
    job.format = *format;

    if (present(j, "config")) job.config = parse_config(j.at("config"), where + ".config").config;
    return job;
}

std::vector<render::RenderJob> load_jobs(const std::string& path) {
    const json j = read_json_file(path);

    if (j.is_object() && !j.contains("jobs")) return {parse_job(j, "root")};

    const json& arr = j.is_object() ? j.at("jobs") : j;
    const std::string where = j.is_object() ? "root.jobs" : "root";
    require_array(arr, where);

    std::vector<render::RenderJob> jobs;
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        jobs.push_back(parse_job(arr.at(i), oss.str()));
    }
    return jobs;
}

static json opt_json(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

static json roi_json(const report::Roi& r) {
    json j;
    j["scoreImpact"] = r.score_impact;
    j["pageReach"] = r.page_reach;
    j["visibilityImpact"] = report::to_string(r.visibility_impact);
    j["trafficEstimate"] = r.traffic_estimate ? json(*r.traffic_estimate) : json(nullptr);
    return j;
}

static json issue_json(const report::Issue& i) {
    json j;
    j["code"] = i.code;
    j["category"] = i.category;
    j["severity"] = report::to_string(i.severity);
    j["message"] = i.message;
    j["recommendation"] = i.recommendation;
    j["affectedPages"] = i.affected_pages;
    j["scoreImpact"] = i.score_impact;
    j["roi"] = i.roi ? roi_json(*i.roi) : json(nullptr);
    j["pillar"] = report::to_string(i.pillar);
    j["owner"] = i.owner;
    j["effort"] = report::to_string(i.effort);
    j["docsUrl"] = i.docs_url;
    return j;
}

static json scores_json(double overall, double technical, double content, double ai_readiness,
                        const std::optional<double>& performance) {
    json j;
    j["overall"] = overall;
    j["technical"] = technical;
    j["content"] = content;
    j["aiReadiness"] = ai_readiness;
    j["performance"] = opt_json(performance);
    return j;
}

static json integrations_json(const report::IntegrationData& in) {
    json j;
    if (in.gsc) {
        json rows = json::array();
        for (const auto& q : in.gsc->top_queries) {
            rows.push_back({{"query", q.query}, {"impressions", q.impressions}, {"clicks", q.clicks},
                            {"position", q.position}});
        }
        j["gsc"] = {{"topQueries", rows}};
    } else {
        j["gsc"] = nullptr;
    }

    if (in.ga4) {
        json pages = json::array();
        for (const auto& p : in.ga4->top_pages) pages.push_back({{"url", p.url}, {"sessions", p.sessions}});
        j["ga4"] = {{"bounceRate", in.ga4->bounce_rate}, {"avgEngagement", in.ga4->avg_engagement}, {"topPages", pages}};
    } else {
        j["ga4"] = nullptr;
    }

    if (in.clarity) {
        j["clarity"] = {{"avgUxScore", in.clarity->avg_ux_score}, {"rageClickPages", in.clarity->rage_click_pages}};
    } else {
        j["clarity"] = nullptr;
    }
    return j;
}

json report_data_to_json(const report::ReportData& d) {
    json j;

    json project;
    project["name"] = d.project.name;
    project["domain"] = d.project.domain;
    if (d.project.branding) {
        project["branding"] = {{"logoUrl", d.project.branding->logo_url},
                               {"companyName", d.project.branding->company_name},
                               {"primaryColor", d.project.branding->primary_color}};
    } else {
        project["branding"] = nullptr;
    }
    j["project"] = project;

    j["crawl"] = {{"id", d.crawl.id},
                  {"completedAt", d.crawl.completed_at},
                  {"pagesFound", d.crawl.pages_found},
                  {"pagesCrawled", d.crawl.pages_crawled},
                  {"pagesScored", d.crawl.pages_scored},
                  {"summary", d.crawl.summary ? json(*d.crawl.summary) : json(nullptr)}};

    json scores = scores_json(d.scores.overall, d.scores.technical, d.scores.content, d.scores.ai_readiness,
                              d.scores.performance);
    scores["letterGrade"] = d.scores.letter_grade;
    j["scores"] = scores;

    json items = json::array();
    for (const auto& i : d.issues.items) items.push_back(issue_json(i));
    json by_severity = json::array();
    for (const auto& s : d.issues.by_severity) {
        by_severity.push_back({{"severity", report::to_string(s.severity)}, {"count", s.count}});
    }
    json by_category = json::array();
    for (const auto& c : d.issues.by_category) by_category.push_back({{"category", c.category}, {"count", c.count}});
    j["issues"] = {{"total", d.issues.total}, {"items", items}, {"bySeverity", by_severity}, {"byCategory", by_category}};

    json wins = json::array();
    for (const auto& w : d.quick_wins) {
        wins.push_back({{"code", w.code},
                        {"message", w.message},
                        {"recommendation", w.recommendation},
                        {"effort", report::to_string(w.effort)},
                        {"affectedPages", w.affected_pages},
                        {"scoreImpact", w.score_impact},
                        {"roi", roi_json(w.roi)},
                        {"pillar", report::to_string(w.pillar)},
                        {"owner", w.owner},
                        {"docsUrl", w.docs_url}});
    }
    j["quickWins"] = wins;

    json pages = json::array();
    for (const auto& p : d.pages) {
        json pj = scores_json(p.overall, p.technical, p.content, p.ai_readiness, p.performance);
        pj["url"] = p.url;
        pj["title"] = p.title;
        pj["grade"] = p.grade;
        pj["issueCount"] = p.issue_count;
        pages.push_back(pj);
    }
    j["pages"] = pages;

    json history = json::array();
    for (const auto& h : d.history) {
        json hj = scores_json(h.overall, h.technical, h.content, h.ai_readiness, h.performance);
        hj["crawlId"] = h.crawl_id;
        hj["completedAt"] = h.completed_at;
        hj["pagesScored"] = h.pages_scored;
        history.push_back(hj);
    }
    j["history"] = history;

    j["scoreDeltas"] = {{"overall", d.score_deltas.overall},
                        {"technical", d.score_deltas.technical},
                        {"content", d.score_deltas.content},
                        {"aiReadiness", d.score_deltas.ai_readiness},
                        {"performance", d.score_deltas.performance}};

    json grades = json::array();
    for (const auto& g : d.grade_distribution) {
        grades.push_back({{"grade", g.grade}, {"count", g.count}, {"percentage", g.percentage}});
    }
    j["gradeDistribution"] = grades;

    if (d.visibility) {
        json platforms = json::array();
        for (const auto& p : d.visibility->platforms) {
            platforms.push_back({{"provider", p.provider},
                                 {"brandMentionRate", p.brand_mention_rate},
                                 {"urlCitationRate", p.url_citation_rate},
                                 {"avgPosition", opt_json(p.avg_position)},
                                 {"checksCount", p.checks_count}});
        }
        j["visibility"] = {{"platforms", platforms}};
    } else {
        j["visibility"] = nullptr;
    }

    if (d.competitors) {
        json list = json::array();
        for (const auto& c : *d.competitors) {
            list.push_back({{"domain", c.domain},
                            {"mentionCount", c.mention_count},
                            {"platforms", c.platforms},
                            {"queries", c.queries}});
        }
        j["competitors"] = list;
    } else {
        j["competitors"] = nullptr;
    }

    if (d.gap_queries) {
        json list = json::array();
        for (const auto& g : *d.gap_queries) {
            list.push_back({{"query", g.query}, {"platform", g.platform}, {"competitorsCited", g.competitors_cited}});
        }
        j["gapQueries"] = list;
    } else {
        j["gapQueries"] = nullptr;
    }

    if (d.content_health) {
        const auto& h = *d.content_health;
        j["contentHealth"] = {{"avgWordCount", h.avg_word_count},
                              {"avgClarity", opt_json(h.avg_clarity)},
                              {"avgAuthority", opt_json(h.avg_authority)},
                              {"avgComprehensiveness", opt_json(h.avg_comprehensiveness)},
                              {"avgStructure", opt_json(h.avg_structure)},
                              {"avgCitationWorthiness", opt_json(h.avg_citation_worthiness)},
                              {"pagesAboveThreshold", h.pages_above_threshold},
                              {"totalPages", h.total_pages}};
    } else {
        j["contentHealth"] = nullptr;
    }

    j["integrations"] = d.integrations ? integrations_json(*d.integrations) : json(nullptr);

    json coverage = json::array();
    for (const auto& m : d.readiness_coverage) {
        coverage.push_back({{"code", m.code},
                            {"label", m.label},
                            {"description", m.description},
                            {"pillar", report::to_string(m.pillar)},
                            {"affectedPages", m.affected_pages},
                            {"totalPages", m.total_pages},
                            {"coveragePercent", m.coverage_percent}});
    }
    j["readinessCoverage"] = coverage;

    json tiers = json::array();
    for (const auto& t : d.action_plan) {
        json tier_items = json::array();
        for (const auto& i : t.items) tier_items.push_back(issue_json(i));
        tiers.push_back({{"title", t.title}, {"description", t.description}, {"items", tier_items}});
    }
    j["actionPlan"] = tiers;

    j["config"] = {{"brandingColor", d.config.branding_color},
                   {"preparedFor", d.config.prepared_for},
                   {"isPublic", d.config.is_public}};
    j["generatedAt"] = d.generated_at;
    return j;
}

void write_binary_file(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("failed to write output file: " + path);
    }
}

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace report {

enum class Severity {
    Critical,
    Warning,
    Info
};

enum class Pillar {
    Technical,
    Content,
    AiReadiness
};

enum class VisibilityImpact {
    High,
    Medium,
    Low
};

enum class Effort {
    Low,
    Medium,
    High
};

enum class TemplateType {
    Summary,
    Detailed
};

enum class OutputFormat {
    Pdf,
    Docx
};

const char* to_string(Severity s);
const char* to_string(Pillar p);
const char* to_string(VisibilityImpact v);
const char* to_string(Effort e);
const char* to_string(TemplateType t);
const char* to_string(OutputFormat f);

std::optional<Severity> parse_severity(const std::string& s);
std::optional<Pillar> parse_pillar(const std::string& s);
std::optional<Effort> parse_effort(const std::string& s);
std::optional<TemplateType> parse_template_type(const std::string& s);
std::optional<OutputFormat> parse_output_format(const std::string& s);

struct Branding {
    std::string logo_url;
    std::string company_name;
    std::string primary_color;       // "#rrggbb"
};

struct ProjectInfo {
    std::string name;
    std::string domain;
    std::optional<Branding> branding;
};

struct CrawlInfo {
    std::string id;
    std::string completed_at;        // ISO-8601, may be empty
    int pages_found = 0;
    int pages_crawled = 0;
    int pages_scored = 0;
    std::optional<std::string> summary;
};

struct Scores {
    double overall = 0.0;
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    std::optional<double> performance;
    std::string letter_grade = "F";
};

struct Roi {
    double score_impact = 0.0;
    int page_reach = 0;
    VisibilityImpact visibility_impact = VisibilityImpact::Low;
    std::optional<std::string> traffic_estimate;   // "+N clicks/month"
};

struct Issue {
    std::string code;
    std::string category;
    Severity severity = Severity::Info;
    std::string message;
    std::string recommendation;
    int affected_pages = 0;
    double score_impact = 0.0;
    std::optional<Roi> roi;          // only set for issues promoted to quick wins
    Pillar pillar = Pillar::Technical;
    std::string owner;
    Effort effort = Effort::Medium;
    std::string docs_url;
};

struct SeverityCount {
    Severity severity = Severity::Info;
    int count = 0;
};

struct CategoryCount {
    std::string category;
    int count = 0;
};

// by_severity and by_category are aggregates over items; both sum to total.
struct IssueSummary {
    int total = 0;
    std::vector<Issue> items;
    std::vector<SeverityCount> by_severity;
    std::vector<CategoryCount> by_category;
};

struct QuickWin {
    std::string code;
    std::string message;
    std::string recommendation;
    Effort effort = Effort::Medium;
    int affected_pages = 0;
    double score_impact = 0.0;
    Roi roi;
    Pillar pillar = Pillar::Technical;
    std::string owner;
    std::string docs_url;
};

struct PageScore {
    std::string url;
    std::string title;
    double overall = 0.0;
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    std::optional<double> performance;
    std::string grade;
    int issue_count = 0;
};

struct HistoryPoint {
    std::string crawl_id;
    std::string completed_at;
    double overall = 0.0;
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    std::optional<double> performance;
    int pages_scored = 0;
};

struct ScoreDeltas {
    double overall = 0.0;
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    double performance = 0.0;
};

struct PlatformVisibility {
    std::string provider;
    double brand_mention_rate = 0.0;     // percent
    double url_citation_rate = 0.0;      // percent
    std::optional<double> avg_position;
    int checks_count = 0;
};

struct Visibility {
    std::vector<PlatformVisibility> platforms;
};

struct Competitor {
    std::string domain;
    int mention_count = 0;
    std::vector<std::string> platforms;  // distinct, first-seen order
    std::vector<std::string> queries;    // distinct, first-seen order, uncapped
};

struct GapQuery {
    std::string query;
    std::string platform;
    std::vector<std::string> competitors_cited;
};

struct ContentHealth {
    double avg_word_count = 0.0;
    std::optional<double> avg_clarity;
    std::optional<double> avg_authority;
    std::optional<double> avg_comprehensiveness;
    std::optional<double> avg_structure;
    std::optional<double> avg_citation_worthiness;
    int pages_above_threshold = 0;
    int total_pages = 0;
};

struct SearchQueryRow {
    std::string query;
    double impressions = 0.0;
    double clicks = 0.0;
    double position = 0.0;
};

struct SearchConsoleSummary {
    std::vector<SearchQueryRow> top_queries;
};

struct PageSessions {
    std::string url;
    double sessions = 0.0;
};

struct AnalyticsSummary {
    double bounce_rate = 0.0;
    double avg_engagement = 0.0;
    std::vector<PageSessions> top_pages;
};

struct UxSummary {
    double avg_ux_score = 0.0;
    std::vector<std::string> rage_click_pages;
};

// At least one member is set whenever the bundle itself exists.
struct IntegrationData {
    std::optional<SearchConsoleSummary> gsc;
    std::optional<AnalyticsSummary> ga4;
    std::optional<UxSummary> clarity;
};

struct CoverageMetric {
    std::string code;
    std::string label;
    std::string description;
    Pillar pillar = Pillar::Technical;
    int affected_pages = 0;
    int total_pages = 0;
    int coverage_percent = 0;
};

struct ActionTier {
    std::string title;
    std::string description;
    std::vector<Issue> items;
};

struct GradeBucket {
    std::string grade;
    int count = 0;
    int percentage = 0;
};

struct ReportConfig {
    std::string branding_color;      // empty -> brand default
    std::string prepared_for;
    bool is_public = false;
};

struct ReportData {
    ProjectInfo project;
    CrawlInfo crawl;
    Scores scores;
    IssueSummary issues;
    std::vector<QuickWin> quick_wins;
    std::vector<PageScore> pages;            // worst first
    std::vector<HistoryPoint> history;       // oldest first
    ScoreDeltas score_deltas;
    std::vector<GradeBucket> grade_distribution;
    std::optional<Visibility> visibility;
    std::optional<std::vector<Competitor>> competitors;
    std::optional<std::vector<GapQuery>> gap_queries;
    std::optional<ContentHealth> content_health;
    std::optional<IntegrationData> integrations;
    std::vector<CoverageMetric> readiness_coverage;
    std::vector<ActionTier> action_plan;
    ReportConfig config;
    std::string generated_at;
};

struct Brand {
    std::string name;
    std::string color;
    bool is_default = true;
};

inline constexpr const char* kDefaultBrandName = "LLM Boost";
inline constexpr const char* kDefaultBrandColor = "#4f46e5";

// Company name comes from project branding, colour from config first, then
// branding, then the default brand.
Brand resolve_brand(const ReportData& data);

}  // namespace report

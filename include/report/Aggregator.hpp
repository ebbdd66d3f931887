#pragma once

#include <optional>
#include <string>
#include <vector>

#include "enrich/Competitors.hpp"
#include "enrich/Envelope.hpp"
#include "report/Grading.hpp"
#include "report/Models.hpp"
#include "report/Roi.hpp"

namespace report {

struct RawProject {
    std::string name;
    std::string domain;
    std::optional<Branding> branding;
};

struct RawCrawl {
    std::string id;
    std::string completed_at;
    std::optional<int> pages_found;
    std::optional<int> pages_crawled;
    std::optional<int> pages_scored;
    std::optional<std::string> summary;
};

struct LlmContentScores {
    std::optional<double> clarity;
    std::optional<double> authority;
    std::optional<double> comprehensiveness;
    std::optional<double> structure;
    std::optional<double> citation_worthiness;
};

struct RawPageScore {
    std::string url;
    std::optional<std::string> title;
    double overall = 0.0;
    std::optional<double> technical;
    std::optional<double> content;
    std::optional<double> ai_readiness;
    std::optional<double> lighthouse_perf;   // 0..1
    std::optional<double> lighthouse_seo;    // 0..1
    std::optional<int> word_count;
    std::optional<LlmContentScores> llm_scores;
    std::optional<int> issue_count;
};

// One row per page occurrence of an issue.
struct RawIssue {
    std::string code;
    std::string category;
    std::string severity;
    std::string message;
    std::optional<std::string> recommendation;
    std::optional<double> score_impact;       // absolute points, severity default otherwise
    std::optional<std::string> pillar;
    std::optional<std::string> owner;
    std::optional<std::string> effort;
    std::optional<std::string> docs_url;
};

struct RawHistoryCrawl {
    std::string id;
    std::string status = "completed";
    std::string completed_at;
    std::optional<int> pages_scored;
    double overall = 0.0;
    double technical = 0.0;
    double content = 0.0;
    double ai_readiness = 0.0;
    std::optional<double> performance;
};

// Everything the collaborators hand over. Optional members model a
// collaborator that was unavailable for this run.
struct RawInputs {
    RawProject project;
    RawCrawl crawl;
    std::vector<RawPageScore> pages;
    std::vector<RawIssue> issues;
    std::vector<RawHistoryCrawl> history;
    std::optional<std::vector<enrich::VisibilityCheck>> visibility_checks;
    std::optional<std::vector<enrich::RawEnrichment>> enrichments;
    std::optional<double> gsc_impressions;
};

struct AggregateOptions {
    std::string generated_at;        // empty -> current UTC time
    ReportConfig config;
    RoiConstants roi;
    CategoryWeights weights;
};

constexpr size_t kMaxQuickWins = 10;
constexpr int kContentWordThreshold = 300;

// Compiles raw collaborator output into one ReportData. Deterministic for a
// fixed generated_at. Optional sections whose collaborator is missing or
// fails are left empty and logged; negative page counts throw
// std::invalid_argument.
ReportData aggregate(const RawInputs& raw, const AggregateOptions& opt = {});

// Deduplicates page occurrences by code and orders the result by severity,
// affected pages desc, then code.
std::vector<Issue> dedupe_issues(const std::vector<RawIssue>& raw);

IssueSummary summarize_issues(std::vector<Issue> items);

// Completed entries only, oldest first.
std::vector<HistoryPoint> completed_history(const std::vector<RawHistoryCrawl>& raw);

// Current scores minus the latest completed crawl that finished before the
// current one. The current completion time comes from `current_completed_at`,
// else from the history entry for `current_crawl_id`; when neither is readable
// every other crawl counts as prior.
ScoreDeltas compute_score_deltas(const Scores& current,
                                 const std::vector<HistoryPoint>& history,
                                 const std::string& current_crawl_id,
                                 const std::string& current_completed_at = "");

std::optional<Visibility> summarize_visibility(const std::vector<enrich::VisibilityCheck>& checks);

std::optional<ContentHealth> summarize_content_health(const std::vector<RawPageScore>& pages);

std::vector<GradeBucket> grade_distribution(const std::vector<PageScore>& pages);

Pillar pillar_for_category(const std::string& category);

std::string default_owner(Pillar p);

Effort default_effort(Severity s);

}  // namespace report

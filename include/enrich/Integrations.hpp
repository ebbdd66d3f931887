#pragma once

#include <optional>
#include <vector>

#include "enrich/Envelope.hpp"
#include "report/Models.hpp"

namespace enrich {

constexpr size_t kMaxTopQueries = 20;
constexpr size_t kMaxTopPages = 20;

// Queries deduplicated by exact string: impressions and clicks summed,
// position averaged (one decimal). Sorted by impressions, top 20.
// nullopt when no usable query record exists.
std::optional<report::SearchConsoleSummary> merge_search_console(const std::vector<RawEnrichment>& envelopes);

// nullopt only when no ga4 envelope exists. Bounce rate and engagement are
// averaged over the envelopes that report them and default to 0.
std::optional<report::AnalyticsSummary> merge_analytics(const std::vector<RawEnrichment>& envelopes);

// nullopt only when no clarity envelope exists.
std::optional<report::UxSummary> merge_ux(const std::vector<RawEnrichment>& envelopes);

// nullopt when all three summaries are absent.
std::optional<report::IntegrationData> aggregate_integrations(const std::vector<RawEnrichment>& envelopes);

}  // namespace enrich

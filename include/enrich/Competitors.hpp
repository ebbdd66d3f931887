#pragma once

#include <optional>
#include <string>
#include <vector>

#include "report/Models.hpp"

namespace enrich {

struct CompetitorMention {
    std::string domain;
    bool mentioned = false;
};

// One answer-engine probe: a query sent to one platform and what came back.
struct VisibilityCheck {
    std::string provider;
    std::string query;
    std::optional<bool> brand_mentioned;
    std::optional<bool> url_cited;
    std::optional<double> citation_position;
    std::vector<CompetitorMention> competitor_mentions;
};

struct CompetitorAnalysis {
    std::vector<report::Competitor> competitors;
    std::vector<report::GapQuery> gap_queries;
};

// One row per competitor domain with the full platform and query sets,
// sorted by mention count desc then domain. Gap queries are probes where the
// subject brand was not mentioned but a competitor was, merged per
// (query, platform). nullopt when no competitor was ever mentioned.
std::optional<CompetitorAnalysis> aggregate_competitors(const std::vector<VisibilityCheck>& checks);

}  // namespace enrich

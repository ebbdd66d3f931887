#pragma once

#include <cstddef>

namespace doc {

constexpr size_t kSummaryQuickWins = 5;
constexpr size_t kQuickWinsPerPillar = 3;
constexpr size_t kIssuesPerSeverity = 20;
constexpr size_t kWorstPages = 20;
constexpr size_t kActionItemsPerTier = 10;
constexpr size_t kCompetitors = 10;
constexpr size_t kCompetitorQueries = 3;
constexpr size_t kGapQueries = 10;
constexpr size_t kSearchQueries = 15;
constexpr size_t kAnalyticsPages = 10;
constexpr size_t kRageClickPages = 10;
constexpr size_t kCoverageHighlights = 6;

constexpr size_t kUrlChars = 50;
constexpr size_t kQueryChars = 40;
constexpr size_t kSessionUrlChars = 60;

}  // namespace doc

#pragma once

#include <string>
#include <vector>

#include "report/Models.hpp"

namespace report {

// Tiers, in order, with empty tiers dropped:
//   1 critical
//   2 warnings with score impact >= 3
//   3 warnings with score impact < 3
//   4 info
// Items keep the order of `items`.
std::vector<ActionTier> build_action_plan(const std::vector<Issue>& items);

struct CoverageControl {
    const char* code;
    const char* label;
    const char* description;
    Pillar pillar;
};

// Controls reported in the readiness coverage table.
const std::vector<CoverageControl>& coverage_controls();

// One metric per control; empty when total_pages is 0. `occurrences` holds
// the deduplicated issue list (affected_pages per code). Sorted by coverage
// ascending, then code.
std::vector<CoverageMetric> build_readiness_coverage(const std::vector<Issue>& occurrences, int total_pages);

}  // namespace report

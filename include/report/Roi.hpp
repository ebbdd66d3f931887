#pragma once

#include <optional>

#include "report/Models.hpp"

namespace report {

// Heuristic, not an empirically validated figure: a 10 point score gain is
// assumed to lift click-through by 2% of impressions.
struct RoiConstants {
    double ctr_improvement_per_10_points = 0.02;
};

struct RoiInput {
    Severity severity = Severity::Info;
    double score_deduction = 0.0;
    int affected_pages = 0;
    int total_pages = 0;
    std::optional<double> impressions;   // observed impressions for the affected surface
};

// Score points removed per occurrence class.
double score_deduction(Severity s);

// affected / total, 0 when total is 0.
double page_ratio(int affected_pages, int total_pages);

// high   : critical and ratio > 0.5
// medium : critical or warning or ratio > 0.2
// low    : otherwise
VisibilityImpact classify_visibility(Severity severity, double page_ratio);

Roi estimate_issue_roi(const RoiInput& in, const RoiConstants& k = {});

}  // namespace report

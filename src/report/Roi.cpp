#include "report/Roi.hpp"

#include <cmath>
#include <string>

#include "report/TextUtil.hpp"

namespace report {

double score_deduction(Severity s) {
    switch (s) {
        case Severity::Critical: return 8.0;
        case Severity::Warning: return 4.0;
        case Severity::Info: return 2.0;
        default: return 0.0;
    }
}

double page_ratio(int affected_pages, int total_pages) {
    if (total_pages <= 0) return 0.0;
    return static_cast<double>(affected_pages) / static_cast<double>(total_pages);
}

VisibilityImpact classify_visibility(Severity severity, double ratio) {
    if (severity == Severity::Critical && ratio > 0.5) return VisibilityImpact::High;
    if (severity == Severity::Critical || severity == Severity::Warning || ratio > 0.2) {
        return VisibilityImpact::Medium;
    }
    return VisibilityImpact::Low;
}

Roi estimate_issue_roi(const RoiInput& in, const RoiConstants& k) {
    Roi roi;
    roi.score_impact = in.score_deduction;
    roi.page_reach = in.affected_pages;
    roi.visibility_impact = classify_visibility(in.severity, page_ratio(in.affected_pages, in.total_pages));

    if (in.impressions && *in.impressions > 0.0) {
        const double clicks = std::round(*in.impressions * k.ctr_improvement_per_10_points *
                                         in.score_deduction / 10.0);
        // Negative deductions are not validated upstream; never report "+0" or a loss.
        if (clicks > 0.0) {
            roi.traffic_estimate = "+" + textutil::format_thousands(clicks) + " clicks/month";
        }
    }

    return roi;
}

}  // namespace report

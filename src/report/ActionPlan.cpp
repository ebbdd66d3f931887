#include "report/ActionPlan.hpp"

#include <algorithm>
#include <cmath>

namespace report {

std::vector<ActionTier> build_action_plan(const std::vector<Issue>& items) {
    ActionTier critical{"Priority 1: Critical Fixes",
                        "Address immediately - these issues significantly harm your AI visibility.",
                        {}};
    ActionTier quick{"Priority 2: Quick Wins",
                     "High-impact changes that are relatively easy to implement.",
                     {}};
    ActionTier strategic{"Priority 3: Strategic Improvements",
                         "Medium-term improvements for sustained visibility gains.",
                         {}};
    ActionTier longterm{"Priority 4: Long-term Optimization",
                        "Ongoing optimizations for marginal gains.",
                        {}};

    for (const auto& it : items) {
        switch (it.severity) {
            case Severity::Critical:
                critical.items.push_back(it);
                break;
            case Severity::Warning:
                if (it.score_impact >= 3.0) {
                    quick.items.push_back(it);
                } else {
                    strategic.items.push_back(it);
                }
                break;
            case Severity::Info:
                longterm.items.push_back(it);
                break;
        }
    }

    std::vector<ActionTier> out;
    for (auto* t : {&critical, &quick, &strategic, &longterm}) {
        if (!t->items.empty()) out.push_back(std::move(*t));
    }
    return out;
}

const std::vector<CoverageControl>& coverage_controls() {
    static const std::vector<CoverageControl> controls = {
        {"MISSING_META_DESC", "Meta descriptions", "Pages with a meta description", Pillar::Technical},
        {"MISSING_TITLE", "Title tags", "Pages with a well-formed title tag", Pillar::Technical},
        {"MISSING_H1", "H1 headings", "Pages with a single H1 heading", Pillar::Technical},
        {"MISSING_CANONICAL", "Canonical URLs", "Pages declaring a canonical URL", Pillar::Technical},
        {"NO_STRUCTURED_DATA", "Structured data", "Pages with JSON-LD structured data", Pillar::AiReadiness},
        {"MISSING_LLMS_TXT", "llms.txt", "Pages covered by an llms.txt file", Pillar::AiReadiness},
        {"AI_CRAWLER_BLOCKED", "AI crawler access", "Pages reachable by AI crawlers", Pillar::AiReadiness},
        {"MISSING_ALT_TEXT", "Image alt text", "Pages whose images carry alt text", Pillar::Content},
    };
    return controls;
}

std::vector<CoverageMetric> build_readiness_coverage(const std::vector<Issue>& occurrences, int total_pages) {
    std::vector<CoverageMetric> out;
    if (total_pages <= 0) return out;

    for (const auto& c : coverage_controls()) {
        int affected = 0;
        for (const auto& is : occurrences) {
            if (is.code == c.code) {
                affected = is.affected_pages;
                break;
            }
        }
        affected = std::min(affected, total_pages);

        CoverageMetric m;
        m.code = c.code;
        m.label = c.label;
        m.description = c.description;
        m.pillar = c.pillar;
        m.affected_pages = affected;
        m.total_pages = total_pages;
        m.coverage_percent = static_cast<int>(
            std::lround(100.0 * static_cast<double>(total_pages - affected) / total_pages));
        out.push_back(std::move(m));
    }

    std::sort(out.begin(), out.end(), [](const CoverageMetric& a, const CoverageMetric& b) {
        if (a.coverage_percent != b.coverage_percent) return a.coverage_percent < b.coverage_percent;
        return a.code < b.code;
    });
    return out;
}

}  // namespace report

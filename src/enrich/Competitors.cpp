#include "enrich/Competitors.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <utility>

namespace enrich {

static void add_distinct(std::vector<std::string>& v, const std::string& s) {
    if (s.empty()) return;
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

std::optional<CompetitorAnalysis> aggregate_competitors(const std::vector<VisibilityCheck>& checks) {
    std::vector<std::string> domain_order;
    std::unordered_map<std::string, report::Competitor> by_domain;

    std::vector<std::pair<std::string, std::string>> gap_order;
    std::map<std::pair<std::string, std::string>, report::GapQuery> gaps;

    for (const auto& check : checks) {
        std::vector<std::string> cited;

        for (const auto& m : check.competitor_mentions) {
            if (!m.mentioned || m.domain.empty()) continue;

            auto it = by_domain.find(m.domain);
            if (it == by_domain.end()) {
                domain_order.push_back(m.domain);
                report::Competitor c;
                c.domain = m.domain;
                it = by_domain.emplace(m.domain, std::move(c)).first;
            }
            it->second.mention_count += 1;
            add_distinct(it->second.platforms, check.provider);
            add_distinct(it->second.queries, check.query);
            add_distinct(cited, m.domain);
        }

        const bool brand_missing = !check.brand_mentioned.value_or(false);
        if (brand_missing && !cited.empty() && !check.query.empty()) {
            const auto key = std::make_pair(check.query, check.provider);
            auto it = gaps.find(key);
            if (it == gaps.end()) {
                gap_order.push_back(key);
                report::GapQuery g;
                g.query = check.query;
                g.platform = check.provider;
                it = gaps.emplace(key, std::move(g)).first;
            }
            for (const auto& d : cited) add_distinct(it->second.competitors_cited, d);
        }
    }

    if (domain_order.empty()) return std::nullopt;

    CompetitorAnalysis out;
    out.competitors.reserve(domain_order.size());
    for (const auto& d : domain_order) out.competitors.push_back(by_domain.at(d));

    std::sort(out.competitors.begin(), out.competitors.end(),
              [](const report::Competitor& a, const report::Competitor& b) {
                  if (a.mention_count != b.mention_count) return a.mention_count > b.mention_count;
                  return a.domain < b.domain;
              });

    for (const auto& key : gap_order) out.gap_queries.push_back(gaps.at(key));

    return out;
}

}  // namespace enrich

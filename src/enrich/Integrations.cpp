#include "enrich/Integrations.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "report/Grading.hpp"

using json = nlohmann::json;

namespace enrich {

static std::vector<const json*> data_for(const std::vector<RawEnrichment>& envelopes, const char* provider) {
    std::vector<const json*> out;
    for (const auto& e : envelopes) {
        if (e.provider == provider) out.push_back(&e.data);
    }
    return out;
}

std::optional<report::SearchConsoleSummary> merge_search_console(const std::vector<RawEnrichment>& envelopes) {
    std::vector<QueryRecord> all;
    for (const json* d : data_for(envelopes, "gsc")) {
        for (const auto& payload : parse_query_payloads(*d)) {
            append_records(payload, all);
        }
    }
    if (all.empty()) return std::nullopt;

    struct Acc {
        double impressions = 0.0;
        double clicks = 0.0;
        double position_sum = 0.0;
        int positions = 0;
    };

    std::vector<std::string> order;
    std::unordered_map<std::string, Acc> by_query;
    for (const auto& q : all) {
        auto it = by_query.find(q.query);
        if (it == by_query.end()) {
            order.push_back(q.query);
            it = by_query.emplace(q.query, Acc{}).first;
        }
        it->second.impressions += q.impressions;
        it->second.clicks += q.clicks;
        it->second.position_sum += q.position;
        it->second.positions += 1;
    }

    report::SearchConsoleSummary out;
    out.top_queries.reserve(order.size());
    for (const auto& key : order) {
        const Acc& a = by_query.at(key);
        report::SearchQueryRow row;
        row.query = key;
        row.impressions = a.impressions;
        row.clicks = a.clicks;
        row.position = report::round_to(a.position_sum / a.positions, 1);
        out.top_queries.push_back(row);
    }

    std::stable_sort(out.top_queries.begin(), out.top_queries.end(),
                     [](const report::SearchQueryRow& a, const report::SearchQueryRow& b) {
                         return a.impressions > b.impressions;
                     });
    if (out.top_queries.size() > kMaxTopQueries) out.top_queries.resize(kMaxTopQueries);

    return out;
}

std::optional<report::AnalyticsSummary> merge_analytics(const std::vector<RawEnrichment>& envelopes) {
    const auto datas = data_for(envelopes, "ga4");
    if (datas.empty()) return std::nullopt;

    double bounce_total = 0.0, engagement_total = 0.0;
    int bounce_count = 0, engagement_count = 0;

    std::vector<std::string> order;
    std::unordered_map<std::string, double> sessions;

    for (const json* d : datas) {
        if (!d->is_object()) continue;

        if (d->contains("bounceRate")) {
            if (const auto v = try_number(d->at("bounceRate"))) {
                bounce_total += *v;
                ++bounce_count;
            }
        }
        if (d->contains("avgEngagement")) {
            if (const auto v = try_number(d->at("avgEngagement"))) {
                engagement_total += *v;
                ++engagement_count;
            }
        }

        std::vector<PageSessionRecord> pages;
        for (const auto& payload : parse_page_payloads(*d)) {
            append_records(payload, pages);
        }
        for (const auto& p : pages) {
            auto it = sessions.find(p.url);
            if (it == sessions.end()) {
                order.push_back(p.url);
                sessions.emplace(p.url, p.sessions);
            } else {
                it->second += p.sessions;
            }
        }
    }

    report::AnalyticsSummary out;
    out.bounce_rate = bounce_count > 0 ? report::round_to(bounce_total / bounce_count, 1) : 0.0;
    out.avg_engagement = engagement_count > 0 ? report::round_to(engagement_total / engagement_count, 1) : 0.0;

    for (const auto& url : order) {
        out.top_pages.push_back({url, sessions.at(url)});
    }
    std::stable_sort(out.top_pages.begin(), out.top_pages.end(),
                     [](const report::PageSessions& a, const report::PageSessions& b) {
                         return a.sessions > b.sessions;
                     });
    if (out.top_pages.size() > kMaxTopPages) out.top_pages.resize(kMaxTopPages);

    return out;
}

std::optional<report::UxSummary> merge_ux(const std::vector<RawEnrichment>& envelopes) {
    const auto datas = data_for(envelopes, "clarity");
    if (datas.empty()) return std::nullopt;

    double ux_total = 0.0;
    int ux_count = 0;
    report::UxSummary out;
    std::unordered_set<std::string> seen;

    auto add_page = [&](const std::string& url) {
        if (url.empty()) return;
        if (seen.insert(url).second) out.rage_click_pages.push_back(url);
    };

    for (const json* d : datas) {
        if (!d->is_object()) continue;

        if (d->contains("uxScore")) {
            if (const auto v = try_number(d->at("uxScore"))) {
                ux_total += *v;
                ++ux_count;
            }
        }
        if (d->contains("rageClicks") && d->at("rageClicks").is_array()) {
            for (const auto& item : d->at("rageClicks")) {
                if (item.is_string()) add_page(item.get<std::string>());
            }
        }
        if (const auto url = try_text(*d, "rageClickUrl")) {
            add_page(*url);
        }
    }

    out.avg_ux_score = ux_count > 0 ? report::round_to(ux_total / ux_count, 1) : 0.0;
    return out;
}

std::optional<report::IntegrationData> aggregate_integrations(const std::vector<RawEnrichment>& envelopes) {
    if (envelopes.empty()) return std::nullopt;

    report::IntegrationData out;
    out.gsc = merge_search_console(envelopes);
    out.ga4 = merge_analytics(envelopes);
    out.clarity = merge_ux(envelopes);

    if (!out.gsc && !out.ga4 && !out.clarity) return std::nullopt;
    return out;
}

}  // namespace enrich
